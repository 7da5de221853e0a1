#include "ferry/client/interrupt.hpp"

#include <csignal>

#include <spdlog/spdlog.h>

namespace ferry::client
{

    InterruptHandler::InterruptHandler(CancelToken cancel)
        : cancel_(std::move(cancel)),
          signals_(io_context_)
    {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        wait();
        worker_ = std::thread([this]
                              { io_context_.run(); });
    }

    InterruptHandler::~InterruptHandler()
    {
        io_context_.stop();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void InterruptHandler::wait()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (ec)
            {
                return;
            }
            spdlog::info("Received signal {}, cancelling", signal);
            cancel_.cancel();
            wait(); });
    }

} // namespace ferry::client
