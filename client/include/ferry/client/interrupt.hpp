#pragma once

#include <thread>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include "ferry/transfer.hpp"

namespace ferry::client
{

    // Cancels the token on SIGINT or SIGTERM. Signals are handled on a background io_context thread.
    class InterruptHandler
    {
    public:
        explicit InterruptHandler(CancelToken cancel);
        ~InterruptHandler();

        InterruptHandler(const InterruptHandler &) = delete;
        InterruptHandler &operator=(const InterruptHandler &) = delete;

    private:
        void wait();

        CancelToken cancel_;
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread worker_;
    };

} // namespace ferry::client
