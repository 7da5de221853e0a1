#pragma once

#include <iterator>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include "ferry/client/config.hpp"

namespace ferry::client
{

    // Installs the "ferry" logger as spdlog's default, so the core library logs through it as well.
    class Logger
    {
    public:
        explicit Logger(const ClientConfig &config);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args)
        {
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->info("[{}] {}", tag, std::string(buf.data(), buf.size()));
        }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace ferry::client
