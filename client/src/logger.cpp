#include "ferry/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace ferry::client
{

    Logger::Logger(const ClientConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_path->string(), true));
        }
        if (config.debug)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(config.debug ? spdlog::level::debug : spdlog::level::info);
        spdlog::set_default_logger(logger_);
    }

} // namespace ferry::client
