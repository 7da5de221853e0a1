#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>

#include <spdlog/spdlog.h>

#include "ferry/client/commands.hpp"
#include "ferry/client/config.hpp"
#include "ferry/client/interrupt.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/output.hpp"
#include "ferry/config.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/version.hpp"

namespace
{

    using Handler = std::function<int(ferry::client::CommandContext &)>;

    const std::map<std::string, Handler> &handlers()
    {
        static const std::map<std::string, Handler> table = {
            {"cp", ferry::client::run_copy},
            {"mirror", ferry::client::run_mirror},
            {"session", ferry::client::run_session},
            {"watch", ferry::client::run_watch},
            {"diff", ferry::client::run_diff},
            {"version", ferry::client::run_version},
        };
        return table;
    }

    bool wants_json(int argc, char *argv[])
    {
        for (int i = 1; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--json")
            {
                return true;
            }
        }
        return false;
    }

} // namespace

int main(int argc, char *argv[])
{
    ferry::client::ClientConfig options;
    try
    {
        options = ferry::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        ferry::client::Printer(wants_json(argc, argv), false).error(ex);
        return EXIT_FAILURE;
    }

    const ferry::client::Printer printer(options.json, options.quiet);
    try
    {
        ferry::client::Logger logger(options);
        const auto handler = handlers().find(options.command);
        if (handler == handlers().end())
        {
            throw ferry::Error(ferry::ErrorCode::InvalidArgument,
                               "Unknown command '" + options.command + "'\n" + ferry::client::usage());
        }
        logger.log("main", "ferry ", ferry::version(), " running ", options.command);

        const auto config = ferry::Config::load(options.config_dir.value_or(ferry::Config::default_dir()));
        ferry::CancelToken cancel;
        ferry::client::InterruptHandler interrupts(cancel);
        ferry::client::CommandContext context{
            .options = options,
            .config = config,
            .printer = printer,
            .logger = logger,
            .cancel = cancel,
        };
        return handler->second(context);
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Fatal error: {}", ferry::describe(ex));
        printer.error(ex);
        return EXIT_FAILURE;
    }
}
