#include "ferry/client/config.hpp"

#include <string>

#include "ferry/error_codes.hpp"

namespace ferry::client
{

    std::string usage()
    {
        return "Usage: ferry [--json] [--quiet] [--debug] [--log <file>] [--config-dir <dir>] [--retries <n>] "
               "<command> [args]\n"
               "Commands:\n"
               "  cp SOURCE... TARGET              copy files and objects (DIR/... copies recursively)\n"
               "  mirror [--force] SOURCE TARGET... mirror a tree to one or more targets\n"
               "  session list|resume ID|clear ID|all\n"
               "  watch [--recursive] URL...        print create and remove events\n"
               "  diff [--metadata] FIRST SECOND    compare two trees\n"
               "  version\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index];
            if (arg.empty() || arg.front() != '-' || arg == "-")
            {
                break;
            }
            ++index;
            if (arg == "--json")
            {
                config.json = true;
            }
            else if (arg == "--quiet" || arg == "-q")
            {
                config.quiet = true;
            }
            else if (arg == "--debug")
            {
                config.debug = true;
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw Error(ErrorCode::InvalidArgument, "--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--config-dir")
            {
                if (index >= argc)
                {
                    throw Error(ErrorCode::InvalidArgument, "--config-dir requires a directory");
                }
                config.config_dir = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--retries")
            {
                if (index >= argc)
                {
                    throw Error(ErrorCode::InvalidArgument, "--retries requires a value");
                }
                const std::string value = argv[index++];
                try
                {
                    config.retries = std::stoi(value);
                }
                catch (const std::logic_error &)
                {
                    throw Error(ErrorCode::InvalidArgument, "Invalid --retries value '" + value + "'");
                }
                if (config.retries < 0)
                {
                    throw Error(ErrorCode::InvalidArgument, "--retries must not be negative");
                }
            }
            else
            {
                throw Error(ErrorCode::InvalidArgument, "Unknown option: " + arg);
            }
        }

        if (index >= argc)
        {
            throw Error(ErrorCode::InvalidArgument, "Missing command\n" + usage());
        }
        config.command = argv[index++];
        for (; index < argc; ++index)
        {
            config.args.emplace_back(argv[index]);
        }
        return config;
    }

} // namespace ferry::client
