#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::client
{

    struct ClientConfig
    {
        bool json{};
        bool quiet{};
        bool debug{};
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> config_dir;
        int retries{5};
        std::string command;
        // Everything after the command, including command flags such as --force.
        std::vector<std::string> args;
    };

    // Throws ferry::Error(InvalidArgument) on malformed global options.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace ferry::client
