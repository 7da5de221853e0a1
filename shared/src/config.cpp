#include "ferry/config.hpp"

#include <cstdlib>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include "ferry/error_codes.hpp"

extern char **environ;

namespace ferry
{

    namespace
    {
        constexpr auto kConfigFile = "config.json";
        constexpr auto kConfigVersion = "1";
    } // namespace

    Config::Config(std::filesystem::path dir) : dir_(std::move(dir)) {}

    Config Config::load(const std::filesystem::path &dir)
    {
        Config config(dir);
        config.load_file();
        config.apply_environment();
        return config;
    }

    std::filesystem::path Config::default_dir()
    {
        if (const char *dir = std::getenv("FERRY_CONFIG_DIR"))
        {
            return std::filesystem::path(dir);
        }
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".ferry";
        }
        return std::filesystem::path(".ferry");
    }

    std::optional<AliasEntry> Config::parse_host_env(std::string_view value)
    {
        const auto scheme_end = value.find("://");
        if (scheme_end == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto scheme = value.substr(0, scheme_end);
        auto rest = value.substr(scheme_end + 3);

        AliasEntry entry;
        const auto at = rest.rfind('@');
        if (at != std::string_view::npos)
        {
            const auto userinfo = rest.substr(0, at);
            const auto colon = userinfo.find(':');
            if (colon == std::string_view::npos)
            {
                return std::nullopt;
            }
            entry.credentials.access_key = std::string(userinfo.substr(0, colon));
            entry.credentials.secret_key = std::string(userinfo.substr(colon + 1));
            rest = rest.substr(at + 1);
        }
        if (rest.empty())
        {
            return std::nullopt;
        }
        entry.url = std::string(scheme) + "://" + std::string(rest);
        return entry;
    }

    void Config::set_alias(const std::string &name, AliasEntry entry)
    {
        aliases_[name] = std::move(entry);
    }

    AliasMap Config::aliases() const
    {
        AliasMap result;
        for (const auto &[name, entry] : aliases_)
        {
            result.emplace(name, entry.url);
        }
        return result;
    }

    const Credentials &Config::host_config(const ResolvedUrl &url) const
    {
        const auto endpoint = url.endpoint();
        for (const auto &[name, entry] : aliases_)
        {
            try
            {
                const auto alias_url = resolve(entry.url, {});
                if (alias_url.type == UrlType::ObjectStore && alias_url.endpoint() == endpoint)
                {
                    return entry.credentials;
                }
            }
            catch (const Error &ex)
            {
                spdlog::debug("Ignoring alias '{}' with unusable URL: {}", name, ex.what());
            }
        }
        throw Error(ErrorCode::NoMatchingHost, "No alias configured for host '" + endpoint + "'");
    }

    void Config::save() const
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
        {
            throw Error(ErrorCode::IoError, "Unable to create config directory " + dir_.string() + ": " + ec.message());
        }
        nlohmann::json aliases = nlohmann::json::object();
        for (const auto &[name, entry] : aliases_)
        {
            aliases[name] = {{"url", entry.url},
                             {"accessKey", entry.credentials.access_key},
                             {"secretKey", entry.credentials.secret_key},
                             {"region", entry.credentials.region}};
        }
        const nlohmann::json json = {{"version", kConfigVersion}, {"aliases", aliases}};
        std::ofstream out(dir_ / kConfigFile, std::ios::trunc);
        if (!out.is_open())
        {
            throw Error(ErrorCode::IoError, "Unable to write " + (dir_ / kConfigFile).string());
        }
        out << json.dump(2);
    }

    void Config::load_file()
    {
        const auto path = dir_ / kConfigFile;
        if (!std::filesystem::exists(path))
        {
            return;
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw Error(ErrorCode::IoError, "Unable to read " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidArgument, "Malformed config file " + path.string() + ": " + ex.what());
        }
        const auto aliases = json.value("aliases", nlohmann::json::object());
        for (const auto &[name, item] : aliases.items())
        {
            AliasEntry entry;
            entry.url = item.value("url", std::string{});
            entry.credentials.access_key = item.value("accessKey", std::string{});
            entry.credentials.secret_key = item.value("secretKey", std::string{});
            entry.credentials.region = item.value("region", std::string{"us-east-1"});
            if (!entry.url.empty())
            {
                aliases_[name] = std::move(entry);
            }
        }
        spdlog::debug("Loaded {} aliases from {}", aliases_.size(), path.string());
    }

    void Config::apply_environment()
    {
        for (char **env = environ; env != nullptr && *env != nullptr; ++env)
        {
            const std::string_view variable(*env);
            if (!variable.starts_with(kEnvHostPrefix))
            {
                continue;
            }
            const auto equals = variable.find('=');
            if (equals == std::string_view::npos)
            {
                continue;
            }
            const auto name = variable.substr(kEnvHostPrefix.size(), equals - kEnvHostPrefix.size());
            auto entry = parse_host_env(variable.substr(equals + 1));
            if (name.empty() || !entry)
            {
                spdlog::warn("Ignoring malformed {}", std::string(variable.substr(0, equals)));
                continue;
            }
            aliases_[std::string(name)] = std::move(*entry);
        }
    }

} // namespace ferry
