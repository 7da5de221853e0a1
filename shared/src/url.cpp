#include "ferry/url.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {

        constexpr std::string_view kSchemeSeparator = "://";

        std::vector<std::string_view> split_segments(std::string_view path)
        {
            std::vector<std::string_view> segments;
            std::size_t start = 0;
            while (start <= path.size())
            {
                const auto pos = path.find('/', start);
                if (pos == std::string_view::npos)
                {
                    segments.push_back(path.substr(start));
                    break;
                }
                segments.push_back(path.substr(start, pos - start));
                start = pos + 1;
            }
            return segments;
        }

        bool is_alpha_scheme(std::string_view scheme)
        {
            return !scheme.empty() && std::all_of(scheme.begin(), scheme.end(), [](unsigned char c)
                                                  { return std::isalpha(c) != 0; });
        }

        std::string lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        void validate_characters(std::string_view arg)
        {
            if (arg.empty())
            {
                throw Error(ErrorCode::InvalidUrl, "Empty URL");
            }
            for (const unsigned char c : arg)
            {
                if (c < 0x20 || c == 0x7F)
                {
                    throw Error(ErrorCode::InvalidUrl, "URL contains control characters: " + std::string(arg));
                }
            }
        }

        void validate_host(std::string_view host, std::string_view url)
        {
            if (host.empty())
            {
                throw Error(ErrorCode::InvalidUrl, "Missing host in URL '" + std::string(url) + "'");
            }
            if (host.find('@') != std::string_view::npos)
            {
                throw Error(ErrorCode::InvalidUrl, "User info is not supported in URL '" + std::string(url) + "'");
            }
            const auto colon = host.rfind(':');
            if (colon != std::string_view::npos)
            {
                const auto port = host.substr(colon + 1);
                if (port.empty() || port.size() > 5 ||
                    !std::all_of(port.begin(), port.end(), [](unsigned char c)
                                 { return std::isdigit(c) != 0; }))
                {
                    throw Error(ErrorCode::InvalidUrl, "Invalid port in URL '" + std::string(url) + "'");
                }
            }
        }

        std::string trim_trailing_separators(std::string value)
        {
            while (value.size() > 1 && value.back() == '/')
            {
                value.pop_back();
            }
            return value;
        }

    } // namespace

    std::string_view to_string(UrlType type) noexcept
    {
        return type == UrlType::ObjectStore ? "object-store" : "filesystem";
    }

    std::string ResolvedUrl::to_string() const
    {
        if (type == UrlType::Filesystem)
        {
            return path;
        }
        return endpoint() + path;
    }

    std::string ResolvedUrl::endpoint() const
    {
        if (type == UrlType::Filesystem)
        {
            return {};
        }
        return scheme + std::string(kSchemeSeparator) + host;
    }

    bool is_url_recursive(std::string_view url)
    {
        return url.ends_with(kRecursiveSeparator);
    }

    std::string strip_recursive_url(std::string_view url)
    {
        if (!is_url_recursive(url))
        {
            return std::string(url);
        }
        auto stripped = trim_trailing_separators(std::string(url.substr(0, url.size() - kRecursiveSeparator.size())));
        if (stripped.empty())
        {
            return ".";
        }
        return stripped;
    }

    std::string expand_alias(std::string_view arg, const AliasMap &aliases)
    {
        const auto slash = arg.find('/');
        const auto name = arg.substr(0, slash);
        if (name.empty())
        {
            return std::string(arg);
        }
        const auto it = aliases.find(std::string(name));
        if (it == aliases.end())
        {
            return std::string(arg);
        }
        if (slash == std::string_view::npos)
        {
            return it->second;
        }
        return url_join_path(it->second, arg.substr(slash + 1));
    }

    ResolvedUrl resolve(std::string_view arg, const AliasMap &aliases)
    {
        validate_characters(arg);
        std::string expanded = expand_alias(arg, aliases);

        const auto segments = split_segments(expanded);
        for (std::size_t i = 0; i + 1 < segments.size(); ++i)
        {
            if (segments[i] == kRecursiveSeparator)
            {
                throw Error(ErrorCode::InvalidUrl,
                            "Recursive marker '...' is only allowed at the end of '" + std::string(arg) + "'");
            }
        }

        ResolvedUrl url;
        url.recursive = is_url_recursive(expanded);
        if (url.recursive)
        {
            expanded = strip_recursive_url(expanded);
        }

        const auto separator = expanded.find(kSchemeSeparator);
        if (separator == std::string::npos || !is_alpha_scheme(std::string_view(expanded).substr(0, separator)))
        {
            url.type = UrlType::Filesystem;
            url.path = expanded;
            return url;
        }

        const auto scheme = lower(std::string_view(expanded).substr(0, separator));
        const auto rest = std::string_view(expanded).substr(separator + kSchemeSeparator.size());
        if (scheme == "file")
        {
            if (rest.empty())
            {
                throw Error(ErrorCode::InvalidUrl, "Empty path in URL '" + std::string(arg) + "'");
            }
            url.type = UrlType::Filesystem;
            url.path = std::string(rest);
            return url;
        }
        if (scheme != "http" && scheme != "https")
        {
            throw Error(ErrorCode::UnsupportedScheme, "Unsupported scheme '" + scheme + "' in '" + std::string(arg) + "'");
        }

        const auto slash = rest.find('/');
        const auto authority = rest.substr(0, slash);
        validate_host(authority, arg);

        url.type = UrlType::ObjectStore;
        url.scheme = scheme;
        url.host = lower(authority);
        url.path = slash == std::string_view::npos ? std::string("/") : std::string(rest.substr(slash));
        return url;
    }

    std::string url_join_path(std::string_view base, std::string_view relative)
    {
        std::string joined(base);
        while (!relative.empty() && relative.front() == '/')
        {
            relative.remove_prefix(1);
        }
        if (relative.empty())
        {
            return joined;
        }
        if (joined.empty())
        {
            return std::string(relative);
        }
        if (joined.back() != '/')
        {
            joined.push_back('/');
        }
        joined.append(relative);
        return joined;
    }

    ResolvedUrl join(const ResolvedUrl &base, std::string_view relative)
    {
        ResolvedUrl url = base;
        url.recursive = false;
        url.path = url_join_path(base.path, relative);
        return url;
    }

    std::string base_name(const ResolvedUrl &url)
    {
        const auto &path = url.path;
        if (path.empty() || path.back() == '/')
        {
            return {};
        }
        const auto slash = path.rfind('/');
        auto name = slash == std::string::npos ? path : path.substr(slash + 1);
        if (url.type == UrlType::ObjectStore && path.find('/', 1) == std::string::npos)
        {
            // "/bucket": a bucket root has no object name
            return {};
        }
        if (name == "." || name == "..")
        {
            return {};
        }
        return name;
    }

} // namespace ferry
