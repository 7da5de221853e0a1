/**
 * Ferry - URL and alias resolution for filesystem paths and object-store URLs.
 */
#pragma once

#include <map>
#include <string>
#include <string_view>

namespace ferry
{

    inline constexpr std::string_view kRecursiveSeparator = "...";

    enum class UrlType
    {
        Filesystem,
        ObjectStore
    };

    std::string_view to_string(UrlType type) noexcept;

    struct ResolvedUrl
    {
        UrlType type{UrlType::Filesystem};
        std::string scheme;
        std::string host;
        std::string path;
        bool recursive{};

        // Canonical form without the recursive marker; resolving it again yields the same URL.
        std::string to_string() const;

        // Scheme and host only, e.g. "https://play.min.io:9000". Empty for filesystem URLs.
        std::string endpoint() const;

        bool operator==(const ResolvedUrl &) const = default;
    };

    // name -> base URL
    using AliasMap = std::map<std::string, std::string>;

    // Any URL ending in "...".
    bool is_url_recursive(std::string_view url);

    // "a/b/..." and "a/b..." -> "a/b"; a bare "..." becomes ".".
    std::string strip_recursive_url(std::string_view url);

    // Replaces a leading "alias" or "alias/rest" with the alias's base URL. Unknown names pass through.
    std::string expand_alias(std::string_view arg, const AliasMap &aliases);

    // Throws ferry::Error with InvalidUrl or UnsupportedScheme.
    ResolvedUrl resolve(std::string_view arg, const AliasMap &aliases);

    std::string url_join_path(std::string_view base, std::string_view relative);

    ResolvedUrl join(const ResolvedUrl &base, std::string_view relative);

    // Last path segment, empty when the path ends in a separator or is a bucket root.
    std::string base_name(const ResolvedUrl &url);

} // namespace ferry
