/**
 * Ferry - Builds the storage client bound to a resolved URL.
 */
#pragma once

#include <functional>
#include <memory>

#include "ferry/config.hpp"
#include "ferry/storage_client.hpp"

namespace ferry
{

    using ClientFactory = std::function<std::unique_ptr<StorageClient>(const ResolvedUrl &)>;

    // Throws ferry::Error(ClientInit) with the cause nested, or NoMatchingHost when no alias carries
    // credentials for an object-store host. Never retried here.
    std::unique_ptr<StorageClient> new_client(const ResolvedUrl &url, const Config &config);

    // Factory bound to a config, for code that only sees URLs.
    ClientFactory make_client_factory(const Config &config);

} // namespace ferry
