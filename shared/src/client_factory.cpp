#include "ferry/client_factory.hpp"

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"
#include "ferry/fs_client.hpp"
#include "ferry/object_store.hpp"
#include "ferry/s3_http.hpp"

namespace ferry
{

    std::unique_ptr<StorageClient> new_client(const ResolvedUrl &url, const Config &config)
    {
        if (url.type == UrlType::Filesystem)
        {
            return std::make_unique<FilesystemClient>(url);
        }

        const auto &credentials = config.host_config(url);
        try
        {
            auto api = std::make_shared<S3HttpApi>(url.endpoint(), credentials);
            spdlog::debug("Object-store client for {} ({})", url.to_string(),
                          credentials.anonymous() ? "anonymous" : credentials.access_key);
            return std::make_unique<ObjectStoreClient>(url, std::move(api));
        }
        catch (const Error &ex)
        {
            if (ex.code() == ErrorCode::ClientInit)
            {
                throw;
            }
            std::throw_with_nested(Error(ErrorCode::ClientInit, "Unable to initialize client for " + url.to_string()));
        }
    }

    ClientFactory make_client_factory(const Config &config)
    {
        return [&config](const ResolvedUrl &url)
        { return new_client(url, config); };
    }

} // namespace ferry
