/**
 * Ferry - S3-compatible wire protocol over libcurl, signed with AWS Signature V4.
 */
#pragma once

#include <map>
#include <string>

#include "ferry/config.hpp"
#include "ferry/object_store.hpp"

namespace ferry
{

    class S3HttpApi : public ObjectStoreApi
    {
    public:
        // endpoint is "scheme://host[:port]".
        S3HttpApi(std::string endpoint, Credentials credentials);

        ObjectInfo head(const std::string &bucket, const std::string &key) override;

        bool bucket_exists(const std::string &bucket) override;

        ObjectListPage list_objects(const std::string &bucket, const std::string &prefix, const std::string &delimiter,
                                    const std::string &token) override;

        std::vector<ObjectInfo> list_incomplete_uploads(const std::string &bucket, const std::string &prefix) override;

        std::unique_ptr<Reader> get(const std::string &bucket, const std::string &key) override;

        std::string put(const std::string &bucket, const std::string &key, Reader &reader,
                        std::uint64_t length) override;

        void remove(const std::string &bucket, const std::string &key) override;

        // Value of the Authorization header for a request. Exposed for tests with a fixed clock.
        std::string authorization(const std::string &method, const std::string &canonical_path,
                                  const std::string &canonical_query, const std::map<std::string, std::string> &headers,
                                  const std::string &payload_hash) const;

        static std::string uri_encode(std::string_view value, bool keep_slashes);

    private:
        std::string host_header() const;

        std::string endpoint_;
        Credentials credentials_;
    };

} // namespace ferry
