/**
 * Ferry - Object-store backend. Path-style URLs: http(s)://host/bucket/key.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ferry/storage_client.hpp"

namespace ferry
{

    struct ObjectInfo
    {
        std::string key;
        std::uint64_t size{};
        std::chrono::system_clock::time_point modified{};
        std::string etag;
        std::map<std::string, std::string> metadata;
    };

    struct ObjectListPage
    {
        std::vector<ObjectInfo> objects;
        // Common prefixes, each ending in the delimiter.
        std::vector<std::string> prefixes;
        std::string next_token;
        bool truncated{};
    };

    // Wire operations of an S3-compatible store. Failures are thrown as ferry::Error (NotFound, AccessDenied,
    // RemoteError) or as NetworkError/DnsError for transport problems.
    class ObjectStoreApi
    {
    public:
        virtual ~ObjectStoreApi() = default;

        virtual ObjectInfo head(const std::string &bucket, const std::string &key) = 0;

        virtual bool bucket_exists(const std::string &bucket) = 0;

        virtual ObjectListPage list_objects(const std::string &bucket, const std::string &prefix,
                                            const std::string &delimiter, const std::string &token) = 0;

        virtual std::vector<ObjectInfo> list_incomplete_uploads(const std::string &bucket,
                                                                const std::string &prefix) = 0;

        virtual std::unique_ptr<Reader> get(const std::string &bucket, const std::string &key) = 0;

        // Returns the ETag reported by the store.
        virtual std::string put(const std::string &bucket, const std::string &key, Reader &reader,
                                std::uint64_t length) = 0;

        virtual void remove(const std::string &bucket, const std::string &key) = 0;
    };

    class ObjectStoreClient : public StorageClient
    {
    public:
        ObjectStoreClient(ResolvedUrl url, std::shared_ptr<ObjectStoreApi> api);

        const ResolvedUrl &url() const override { return url_; }

        Content stat() override;

        std::unique_ptr<ContentStream> list(const ListOptions &options) override;

        std::unique_ptr<Reader> get() override;

        PutResult put(Reader &reader, std::uint64_t length) override;

        void remove() override;

        bool returns_md5_etag() const noexcept override { return true; }

        const std::string &bucket() const { return bucket_; }
        const std::string &key() const { return key_; }

    private:
        ResolvedUrl url_;
        std::shared_ptr<ObjectStoreApi> api_;
        std::string bucket_;
        std::string key_;
    };

} // namespace ferry
