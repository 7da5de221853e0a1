#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ferry/client_factory.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/fs_client.hpp"
#include "ferry/object_store.hpp"

namespace ferry::test
{

    inline std::filesystem::path make_temp_dir(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / ("ferry_test_" + name);
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    inline void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    inline void write_file(const std::filesystem::path &path, const std::string &data)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << data;
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    inline std::string read_all(Reader &reader)
    {
        std::string result;
        std::vector<std::byte> buffer(7);
        while (const auto count = reader.read(buffer))
        {
            result.append(reinterpret_cast<const char *>(buffer.data()), count);
        }
        return result;
    }

    inline std::string md5_of(const std::string &data)
    {
        return crypto::md5_hex(std::as_bytes(std::span(data.data(), data.size())));
    }

    // In-memory S3 stand-in. ETags are the quoted MD5 of the stored bytes.
    class MemoryObjectStore : public ObjectStoreApi
    {
    public:
        void add_bucket(const std::string &bucket)
        {
            std::lock_guard lock(mutex_);
            buckets_[bucket];
        }

        void put_object(const std::string &bucket, const std::string &key, const std::string &data,
                        std::map<std::string, std::string> metadata = {})
        {
            std::lock_guard lock(mutex_);
            buckets_[bucket][key] = Object{data, std::move(metadata)};
        }

        std::optional<std::string> object(const std::string &bucket, const std::string &key) const
        {
            std::lock_guard lock(mutex_);
            const auto bucket_it = buckets_.find(bucket);
            if (bucket_it == buckets_.end())
            {
                return std::nullopt;
            }
            const auto it = bucket_it->second.find(key);
            if (it == bucket_it->second.end())
            {
                return std::nullopt;
            }
            return it->second.data;
        }

        // The next `count` puts write half the payload, then fail like a dropped connection.
        void fail_next_puts(int count) { transient_failures_ = count; }

        // Every put is refused with AccessDenied.
        void deny_puts(bool deny) { deny_puts_ = deny; }

        // Puts store the data but report a wrong ETag.
        void corrupt_etags(bool corrupt) { corrupt_etags_ = corrupt; }

        // Objects per list_objects page.
        void set_page_size(std::size_t size) { page_size_ = size; }

        int put_attempts() const { return put_attempts_; }

        int get_calls() const { return get_calls_; }

        ObjectInfo head(const std::string &bucket, const std::string &key) override
        {
            std::lock_guard lock(mutex_);
            const auto &objects = bucket_locked(bucket);
            const auto it = objects.find(key);
            if (it == objects.end())
            {
                throw Error(ErrorCode::NotFound, "No such key: " + key);
            }
            return info(it->first, it->second);
        }

        bool bucket_exists(const std::string &bucket) override
        {
            std::lock_guard lock(mutex_);
            return buckets_.contains(bucket);
        }

        ObjectListPage list_objects(const std::string &bucket, const std::string &prefix, const std::string &delimiter,
                                    const std::string &token) override
        {
            std::lock_guard lock(mutex_);
            const auto &objects = bucket_locked(bucket);
            ObjectListPage page;
            auto it = token.empty() ? objects.lower_bound(prefix) : objects.upper_bound(token);
            for (; it != objects.end() && it->first.starts_with(prefix); ++it)
            {
                if (!delimiter.empty())
                {
                    const auto pos = it->first.find(delimiter, prefix.size());
                    if (pos != std::string::npos)
                    {
                        const auto common = it->first.substr(0, pos + delimiter.size());
                        if (page.prefixes.empty() || page.prefixes.back() != common)
                        {
                            page.prefixes.push_back(common);
                        }
                        continue;
                    }
                }
                else if (page.objects.size() == page_size_)
                {
                    page.truncated = true;
                    page.next_token = page.objects.back().key;
                    break;
                }
                page.objects.push_back(info(it->first, it->second));
            }
            return page;
        }

        std::vector<ObjectInfo> list_incomplete_uploads(const std::string &, const std::string &) override
        {
            return {};
        }

        std::unique_ptr<Reader> get(const std::string &bucket, const std::string &key) override
        {
            ++get_calls_;
            std::lock_guard lock(mutex_);
            const auto &objects = bucket_locked(bucket);
            const auto it = objects.find(key);
            if (it == objects.end())
            {
                throw Error(ErrorCode::NotFound, "No such key: " + key);
            }
            return std::make_unique<StringReader>(it->second.data);
        }

        std::string put(const std::string &bucket, const std::string &key, Reader &reader,
                        std::uint64_t length) override
        {
            ++put_attempts_;
            if (deny_puts_)
            {
                throw Error(ErrorCode::AccessDenied, "Access denied: " + bucket + "/" + key);
            }
            std::string data;
            std::vector<std::byte> buffer(4096);
            const bool fail = transient_failures_.fetch_sub(1) > 0;
            while (const auto count = reader.read(buffer))
            {
                data.append(reinterpret_cast<const char *>(buffer.data()), count);
                if (fail && data.size() * 2 >= length)
                {
                    throw NetworkError("write", "connection reset by peer");
                }
            }
            if (fail)
            {
                throw NetworkError("write", "connection reset by peer");
            }
            if (data.size() != length)
            {
                throw Error(ErrorCode::IoError, "Short upload for " + key);
            }
            const auto etag = corrupt_etags_ ? std::string(32, '0') : md5_of(data);
            {
                std::lock_guard lock(mutex_);
                if (!buckets_.contains(bucket))
                {
                    throw Error(ErrorCode::NotFound, "No such bucket: " + bucket);
                }
                buckets_[bucket][key] = Object{data, {}};
            }
            return "\"" + etag + "\"";
        }

        void remove(const std::string &bucket, const std::string &key) override
        {
            std::lock_guard lock(mutex_);
            bucket_locked(bucket).erase(key);
        }

    private:
        struct Object
        {
            std::string data;
            std::map<std::string, std::string> metadata;
        };

        std::map<std::string, Object> &bucket_locked(const std::string &bucket)
        {
            const auto it = buckets_.find(bucket);
            if (it == buckets_.end())
            {
                throw Error(ErrorCode::NotFound, "No such bucket: " + bucket);
            }
            return it->second;
        }

        static ObjectInfo info(const std::string &key, const Object &object)
        {
            return ObjectInfo{.key = key,
                              .size = object.data.size(),
                              .etag = "\"" + md5_of(object.data) + "\"",
                              .metadata = object.metadata};
        }

        mutable std::mutex mutex_;
        std::map<std::string, std::map<std::string, Object>> buckets_;
        std::atomic<int> transient_failures_{0};
        std::atomic<bool> deny_puts_{false};
        std::atomic<bool> corrupt_etags_{false};
        std::atomic<int> put_attempts_{0};
        std::atomic<int> get_calls_{0};
        std::size_t page_size_{1000};
    };

    // Filesystem URLs get a FilesystemClient; every object-store URL goes to `store`.
    inline ClientFactory memory_factory(std::shared_ptr<MemoryObjectStore> store)
    {
        return [store](const ResolvedUrl &url) -> std::unique_ptr<StorageClient>
        {
            if (url.type == UrlType::Filesystem)
            {
                return std::make_unique<FilesystemClient>(url);
            }
            return std::make_unique<ObjectStoreClient>(url, store);
        };
    }

} // namespace ferry::test
