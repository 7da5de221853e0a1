#include "ferry/object_store.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {
        constexpr std::string_view kDelimiter = "/";

        std::string directory_prefix(const std::string &key)
        {
            if (key.empty() || key.ends_with(kDelimiter))
            {
                return key;
            }
            return key + std::string(kDelimiter);
        }

        Content to_content(const ResolvedUrl &root, const std::string &base_path, const ObjectInfo &info,
                           const std::string &relative)
        {
            Content content;
            content.url = root.endpoint() + url_join_path(base_path, relative);
            content.key = relative;
            content.size = info.size;
            content.modified = info.modified;
            content.etag = info.etag;
            content.metadata = info.metadata;
            return content;
        }

        // Pages through list_objects and merges objects, common prefixes and (optionally) incomplete uploads
        // back into a single key-ordered sequence.
        class ObjectContentStream : public ContentStream
        {
        public:
            using Convert = std::function<Content(const ObjectInfo &, const std::string &)>;

            ObjectContentStream(std::shared_ptr<ObjectStoreApi> api, std::string bucket, std::string prefix,
                                ListOptions options, Convert convert)
                : api_(std::move(api)), bucket_(std::move(bucket)), prefix_(std::move(prefix)), options_(options),
                  convert_(std::move(convert))
            {
                if (options_.include_incomplete)
                {
                    try
                    {
                        auto uploads = api_->list_incomplete_uploads(bucket_, prefix_);
                        std::sort(uploads.begin(), uploads.end(), [](const ObjectInfo &a, const ObjectInfo &b)
                                  { return a.key < b.key; });
                        incomplete_.assign(uploads.begin(), uploads.end());
                    }
                    catch (const Error &ex)
                    {
                        spdlog::warn("Unable to list incomplete uploads in {}: {}", bucket_, ex.what());
                    }
                }
            }

            std::optional<ListEntry> next() override
            {
                if (buffer_.empty() && !finished_)
                {
                    fetch_page();
                }
                if (!incomplete_.empty() && (buffer_.empty() || incomplete_.front().key < buffer_.front().content.key))
                {
                    const auto info = std::move(incomplete_.front());
                    incomplete_.pop_front();
                    return ListEntry{convert_(info, relative(info.key)), nullptr};
                }
                if (buffer_.empty())
                {
                    return std::nullopt;
                }
                auto entry = std::move(buffer_.front());
                buffer_.pop_front();
                entry.content.key = relative(entry.content.key);
                return entry;
            }

        private:
            std::string relative(const std::string &key) const
            {
                return key.substr(std::min(prefix_.size(), key.size()));
            }

            void fetch_page()
            {
                ObjectListPage page;
                try
                {
                    page = api_->list_objects(bucket_, prefix_, options_.recursive ? "" : std::string(kDelimiter),
                                              token_);
                }
                catch (const std::exception &)
                {
                    finished_ = true;
                    buffer_.push_back(ListEntry{Content{.url = "/" + bucket_ + "/" + prefix_}, std::current_exception()});
                    return;
                }

                // Full keys for now; next() makes them relative once ordering is settled.
                std::vector<ListEntry> merged;
                merged.reserve(page.objects.size() + page.prefixes.size());
                for (const auto &object : page.objects)
                {
                    if (object.key == prefix_)
                    {
                        continue;
                    }
                    auto content = convert_(object, relative(object.key));
                    content.key = object.key;
                    merged.push_back(ListEntry{std::move(content), nullptr});
                }
                for (const auto &common : page.prefixes)
                {
                    auto name = common;
                    while (name.ends_with(kDelimiter))
                    {
                        name.pop_back();
                    }
                    auto content = convert_(ObjectInfo{.key = name}, relative(name));
                    content.key = name;
                    content.is_directory = true;
                    merged.push_back(ListEntry{std::move(content), nullptr});
                }
                std::sort(merged.begin(), merged.end(), [](const ListEntry &a, const ListEntry &b)
                          { return a.content.key < b.content.key; });
                buffer_.assign(std::make_move_iterator(merged.begin()), std::make_move_iterator(merged.end()));

                token_ = page.next_token;
                finished_ = !page.truncated || token_.empty();
            }

            std::shared_ptr<ObjectStoreApi> api_;
            std::string bucket_;
            std::string prefix_;
            ListOptions options_;
            Convert convert_;
            std::string token_;
            bool finished_{false};
            std::deque<ListEntry> buffer_;
            std::deque<ObjectInfo> incomplete_;
        };

    } // namespace

    ObjectStoreClient::ObjectStoreClient(ResolvedUrl url, std::shared_ptr<ObjectStoreApi> api)
        : url_(std::move(url)), api_(std::move(api))
    {
        if (url_.type != UrlType::ObjectStore)
        {
            throw Error(ErrorCode::ClientInit, "Not an object-store URL: " + url_.to_string());
        }
        if (!api_)
        {
            throw Error(ErrorCode::ClientInit, "No object-store API for " + url_.to_string());
        }
        std::string_view path = url_.path;
        while (path.starts_with('/'))
        {
            path.remove_prefix(1);
        }
        const auto slash = path.find('/');
        bucket_ = std::string(path.substr(0, slash));
        if (slash != std::string_view::npos)
        {
            key_ = std::string(path.substr(slash + 1));
        }
        if (bucket_.empty())
        {
            throw Error(ErrorCode::ClientInit, "Missing bucket in " + url_.to_string());
        }
    }

    Content ObjectStoreClient::stat()
    {
        if (key_.empty())
        {
            if (!api_->bucket_exists(bucket_))
            {
                throw Error(ErrorCode::NotFound, "Bucket does not exist: " + bucket_);
            }
            return Content{.url = url_.to_string(), .is_directory = true};
        }
        if (!key_.ends_with(kDelimiter))
        {
            try
            {
                const auto info = api_->head(bucket_, key_);
                auto content = to_content(url_, url_.path, info, {});
                content.url = url_.to_string();
                return content;
            }
            catch (const Error &ex)
            {
                if (ex.code() != ErrorCode::NotFound)
                {
                    throw;
                }
            }
        }
        const auto page = api_->list_objects(bucket_, directory_prefix(key_), std::string(kDelimiter), {});
        if (page.objects.empty() && page.prefixes.empty())
        {
            throw Error(ErrorCode::NotFound, "Object does not exist: " + url_.to_string());
        }
        return Content{.url = url_.to_string(), .is_directory = true};
    }

    std::unique_ptr<ContentStream> ObjectStoreClient::list(const ListOptions &options)
    {
        if (!key_.empty() && !key_.ends_with(kDelimiter))
        {
            try
            {
                const auto info = api_->head(bucket_, key_);
                auto content = to_content(url_, url_.path, info, {});
                content.url = url_.to_string();
                content.key = base_name(url_);
                std::vector<ListEntry> entries;
                entries.push_back(ListEntry{std::move(content), nullptr});
                return std::make_unique<VectorContentStream>(std::move(entries));
            }
            catch (const Error &ex)
            {
                if (ex.code() != ErrorCode::NotFound)
                {
                    throw;
                }
            }
        }
        const auto prefix = directory_prefix(key_);
        return std::make_unique<ObjectContentStream>(
            api_, bucket_, prefix, options,
            [root = url_, base_path = "/" + bucket_ + "/" + prefix](const ObjectInfo &info, const std::string &relative)
            { return to_content(root, base_path, info, relative); });
    }

    std::unique_ptr<Reader> ObjectStoreClient::get()
    {
        if (key_.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Cannot read a bucket: " + url_.to_string());
        }
        return api_->get(bucket_, key_);
    }

    PutResult ObjectStoreClient::put(Reader &reader, std::uint64_t length)
    {
        if (key_.empty() || key_.ends_with(kDelimiter))
        {
            throw Error(ErrorCode::InvalidArgument, "Target is not an object: " + url_.to_string());
        }
        auto etag = api_->put(bucket_, key_, reader, length);
        spdlog::debug("Stored {} ({} bytes, etag {})", url_.to_string(), length, etag);
        return PutResult{.bytes = length, .etag = std::move(etag)};
    }

    void ObjectStoreClient::remove()
    {
        if (key_.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Refusing to remove a bucket: " + url_.to_string());
        }
        api_->remove(bucket_, key_);
    }

} // namespace ferry
