#include "ferry/s3_http.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include "ferry/channel.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {
        constexpr auto kAlgorithm = "AWS4-HMAC-SHA256";
        constexpr auto kService = "s3";
        constexpr auto kUnsignedPayload = "UNSIGNED-PAYLOAD";
        constexpr std::size_t kStreamDepth = 64;
        constexpr long kConnectTimeoutSeconds = 30;
        constexpr long kLowSpeedTimeSeconds = 60;

        void ensure_curl_global_init()
        {
            static std::once_flag once;
            std::call_once(once, []
                           { curl_global_init(CURL_GLOBAL_DEFAULT); });
        }

        class CurlEasy
        {
        public:
            CurlEasy() : handle_(curl_easy_init())
            {
                if (!handle_)
                {
                    throw Error(ErrorCode::Transport, "curl_easy_init failed");
                }
                curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L);
                curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
                curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
                curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_LIMIT, 1L);
                curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_TIME, kLowSpeedTimeSeconds);
            }

            ~CurlEasy() { curl_easy_cleanup(handle_); }

            CurlEasy(const CurlEasy &) = delete;
            CurlEasy &operator=(const CurlEasy &) = delete;

            operator CURL *() { return handle_; }

        private:
            CURL *handle_;
        };

        class SList
        {
        public:
            SList() = default;
            ~SList() { curl_slist_free_all(head_); }

            SList(const SList &) = delete;
            SList &operator=(const SList &) = delete;

            void add(std::string line)
            {
                store_.push_back(std::move(line));
                head_ = curl_slist_append(head_, store_.back().c_str());
            }

            curl_slist *get() const { return head_; }

        private:
            std::vector<std::string> store_;
            curl_slist *head_ = nullptr;
        };

        struct HttpResponse
        {
            CURLcode curl = CURLE_OK;
            long http = 0;
            std::string body;
            std::string headers;
        };

        std::size_t append_to_string(char *data, std::size_t size, std::size_t count, void *userdata)
        {
            static_cast<std::string *>(userdata)->append(data, size * count);
            return size * count;
        }

        template <class SetupFn>
        HttpResponse perform(SetupFn &&setup)
        {
            CurlEasy handle;
            HttpResponse response;
            curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_to_string);
            curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, append_to_string);
            curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

            setup(handle);

            response.curl = curl_easy_perform(handle);
            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.http);
            return response;
        }

        [[noreturn]] void throw_transport(CURLcode code, const std::string &host, const std::string &what)
        {
            const auto message = what + ": " + curl_easy_strerror(code);
            switch (code)
            {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                throw DnsError(host, message);
            case CURLE_COULDNT_CONNECT:
                throw NetworkError("dial", message);
            case CURLE_SEND_ERROR:
                throw NetworkError("write", message);
            case CURLE_RECV_ERROR:
            case CURLE_PARTIAL_FILE:
            case CURLE_GOT_NOTHING:
            case CURLE_OPERATION_TIMEDOUT:
                throw NetworkError("read", message);
            default:
                throw Error(ErrorCode::Transport, message);
            }
        }

        void check(const HttpResponse &response, const std::string &host, const std::string &what)
        {
            if (response.curl != CURLE_OK)
            {
                throw_transport(response.curl, host, what);
            }
            if (response.http / 100 == 2)
            {
                return;
            }

            auto message = what + ": HTTP " + std::to_string(response.http);
            pugi::xml_document doc;
            if (!response.body.empty() && doc.load_buffer(response.body.data(), response.body.size()))
            {
                const auto error = doc.child("Error");
                if (error)
                {
                    message += std::string(" ") + error.child_value("Code") + ": " + error.child_value("Message");
                }
            }
            switch (response.http)
            {
            case 404:
                throw Error(ErrorCode::NotFound, message);
            case 401:
            case 403:
                throw Error(ErrorCode::AccessDenied, message);
            default:
                throw Error(ErrorCode::RemoteError, message);
            }
        }

        std::string lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return std::string(value);
        }

        // Response headers as lower-cased name -> value. Later blocks (after redirects) win.
        std::map<std::string, std::string> parse_headers(const std::string &raw)
        {
            std::map<std::string, std::string> headers;
            std::istringstream in(raw);
            std::string line;
            while (std::getline(in, line))
            {
                const auto colon = line.find(':');
                if (colon == std::string::npos)
                {
                    continue;
                }
                headers[lower(trim(std::string_view(line).substr(0, colon)))] =
                    trim(std::string_view(line).substr(colon + 1));
            }
            return headers;
        }

        std::chrono::system_clock::time_point parse_time(const std::string &value, const char *format)
        {
            std::tm tm{};
            std::istringstream in(value);
            in >> std::get_time(&tm, format);
            if (in.fail())
            {
                return {};
            }
            return std::chrono::system_clock::from_time_t(timegm(&tm));
        }

        struct Timestamp
        {
            std::string amz_date;
        };

        Timestamp now()
        {
            const auto time = std::time(nullptr);
            std::tm tm{};
            gmtime_r(&time, &tm);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
            return Timestamp{buffer};
        }

        struct Target
        {
            std::string url;
            std::string canonical_path;
            std::string canonical_query;
        };

        Target target_for(const std::string &endpoint, const std::string &bucket, const std::string &key,
                          const std::map<std::string, std::string> &query)
        {
            Target target;
            target.canonical_path = "/" + S3HttpApi::uri_encode(bucket, false);
            if (!key.empty())
            {
                target.canonical_path += "/" + S3HttpApi::uri_encode(key, true);
            }
            for (const auto &[name, value] : query)
            {
                if (!target.canonical_query.empty())
                {
                    target.canonical_query += '&';
                }
                target.canonical_query += S3HttpApi::uri_encode(name, false) + "=" + S3HttpApi::uri_encode(value, false);
            }
            target.url = endpoint + target.canonical_path;
            if (!target.canonical_query.empty())
            {
                target.url += "?" + target.canonical_query;
            }
            return target;
        }

        std::vector<std::string> signed_headers(const S3HttpApi &api, const std::string &host, const std::string &method,
                                                const Target &target, const std::string &payload_hash)
        {
            const std::map<std::string, std::string> headers = {
                {"host", host},
                {"x-amz-content-sha256", payload_hash},
                {"x-amz-date", now().amz_date},
            };
            std::vector<std::string> lines;
            const auto authorization =
                api.authorization(method, target.canonical_path, target.canonical_query, headers, payload_hash);
            if (!authorization.empty())
            {
                lines.push_back("Authorization: " + authorization);
            }
            for (const auto &[name, value] : headers)
            {
                lines.push_back(name + ": " + value);
            }
            return lines;
        }

        // Streams a GET body through a bounded channel filled by a curl thread.
        class CurlStreamReader : public Reader
        {
        public:
            CurlStreamReader(std::string url, std::vector<std::string> headers, std::string host, std::string what)
                : url_(std::move(url)), headers_(std::move(headers)), host_(std::move(host)), what_(std::move(what)),
                  chunks_(kStreamDepth)
            {
                worker_ = std::thread([this]
                                      { run(); });
            }

            ~CurlStreamReader() override
            {
                chunks_.close();
                if (worker_.joinable())
                {
                    worker_.join();
                }
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                while (offset_ >= current_.size())
                {
                    auto chunk = chunks_.receive();
                    if (!chunk)
                    {
                        std::lock_guard lock(mutex_);
                        if (error_)
                        {
                            std::rethrow_exception(error_);
                        }
                        return 0;
                    }
                    current_ = std::move(*chunk);
                    offset_ = 0;
                }
                const auto count = std::min(buffer.size(), current_.size() - offset_);
                std::memcpy(buffer.data(), current_.data() + offset_, count);
                offset_ += count;
                return count;
            }

        private:
            void run()
            {
                try
                {
                    CurlEasy handle;
                    SList headers;
                    for (const auto &line : headers_)
                    {
                        headers.add(line);
                    }
                    handle_ = handle;
                    curl_easy_setopt(handle, CURLOPT_URL, url_.c_str());
                    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
                    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION,
                                     +[](char *data, std::size_t size, std::size_t count, void *userdata) -> std::size_t
                                     { return static_cast<CurlStreamReader *>(userdata)->on_data(data, size * count); });
                    curl_easy_setopt(handle, CURLOPT_WRITEDATA, this);

                    HttpResponse response;
                    response.curl = curl_easy_perform(handle);
                    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.http);
                    response.body = std::move(error_body_);
                    if (response.curl == CURLE_WRITE_ERROR && chunks_.closed())
                    {
                        spdlog::debug("Download of {} abandoned by reader", url_);
                    }
                    else
                    {
                        check(response, host_, what_);
                    }
                }
                catch (const std::exception &)
                {
                    std::lock_guard lock(mutex_);
                    error_ = std::current_exception();
                }
                chunks_.close();
            }

            std::size_t on_data(const char *data, std::size_t length)
            {
                if (status_ == 0)
                {
                    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status_);
                }
                if (status_ / 100 != 2)
                {
                    error_body_.append(data, length);
                    return length;
                }
                return chunks_.send(std::string(data, length)) ? length : 0;
            }

            std::string url_;
            std::vector<std::string> headers_;
            std::string host_;
            std::string what_;
            CURL *handle_{nullptr};
            long status_{0};
            std::string error_body_;
            Channel<std::string> chunks_;
            std::string current_;
            std::size_t offset_{0};
            std::mutex mutex_;
            std::exception_ptr error_;
            std::thread worker_;
        };

        struct UploadSource
        {
            Reader *reader;
            std::uint64_t remaining;
            std::exception_ptr error;
        };

    } // namespace

    S3HttpApi::S3HttpApi(std::string endpoint, Credentials credentials)
        : endpoint_(std::move(endpoint)), credentials_(std::move(credentials))
    {
        if (endpoint_.find("://") == std::string::npos)
        {
            throw Error(ErrorCode::ClientInit, "Invalid object-store endpoint '" + endpoint_ + "'");
        }
        ensure_curl_global_init();
    }

    std::string S3HttpApi::host_header() const
    {
        return endpoint_.substr(endpoint_.find("://") + 3);
    }

    std::string S3HttpApi::uri_encode(std::string_view value, bool keep_slashes)
    {
        std::ostringstream out;
        out << std::hex << std::uppercase << std::setfill('0');
        for (const unsigned char c : value)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slashes && c == '/'))
            {
                out << static_cast<char>(c);
            }
            else
            {
                out << '%' << std::setw(2) << static_cast<int>(c);
            }
        }
        return out.str();
    }

    std::string S3HttpApi::authorization(const std::string &method, const std::string &canonical_path,
                                         const std::string &canonical_query,
                                         const std::map<std::string, std::string> &headers,
                                         const std::string &payload_hash) const
    {
        if (credentials_.anonymous())
        {
            return {};
        }
        const auto &amz_date = headers.at("x-amz-date");
        const auto date_stamp = amz_date.substr(0, 8);

        std::string canonical_headers;
        std::string signed_names;
        for (auto it = headers.begin(); it != headers.end(); ++it)
        {
            canonical_headers += it->first + ":" + it->second + "\n";
            signed_names += it->first;
            if (std::next(it) != headers.end())
            {
                signed_names += ";";
            }
        }

        std::ostringstream canonical_request;
        canonical_request << method << "\n"
                          << canonical_path << "\n"
                          << canonical_query << "\n"
                          << canonical_headers << "\n"
                          << signed_names << "\n"
                          << payload_hash;

        const auto scope = date_stamp + "/" + credentials_.region + "/" + kService + "/aws4_request";
        const auto string_to_sign = std::string(kAlgorithm) + "\n" + amz_date + "\n" + scope + "\n" +
                                    crypto::sha256_hex(canonical_request.str());

        const auto date_key = crypto::hmac_sha256_raw("AWS4" + credentials_.secret_key, date_stamp);
        const auto region_key = crypto::hmac_sha256_raw(date_key, credentials_.region);
        const auto service_key = crypto::hmac_sha256_raw(region_key, kService);
        const auto signing_key = crypto::hmac_sha256_raw(service_key, "aws4_request");
        const auto signature = crypto::hmac_sha256_hex(signing_key, string_to_sign);

        return std::string(kAlgorithm) + " Credential=" + credentials_.access_key + "/" + scope +
               ", SignedHeaders=" + signed_names + ", Signature=" + signature;
    }

    ObjectInfo S3HttpApi::head(const std::string &bucket, const std::string &key)
    {
        const auto target = target_for(endpoint_, bucket, key, {});
        SList headers;
        for (auto &line : signed_headers(*this, host_header(), "HEAD", target, crypto::sha256_hex("")))
        {
            headers.add(std::move(line));
        }
        const auto response = perform([&](CURL *handle)
                                      {
            curl_easy_setopt(handle, CURLOPT_URL, target.url.c_str());
            curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get()); });
        check(response, host_header(), "HEAD " + target.canonical_path);

        const auto values = parse_headers(response.headers);
        ObjectInfo info;
        info.key = key;
        if (const auto it = values.find("content-length"); it != values.end())
        {
            info.size = std::stoull(it->second);
        }
        if (const auto it = values.find("etag"); it != values.end())
        {
            info.etag = it->second;
        }
        if (const auto it = values.find("last-modified"); it != values.end())
        {
            info.modified = parse_time(it->second, "%a, %d %b %Y %H:%M:%S");
        }
        constexpr std::string_view kMetaPrefix = "x-amz-meta-";
        for (const auto &[name, value] : values)
        {
            if (name.starts_with(kMetaPrefix))
            {
                info.metadata[name.substr(kMetaPrefix.size())] = value;
            }
        }
        return info;
    }

    bool S3HttpApi::bucket_exists(const std::string &bucket)
    {
        const auto target = target_for(endpoint_, bucket, {}, {});
        SList headers;
        for (auto &line : signed_headers(*this, host_header(), "HEAD", target, crypto::sha256_hex("")))
        {
            headers.add(std::move(line));
        }
        const auto response = perform([&](CURL *handle)
                                      {
            curl_easy_setopt(handle, CURLOPT_URL, target.url.c_str());
            curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get()); });
        if (response.curl == CURLE_OK && response.http == 404)
        {
            return false;
        }
        check(response, host_header(), "HEAD " + target.canonical_path);
        return true;
    }

    ObjectListPage S3HttpApi::list_objects(const std::string &bucket, const std::string &prefix,
                                           const std::string &delimiter, const std::string &token)
    {
        std::map<std::string, std::string> query = {{"list-type", "2"}, {"prefix", prefix}};
        if (!delimiter.empty())
        {
            query["delimiter"] = delimiter;
        }
        if (!token.empty())
        {
            query["continuation-token"] = token;
        }
        const auto target = target_for(endpoint_, bucket, {}, query);
        SList headers;
        for (auto &line : signed_headers(*this, host_header(), "GET", target, crypto::sha256_hex("")))
        {
            headers.add(std::move(line));
        }
        const auto response = perform([&](CURL *handle)
                                      {
            curl_easy_setopt(handle, CURLOPT_URL, target.url.c_str());
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get()); });
        check(response, host_header(), "LIST " + target.canonical_path);

        pugi::xml_document doc;
        const auto parsed = doc.load_buffer(response.body.data(), response.body.size());
        if (!parsed)
        {
            throw Error(ErrorCode::RemoteError, std::string("Malformed listing: ") + parsed.description());
        }
        const auto root = doc.child("ListBucketResult");
        if (!root)
        {
            throw Error(ErrorCode::RemoteError, "Listing response has no ListBucketResult");
        }

        ObjectListPage page;
        for (const auto content : root.children("Contents"))
        {
            ObjectInfo info;
            info.key = content.child_value("Key");
            info.size = content.child("Size").text().as_ullong();
            info.etag = content.child_value("ETag");
            info.modified = parse_time(content.child_value("LastModified"), "%Y-%m-%dT%H:%M:%S");
            page.objects.push_back(std::move(info));
        }
        for (const auto common : root.children("CommonPrefixes"))
        {
            page.prefixes.emplace_back(common.child_value("Prefix"));
        }
        page.truncated = root.child("IsTruncated").text().as_bool();
        page.next_token = root.child_value("NextContinuationToken");
        return page;
    }

    std::vector<ObjectInfo> S3HttpApi::list_incomplete_uploads(const std::string &bucket, const std::string &prefix)
    {
        std::vector<ObjectInfo> uploads;
        std::string key_marker;
        std::string upload_marker;
        bool truncated = true;
        while (truncated)
        {
            std::map<std::string, std::string> query = {{"uploads", ""}, {"prefix", prefix}};
            if (!key_marker.empty())
            {
                query["key-marker"] = key_marker;
                query["upload-id-marker"] = upload_marker;
            }
            const auto target = target_for(endpoint_, bucket, {}, query);
            SList headers;
            for (auto &line : signed_headers(*this, host_header(), "GET", target, crypto::sha256_hex("")))
            {
                headers.add(std::move(line));
            }
            const auto response = perform([&](CURL *handle)
                                          {
                curl_easy_setopt(handle, CURLOPT_URL, target.url.c_str());
                curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get()); });
            check(response, host_header(), "LIST UPLOADS " + target.canonical_path);

            pugi::xml_document doc;
            if (!doc.load_buffer(response.body.data(), response.body.size()))
            {
                throw Error(ErrorCode::RemoteError, "Malformed multipart upload listing");
            }
            const auto root = doc.child("ListMultipartUploadsResult");
            for (const auto upload : root.children("Upload"))
            {
                ObjectInfo info;
                info.key = upload.child_value("Key");
                info.modified = parse_time(upload.child_value("Initiated"), "%Y-%m-%dT%H:%M:%S");
                uploads.push_back(std::move(info));
            }
            truncated = root.child("IsTruncated").text().as_bool();
            key_marker = root.child_value("NextKeyMarker");
            upload_marker = root.child_value("NextUploadIdMarker");
            if (key_marker.empty())
            {
                truncated = false;
            }
        }
        return uploads;
    }

    std::unique_ptr<Reader> S3HttpApi::get(const std::string &bucket, const std::string &key)
    {
        const auto target = target_for(endpoint_, bucket, key, {});
        auto headers = signed_headers(*this, host_header(), "GET", target, kUnsignedPayload);
        return std::make_unique<CurlStreamReader>(target.url, std::move(headers), host_header(),
                                                  "GET " + target.canonical_path);
    }

    std::string S3HttpApi::put(const std::string &bucket, const std::string &key, Reader &reader, std::uint64_t length)
    {
        const auto target = target_for(endpoint_, bucket, key, {});
        SList headers;
        headers.add("Content-Type: application/octet-stream");
        headers.add("Expect:");
        for (auto &line : signed_headers(*this, host_header(), "PUT", target, kUnsignedPayload))
        {
            headers.add(std::move(line));
        }

        UploadSource source{&reader, length, nullptr};
        const auto response = perform([&](CURL *handle)
                                      {
            curl_easy_setopt(handle, CURLOPT_URL, target.url.c_str());
            curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(length));
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
            curl_easy_setopt(handle, CURLOPT_READDATA, &source);
            curl_easy_setopt(handle, CURLOPT_READFUNCTION,
                             +[](char *buffer, std::size_t size, std::size_t count, void *userdata) -> std::size_t
                             {
                                 auto *upload = static_cast<UploadSource *>(userdata);
                                 if (upload->remaining == 0)
                                 {
                                     return 0;
                                 }
                                 const auto wanted = static_cast<std::size_t>(
                                     std::min<std::uint64_t>(size * count, upload->remaining));
                                 try
                                 {
                                     const auto got = upload->reader->read(
                                         std::span(reinterpret_cast<std::byte *>(buffer), wanted));
                                     if (got == 0)
                                     {
                                         throw Error(ErrorCode::IoError, "Source ended before the declared length");
                                     }
                                     upload->remaining -= got;
                                     return got;
                                 }
                                 catch (const std::exception &)
                                 {
                                     upload->error = std::current_exception();
                                     return CURL_READFUNC_ABORT;
                                 }
                             }); });

        if (source.error)
        {
            std::rethrow_exception(source.error);
        }
        check(response, host_header(), "PUT " + target.canonical_path);

        const auto values = parse_headers(response.headers);
        const auto it = values.find("etag");
        return it == values.end() ? std::string{} : it->second;
    }

    void S3HttpApi::remove(const std::string &bucket, const std::string &key)
    {
        const auto target = target_for(endpoint_, bucket, key, {});
        SList headers;
        for (auto &line : signed_headers(*this, host_header(), "DELETE", target, crypto::sha256_hex("")))
        {
            headers.add(std::move(line));
        }
        const auto response = perform([&](CURL *handle)
                                      {
            curl_easy_setopt(handle, CURLOPT_URL, target.url.c_str());
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
            curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get()); });
        check(response, host_header(), "DELETE " + target.canonical_path);
    }

} // namespace ferry
