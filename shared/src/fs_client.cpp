#include "ferry/fs_client.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <fstream>
#include <map>
#include <thread>
#include <unordered_map>
#include <vector>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {
        constexpr std::size_t kBufferSize = 256 * 1024;
        constexpr int kPollIntervalMs = 200;
        constexpr std::uint32_t kWatchMask =
            IN_CREATE | IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF;

        std::chrono::system_clock::time_point to_system_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            return time_point_cast<system_clock::duration>(time - std::filesystem::file_time_type::clock::now() +
                                                           system_clock::now());
        }

        std::string join_key(const std::string &prefix, const std::string &name)
        {
            return prefix.empty() ? name : prefix + "/" + name;
        }

        std::exception_ptr io_error(const std::string &what, const std::filesystem::path &path, const std::error_code &ec)
        {
            return std::make_exception_ptr(Error(ErrorCode::IoError, what + " " + path.string() + ": " + ec.message()));
        }

        class FileReader : public Reader
        {
        public:
            explicit FileReader(const std::filesystem::path &path) : path_(path), in_(path, std::ios::binary)
            {
                if (!in_.is_open())
                {
                    throw Error(ErrorCode::IoError, "Unable to open " + path.string() + " for reading");
                }
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                in_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (in_.bad())
                {
                    throw Error(ErrorCode::IoError, "Read failed on " + path_.string());
                }
                return static_cast<std::size_t>(in_.gcount());
            }

        private:
            std::filesystem::path path_;
            std::ifstream in_;
        };

        // Walks a directory in byte order of the relative key. Directories are only read once they become
        // the smallest pending key, so "a", "a.txt", "a/b" come out in that order.
        class FilesystemContentStream : public ContentStream
        {
        public:
            FilesystemContentStream(const std::filesystem::path &root, ListOptions options)
                : options_(options)
            {
                expand(root, "");
            }

            std::optional<ListEntry> next() override
            {
                if (!errors_.empty())
                {
                    auto entry = std::move(errors_.front());
                    errors_.pop_front();
                    return entry;
                }
                while (!frontier_.empty())
                {
                    auto node = frontier_.extract(frontier_.begin());
                    const auto &key = node.key();
                    const auto &path = node.mapped();

                    Content content;
                    content.url = path.string();
                    content.key = key;

                    std::error_code ec;
                    const auto status = std::filesystem::status(path, ec);
                    if (ec)
                    {
                        return ListEntry{std::move(content), io_error("Unable to stat", path, ec)};
                    }
                    content.modified = to_system_time(std::filesystem::last_write_time(path, ec));

                    if (std::filesystem::is_directory(status))
                    {
                        content.is_directory = true;
                        if (options_.recursive)
                        {
                            if (std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec)))
                            {
                                spdlog::debug("Not descending into symlinked directory {}", path.string());
                            }
                            else
                            {
                                expand(path, key);
                            }
                            if (!options_.include_directories)
                            {
                                if (!errors_.empty())
                                {
                                    return next();
                                }
                                continue;
                            }
                        }
                        return ListEntry{std::move(content), nullptr};
                    }
                    if (!std::filesystem::is_regular_file(status))
                    {
                        continue;
                    }
                    if (!options_.include_incomplete && key.ends_with(kPartSuffix))
                    {
                        continue;
                    }
                    content.size = std::filesystem::file_size(path, ec);
                    if (ec)
                    {
                        return ListEntry{std::move(content), io_error("Unable to size", path, ec)};
                    }
                    return ListEntry{std::move(content), nullptr};
                }
                return std::nullopt;
            }

        private:
            void expand(const std::filesystem::path &directory, const std::string &prefix)
            {
                std::error_code ec;
                std::filesystem::directory_iterator it(directory, ec);
                if (ec)
                {
                    errors_.push_back(ListEntry{Content{.url = directory.string(), .key = prefix},
                                                io_error("Unable to read directory", directory, ec)});
                    return;
                }
                for (const std::filesystem::directory_iterator end; it != end; it.increment(ec))
                {
                    if (ec)
                    {
                        errors_.push_back(ListEntry{Content{.url = directory.string(), .key = prefix},
                                                    io_error("Unable to read directory", directory, ec)});
                        return;
                    }
                    frontier_.emplace(join_key(prefix, it->path().filename().string()), it->path());
                }
            }

            ListOptions options_;
            std::map<std::string, std::filesystem::path> frontier_;
            std::deque<ListEntry> errors_;
        };

        class InotifySubscription : public WatchSubscription
        {
        public:
            InotifySubscription(std::filesystem::path root, bool recursive, std::string client_url)
                : root_(std::move(root)), recursive_(recursive), client_url_(std::move(client_url))
            {
                fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
                if (fd_ < 0)
                {
                    throw Error(ErrorCode::IoError, "Unable to initialize inotify");
                }
                try
                {
                    add_tree(root_);
                }
                catch (const Error &)
                {
                    ::close(fd_);
                    throw;
                }
                worker_ = std::thread([this]
                                      { loop(); });
            }

            ~InotifySubscription() override
            {
                close();
            }

            Channel<WatchMessage> &messages() override { return messages_; }

            void close() override
            {
                if (stopping_.exchange(true))
                {
                    return;
                }
                if (worker_.joinable())
                {
                    worker_.join();
                }
                ::close(fd_);
                messages_.close();
                spdlog::debug("Stopped watching {}", root_.string());
            }

        private:
            void add_watch(const std::filesystem::path &directory)
            {
                const int wd = inotify_add_watch(fd_, directory.c_str(), kWatchMask);
                if (wd < 0)
                {
                    throw Error(ErrorCode::IoError, "Unable to watch " + directory.string());
                }
                directories_[wd] = directory;
            }

            void add_tree(const std::filesystem::path &directory)
            {
                add_watch(directory);
                if (!recursive_)
                {
                    return;
                }
                std::error_code ec;
                for (std::filesystem::recursive_directory_iterator it(directory, ec), end; !ec && it != end;
                     it.increment(ec))
                {
                    if (it->is_directory(ec) && !it->is_symlink(ec))
                    {
                        add_watch(it->path());
                    }
                }
                if (ec)
                {
                    throw Error(ErrorCode::IoError, "Unable to walk " + directory.string() + ": " + ec.message());
                }
            }

            void loop()
            {
                std::vector<char> buffer(64 * 1024);
                while (!stopping_)
                {
                    pollfd descriptor{fd_, POLLIN, 0};
                    const int ready = ::poll(&descriptor, 1, kPollIntervalMs);
                    if (ready < 0)
                    {
                        if (errno == EINTR)
                        {
                            continue;
                        }
                        messages_.send(std::make_exception_ptr(Error(ErrorCode::IoError, "inotify poll failed")));
                        return;
                    }
                    if (ready == 0)
                    {
                        continue;
                    }
                    const auto length = ::read(fd_, buffer.data(), buffer.size());
                    if (length <= 0)
                    {
                        continue;
                    }
                    dispatch(buffer.data(), static_cast<std::size_t>(length));
                }
            }

            void dispatch(const char *data, std::size_t length)
            {
                std::size_t offset = 0;
                while (offset + sizeof(inotify_event) <= length)
                {
                    const auto *raw = reinterpret_cast<const inotify_event *>(data + offset);
                    offset += sizeof(inotify_event) + raw->len;

                    if ((raw->mask & IN_IGNORED) != 0)
                    {
                        directories_.erase(raw->wd);
                        continue;
                    }
                    const auto it = directories_.find(raw->wd);
                    if (it == directories_.end())
                    {
                        continue;
                    }
                    const auto path = raw->len > 0 ? it->second / raw->name : it->second;
                    const bool is_directory = (raw->mask & IN_ISDIR) != 0;

                    if (is_directory && (raw->mask & (IN_CREATE | IN_MOVED_TO)) != 0)
                    {
                        if (recursive_)
                        {
                            try
                            {
                                add_tree(path);
                            }
                            catch (const Error &)
                            {
                                messages_.send(std::current_exception());
                            }
                        }
                        continue;
                    }
                    if (is_directory)
                    {
                        continue;
                    }

                    Event event;
                    event.path = path.string();
                    event.client_url = client_url_;
                    event.time = std::chrono::system_clock::now();
                    if ((raw->mask & (IN_CLOSE_WRITE | IN_MOVED_TO)) != 0)
                    {
                        std::error_code ec;
                        event.type = EventType::Created;
                        event.size = std::filesystem::file_size(path, ec);
                        if (ec)
                        {
                            event.size = 0;
                        }
                    }
                    else if ((raw->mask & (IN_DELETE | IN_MOVED_FROM)) != 0)
                    {
                        event.type = EventType::Removed;
                    }
                    else
                    {
                        continue;
                    }
                    messages_.send(std::move(event));
                }
            }

            std::filesystem::path root_;
            bool recursive_;
            std::string client_url_;
            int fd_{-1};
            std::unordered_map<int, std::filesystem::path> directories_;
            Channel<WatchMessage> messages_;
            std::atomic<bool> stopping_{false};
            std::thread worker_;
        };

    } // namespace

    FilesystemClient::FilesystemClient(ResolvedUrl url) : url_(std::move(url)), path_(url_.path)
    {
        if (url_.type != UrlType::Filesystem)
        {
            throw Error(ErrorCode::ClientInit, "Not a filesystem URL: " + url_.to_string());
        }
    }

    Content FilesystemClient::stat()
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path_, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw Error(ErrorCode::NotFound, "No such file or directory: " + path_.string());
        }
        Content content;
        content.url = path_.string();
        content.is_directory = std::filesystem::is_directory(status);
        content.modified = to_system_time(std::filesystem::last_write_time(path_, ec));
        if (!content.is_directory)
        {
            content.size = std::filesystem::file_size(path_, ec);
        }
        if (ec)
        {
            throw Error(ErrorCode::IoError, "Unable to stat " + path_.string() + ": " + ec.message());
        }
        return content;
    }

    std::unique_ptr<ContentStream> FilesystemClient::list(const ListOptions &options)
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path_, ec);
        if (ec || !std::filesystem::exists(status))
        {
            std::vector<ListEntry> entries;
            entries.push_back(ListEntry{Content{.url = path_.string()},
                                        std::make_exception_ptr(Error(ErrorCode::NotFound,
                                                                      "No such file or directory: " + path_.string()))});
            return std::make_unique<VectorContentStream>(std::move(entries));
        }
        if (!std::filesystem::is_directory(status))
        {
            auto content = stat();
            content.key = path_.filename().string();
            std::vector<ListEntry> entries;
            entries.push_back(ListEntry{std::move(content), nullptr});
            return std::make_unique<VectorContentStream>(std::move(entries));
        }
        return std::make_unique<FilesystemContentStream>(path_, options);
    }

    std::unique_ptr<Reader> FilesystemClient::get()
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path_, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw Error(ErrorCode::NotFound, "No such file: " + path_.string());
        }
        if (std::filesystem::is_directory(status))
        {
            throw Error(ErrorCode::InvalidArgument, "Cannot read a directory: " + path_.string());
        }
        return std::make_unique<FileReader>(path_);
    }

    PutResult FilesystemClient::put(Reader &reader, std::uint64_t length)
    {
        std::error_code ec;
        if (std::filesystem::is_directory(path_, ec))
        {
            throw Error(ErrorCode::InvalidArgument, "Target is a directory: " + path_.string());
        }
        const auto parent = path_.parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw Error(ErrorCode::IoError, "Unable to create " + parent.string() + ": " + ec.message());
            }
        }

        auto temp_path = path_;
        temp_path += std::string(kPartSuffix);
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw Error(ErrorCode::IoError, "Unable to open " + temp_path.string() + " for writing");
        }

        std::vector<std::byte> buffer(kBufferSize);
        std::uint64_t written = 0;
        try
        {
            while (written < length)
            {
                const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), length - written));
                const auto count = reader.read(std::span(buffer.data(), wanted));
                if (count == 0)
                {
                    break;
                }
                out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(count));
                if (!out)
                {
                    throw Error(ErrorCode::IoError, "Write failed on " + temp_path.string());
                }
                written += count;
            }
            out.close();
            if (written != length)
            {
                throw Error(ErrorCode::IoError, "Short read for " + path_.string() + ": expected " +
                                                    std::to_string(length) + " bytes, got " + std::to_string(written));
            }
        }
        catch (const std::exception &)
        {
            out.close();
            std::filesystem::remove(temp_path, ec);
            throw;
        }

        std::filesystem::rename(temp_path, path_, ec);
        if (ec)
        {
            std::error_code cleanup;
            std::filesystem::remove(temp_path, cleanup);
            throw Error(ErrorCode::IoError, "Unable to move " + temp_path.string() + " into place: " + ec.message());
        }
        return PutResult{.bytes = written, .etag = {}};
    }

    void FilesystemClient::remove()
    {
        std::error_code ec;
        if (!std::filesystem::remove(path_, ec))
        {
            if (ec)
            {
                throw Error(ErrorCode::IoError, "Unable to remove " + path_.string() + ": " + ec.message());
            }
            throw Error(ErrorCode::NotFound, "No such file: " + path_.string());
        }
    }

    std::unique_ptr<WatchSubscription> FilesystemClient::watch(const WatchOptions &options)
    {
        if (!std::filesystem::is_directory(path_))
        {
            throw Error(ErrorCode::InvalidArgument, "Can only watch directories: " + path_.string());
        }
        spdlog::debug("Watching {} (recursive: {})", path_.string(), options.recursive);
        return std::make_unique<InotifySubscription>(path_, options.recursive, url_.to_string());
    }

} // namespace ferry
