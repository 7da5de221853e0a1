/**
 * Ferry - Storage client capability set shared by the filesystem and object-store backends.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "ferry/channel.hpp"
#include "ferry/url.hpp"

namespace ferry
{

    struct Content
    {
        std::string url;
        // Relative to the URL the client is bound to; empty for the bound object itself.
        std::string key;
        std::uint64_t size{};
        std::chrono::system_clock::time_point modified{};
        bool is_directory{};
        std::string etag;
        std::map<std::string, std::string> metadata;
    };

    // One listing step. A failed entry carries its error and does not end the sequence.
    struct ListEntry
    {
        Content content;
        std::exception_ptr error;
    };

    struct ListOptions
    {
        bool recursive{};
        bool include_incomplete{};
        bool include_directories{};
    };

    // Lazy listing ordered lexicographically by key. Calling StorageClient::list again restarts it.
    class ContentStream
    {
    public:
        virtual ~ContentStream() = default;

        virtual std::optional<ListEntry> next() = 0;
    };

    class VectorContentStream : public ContentStream
    {
    public:
        explicit VectorContentStream(std::vector<ListEntry> entries);

        std::optional<ListEntry> next() override;

    private:
        std::vector<ListEntry> entries_;
        std::size_t position_{0};
    };

    // Runs the listing on a background thread that fills a bounded channel.
    std::unique_ptr<ContentStream> prefetch(std::unique_ptr<ContentStream> stream, std::size_t capacity = 1000);

    class Reader
    {
    public:
        virtual ~Reader() = default;

        // Returns 0 at end of stream.
        virtual std::size_t read(std::span<std::byte> buffer) = 0;
    };

    class StringReader : public Reader
    {
    public:
        explicit StringReader(std::string data);

        std::size_t read(std::span<std::byte> buffer) override;

    private:
        std::string data_;
        std::size_t offset_{0};
    };

    struct PutResult
    {
        std::uint64_t bytes{};
        std::string etag;
    };

    enum class EventType
    {
        Created,
        Removed
    };

    std::string_view to_string(EventType type) noexcept;

    struct Event
    {
        std::string path;
        std::string client_url;
        EventType type{EventType::Created};
        std::chrono::system_clock::time_point time{};
        std::uint64_t size{};
    };

    using WatchMessage = std::variant<Event, std::exception_ptr>;

    struct WatchOptions
    {
        bool recursive{};
    };

    // A live subscription. close() stops the producer and closes messages().
    class WatchSubscription
    {
    public:
        virtual ~WatchSubscription() = default;

        virtual Channel<WatchMessage> &messages() = 0;

        virtual void close() = 0;
    };

    class WatchCapability
    {
    public:
        virtual ~WatchCapability() = default;

        virtual std::unique_ptr<WatchSubscription> watch(const WatchOptions &options) = 0;
    };

    class StorageClient
    {
    public:
        virtual ~StorageClient() = default;

        virtual const ResolvedUrl &url() const = 0;

        // Throws ferry::Error(NotFound) when nothing exists at the URL.
        virtual Content stat() = 0;

        virtual std::unique_ptr<ContentStream> list(const ListOptions &options) = 0;

        virtual std::unique_ptr<Reader> get() = 0;

        // Writes exactly `length` bytes from reader to the bound URL.
        virtual PutResult put(Reader &reader, std::uint64_t length) = 0;

        virtual void remove() = 0;

        // nullptr when the backend cannot watch.
        virtual WatchCapability *watch_capability() noexcept { return nullptr; }

        // True when put() returns the MD5 of the written bytes as ETag.
        virtual bool returns_md5_etag() const noexcept { return false; }
    };

} // namespace ferry
