/**
 * Ferry - Streaming comparison of two URL trees by key, size, type and (optionally) metadata.
 * Content is never read.
 */
#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ferry/storage_client.hpp"

namespace ferry
{

    // Ordinals are part of the JSON output and must not change.
    enum class DiffType : int
    {
        None = 0,
        Size = 1,
        Metadata = 2,
        Type = 3,
        OnlyInFirst = 4,
        OnlyInSecond = 5
    };

    // "differInNone", "differInSize", ...
    std::string_view to_string(DiffType type) noexcept;

    // One-character legend: '<' only in first, '>' only in second, '!' size, '~' metadata, '#' type, ' ' none.
    char legend(DiffType type) noexcept;

    struct DiffOptions
    {
        bool compare_metadata{};
        // Also emit keys that do not differ (DiffType::None).
        bool return_similar{};
    };

    struct DiffResult
    {
        std::string key;
        std::optional<std::string> first_url;
        std::optional<std::string> second_url;
        DiffType type{DiffType::None};
        std::optional<Content> first;
        std::optional<Content> second;
        // Set when a listing entry failed; the comparison goes on with the next entry.
        std::exception_ptr error;
    };

    // Sorted merge-join of two key-ordered listings. Directories only take part in type conflicts.
    class DiffStream
    {
    public:
        DiffStream(std::unique_ptr<ContentStream> first, std::unique_ptr<ContentStream> second, DiffOptions options);

        std::optional<DiffResult> next();

    private:
        // Fills the lookahead of one side. Returns an error result instead when the next entry failed.
        std::optional<DiffResult> advance(ContentStream &stream, std::optional<Content> &head, bool &done, bool first);

        std::unique_ptr<ContentStream> first_stream_;
        std::unique_ptr<ContentStream> second_stream_;
        DiffOptions options_;
        std::optional<Content> first_;
        std::optional<Content> second_;
        bool first_done_{false};
        bool second_done_{false};
    };

    // Lists both clients recursively, each on its own prefetching thread, and compares them.
    std::unique_ptr<DiffStream> diff(StorageClient &first, StorageClient &second, const DiffOptions &options);

} // namespace ferry
