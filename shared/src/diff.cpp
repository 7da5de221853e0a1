#include "ferry/diff.hpp"

#include <array>
#include <utility>

namespace ferry
{

    namespace
    {
        constexpr std::array<std::string_view, 6> kDiffNames = {"differInNone", "differInSize", "differInMetadata",
                                                                "differInType", "differInFirst", "differInSecond"};
        constexpr std::array<char, 6> kLegend = {' ', '!', '~', '#', '<', '>'};

        DiffResult only_in(DiffType type, Content content)
        {
            DiffResult result;
            result.key = content.key;
            result.type = type;
            if (type == DiffType::OnlyInFirst)
            {
                result.first_url = content.url;
                result.first = std::move(content);
            }
            else
            {
                result.second_url = content.url;
                result.second = std::move(content);
            }
            return result;
        }

    } // namespace

    std::string_view to_string(DiffType type) noexcept
    {
        return kDiffNames[static_cast<std::size_t>(type)];
    }

    char legend(DiffType type) noexcept
    {
        return kLegend[static_cast<std::size_t>(type)];
    }

    DiffStream::DiffStream(std::unique_ptr<ContentStream> first, std::unique_ptr<ContentStream> second,
                           DiffOptions options)
        : first_stream_(std::move(first)), second_stream_(std::move(second)), options_(options)
    {
    }

    std::optional<DiffResult> DiffStream::advance(ContentStream &stream, std::optional<Content> &head, bool &done,
                                                  bool first)
    {
        if (head || done)
        {
            return std::nullopt;
        }
        auto entry = stream.next();
        if (!entry)
        {
            done = true;
            return std::nullopt;
        }
        if (entry->error)
        {
            DiffResult result;
            result.key = entry->content.key;
            (first ? result.first_url : result.second_url) = entry->content.url;
            result.error = entry->error;
            return result;
        }
        head = std::move(entry->content);
        return std::nullopt;
    }

    std::optional<DiffResult> DiffStream::next()
    {
        while (true)
        {
            if (auto failed = advance(*first_stream_, first_, first_done_, true))
            {
                return failed;
            }
            if (auto failed = advance(*second_stream_, second_, second_done_, false))
            {
                return failed;
            }
            if (!first_ && !second_)
            {
                return std::nullopt;
            }

            if (!second_ || (first_ && first_->key < second_->key))
            {
                auto content = std::move(*first_);
                first_.reset();
                if (content.is_directory)
                {
                    continue;
                }
                return only_in(DiffType::OnlyInFirst, std::move(content));
            }
            if (!first_ || second_->key < first_->key)
            {
                auto content = std::move(*second_);
                second_.reset();
                if (content.is_directory)
                {
                    continue;
                }
                return only_in(DiffType::OnlyInSecond, std::move(content));
            }

            auto a = std::move(*first_);
            auto b = std::move(*second_);
            first_.reset();
            second_.reset();
            if (a.is_directory && b.is_directory)
            {
                continue;
            }

            DiffResult result;
            result.key = a.key;
            result.first_url = a.url;
            result.second_url = b.url;
            if (a.is_directory != b.is_directory)
            {
                result.type = DiffType::Type;
            }
            else if (a.size != b.size)
            {
                result.type = DiffType::Size;
            }
            else if (options_.compare_metadata && a.metadata != b.metadata)
            {
                result.type = DiffType::Metadata;
            }
            result.first = std::move(a);
            result.second = std::move(b);
            if (result.type == DiffType::None && !options_.return_similar)
            {
                continue;
            }
            return result;
        }
    }

    std::unique_ptr<DiffStream> diff(StorageClient &first, StorageClient &second, const DiffOptions &options)
    {
        const ListOptions listing{.recursive = true, .include_incomplete = false, .include_directories = true};
        return std::make_unique<DiffStream>(prefetch(first.list(listing)), prefetch(second.list(listing)), options);
    }

} // namespace ferry
