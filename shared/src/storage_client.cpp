#include "ferry/storage_client.hpp"

#include <algorithm>
#include <cstring>
#include <thread>
#include <utility>

namespace ferry
{

    namespace
    {

        class PrefetchedContentStream : public ContentStream
        {
        public:
            PrefetchedContentStream(std::unique_ptr<ContentStream> source, std::size_t capacity)
                : source_(std::move(source)), channel_(capacity)
            {
                worker_ = std::thread([this]
                                      { pump(); });
            }

            ~PrefetchedContentStream() override
            {
                channel_.close();
                if (worker_.joinable())
                {
                    worker_.join();
                }
            }

            std::optional<ListEntry> next() override
            {
                return channel_.receive();
            }

        private:
            void pump()
            {
                try
                {
                    while (auto entry = source_->next())
                    {
                        if (!channel_.send(std::move(*entry)))
                        {
                            return;
                        }
                    }
                }
                catch (const std::exception &)
                {
                    channel_.send(ListEntry{{}, std::current_exception()});
                }
                channel_.close();
            }

            std::unique_ptr<ContentStream> source_;
            Channel<ListEntry> channel_;
            std::thread worker_;
        };

    } // namespace

    VectorContentStream::VectorContentStream(std::vector<ListEntry> entries) : entries_(std::move(entries)) {}

    std::optional<ListEntry> VectorContentStream::next()
    {
        if (position_ >= entries_.size())
        {
            return std::nullopt;
        }
        return entries_[position_++];
    }

    std::unique_ptr<ContentStream> prefetch(std::unique_ptr<ContentStream> stream, std::size_t capacity)
    {
        return std::make_unique<PrefetchedContentStream>(std::move(stream), capacity);
    }

    StringReader::StringReader(std::string data) : data_(std::move(data)) {}

    std::size_t StringReader::read(std::span<std::byte> buffer)
    {
        const auto count = std::min(buffer.size(), data_.size() - offset_);
        if (count > 0)
        {
            std::memcpy(buffer.data(), data_.data() + offset_, count);
            offset_ += count;
        }
        return count;
    }

    std::string_view to_string(EventType type) noexcept
    {
        return type == EventType::Created ? "ObjectCreated" : "ObjectRemoved";
    }

} // namespace ferry
