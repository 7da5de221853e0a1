#include "ferry/transfer.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <thread>

#include "ferry/channel.hpp"
#include "ferry/crypto.hpp"

namespace ferry
{

    namespace
    {
        constexpr std::size_t kChunkSize = 128 * 1024;
        constexpr std::size_t kHashQueueDepth = 16;
        constexpr std::size_t kFanOutQueueDepth = 8;
        constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

        using Chunk = std::shared_ptr<const std::vector<std::byte>>;

        // Hashes chunks handed over by the writer on its own thread. digest() joins it.
        class HashTee
        {
        public:
            HashTee() : chunks_(kHashQueueDepth)
            {
                worker_ = std::thread([this]
                                      {
                    while (auto chunk = chunks_.receive())
                    {
                        md5_.update(*chunk);
                    } });
            }

            ~HashTee()
            {
                finish();
            }

            void feed(std::span<const std::byte> data)
            {
                chunks_.send(std::vector<std::byte>(data.begin(), data.end()));
            }

            std::string digest()
            {
                finish();
                return md5_.hex_digest();
            }

        private:
            void finish()
            {
                chunks_.close();
                if (worker_.joinable())
                {
                    worker_.join();
                }
            }

            Channel<std::vector<std::byte>> chunks_;
            crypto::Md5 md5_;
            std::thread worker_;
        };

        class VerifyingReader : public Reader
        {
        public:
            VerifyingReader(Reader &inner, const CancelToken &cancel, HashTee *tee)
                : inner_(inner), cancel_(cancel), tee_(tee) {}

            std::size_t read(std::span<std::byte> buffer) override
            {
                cancel_.throw_if_cancelled();
                const auto count = inner_.read(buffer);
                if (tee_ != nullptr && count > 0)
                {
                    tee_->feed(buffer.first(count));
                }
                return count;
            }

        private:
            Reader &inner_;
            const CancelToken &cancel_;
            HashTee *tee_;
        };

        // Error raised while reading the shared source, handed to every target of a fan-out.
        class SourceState
        {
        public:
            void fail(std::exception_ptr error)
            {
                std::lock_guard lock(mutex_);
                error_ = std::move(error);
            }

            std::exception_ptr error() const
            {
                std::lock_guard lock(mutex_);
                return error_;
            }

        private:
            mutable std::mutex mutex_;
            std::exception_ptr error_;
        };

        class ChannelReader : public Reader
        {
        public:
            ChannelReader(Channel<Chunk> &channel, const SourceState &source) : channel_(channel), source_(source) {}

            std::size_t read(std::span<std::byte> buffer) override
            {
                while (!current_ || offset_ >= current_->size())
                {
                    auto chunk = channel_.receive();
                    if (!chunk)
                    {
                        if (auto error = source_.error())
                        {
                            std::rethrow_exception(error);
                        }
                        return 0;
                    }
                    current_ = std::move(*chunk);
                    offset_ = 0;
                }
                const auto count = std::min(buffer.size(), current_->size() - offset_);
                std::memcpy(buffer.data(), current_->data() + offset_, count);
                offset_ += count;
                return count;
            }

        private:
            Channel<Chunk> &channel_;
            const SourceState &source_;
            Chunk current_;
            std::size_t offset_{0};
        };

        void pump(StorageClient &source, std::vector<std::unique_ptr<Channel<Chunk>>> &channels, SourceState &state,
                  const CancelToken &cancel)
        {
            try
            {
                auto reader = source.get();
                std::vector<std::byte> buffer(kChunkSize);
                while (true)
                {
                    cancel.throw_if_cancelled();
                    const auto count = reader->read(buffer);
                    if (count == 0)
                    {
                        break;
                    }
                    auto chunk = std::make_shared<const std::vector<std::byte>>(buffer.begin(), buffer.begin() + count);
                    bool delivered = false;
                    for (auto &channel : channels)
                    {
                        delivered = channel->send(chunk) || delivered;
                    }
                    if (!delivered)
                    {
                        break;
                    }
                }
            }
            catch (const std::exception &)
            {
                state.fail(std::current_exception());
            }
            for (auto &channel : channels)
            {
                channel->close();
            }
        }

    } // namespace

    void CancelToken::throw_if_cancelled() const
    {
        if (cancelled())
        {
            throw Error(ErrorCode::Interrupted, "Transfer interrupted");
        }
    }

    void CancelToken::wait(std::chrono::milliseconds duration) const
    {
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (!cancelled())
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                return;
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(kCancelPollInterval, deadline - now));
        }
    }

    std::string normalize_etag(std::string_view etag)
    {
        while (!etag.empty() && (etag.front() == '"' || etag.front() == ' '))
        {
            etag.remove_prefix(1);
        }
        while (!etag.empty() && (etag.back() == '"' || etag.back() == ' '))
        {
            etag.remove_suffix(1);
        }
        std::string result(etag);
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    PutResult put_verified(Reader &reader, StorageClient &target, std::uint64_t length, const CancelToken &cancel)
    {
        if (!target.returns_md5_etag())
        {
            VerifyingReader verifying(reader, cancel, nullptr);
            return target.put(verifying, length);
        }

        HashTee tee;
        VerifyingReader verifying(reader, cancel, &tee);
        auto result = target.put(verifying, length);
        const auto local = tee.digest();

        const auto remote = normalize_etag(result.etag);
        if (remote.empty() || remote.find('-') != std::string::npos)
        {
            spdlog::debug("No single-part ETag for {}, skipping checksum", target.url().to_string());
            return result;
        }
        if (remote != local)
        {
            spdlog::error("Checksum mismatch on {}: local md5 {} remote etag {}", target.url().to_string(), local,
                          remote);
            throw Error(ErrorCode::IntegrityMismatch,
                        "Checksum mismatch for " + target.url().to_string() + ": expected " + local + ", got " + remote);
        }
        return result;
    }

    TransferExecutor::TransferExecutor(RetryPolicy policy, CancelToken cancel)
        : policy_(policy), cancel_(std::move(cancel)) {}

    PutResult TransferExecutor::copy(StorageClient &source, StorageClient &target, std::uint64_t length)
    {
        const auto what = "copy " + source.url().to_string() + " -> " + target.url().to_string();
        return with_retry(policy_, cancel_, what, [&](int)
                          {
            auto reader = source.get();
            return put_verified(*reader, target, length, cancel_); });
    }

    std::vector<TargetOutcome> TransferExecutor::copy(StorageClient &source, std::span<StorageClient *const> targets,
                                                      std::uint64_t length)
    {
        std::vector<TargetOutcome> outcomes(targets.size());
        if (targets.empty())
        {
            return outcomes;
        }
        if (targets.size() == 1)
        {
            try
            {
                outcomes[0].result = copy(source, *targets[0], length);
            }
            catch (const std::exception &)
            {
                outcomes[0].error = std::current_exception();
            }
            return outcomes;
        }

        std::vector<std::unique_ptr<Channel<Chunk>>> channels;
        channels.reserve(targets.size());
        for (std::size_t i = 0; i < targets.size(); ++i)
        {
            channels.push_back(std::make_unique<Channel<Chunk>>(kFanOutQueueDepth));
        }
        SourceState state;

        std::vector<std::thread> workers;
        workers.reserve(targets.size());
        for (std::size_t i = 0; i < targets.size(); ++i)
        {
            workers.emplace_back([&, i]
                                 {
                auto &target = *targets[i];
                auto &channel = *channels[i];
                const auto what = "copy " + source.url().to_string() + " -> " + target.url().to_string();
                try
                {
                    outcomes[i].result = with_retry(policy_, cancel_, what, [&](int attempt)
                                                    {
                        if (attempt == 0)
                        {
                            ChannelReader shared(channel, state);
                            try
                            {
                                auto result = put_verified(shared, target, length, cancel_);
                                channel.close();
                                return result;
                            }
                            catch (const std::exception &)
                            {
                                channel.close();
                                throw;
                            }
                        }
                        auto reader = source.get();
                        return put_verified(*reader, target, length, cancel_); });
                }
                catch (const std::exception &)
                {
                    channel.close();
                    outcomes[i].error = std::current_exception();
                } });
        }

        pump(source, channels, state, cancel_);
        for (auto &worker : workers)
        {
            worker.join();
        }
        return outcomes;
    }

} // namespace ferry
