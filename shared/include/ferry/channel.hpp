/**
 * Ferry - Closable multi-producer/multi-consumer queue used between worker threads.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace ferry
{

    // capacity == 0 means unbounded. After close() senders are refused and receivers drain what is left.
    template <typename T>
    class Channel
    {
    public:
        explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

        Channel(const Channel &) = delete;
        Channel &operator=(const Channel &) = delete;

        bool send(T value)
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]
                           { return closed_ || capacity_ == 0 || queue_.size() < capacity_; });
            if (closed_)
            {
                return false;
            }
            queue_.push_back(std::move(value));
            not_empty_.notify_one();
            return true;
        }

        std::optional<T> receive()
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this]
                            { return closed_ || !queue_.empty(); });
            return pop_locked();
        }

        template <typename Rep, typename Period>
        std::optional<T> receive_for(const std::chrono::duration<Rep, Period> &timeout)
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait_for(lock, timeout, [this]
                                { return closed_ || !queue_.empty(); });
            return pop_locked();
        }

        std::optional<T> try_receive()
        {
            std::lock_guard lock(mutex_);
            return pop_locked();
        }

        void close()
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            not_empty_.notify_all();
            not_full_.notify_all();
        }

        bool closed() const
        {
            std::lock_guard lock(mutex_);
            return closed_;
        }

        // True once closed and fully drained: a receive would return immediately with nothing.
        bool exhausted() const
        {
            std::lock_guard lock(mutex_);
            return closed_ && queue_.empty();
        }

    private:
        std::optional<T> pop_locked()
        {
            if (queue_.empty())
            {
                return std::nullopt;
            }
            T value = std::move(queue_.front());
            queue_.pop_front();
            not_full_.notify_one();
            return value;
        }

        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        std::deque<T> queue_;
        bool closed_{false};
    };

} // namespace ferry
