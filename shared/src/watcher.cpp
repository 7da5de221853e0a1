#include "ferry/watcher.hpp"

#include <variant>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"

namespace ferry
{

    Watcher::Watcher() = default;

    Watcher::~Watcher()
    {
        stop();
    }

    void Watcher::join(StorageClient &client, bool recursive)
    {
        auto *capability = client.watch_capability();
        if (capability == nullptr)
        {
            throw Error(ErrorCode::NoWatcherCapability, "Watching is not supported for " + client.url().to_string());
        }

        std::lock_guard lock(mutex_);
        if (stopped_)
        {
            throw Error(ErrorCode::InvalidArgument, "Watcher already stopped");
        }
        auto subscription = capability->watch(WatchOptions{.recursive = recursive});
        auto &ref = *subscription;
        subscriptions_.push_back(std::move(subscription));
        listeners_.emplace_back([this, &ref]
                                { forward(ref); });
        spdlog::info("Watching {}", client.url().to_string());
    }

    void Watcher::forward(WatchSubscription &subscription)
    {
        while (auto message = subscription.messages().receive())
        {
            if (auto *event = std::get_if<Event>(&*message))
            {
                events_.send(std::move(*event));
            }
            else
            {
                errors_.send(std::get<std::exception_ptr>(*message));
            }
        }
    }

    void Watcher::stop()
    {
        std::vector<std::thread> listeners;
        {
            std::lock_guard lock(mutex_);
            if (stopped_)
            {
                return;
            }
            stopped_ = true;
            for (auto &subscription : subscriptions_)
            {
                subscription->close();
            }
            listeners.swap(listeners_);
        }
        for (auto &listener : listeners)
        {
            listener.join();
        }
        events_.close();
        errors_.close();
        spdlog::debug("Watcher stopped");
    }

} // namespace ferry
