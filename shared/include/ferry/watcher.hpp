/**
 * Ferry - Fans the watch subscriptions of several clients into one event channel and one error channel.
 */
#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "ferry/channel.hpp"
#include "ferry/storage_client.hpp"

namespace ferry
{

    class Watcher
    {
    public:
        Watcher();
        ~Watcher();

        Watcher(const Watcher &) = delete;
        Watcher &operator=(const Watcher &) = delete;

        // Subscribes to the client and starts forwarding its events. Throws Error(NoWatcherCapability) when the
        // client cannot watch. The client must outlive the watcher.
        void join(StorageClient &client, bool recursive);

        // Events in arrival order per client. Closed by stop().
        Channel<Event> &events() { return events_; }

        Channel<std::exception_ptr> &errors() { return errors_; }

        // Closes every subscription, waits for the forwarding threads, then closes events() and errors().
        // Only the first call does anything.
        void stop();

    private:
        void forward(WatchSubscription &subscription);

        Channel<Event> events_;
        Channel<std::exception_ptr> errors_;
        std::mutex mutex_;
        bool stopped_{false};
        std::vector<std::unique_ptr<WatchSubscription>> subscriptions_;
        std::vector<std::thread> listeners_;
    };

} // namespace ferry
