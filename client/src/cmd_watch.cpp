#include "ferry/client/commands.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "ferry/client_factory.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/url.hpp"
#include "ferry/watcher.hpp"

namespace ferry::client
{

    namespace
    {
        constexpr auto kPollInterval = std::chrono::milliseconds(200);

        void print_event(const Printer &printer, const Event &event)
        {
            const auto millis =
                std::chrono::duration_cast<std::chrono::milliseconds>(event.time.time_since_epoch()).count();
            std::string text = "[" + std::string(to_string(event.type)) + "] " + event.path;
            if (event.type == EventType::Created)
            {
                text += " (" + std::to_string(event.size) + " bytes)";
            }
            printer.result(text, nlohmann::json{{"status", "success"},
                                                {"type", std::string(to_string(event.type))},
                                                {"path", event.path},
                                                {"client", event.client_url},
                                                {"size", event.size},
                                                {"time", millis}});
        }

        void drain_errors(Watcher &watcher, const Printer &printer)
        {
            while (auto error = watcher.errors().try_receive())
            {
                printer.error(*error);
            }
        }
    } // namespace

    int run_watch(CommandContext &context)
    {
        bool recursive = false;
        std::vector<std::string> urls;
        for (const auto &arg : context.options.args)
        {
            if (arg == "--recursive" || arg == "-r")
            {
                recursive = true;
            }
            else
            {
                urls.push_back(arg);
            }
        }
        if (urls.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Usage: ferry watch [--recursive] URL...");
        }

        const auto aliases = context.config.aliases();
        std::vector<std::unique_ptr<StorageClient>> clients;
        for (const auto &url : urls)
        {
            clients.push_back(new_client(resolve(url, aliases), context.config));
        }

        Watcher watcher;
        for (auto &client : clients)
        {
            watcher.join(*client, recursive);
            context.logger.log("watch", "watching ", client->url().to_string());
        }

        while (!context.cancel.cancelled())
        {
            drain_errors(watcher, context.printer);
            auto event = watcher.events().receive_for(kPollInterval);
            if (event)
            {
                print_event(context.printer, *event);
            }
            else if (watcher.events().exhausted())
            {
                break;
            }
        }
        watcher.stop();
        while (auto event = watcher.events().try_receive())
        {
            print_event(context.printer, *event);
        }
        drain_errors(watcher, context.printer);
        return 0;
    }

} // namespace ferry::client
