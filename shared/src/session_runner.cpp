#include "ferry/session_runner.hpp"

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {
        bool is_interrupt(const std::exception_ptr &error)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception &ex)
            {
                return error_code_of(ex) == ErrorCode::Interrupted;
            }
            return false;
        }

        void report_failure(const SessionCallbacks &callbacks, const TransferItem &item, std::exception_ptr error)
        {
            spdlog::error("Failed to copy {} -> {}: {}", item.source_url, item.target_url, describe(error));
            if (callbacks.on_failed)
            {
                callbacks.on_failed(item, std::move(error));
            }
        }

    } // namespace

    void populate_session(Session &session, const std::function<void(const ItemSink &)> &prepare,
                          const CancelToken &cancel)
    {
        session.begin_populating();
        try
        {
            prepare([&](const TransferItem &item)
                    {
                cancel.throw_if_cancelled();
                session.append(item); });
            cancel.throw_if_cancelled();
        }
        catch (const std::exception &ex)
        {
            spdlog::info("Dropping session {} while populating: {}", session.id(), describe(ex));
            session.clear();
            throw;
        }
        session.activate();
    }

    RunSummary run_session(Session &session, TransferExecutor &executor, const ClientFactory &factory,
                           const SessionCallbacks &callbacks)
    {
        const auto header = session.header();
        if (header.state != SessionState::Active)
        {
            throw Error(ErrorCode::InvalidSessionId,
                        "Session " + session.id() + " is " + std::string(to_string(header.state)));
        }

        const auto items = session.items();
        std::vector<bool> stalled(header.cursors.size(), false);
        RunSummary summary;

        std::size_t begin = 0;
        while (begin < items.size())
        {
            auto end = begin + 1;
            while (end < items.size() && items[end].source_url == items[begin].source_url)
            {
                ++end;
            }

            std::vector<std::size_t> pending;
            for (auto position = begin; position < end; ++position)
            {
                const auto target = items[position].target;
                if (session.is_copied(position, target))
                {
                    ++summary.resumed;
                }
                else if (target < stalled.size() && stalled[target])
                {
                    ++summary.stalled;
                }
                else
                {
                    pending.push_back(position);
                }
            }
            if (pending.empty())
            {
                begin = end;
                continue;
            }

            executor.cancel_token().throw_if_cancelled();
            const auto &first = items[pending.front()];

            std::unique_ptr<StorageClient> source;
            try
            {
                source = factory(resolve(first.source_url, {}));
            }
            catch (const Error &)
            {
                for (const auto position : pending)
                {
                    stalled[items[position].target] = true;
                    ++summary.failed;
                    report_failure(callbacks, items[position], std::current_exception());
                }
                begin = end;
                continue;
            }

            std::vector<std::unique_ptr<StorageClient>> owned;
            std::vector<StorageClient *> targets;
            std::vector<std::size_t> positions;
            for (const auto position : pending)
            {
                try
                {
                    owned.push_back(factory(resolve(items[position].target_url, {})));
                    targets.push_back(owned.back().get());
                    positions.push_back(position);
                }
                catch (const Error &)
                {
                    stalled[items[position].target] = true;
                    ++summary.failed;
                    report_failure(callbacks, items[position], std::current_exception());
                }
            }

            const auto outcomes = executor.copy(*source, targets, first.size);

            std::exception_ptr interrupted;
            for (std::size_t i = 0; i < outcomes.size(); ++i)
            {
                const auto position = positions[i];
                const auto &item = items[position];
                if (outcomes[i].ok())
                {
                    session.mark_copied(position, item);
                    ++summary.copied;
                    spdlog::debug("Copied {} -> {}", item.source_url, item.target_url);
                    if (callbacks.on_copied)
                    {
                        callbacks.on_copied(item, outcomes[i].result);
                    }
                    continue;
                }
                if (is_interrupt(outcomes[i].error))
                {
                    interrupted = outcomes[i].error;
                    continue;
                }
                stalled[item.target] = true;
                ++summary.failed;
                report_failure(callbacks, item, outcomes[i].error);
            }
            if (interrupted)
            {
                std::rethrow_exception(interrupted);
            }
            begin = end;
        }

        if (session.all_copied(items))
        {
            session.complete();
            summary.completed = true;
        }
        else
        {
            spdlog::info("Session {} kept for resume: {} failed, {} stalled", session.id(), summary.failed,
                         summary.stalled);
        }
        return summary;
    }

} // namespace ferry
