/**
 * Ferry - Drives a session: populate it once, then copy its items in order, advancing the per-target cursors.
 */
#pragma once

#include <cstddef>
#include <exception>
#include <functional>

#include "ferry/client_factory.hpp"
#include "ferry/prepare.hpp"
#include "ferry/session.hpp"
#include "ferry/transfer.hpp"

namespace ferry
{

    struct SessionCallbacks
    {
        std::function<void(const TransferItem &, const PutResult &)> on_copied;
        std::function<void(const TransferItem &, std::exception_ptr)> on_failed;
    };

    struct RunSummary
    {
        std::size_t copied{};
        std::size_t failed{};
        // Items already copied by an earlier run.
        std::size_t resumed{};
        // Items not attempted because their target failed earlier in this run.
        std::size_t stalled{};
        bool completed{};
    };

    // Moves a `created` session through `populating` to `active`, feeding it the items produced by `prepare`.
    // When interrupted, or when `prepare` throws, the half-populated session is cleared and the error rethrown.
    void populate_session(Session &session, const std::function<void(const ItemSink &)> &prepare,
                          const CancelToken &cancel);

    // Processes every item of an `active` session that its target cursor has not passed. Items sharing a source are
    // copied with one fan-out. A target whose item fails is not attempted again in this run, so its cursor stays on
    // its last completed item. The session completes (and its files are removed) once every cursor is at the end.
    // Throws Error(Interrupted) when cancelled; the header already holds the progress made so far.
    RunSummary run_session(Session &session, TransferExecutor &executor, const ClientFactory &factory,
                           const SessionCallbacks &callbacks = {});

} // namespace ferry
