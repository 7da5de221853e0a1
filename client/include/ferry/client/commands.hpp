#pragma once

#include <string>
#include <vector>

#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/output.hpp"
#include "ferry/config.hpp"
#include "ferry/session.hpp"
#include "ferry/transfer.hpp"

namespace ferry::client
{

    struct CommandContext
    {
        const ClientConfig &options;
        const Config &config;
        const Printer &printer;
        Logger &logger;
        CancelToken cancel;
    };

    // Each handler returns the process exit status. Fatal errors are thrown.
    int run_copy(CommandContext &context);
    int run_mirror(CommandContext &context);
    int run_session(CommandContext &context);
    int run_watch(CommandContext &context);
    int run_diff(CommandContext &context);
    int run_version(CommandContext &context);

    // Copies the pending items of an active session, printing one line per item.
    int run_transfer_session(CommandContext &context, Session &session);

    RetryPolicy retry_policy(const ClientConfig &options);

} // namespace ferry::client
