#include "ferry/client/commands.hpp"

#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "ferry/client_factory.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/prepare.hpp"
#include "ferry/session_runner.hpp"
#include "ferry/url.hpp"

namespace ferry::client
{

    namespace
    {
        SessionHeader make_prototype(CommandType type, const std::vector<std::string> &args,
                                     const std::vector<ResolvedUrl> &targets, bool force, bool recursive)
        {
            SessionHeader header;
            header.command_type = type;
            header.command_args = args;
            header.force = force;
            header.recursive = recursive;
            for (const auto &target : targets)
            {
                header.cursors.push_back(TargetCursor{.target = target.to_string()});
            }
            return header;
        }

        // Populates a new session from `prepare`, then copies its items.
        int populate_and_run(CommandContext &context, SessionHeader prototype,
                             const std::function<void(const ClientFactory &, const ItemSink &,
                                                      const PrepareErrorSink &)> &prepare)
        {
            SessionStore store(context.config.session_dir());
            auto session = store.create(std::move(prototype));
            context.logger.log(std::string(to_string(session->header().command_type)), "session ", session->id(),
                               " created");

            const auto factory = make_client_factory(context.config);
            bool prepare_failed = false;
            const PrepareErrorSink on_error = [&](const std::string &, std::exception_ptr error)
            {
                prepare_failed = true;
                context.printer.error(error);
            };
            populate_session(*session, [&](const ItemSink &sink)
                             { prepare(factory, sink, on_error); },
                             context.cancel);

            const auto status = run_transfer_session(context, *session);
            return prepare_failed ? 1 : status;
        }
    } // namespace

    RetryPolicy retry_policy(const ClientConfig &options)
    {
        return RetryPolicy{.max_retries = options.retries};
    }

    int run_transfer_session(CommandContext &context, Session &session)
    {
        TransferExecutor executor(retry_policy(context.options), context.cancel);
        const auto factory = make_client_factory(context.config);

        SessionCallbacks callbacks;
        callbacks.on_copied = [&](const TransferItem &item, const PutResult &result)
        {
            context.logger.log("copy", item.source_url, " -> ", item.target_url, " (", result.bytes, " bytes)");
            context.printer.result("'" + item.source_url + "' -> '" + item.target_url + "'",
                                   nlohmann::json{{"status", "success"},
                                                  {"source", item.source_url},
                                                  {"target", item.target_url},
                                                  {"size", result.bytes},
                                                  {"etag", result.etag}});
        };
        callbacks.on_failed = [&](const TransferItem &, std::exception_ptr error)
        { context.printer.error(error); };

        RunSummary summary;
        try
        {
            summary = run_session(session, executor, factory, callbacks);
        }
        catch (const Error &ex)
        {
            if (ex.code() != ErrorCode::Interrupted)
            {
                throw;
            }
            std::cerr << "Session safely terminated. To resume session 'ferry session resume " << session.id()
                      << "'" << std::endl;
            return 1;
        }

        if (summary.completed)
        {
            const auto header = session.header();
            context.printer.result("Total: " + std::to_string(header.copied_objects) + " objects, " +
                                       std::to_string(header.copied_bytes) + " bytes",
                                   nlohmann::json{{"status", "success"},
                                                  {"session", session.id()},
                                                  {"copied", summary.copied},
                                                  {"resumed", summary.resumed},
                                                  {"totalObjects", header.total_objects},
                                                  {"totalBytes", header.total_bytes}});
            return summary.failed == 0 ? 0 : 1;
        }
        context.printer.message(std::to_string(summary.failed) + " item(s) failed. To resume session 'ferry session resume " +
                                session.id() + "'");
        return 1;
    }

    int run_copy(CommandContext &context)
    {
        const auto &args = context.options.args;
        if (args.size() < 2)
        {
            throw Error(ErrorCode::InvalidArgument, "Usage: ferry cp SOURCE... TARGET");
        }

        const auto aliases = context.config.aliases();
        std::vector<ResolvedUrl> sources;
        bool recursive = false;
        for (std::size_t i = 0; i + 1 < args.size(); ++i)
        {
            sources.push_back(resolve(args[i], aliases));
            recursive = recursive || sources.back().recursive;
        }
        const auto target = resolve(args.back(), aliases);

        auto prototype = make_prototype(CommandType::Copy, args, {target}, false, recursive);
        return populate_and_run(context, std::move(prototype),
                                [&](const ClientFactory &factory, const ItemSink &sink, const PrepareErrorSink &on_error)
                                { prepare_copy(sources, target, factory, sink, on_error); });
    }

    int run_mirror(CommandContext &context)
    {
        bool force = false;
        std::vector<std::string> positional;
        for (const auto &arg : context.options.args)
        {
            if (arg == "--force")
            {
                force = true;
            }
            else if (arg.starts_with("--"))
            {
                throw Error(ErrorCode::InvalidArgument, "Unknown mirror option: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }
        if (positional.size() < 2)
        {
            throw Error(ErrorCode::InvalidArgument, "Usage: ferry mirror [--force] SOURCE TARGET...");
        }

        const auto aliases = context.config.aliases();
        const auto source = resolve(positional.front(), aliases);
        std::vector<ResolvedUrl> targets;
        for (std::size_t i = 1; i < positional.size(); ++i)
        {
            targets.push_back(resolve(positional[i], aliases));
        }

        auto prototype = make_prototype(CommandType::Mirror, context.options.args, targets, force, true);
        return populate_and_run(context, std::move(prototype),
                                [&](const ClientFactory &factory, const ItemSink &sink, const PrepareErrorSink &on_error)
                                { prepare_mirror(source, targets, force, factory, sink, on_error); });
    }

} // namespace ferry::client
