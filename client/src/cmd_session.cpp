#include "ferry/client/commands.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"

namespace ferry::client
{

    namespace
    {
        std::string format_time(std::chrono::system_clock::time_point time)
        {
            const auto seconds = std::chrono::system_clock::to_time_t(time);
            std::tm local{};
            localtime_r(&seconds, &local);
            std::ostringstream out;
            out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return out.str();
        }

        std::string join_args(const std::vector<std::string> &args)
        {
            std::string result;
            for (const auto &arg : args)
            {
                if (!result.empty())
                {
                    result += ' ';
                }
                result += arg;
            }
            return result;
        }

        int list_sessions(CommandContext &context, const SessionStore &store)
        {
            const auto headers = store.list();
            if (headers.empty())
            {
                context.printer.message("No sessions found");
            }
            for (const auto &header : headers)
            {
                const auto created = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         header.created_at.time_since_epoch())
                                         .count();
                std::ostringstream line;
                line << header.id << "  [" << format_time(header.created_at) << "]  " << to_string(header.command_type)
                     << ' ' << join_args(header.command_args) << "  (" << to_string(header.state) << ", "
                     << header.copied_objects << '/' << header.total_objects << " objects)";
                context.printer.result(line.str(), nlohmann::json{{"status", "success"},
                                                                  {"id", header.id},
                                                                  {"createdAt", created},
                                                                  {"commandType", std::string(to_string(header.command_type))},
                                                                  {"commandArgs", header.command_args},
                                                                  {"state", std::string(to_string(header.state))},
                                                                  {"copiedObjects", header.copied_objects},
                                                                  {"totalObjects", header.total_objects},
                                                                  {"copiedBytes", header.copied_bytes},
                                                                  {"totalBytes", header.total_bytes}});
            }
            return 0;
        }

        int resume_session(CommandContext &context, const SessionStore &store, const std::string &id)
        {
            auto session = store.resume(id);
            const auto header = session->header();
            // Relative filesystem URLs in the data stream resolve against the directory the session was created in.
            std::error_code ec;
            std::filesystem::current_path(header.working_directory, ec);
            if (ec)
            {
                throw Error(ErrorCode::IoError,
                            "Unable to enter session working directory " + header.working_directory + ": " +
                                ec.message());
            }
            context.logger.log("session", "resuming ", id, ": ", to_string(header.command_type), ' ',
                               join_args(header.command_args));
            return run_transfer_session(context, *session);
        }

        int clear_sessions(CommandContext &context, SessionStore &store, const std::string &id)
        {
            if (id == "all")
            {
                const auto count = store.clear_all();
                context.printer.result("Cleared " + std::to_string(count) + " session(s)",
                                       nlohmann::json{{"status", "success"}, {"cleared", count}});
                return 0;
            }
            store.clear(id);
            context.printer.result("Session '" + id + "' cleared successfully",
                                   nlohmann::json{{"status", "success"}, {"cleared", 1}, {"id", id}});
            return 0;
        }
    } // namespace

    int run_session(CommandContext &context)
    {
        const auto &args = context.options.args;
        if (args.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Usage: ferry session list|resume ID|clear ID|all");
        }
        SessionStore store(context.config.session_dir());
        const auto &action = args.front();
        if (action == "list" && args.size() == 1)
        {
            return list_sessions(context, store);
        }
        if (action == "resume" && args.size() == 2)
        {
            return resume_session(context, store, args[1]);
        }
        if (action == "clear" && args.size() == 2)
        {
            return clear_sessions(context, store, args[1]);
        }
        throw Error(ErrorCode::InvalidArgument, "Usage: ferry session list|resume ID|clear ID|all");
    }

} // namespace ferry::client
