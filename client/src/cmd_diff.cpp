#include "ferry/client/commands.hpp"

#include <string>
#include <vector>

#include "ferry/client_factory.hpp"
#include "ferry/diff.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/url.hpp"
#include "ferry/version.hpp"

namespace ferry::client
{

    int run_diff(CommandContext &context)
    {
        DiffOptions options;
        std::vector<std::string> urls;
        for (const auto &arg : context.options.args)
        {
            if (arg == "--metadata")
            {
                options.compare_metadata = true;
            }
            else
            {
                urls.push_back(arg);
            }
        }
        if (urls.size() != 2)
        {
            throw Error(ErrorCode::InvalidArgument, "Usage: ferry diff [--metadata] FIRST SECOND");
        }

        const auto aliases = context.config.aliases();
        auto first = new_client(resolve(urls[0], aliases), context.config);
        auto second = new_client(resolve(urls[1], aliases), context.config);

        auto stream = diff(*first, *second, options);
        int status = 0;
        while (auto result = stream->next())
        {
            context.cancel.throw_if_cancelled();
            if (result->error)
            {
                context.printer.error(result->error);
                status = 1;
                continue;
            }
            const auto &url = result->type == DiffType::OnlyInSecond ? result->second_url : result->first_url;
            nlohmann::json record{{"status", "success"}, {"key", result->key}, {"diff", static_cast<int>(result->type)}};
            if (result->first_url)
            {
                record["first"] = *result->first_url;
            }
            if (result->second_url)
            {
                record["second"] = *result->second_url;
            }
            context.printer.result(std::string(1, legend(result->type)) + " " + url.value_or(result->key), record);
        }
        return status;
    }

    int run_version(CommandContext &context)
    {
        context.printer.result("ferry version " + std::string(version()),
                               nlohmann::json{{"status", "success"}, {"version", std::string(version())}});
        return 0;
    }

} // namespace ferry::client
