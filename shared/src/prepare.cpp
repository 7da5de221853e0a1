#include "ferry/prepare.hpp"

#include <algorithm>
#include <optional>

#include <spdlog/spdlog.h>

#include "ferry/diff.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/transfer.hpp"

namespace ferry
{

    namespace
    {
        // Stat that maps NotFound to nullopt.
        std::optional<Content> try_stat(StorageClient &client)
        {
            try
            {
                return client.stat();
            }
            catch (const Error &ex)
            {
                if (ex.code() != ErrorCode::NotFound)
                {
                    throw;
                }
            }
            return std::nullopt;
        }

        TransferItem make_item(const Content &source, const ResolvedUrl &target, std::size_t index)
        {
            TransferItem item;
            item.source_url = source.url;
            item.target_url = target.to_string();
            item.size = source.size;
            item.content_hash = normalize_etag(source.etag);
            item.target = index;
            return item;
        }

        void report(const PrepareErrorSink &on_error, const std::string &url, std::exception_ptr error)
        {
            spdlog::warn("Skipping {}: {}", url, describe(error));
            if (on_error)
            {
                on_error(url, std::move(error));
            }
        }

    } // namespace

    void prepare_copy(const std::vector<ResolvedUrl> &sources, const ResolvedUrl &target, const ClientFactory &factory,
                      const ItemSink &sink, const PrepareErrorSink &on_error)
    {
        if (sources.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "cp needs at least one source");
        }

        auto target_client = factory(target);
        const auto target_stat = try_stat(*target_client);
        const bool into_directory = sources.size() > 1 || target.path.ends_with('/') ||
                                    (target_stat && target_stat->is_directory);

        for (const auto &source : sources)
        {
            try
            {
                auto client = factory(source);
                if (source.recursive)
                {
                    auto stream = client->list(ListOptions{.recursive = true});
                    while (auto entry = stream->next())
                    {
                        if (entry->error)
                        {
                            report(on_error, entry->content.url, entry->error);
                            continue;
                        }
                        if (entry->content.is_directory)
                        {
                            continue;
                        }
                        sink(make_item(entry->content, join(target, entry->content.key), 0));
                    }
                    continue;
                }

                const auto content = client->stat();
                if (content.is_directory)
                {
                    throw Error(ErrorCode::InvalidArgument,
                                source.to_string() + " is a directory, use '" +
                                    url_join_path(source.to_string(), kRecursiveSeparator) + "' to copy recursively");
                }
                if (!into_directory)
                {
                    sink(make_item(content, target, 0));
                    continue;
                }
                const auto name = base_name(source);
                if (name.empty())
                {
                    throw Error(ErrorCode::InvalidArgument, "Cannot derive a target name from " + source.to_string());
                }
                sink(make_item(content, join(target, name), 0));
            }
            catch (const Error &ex)
            {
                if (ex.code() == ErrorCode::Interrupted)
                {
                    throw;
                }
                report(on_error, source.to_string(), std::current_exception());
            }
        }
    }

    void prepare_mirror(const ResolvedUrl &source, const std::vector<ResolvedUrl> &targets, bool force,
                        const ClientFactory &factory, const ItemSink &sink, const PrepareErrorSink &on_error)
    {
        if (targets.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "mirror needs at least one target");
        }

        auto source_client = factory(source);
        if (!try_stat(*source_client))
        {
            throw Error(ErrorCode::NotFound, "Mirror source " + source.to_string() + " does not exist");
        }

        const ListOptions listing{.recursive = true, .include_incomplete = false, .include_directories = true};
        std::vector<std::unique_ptr<StorageClient>> target_clients;
        std::vector<std::unique_ptr<DiffStream>> streams;
        for (const auto &target : targets)
        {
            auto client = factory(target);
            std::unique_ptr<ContentStream> target_listing;
            if (try_stat(*client))
            {
                target_listing = prefetch(client->list(listing));
            }
            else
            {
                target_listing = std::make_unique<VectorContentStream>(std::vector<ListEntry>{});
            }
            streams.push_back(std::make_unique<DiffStream>(prefetch(source_client->list(listing)),
                                                           std::move(target_listing), DiffOptions{}));
            target_clients.push_back(std::move(client));
        }

        std::vector<std::optional<DiffResult>> heads(streams.size());
        for (std::size_t i = 0; i < streams.size(); ++i)
        {
            heads[i] = streams[i]->next();
        }

        while (true)
        {
            std::optional<std::string> key;
            for (const auto &head : heads)
            {
                if (head && (!key || head->key < *key))
                {
                    key = head->key;
                }
            }
            if (!key)
            {
                break;
            }

            for (std::size_t i = 0; i < heads.size(); ++i)
            {
                if (!heads[i] || heads[i]->key != *key)
                {
                    continue;
                }
                const auto result = std::move(*heads[i]);
                heads[i] = streams[i]->next();

                if (result.error)
                {
                    report(on_error, result.first_url.value_or(result.second_url.value_or(result.key)), result.error);
                    continue;
                }
                switch (result.type)
                {
                case DiffType::OnlyInFirst:
                    sink(make_item(*result.first, join(targets[i], result.key), i));
                    break;
                case DiffType::Size:
                case DiffType::Metadata:
                    if (force)
                    {
                        sink(make_item(*result.first, join(targets[i], result.key), i));
                    }
                    else
                    {
                        spdlog::info("{} differs on {}, use --force to overwrite", result.key, targets[i].to_string());
                    }
                    break;
                case DiffType::Type:
                    report(on_error, *result.second_url,
                           std::make_exception_ptr(Error(ErrorCode::InvalidArgument,
                                                         "Type conflict for '" + result.key + "' on " +
                                                             targets[i].to_string())));
                    break;
                case DiffType::OnlyInSecond:
                case DiffType::None:
                    break;
                }
            }
        }
    }

} // namespace ferry
