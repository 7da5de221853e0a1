/**
 * Ferry - Local filesystem backend.
 */
#pragma once

#include <filesystem>
#include <memory>

#include "ferry/storage_client.hpp"

namespace ferry
{

    inline constexpr std::string_view kPartSuffix = ".part";

    class FilesystemClient : public StorageClient, public WatchCapability
    {
    public:
        explicit FilesystemClient(ResolvedUrl url);

        const ResolvedUrl &url() const override { return url_; }

        Content stat() override;

        std::unique_ptr<ContentStream> list(const ListOptions &options) override;

        std::unique_ptr<Reader> get() override;

        PutResult put(Reader &reader, std::uint64_t length) override;

        void remove() override;

        WatchCapability *watch_capability() noexcept override { return this; }

        std::unique_ptr<WatchSubscription> watch(const WatchOptions &options) override;

        const std::filesystem::path &path() const { return path_; }

    private:
        ResolvedUrl url_;
        std::filesystem::path path_;
    };

} // namespace ferry
