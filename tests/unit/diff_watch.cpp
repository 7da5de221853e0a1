#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ferry/diff.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/fs_client.hpp"
#include "ferry/object_store.hpp"
#include "ferry/prepare.hpp"
#include "ferry/watcher.hpp"

#include "test_support.hpp"

using namespace ferry;

namespace
{

    constexpr auto kEventTimeout = std::chrono::seconds(5);

    std::vector<DiffResult> collect(DiffStream &stream)
    {
        std::vector<DiffResult> results;
        while (auto result = stream.next())
        {
            results.push_back(std::move(*result));
        }
        return results;
    }

    void test_diff_labels()
    {
        assert(to_string(DiffType::OnlyInFirst) == "differInFirst");
        assert(to_string(DiffType::Size) == "differInSize");
        assert(legend(DiffType::OnlyInFirst) == '<');
        assert(legend(DiffType::OnlyInSecond) == '>');
        assert(legend(DiffType::Size) == '!');
        assert(legend(DiffType::Metadata) == '~');
        assert(legend(DiffType::Type) == '#');
        assert(static_cast<int>(DiffType::OnlyInSecond) == 5);
    }

    void test_diff_size_and_missing()
    {
        const auto root = test::make_temp_dir("diff_basic");
        test::write_file(root / "first" / "a", std::string(10, 'a'));
        test::write_file(root / "second" / "a", std::string(20, 'a'));
        test::write_file(root / "second" / "b", std::string(5, 'b'));
        std::filesystem::create_directories(root / "first" / "empty");

        FilesystemClient first(resolve((root / "first").string(), {}));
        FilesystemClient second(resolve((root / "second").string(), {}));
        auto stream = diff(first, second, DiffOptions{});
        const auto results = collect(*stream);
        assert(results.size() == 2);
        assert(results[0].key == "a");
        assert(results[0].type == DiffType::Size);
        assert(results[0].first->size == 10);
        assert(results[0].second->size == 20);
        assert(results[1].key == "b");
        assert(results[1].type == DiffType::OnlyInSecond);
        assert(!results[1].first_url);
        assert(results[1].second_url == (root / "second" / "b").string());
        test::cleanup_path(root);
    }

    void test_diff_type_and_similar()
    {
        const auto root = test::make_temp_dir("diff_type");
        test::write_file(root / "first" / "same", "xyz");
        test::write_file(root / "first" / "x", "file");
        test::write_file(root / "second" / "same", "xyz");
        test::write_file(root / "second" / "x" / "y", "nested");

        FilesystemClient first(resolve((root / "first").string(), {}));
        FilesystemClient second(resolve((root / "second").string(), {}));
        auto stream = diff(first, second, DiffOptions{.return_similar = true});
        const auto results = collect(*stream);
        assert(results.size() == 3);
        assert(results[0].key == "same");
        assert(results[0].type == DiffType::None);
        assert(results[1].key == "x");
        assert(results[1].type == DiffType::Type);
        assert(results[2].key == "x/y");
        assert(results[2].type == DiffType::OnlyInSecond);
        test::cleanup_path(root);
    }

    void test_diff_metadata_and_errors()
    {
        auto store = std::make_shared<test::MemoryObjectStore>();
        store->add_bucket("left");
        store->add_bucket("right");
        store->put_object("left", "doc", "v1", {{"content-type", "text/plain"}});
        store->put_object("right", "doc", "v2", {{"content-type", "text/html"}});

        ObjectStoreClient left(resolve("http://mem/left", {}), store);
        ObjectStoreClient right(resolve("http://mem/right", {}), store);
        assert(collect(*diff(left, right, DiffOptions{})).empty());
        const auto results = collect(*diff(left, right, DiffOptions{.compare_metadata = true}));
        assert(results.size() == 1);
        assert(results[0].type == DiffType::Metadata);

        std::vector<ListEntry> broken;
        broken.push_back(ListEntry{Content{.url = "first/bad", .key = "bad"},
                                   std::make_exception_ptr(Error(ErrorCode::IoError, "unreadable"))});
        broken.push_back(ListEntry{Content{.url = "first/ok", .key = "ok", .size = 1}, nullptr});
        DiffStream stream(std::make_unique<VectorContentStream>(std::move(broken)),
                          std::make_unique<VectorContentStream>(std::vector<ListEntry>{}), DiffOptions{});
        const auto mixed = collect(stream);
        assert(mixed.size() == 2);
        assert(mixed[0].error);
        assert(mixed[0].first_url == "first/bad");
        assert(!mixed[1].error);
        assert(mixed[1].type == DiffType::OnlyInFirst);
    }

    void test_mirror_force()
    {
        const auto root = test::make_temp_dir("mirror_force");
        test::write_file(root / "src" / "a", "same");
        test::write_file(root / "src" / "b", "longer");
        test::write_file(root / "src" / "c", "new");
        test::write_file(root / "src" / "d", "file");
        test::write_file(root / "dst" / "a", "same");
        test::write_file(root / "dst" / "b", "short");
        test::write_file(root / "dst" / "d" / "inner", "dir");
        test::write_file(root / "dst" / "extra", "only in target");

        auto store = std::make_shared<test::MemoryObjectStore>();
        const auto factory = test::memory_factory(store);
        const auto source = resolve((root / "src").string(), {});
        const std::vector<ResolvedUrl> targets = {resolve((root / "dst").string(), {})};

        std::vector<std::string> keys;
        std::vector<std::string> conflicts;
        const ItemSink sink = [&](const TransferItem &item)
        { keys.push_back(item.target_url.substr(item.target_url.rfind('/') + 1)); };
        const PrepareErrorSink on_error = [&](const std::string &url, std::exception_ptr)
        { conflicts.push_back(url); };

        prepare_mirror(source, targets, false, factory, sink, on_error);
        assert((keys == std::vector<std::string>{"c"}));
        assert(conflicts.size() == 1);
        assert(conflicts[0] == (root / "dst" / "d").string());

        keys.clear();
        prepare_mirror(source, targets, true, factory, sink, on_error);
        assert((keys == std::vector<std::string>{"b", "c"}));

        try
        {
            prepare_mirror(resolve((root / "missing").string(), {}), targets, false, factory, sink, on_error);
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::NotFound);
        }
        test::cleanup_path(root);
    }

    std::optional<Event> next_event(Watcher &watcher)
    {
        return watcher.events().receive_for(kEventTimeout);
    }

    void test_watcher_events()
    {
        const auto root = test::make_temp_dir("watch");
        FilesystemClient client(resolve(root.string(), {}));
        Watcher watcher;
        watcher.join(client, true);

        test::write_file(root / "hello.txt", "hi!");
        auto created = next_event(watcher);
        assert(created);
        assert(created->type == EventType::Created);
        assert(created->path == (root / "hello.txt").string());
        assert(created->size == 3);
        assert(created->client_url == root.string());

        std::filesystem::remove(root / "hello.txt");
        auto removed = next_event(watcher);
        assert(removed);
        assert(removed->type == EventType::Removed);
        assert(removed->path == (root / "hello.txt").string());

        std::filesystem::create_directories(root / "sub");
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        test::write_file(root / "sub" / "deep.txt", "deep");
        auto deep = next_event(watcher);
        assert(deep);
        assert(deep->path == (root / "sub" / "deep.txt").string());

        watcher.stop();
        assert(watcher.events().closed());
        assert(watcher.errors().closed());
        while (watcher.events().try_receive())
        {
        }
        assert(!watcher.events().receive());
        watcher.stop();

        try
        {
            watcher.join(client, false);
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::InvalidArgument);
        }
        test::cleanup_path(root);
    }

    void test_watcher_requires_capability()
    {
        auto store = std::make_shared<test::MemoryObjectStore>();
        store->add_bucket("b");
        ObjectStoreClient remote(resolve("http://mem/b", {}), store);
        Watcher watcher;
        try
        {
            watcher.join(remote, false);
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::NoWatcherCapability);
        }

        const auto root = test::make_temp_dir("watch_file");
        test::write_file(root / "plain", "x");
        FilesystemClient file(resolve((root / "plain").string(), {}));
        try
        {
            watcher.join(file, false);
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::InvalidArgument);
        }
        watcher.stop();
        assert(watcher.events().closed());
        test::cleanup_path(root);
    }

} // namespace

void run_diff_and_watch_tests()
{
    test_diff_labels();
    test_diff_size_and_missing();
    test_diff_type_and_similar();
    test_diff_metadata_and_errors();
    test_mirror_force();
    test_watcher_events();
    test_watcher_requires_capability();
}
