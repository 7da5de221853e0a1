#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "ferry/error_codes.hpp"
#include "ferry/fs_client.hpp"
#include "ferry/object_store.hpp"
#include "ferry/transfer.hpp"

#include "test_support.hpp"

using namespace ferry;

namespace
{

    RetryPolicy fast_policy(int retries)
    {
        return RetryPolicy{.max_retries = retries, .backoff_unit = std::chrono::milliseconds(0)};
    }

    ErrorCode code_of(const std::exception_ptr &error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception &ex)
        {
            return error_code_of(ex);
        }
        return ErrorCode::Ok;
    }

    void test_backoff_schedule()
    {
        const RetryPolicy policy{};
        assert(policy.max_retries == 5);
        assert(policy.delay_before(0) == std::chrono::seconds(0));
        assert(policy.delay_before(1) == std::chrono::seconds(1));
        assert(policy.delay_before(2) == std::chrono::seconds(4));
        assert(policy.delay_before(3) == std::chrono::seconds(9));
    }

    void test_with_retry_classification()
    {
        CancelToken cancel;
        int calls = 0;
        const auto value = with_retry(fast_policy(3), cancel, "flaky", [&](int attempt)
                                      {
            ++calls;
            if (attempt < 2)
            {
                throw NetworkError("read", "unexpected EOF");
            }
            return attempt; });
        assert(value == 2);
        assert(calls == 3);

        calls = 0;
        try
        {
            with_retry(fast_policy(3), cancel, "denied", [&](int) -> int
                       {
                ++calls;
                throw Error(ErrorCode::AccessDenied, "forbidden"); });
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::AccessDenied);
        }
        assert(calls == 1);

        calls = 0;
        try
        {
            with_retry(fast_policy(2), cancel, "down", [&](int) -> int
                       {
                ++calls;
                throw NetworkError("dial", "connection refused"); });
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::TransferFailed);
            assert(is_retryable(ex));
            assert(describe(ex).find("connection refused") != std::string::npos);
        }
        assert(calls == 3);
    }

    void test_cancel_token()
    {
        CancelToken cancel;
        CancelToken copy = cancel;
        assert(!copy.cancelled());
        cancel.cancel();
        assert(copy.cancelled());

        const auto start = std::chrono::steady_clock::now();
        copy.wait(std::chrono::seconds(30));
        assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));

        int calls = 0;
        try
        {
            with_retry(fast_policy(3), copy, "cancelled", [&](int)
                       { return ++calls; });
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::Interrupted);
        }
        assert(calls == 0);
    }

    void test_normalize_etag()
    {
        assert(normalize_etag("\"ABCDEF\"") == "abcdef");
        assert(normalize_etag(" \"abc-2\" ") == "abc-2");
        assert(normalize_etag("").empty());
    }

    void test_copy_retries_transient_failures()
    {
        auto store = std::make_shared<test::MemoryObjectStore>();
        store->add_bucket("dst");
        store->put_object("dst", "src.bin", std::string(10000, 'x'));
        store->fail_next_puts(2);

        ObjectStoreClient source(resolve("http://mem/dst/src.bin", {}), store);
        ObjectStoreClient target(resolve("http://mem/dst/copy.bin", {}), store);
        TransferExecutor executor(fast_policy(5), CancelToken{});
        const auto result = executor.copy(source, target, 10000);
        assert(result.bytes == 10000);
        assert(store->put_attempts() == 3);
        assert(store->get_calls() == 3);
        assert(store->object("dst", "copy.bin") == std::string(10000, 'x'));
    }

    void test_copy_gives_up_after_retries()
    {
        auto store = std::make_shared<test::MemoryObjectStore>();
        store->add_bucket("b");
        store->put_object("b", "in", "data");
        store->fail_next_puts(100);

        ObjectStoreClient source(resolve("http://mem/b/in", {}), store);
        ObjectStoreClient target(resolve("http://mem/b/out", {}), store);
        TransferExecutor executor(fast_policy(2), CancelToken{});
        try
        {
            executor.copy(source, target, 4);
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::TransferFailed);
        }
        assert(store->put_attempts() == 3);
        assert(!store->object("b", "out"));
    }

    void test_checksum_gate()
    {
        auto store = std::make_shared<test::MemoryObjectStore>();
        store->add_bucket("b");
        store->corrupt_etags(true);

        ObjectStoreClient target(resolve("http://mem/b/file", {}), store);
        StringReader reader("some bytes");
        try
        {
            put_verified(reader, target, 10, CancelToken{});
            assert(false);
        }
        catch (const Error &ex)
        {
            assert(ex.code() == ErrorCode::IntegrityMismatch);
        }
        assert(store->put_attempts() == 1);

        store->corrupt_etags(false);
        StringReader good("some bytes");
        const auto result = put_verified(good, target, 10, CancelToken{});
        assert(normalize_etag(result.etag) == test::md5_of("some bytes"));

        // Filesystem targets report no ETag and are not checked.
        const auto root = test::make_temp_dir("checksum");
        FilesystemClient local(resolve((root / "file").string(), {}));
        StringReader plain("abc");
        assert(put_verified(plain, local, 3, CancelToken{}).etag.empty());
        test::cleanup_path(root);
    }

    void test_fan_out_isolates_targets()
    {
        const auto root = test::make_temp_dir("fan_out");
        const std::string payload(300 * 1024, 'p');
        test::write_file(root / "source.bin", payload);

        auto flaky = std::make_shared<test::MemoryObjectStore>();
        flaky->add_bucket("one");
        flaky->fail_next_puts(1);
        auto denied = std::make_shared<test::MemoryObjectStore>();
        denied->add_bucket("two");
        denied->deny_puts(true);

        FilesystemClient source(resolve((root / "source.bin").string(), {}));
        ObjectStoreClient first(resolve("http://mem/one/source.bin", {}), flaky);
        ObjectStoreClient second(resolve("http://mem/two/source.bin", {}), denied);
        FilesystemClient third(resolve((root / "out" / "source.bin").string(), {}));

        TransferExecutor executor(fast_policy(3), CancelToken{});
        const std::vector<StorageClient *> targets = {&first, &second, &third};
        const auto outcomes = executor.copy(source, targets, payload.size());

        assert(outcomes.size() == 3);
        assert(outcomes[0].ok());
        assert(flaky->put_attempts() == 2);
        assert(flaky->object("one", "source.bin") == payload);
        assert(!outcomes[1].ok());
        assert(code_of(outcomes[1].error) == ErrorCode::AccessDenied);
        assert(outcomes[2].ok());
        assert(outcomes[2].result.bytes == payload.size());
        assert(test::read_file(root / "out" / "source.bin") == payload);
        test::cleanup_path(root);
    }

    void test_fan_out_source_failure()
    {
        auto store = std::make_shared<test::MemoryObjectStore>();
        store->add_bucket("b");

        ObjectStoreClient source(resolve("http://mem/b/missing", {}), store);
        ObjectStoreClient first(resolve("http://mem/b/x", {}), store);
        ObjectStoreClient second(resolve("http://mem/b/y", {}), store);
        TransferExecutor executor(fast_policy(1), CancelToken{});
        const std::vector<StorageClient *> targets = {&first, &second};
        const auto outcomes = executor.copy(source, targets, 5);
        for (const auto &outcome : outcomes)
        {
            assert(!outcome.ok());
            assert(code_of(outcome.error) == ErrorCode::NotFound);
        }
        assert(!store->object("b", "x"));
        assert(!store->object("b", "y"));
    }

} // namespace

void run_transfer_tests()
{
    test_backoff_schedule();
    test_with_retry_classification();
    test_cancel_token();
    test_normalize_etag();
    test_copy_retries_transient_failures();
    test_copy_gives_up_after_retries();
    test_checksum_gate();
    test_fan_out_isolates_targets();
    test_fan_out_source_failure();
}
