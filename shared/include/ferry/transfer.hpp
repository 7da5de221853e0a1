/**
 * Ferry - Transfer executor: streams one source to one or more targets with MD5 verification and
 * bounded retry of transport failures.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

#include "ferry/error_codes.hpp"
#include "ferry/storage_client.hpp"

namespace ferry
{

    struct RetryPolicy
    {
        // Retries after the first attempt.
        int max_retries{5};
        std::chrono::milliseconds backoff_unit{std::chrono::seconds(1)};

        // Wait before attempt i (0-indexed): i * i units.
        std::chrono::milliseconds delay_before(int attempt) const
        {
            return backoff_unit * (static_cast<long long>(attempt) * attempt);
        }
    };

    // Shared cancellation flag; copies observe the same state.
    class CancelToken
    {
    public:
        void cancel() noexcept { flag_->store(true); }

        bool cancelled() const noexcept { return flag_->load(); }

        // Throws ferry::Error(Interrupted) once cancelled.
        void throw_if_cancelled() const;

        // Sleeps up to `duration`, returning early on cancel.
        void wait(std::chrono::milliseconds duration) const;

    private:
        std::shared_ptr<std::atomic<bool>> flag_ = std::make_shared<std::atomic<bool>>(false);
    };

    // Runs attempt(i) for i = 0..max_retries. Only transport failures (is_retryable) are retried; when they run out
    // the last one is rethrown nested inside ferry::Error(TransferFailed).
    template <typename Fn>
    std::invoke_result_t<Fn &, int> with_retry(const RetryPolicy &policy, const CancelToken &cancel, std::string_view what,
                                               Fn &&attempt)
    {
        for (int i = 0;; ++i)
        {
            if (i > 0)
            {
                cancel.wait(policy.delay_before(i));
            }
            cancel.throw_if_cancelled();
            try
            {
                return attempt(i);
            }
            catch (const std::exception &ex)
            {
                if (!is_retryable(ex))
                {
                    throw;
                }
                if (i >= policy.max_retries)
                {
                    std::throw_with_nested(Error(ErrorCode::TransferFailed,
                                                 std::string(what) + " failed after " + std::to_string(i + 1) +
                                                     " attempts"));
                }
                spdlog::info("Retrying {} ({}/{}): {}", what, i + 1, policy.max_retries, describe(ex));
            }
        }
    }

    // Copies `length` bytes from reader to target. When the target reports MD5 ETags, the bytes are hashed
    // on a separate thread while they are written and the digest is checked against the returned ETag.
    // Throws ferry::Error(IntegrityMismatch) on a mismatch.
    PutResult put_verified(Reader &reader, StorageClient &target, std::uint64_t length, const CancelToken &cancel);

    // "\"abc\"" -> "abc"
    std::string normalize_etag(std::string_view etag);

    struct TargetOutcome
    {
        PutResult result;
        std::exception_ptr error;

        bool ok() const { return !error; }
    };

    class TransferExecutor
    {
    public:
        TransferExecutor(RetryPolicy policy, CancelToken cancel);

        // Single target. Get and put are retried together.
        PutResult copy(StorageClient &source, StorageClient &target, std::uint64_t length);

        // Reads the source once and writes it to every target in parallel. A target that fails is retried on its
        // own, re-reading the source; failures never affect the other targets.
        std::vector<TargetOutcome> copy(StorageClient &source, std::span<StorageClient *const> targets,
                                        std::uint64_t length);

        const RetryPolicy &policy() const { return policy_; }
        const CancelToken &cancel_token() const { return cancel_; }

    private:
        RetryPolicy policy_;
        CancelToken cancel_;
    };

} // namespace ferry
