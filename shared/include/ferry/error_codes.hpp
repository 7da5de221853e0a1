/**
 * Ferry - Error codes and exception types shared by every layer.
 */
#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        UnsupportedScheme = 1,
        InvalidUrl = 2,
        NoMatchingHost = 3,
        ClientInit = 4,
        NotFound = 5,
        AccessDenied = 6,
        RemoteError = 7,
        IoError = 8,
        IntegrityMismatch = 9,
        TransferFailed = 10,
        InvalidSessionId = 11,
        SessionDirMissing = 12,
        NoWatcherCapability = 13,
        InvalidArgument = 14,
        Interrupted = 15,
        Transport = 16,
        DnsFailure = 17
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Connection-level failure; op names the network operation that failed ("read", "write", "dial", ...).
    class NetworkError : public Error
    {
    public:
        NetworkError(std::string op, const std::string &message);

        const std::string &op() const noexcept { return op_; }

    private:
        std::string op_;
    };

    class DnsError : public Error
    {
    public:
        DnsError(std::string host, const std::string &message);

        const std::string &host() const noexcept { return host_; }

    private:
        std::string host_;
    };

    bool is_retryable(const std::exception &error);
    bool is_retryable(const std::exception_ptr &error);

    // Code of the outermost ferry::Error in the nesting chain, IoError when there is none.
    ErrorCode error_code_of(const std::exception &error);

    // Messages of the exception and everything nested inside it, joined with ": ".
    std::string describe(const std::exception &error);
    std::string describe(const std::exception_ptr &error);

} // namespace ferry
