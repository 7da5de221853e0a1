#include "ferry/error_codes.hpp"

#include <array>
#include <utility>

namespace ferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 18> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::UnsupportedScheme, "unsupported_scheme"},
            {ErrorCode::InvalidUrl, "invalid_url"},
            {ErrorCode::NoMatchingHost, "no_matching_host"},
            {ErrorCode::ClientInit, "client_init_error"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AccessDenied, "access_denied"},
            {ErrorCode::RemoteError, "remote_error"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::IntegrityMismatch, "integrity_error"},
            {ErrorCode::TransferFailed, "transfer_failed"},
            {ErrorCode::InvalidSessionId, "invalid_session_id"},
            {ErrorCode::SessionDirMissing, "session_dir_missing"},
            {ErrorCode::NoWatcherCapability, "no_watcher_capability"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::Interrupted, "interrupted"},
            {ErrorCode::Transport, "transport_error"},
            {ErrorCode::DnsFailure, "dns_failure"},
        }};

        constexpr std::array<std::string_view, 3> kRetryableOps{"read", "write", "dial"};

    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::IoError;
    }

    Error::Error(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    NetworkError::NetworkError(std::string op, const std::string &message)
        : Error(ErrorCode::Transport, message), op_(std::move(op)) {}

    DnsError::DnsError(std::string host, const std::string &message)
        : Error(ErrorCode::DnsFailure, message), host_(std::move(host)) {}

    bool is_retryable(const std::exception &error)
    {
        if (dynamic_cast<const DnsError *>(&error) != nullptr)
        {
            return true;
        }
        if (const auto *network = dynamic_cast<const NetworkError *>(&error))
        {
            for (const auto op : kRetryableOps)
            {
                if (network->op() == op)
                {
                    return true;
                }
            }
            return false;
        }
        try
        {
            std::rethrow_if_nested(error);
        }
        catch (const std::exception &inner)
        {
            return is_retryable(inner);
        }
        return false;
    }

    bool is_retryable(const std::exception_ptr &error)
    {
        if (!error)
        {
            return false;
        }
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception &ex)
        {
            return is_retryable(ex);
        }
        return false;
    }

    ErrorCode error_code_of(const std::exception &error)
    {
        if (const auto *typed = dynamic_cast<const Error *>(&error))
        {
            return typed->code();
        }
        try
        {
            std::rethrow_if_nested(error);
        }
        catch (const std::exception &inner)
        {
            return error_code_of(inner);
        }
        return ErrorCode::IoError;
    }

    std::string describe(const std::exception &error)
    {
        std::string message = error.what();
        try
        {
            std::rethrow_if_nested(error);
        }
        catch (const std::exception &inner)
        {
            message += ": " + describe(inner);
        }
        return message;
    }

    std::string describe(const std::exception_ptr &error)
    {
        if (!error)
        {
            return {};
        }
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception &ex)
        {
            return describe(ex);
        }
        return {};
    }

} // namespace ferry
