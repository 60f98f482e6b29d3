#pragma once
#include <optional>
#include <string>
#include "core/errors/octavius_errors.hpp"

namespace octavius::core::errors {

    // Status codes carried across the RPC boundary.
    enum class StatusCode {
        Ok,
        InvalidArgument,
        NotFound,
        AlreadyExists,
        Cancelled,
        DeadlineExceeded,
        Internal
    };

    inline StatusCode to_status_code(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return StatusCode::InvalidArgument;
            case ErrorCategory::NotFound:
                return StatusCode::NotFound;
            case ErrorCategory::AlreadyExists:
                return StatusCode::AlreadyExists;
            case ErrorCategory::Cancelled:
                return StatusCode::Cancelled;
            case ErrorCategory::DeadlineExceeded:
                return StatusCode::DeadlineExceeded;
            case ErrorCategory::Internal:
            default:
                return StatusCode::Internal;
        }
    }

    // Ok has no error category, callers check it before mapping.
    inline ErrorCategory to_error_category(const StatusCode code) {
        switch (code) {
            case StatusCode::InvalidArgument:
                return ErrorCategory::Input;
            case StatusCode::NotFound:
                return ErrorCategory::NotFound;
            case StatusCode::AlreadyExists:
                return ErrorCategory::AlreadyExists;
            case StatusCode::Cancelled:
                return ErrorCategory::Cancelled;
            case StatusCode::DeadlineExceeded:
                return ErrorCategory::DeadlineExceeded;
            case StatusCode::Ok:
            case StatusCode::Internal:
            default:
                return ErrorCategory::Internal;
        }
    }

    inline std::string to_string(const StatusCode code) {
        switch (code) {
            case StatusCode::Ok:
                return "OK";
            case StatusCode::InvalidArgument:
                return "INVALID_ARGUMENT";
            case StatusCode::NotFound:
                return "NOT_FOUND";
            case StatusCode::AlreadyExists:
                return "ALREADY_EXISTS";
            case StatusCode::Cancelled:
                return "CANCELLED";
            case StatusCode::DeadlineExceeded:
                return "DEADLINE_EXCEEDED";
            case StatusCode::Internal:
                return "INTERNAL";
            default:
                return "UNKNOWN";
        }
    }

    inline std::optional<StatusCode> parse_status_code(const std::string& text) {
        if (text == "OK") return StatusCode::Ok;
        if (text == "INVALID_ARGUMENT") return StatusCode::InvalidArgument;
        if (text == "NOT_FOUND") return StatusCode::NotFound;
        if (text == "ALREADY_EXISTS") return StatusCode::AlreadyExists;
        if (text == "CANCELLED") return StatusCode::Cancelled;
        if (text == "DEADLINE_EXCEEDED") return StatusCode::DeadlineExceeded;
        if (text == "INTERNAL") return StatusCode::Internal;
        return std::nullopt;
    }

}  // namespace octavius::core::errors
