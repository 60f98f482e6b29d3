#pragma once
#include <string>
#include <utility>
#include <variant>

namespace octavius::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,             // E.g., malformed key=value token or empty job name
        NotFound,          // E.g., no metadata stored for the job name
        AlreadyExists,     // E.g., job name registered twice
        Cancelled,         // Caller cancelled while a backend call was outstanding
        DeadlineExceeded,  // Caller deadline passed while a backend call was outstanding
        Internal           // Store, codec or executor failure
    };

    // The standardized error payload
    struct OctaviusError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Helpful tips for the user
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR an OctaviusError.
    template <typename T>
    using Result = std::variant<T, OctaviusError>;

    // Result for operations that only report success or failure.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<OctaviusError>(result);
    }

    template <typename T>
    const OctaviusError& get_error(const Result<T>& result) {
        return std::get<OctaviusError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    // Prefixes the message with the failing operation, keeping category and code.
    inline OctaviusError with_context(OctaviusError error, const std::string& context) {
        error.message = context + ": " + error.message;
        return error;
    }

    // Backend failures surface as Internal, except cancellation and expiry
    // which keep their own category so callers can tell them apart.
    inline OctaviusError as_internal(OctaviusError error, const std::string& context) {
        if (error.category != ErrorCategory::Cancelled &&
            error.category != ErrorCategory::DeadlineExceeded) {
            error.category = ErrorCategory::Internal;
        }
        return with_context(std::move(error), context);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::NotFound:
                return "not_found";
            case ErrorCategory::AlreadyExists:
                return "already_exists";
            case ErrorCategory::Cancelled:
                return "cancelled";
            case ErrorCategory::DeadlineExceeded:
                return "deadline_exceeded";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace octavius::core::errors
