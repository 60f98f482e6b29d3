#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/octavius_errors.hpp"

namespace octavius::core::context {

    // Carries cancellation and deadline through every store and executor call.
    // Copies share the same cancel token.
    class CallContext {
    public:
        using Clock = std::chrono::steady_clock;

        CallContext() : cancel_token_(std::make_shared<std::atomic_bool>(false)) {}

        static CallContext background() { return CallContext(); }

        static CallContext with_timeout(const std::chrono::milliseconds timeout) {
            CallContext ctx;
            ctx.deadline_ = Clock::now() + timeout;
            return ctx;
        }

        void cancel() const { cancel_token_->store(true); }

        bool is_cancelled() const { return cancel_token_->load(); }

        bool is_expired() const {
            return deadline_.has_value() && Clock::now() >= deadline_.value();
        }

        const std::optional<Clock::time_point>& deadline() const { return deadline_; }

        // Milliseconds left before the deadline, nullopt when there is none.
        std::optional<std::int64_t> remaining_ms() const {
            if (!deadline_.has_value()) {
                return std::nullopt;
            }
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  deadline_.value() - Clock::now())
                                  .count();
            return left > 0 ? left : 0;
        }

        const std::shared_ptr<std::atomic_bool>& cancel_token() const {
            return cancel_token_;
        }

        // Cancellation wins over expiry when both hold.
        errors::Status check(const std::string& operation) const {
            if (is_cancelled()) {
                return errors::OctaviusError{errors::ErrorCategory::Cancelled,
                                             operation + ": call cancelled",
                                             "cancelled"};
            }
            if (is_expired()) {
                return errors::OctaviusError{errors::ErrorCategory::DeadlineExceeded,
                                             operation + ": deadline exceeded",
                                             "deadline_exceeded"};
            }
            return errors::ok();
        }

    private:
        std::shared_ptr<std::atomic_bool> cancel_token_;
        std::optional<Clock::time_point> deadline_;
    };

}  // namespace octavius::core::context
