#include <chrono>
#include <gtest/gtest.h>
#include "core/context/call_context.hpp"

namespace {

using octavius::core::context::CallContext;
using octavius::core::errors::ErrorCategory;
using octavius::core::errors::get_error;
using octavius::core::errors::is_error;

TEST(CallContextTest, BackgroundIsLiveWithoutDeadline) {
    const auto ctx = CallContext::background();
    EXPECT_FALSE(is_error(ctx.check("op")));
    EXPECT_FALSE(ctx.remaining_ms().has_value());
}

TEST(CallContextTest, CopiesShareCancellation) {
    const auto ctx = CallContext::background();
    const CallContext copy = ctx;
    ctx.cancel();

    auto status = copy.check("get metadata/a");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).category, ErrorCategory::Cancelled);
    EXPECT_EQ(get_error(status).message, "get metadata/a: call cancelled");
}

TEST(CallContextTest, ExpiredDeadlineIsReported) {
    const auto ctx = CallContext::with_timeout(std::chrono::milliseconds(0));
    auto status = ctx.check("scan");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).category, ErrorCategory::DeadlineExceeded);
    EXPECT_EQ(ctx.remaining_ms().value(), 0);
}

TEST(CallContextTest, CancellationWinsOverExpiry) {
    const auto ctx = CallContext::with_timeout(std::chrono::milliseconds(0));
    ctx.cancel();
    EXPECT_EQ(get_error(ctx.check("op")).category, ErrorCategory::Cancelled);
}

TEST(CallContextTest, FutureDeadlineLeavesTimeRemaining) {
    const auto ctx = CallContext::with_timeout(std::chrono::seconds(60));
    EXPECT_FALSE(is_error(ctx.check("op")));
    EXPECT_GT(ctx.remaining_ms().value(), 1000);
}

}  // namespace
