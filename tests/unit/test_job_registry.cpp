#include <algorithm>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"
#include "core/logging/logger.hpp"
#include "registry/job_registry.hpp"
#include "registry/metadata_codec.hpp"
#include "test_doubles.hpp"

namespace {

using octavius::core::context::CallContext;
using octavius::core::errors::ErrorCategory;
using octavius::core::errors::get_error;
using octavius::core::errors::get_value;
using octavius::core::errors::is_error;
using octavius::core::logging::Logger;
using octavius::protocol::Metadata;
using octavius::registry::JobRegistry;
using octavius::registry::RegistrationMode;
using octavius::test_support::backend_error;
using octavius::test_support::RecordingStore;

Metadata make_metadata(const std::string& name) {
    Metadata metadata;
    metadata.name = name;
    metadata.author = "littlestar642";
    metadata.image_name = "demo-image";
    metadata.description = "sample test metadata";
    return metadata;
}

class JobRegistryTest : public ::testing::Test {
protected:
    std::ostringstream log_output_;
    Logger logger_{log_output_, octavius::core::logging::LogLevel::DEBUG};
    std::shared_ptr<RecordingStore> store_ = std::make_shared<RecordingStore>();
    CallContext ctx_ = CallContext::background();

    JobRegistry make_registry(RegistrationMode mode = RegistrationMode::CheckThenPut) {
        return JobRegistry(store_, mode, logger_);
    }
};

TEST_F(JobRegistryTest, RegisterThenFetchRoundTrips) {
    auto registry = make_registry();
    const auto metadata = make_metadata("test-data");

    auto saved = registry.register_job(ctx_, "test-data", metadata);
    ASSERT_FALSE(is_error(saved));
    EXPECT_EQ(get_value(saved), metadata);

    auto fetched = registry.fetch(ctx_, "test-data");
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched), metadata);
}

TEST_F(JobRegistryTest, NameWithSpaceRoundTripsAndLists) {
    auto registry = make_registry();
    const auto metadata = make_metadata("test data");

    auto saved = registry.register_job(ctx_, "test data", metadata);
    ASSERT_FALSE(is_error(saved));
    EXPECT_TRUE(store_->raw("metadata/test data").has_value());

    auto fetched = registry.fetch(ctx_, "test data");
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched), metadata);

    auto listed = registry.list(ctx_);
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed).jobs, (std::vector<std::string>{"test data"}));
}

TEST_F(JobRegistryTest, RegisterStoresUnderMetadataPrefix) {
    auto registry = make_registry();
    ASSERT_FALSE(is_error(registry.register_job(ctx_, "test-data", make_metadata("test-data"))));

    ASSERT_EQ(store_->calls.size(), 2u);
    EXPECT_EQ(store_->calls[0], "get metadata/test-data");
    EXPECT_EQ(store_->calls[1], "put metadata/test-data");
    EXPECT_TRUE(store_->raw("metadata/test-data").has_value());
}

TEST_F(JobRegistryTest, RegisterForcesRecordNameToKeyName) {
    auto registry = make_registry();
    auto saved = registry.register_job(ctx_, "resize", make_metadata("something-else"));
    ASSERT_FALSE(is_error(saved));
    EXPECT_EQ(get_value(saved).name, "resize");

    auto fetched = registry.fetch(ctx_, "resize");
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched).name, "resize");
}

TEST_F(JobRegistryTest, SecondRegisterFailsAndKeepsOriginal) {
    auto registry = make_registry();
    const auto original = make_metadata("test-data");
    ASSERT_FALSE(is_error(registry.register_job(ctx_, "test-data", original)));

    auto replacement = make_metadata("test-data");
    replacement.image_name = "other-image";
    auto second = registry.register_job(ctx_, "test-data", replacement);
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).category, ErrorCategory::AlreadyExists);
    EXPECT_EQ(get_error(second).message, "metadata: key already present");
    EXPECT_EQ(store_->count("put"), 1u);

    auto fetched = registry.fetch(ctx_, "test-data");
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched), original);
}

TEST_F(JobRegistryTest, AnyNonEmptyExistingValueCountsAsPresent) {
    store_->seed("metadata/test-data", "some key");
    auto registry = make_registry();

    auto saved = registry.register_job(ctx_, "test-data", make_metadata("test-data"));
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).category, ErrorCategory::AlreadyExists);
    EXPECT_EQ(store_->raw("metadata/test-data").value(), "some key");
}

TEST_F(JobRegistryTest, ReadFailureIsInternalAndSkipsWrite) {
    store_->get_failure = backend_error("some error");
    auto registry = make_registry();

    auto saved = registry.register_job(ctx_, "test-data", make_metadata("test-data"));
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).category, ErrorCategory::Internal);
    EXPECT_NE(get_error(saved).message.find("some error"), std::string::npos);
    EXPECT_NE(get_error(saved).message.find("metadata/test-data"), std::string::npos);
    EXPECT_EQ(store_->count("put"), 0u);
}

TEST_F(JobRegistryTest, WriteFailureIsInternalAfterExistenceCheck) {
    store_->put_failure = backend_error("some error");
    auto registry = make_registry();

    auto saved = registry.register_job(ctx_, "test-data", make_metadata("test-data"));
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).category, ErrorCategory::Internal);
    ASSERT_EQ(store_->calls.size(), 2u);
    EXPECT_EQ(store_->calls[0], "get metadata/test-data");
    EXPECT_EQ(store_->calls[1], "put metadata/test-data");
}

TEST_F(JobRegistryTest, RegisterRejectsInvalidName) {
    auto registry = make_registry();
    auto empty = registry.register_job(ctx_, "", make_metadata(""));
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).category, ErrorCategory::Input);

    auto nested = registry.register_job(ctx_, "a/b", make_metadata("a/b"));
    ASSERT_TRUE(is_error(nested));
    EXPECT_EQ(get_error(nested).code, "invalid_job_name");
    EXPECT_TRUE(store_->calls.empty());
}

TEST_F(JobRegistryTest, CheckThenPutLetsConcurrentRegistrationsBothSucceed) {
    auto registry = make_registry(RegistrationMode::CheckThenPut);
    auto winner = make_metadata("race");
    winner.author = "first";
    auto loser = make_metadata("race");
    loser.author = "second";

    // The second registration runs entirely between the first one's get and put.
    octavius::core::errors::Result<Metadata> inner = Metadata{};
    store_->hook_on = "after:get";
    store_->hook = [&]() { inner = registry.register_job(ctx_, "race", loser); };

    auto outer = registry.register_job(ctx_, "race", winner);
    ASSERT_FALSE(is_error(outer));
    ASSERT_FALSE(is_error(inner));

    auto fetched = registry.fetch(ctx_, "race");
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched).author, "first");
}

TEST_F(JobRegistryTest, ConditionalWriteRejectsTheLosingRegistration) {
    auto registry = make_registry(RegistrationMode::ConditionalWrite);
    auto first = make_metadata("race");
    first.author = "first";
    auto second = make_metadata("race");
    second.author = "second";

    octavius::core::errors::Result<Metadata> inner = Metadata{};
    store_->hook_on = "before:put_if_absent";
    store_->hook = [&]() { inner = registry.register_job(ctx_, "race", second); };

    auto outer = registry.register_job(ctx_, "race", first);
    ASSERT_FALSE(is_error(inner));
    ASSERT_TRUE(is_error(outer));
    EXPECT_EQ(get_error(outer).category, ErrorCategory::AlreadyExists);

    auto fetched = registry.fetch(ctx_, "race");
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched).author, "second");
    EXPECT_EQ(store_->count("get"), 1u);  // only the fetch above
}

TEST_F(JobRegistryTest, ConditionalWriteFailureIsInternal) {
    store_->put_failure = backend_error("etcd unavailable");
    auto registry = make_registry(RegistrationMode::ConditionalWrite);

    auto saved = registry.register_job(ctx_, "job", make_metadata("job"));
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).category, ErrorCategory::Internal);
}

TEST_F(JobRegistryTest, FetchUnknownJobIsNotFound) {
    auto registry = make_registry();
    auto fetched = registry.fetch(ctx_, "missing");
    ASSERT_TRUE(is_error(fetched));
    EXPECT_EQ(get_error(fetched).category, ErrorCategory::NotFound);
    EXPECT_EQ(get_error(fetched).code, "job_not_found");
}

TEST_F(JobRegistryTest, FetchEmptyValueIsNotFound) {
    store_->seed("metadata/blank", "");
    auto registry = make_registry();
    auto fetched = registry.fetch(ctx_, "blank");
    ASSERT_TRUE(is_error(fetched));
    EXPECT_EQ(get_error(fetched).category, ErrorCategory::NotFound);
}

TEST_F(JobRegistryTest, BothModesTreatEmptyValueAsAbsent) {
    for (const auto mode : {RegistrationMode::CheckThenPut, RegistrationMode::ConditionalWrite}) {
        store_ = std::make_shared<RecordingStore>();
        store_->seed("metadata/blank", "");
        auto registry = make_registry(mode);

        auto saved = registry.register_job(ctx_, "blank", make_metadata("blank"));
        ASSERT_FALSE(is_error(saved)) << octavius::registry::to_string(mode);

        auto fetched = registry.fetch(ctx_, "blank");
        ASSERT_FALSE(is_error(fetched)) << octavius::registry::to_string(mode);
        EXPECT_EQ(get_value(fetched), make_metadata("blank"));
    }
}

TEST_F(JobRegistryTest, FetchReadFailureIsInternal) {
    store_->get_failure = backend_error("error in etcd");
    auto registry = make_registry();
    auto fetched = registry.fetch(ctx_, "job");
    ASSERT_TRUE(is_error(fetched));
    EXPECT_EQ(get_error(fetched).category, ErrorCategory::Internal);
}

TEST_F(JobRegistryTest, FetchCorruptRecordIsInternalNotZeroValue) {
    store_->seed("metadata/broken", "\x01\x02not-json");
    auto registry = make_registry();
    auto fetched = registry.fetch(ctx_, "broken");
    ASSERT_TRUE(is_error(fetched));
    EXPECT_EQ(get_error(fetched).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(fetched).code, "decode_failed");
}

TEST_F(JobRegistryTest, FetchRejectsRecordStoredUnderAnotherName) {
    store_->seed("metadata/alias", octavius::registry::encode_metadata(make_metadata("real")));
    auto registry = make_registry();
    auto fetched = registry.fetch(ctx_, "alias");
    ASSERT_TRUE(is_error(fetched));
    EXPECT_EQ(get_error(fetched).code, "record_key_mismatch");
}

TEST_F(JobRegistryTest, ListReturnsExactlyRegisteredNames) {
    auto registry = make_registry();
    for (const std::string name : {"c", "a", "b"}) {
        ASSERT_FALSE(is_error(registry.register_job(ctx_, name, make_metadata(name))));
    }
    store_->seed("other/ignored", "x");

    auto listed = registry.list(ctx_);
    ASSERT_FALSE(is_error(listed));
    auto jobs = get_value(listed).jobs;
    std::sort(jobs.begin(), jobs.end());
    EXPECT_EQ(jobs, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(store_->calls.back(), "scan metadata/");
}

TEST_F(JobRegistryTest, ListDerivesNamesFromKeysNotValues) {
    store_->seed("metadata/demo-image-name", "");
    store_->seed("metadata/demo-image-name-1", "garbage");
    auto registry = make_registry();

    auto listed = registry.list(ctx_);
    ASSERT_FALSE(is_error(listed));
    EXPECT_EQ(get_value(listed).jobs,
              (std::vector<std::string>{"demo-image-name", "demo-image-name-1"}));
}

TEST_F(JobRegistryTest, ListScanFailureIsInternal) {
    store_->scan_failure = backend_error("error in etcd");
    auto registry = make_registry();
    auto listed = registry.list(ctx_);
    ASSERT_TRUE(is_error(listed));
    EXPECT_EQ(get_error(listed).category, ErrorCategory::Internal);
    EXPECT_NE(get_error(listed).message.find("error in etcd"), std::string::npos);
}

TEST_F(JobRegistryTest, CancelledContextFailsWithoutWriting) {
    auto registry = make_registry();
    const auto ctx = CallContext::background();
    ctx.cancel();

    auto saved = registry.register_job(ctx, "job", make_metadata("job"));
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).category, ErrorCategory::Cancelled);
    EXPECT_FALSE(store_->raw("metadata/job").has_value());
}

TEST_F(JobRegistryTest, ExpiredContextIsDeadlineExceeded) {
    auto registry = make_registry();
    const auto ctx = CallContext::with_timeout(std::chrono::milliseconds(0));

    auto listed = registry.list(ctx);
    ASSERT_TRUE(is_error(listed));
    EXPECT_EQ(get_error(listed).category, ErrorCategory::DeadlineExceeded);
}

}  // namespace
