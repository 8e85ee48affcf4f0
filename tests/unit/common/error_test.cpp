/// @file error_test.cpp
/// @brief Tests for error codes and status helpers

#include <gtest/gtest.h>

#include "common/error.h"

namespace agentguard {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    if (value <= 0) {
        return InvalidArgumentError("value must be positive");
    }
    return value;
}

absl::Status Doubled(int value, int* out) {
    AGENTGUARD_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    *out = parsed * 2;
    return OkStatus();
}

absl::Status Chain(int value) {
    int out = 0;
    AGENTGUARD_RETURN_IF_ERROR(Doubled(value, &out));
    return OkStatus();
}

TEST(ErrorTest, CodesMapToAbslCodes) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigurationError), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(ToAbslCode(ErrorCode::kPatternCompileError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kDuplicateRule), absl::StatusCode::kAlreadyExists);
    EXPECT_EQ(ToAbslCode(ErrorCode::kBlocked), absl::StatusCode::kPermissionDenied);
    EXPECT_EQ(ToAbslCode(ErrorCode::kNotFound), absl::StatusCode::kNotFound);
}

TEST(ErrorTest, ErrorCodeSurvivesPropagation) {
    auto status = Chain(-1);
    ASSERT_FALSE(status.ok());
    EXPECT_TRUE(absl::IsInvalidArgument(status));
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "value must be positive");

    EXPECT_TRUE(Chain(3).ok());
}

TEST(ErrorTest, ConfigurationErrorIsDistinguishable) {
    auto config_error = ConfigurationError("bad monitor section");
    auto plain = absl::FailedPreconditionError("bad monitor section");

    EXPECT_EQ(config_error.code(), plain.code());
    EXPECT_EQ(GetErrorCode(config_error), ErrorCode::kConfigurationError);
    EXPECT_FALSE(GetErrorCode(plain).has_value());
}

TEST(ErrorTest, OkStatusHasOkCode) {
    EXPECT_EQ(GetErrorCode(OkStatus()), ErrorCode::kOk);
    EXPECT_TRUE(MakeError(ErrorCode::kOk, "ignored").ok());
}

TEST(ErrorTest, Names) {
    EXPECT_EQ(ErrorCodeName(ErrorCode::kBlocked), "BLOCKED");
    EXPECT_EQ(ErrorCodeName(ErrorCode::kConfigurationError), "CONFIGURATION_ERROR");
    EXPECT_EQ(ErrorCodeName(ErrorCode::kDuplicateRule), "DUPLICATE_RULE");
}

}  // namespace
}  // namespace agentguard
