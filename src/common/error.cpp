#include "error.h"

#include <absl/strings/cord.h>

namespace agentguard {

namespace {

constexpr ErrorCode kAllCodes[] = {
    ErrorCode::kOk,
    ErrorCode::kUnknown,
    ErrorCode::kInvalidArgument,
    ErrorCode::kNotFound,
    ErrorCode::kFailedPrecondition,
    ErrorCode::kInternal,
    ErrorCode::kConfigurationError,
    ErrorCode::kPatternCompileError,
    ErrorCode::kDuplicateRule,
    ErrorCode::kBlocked,
};

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kPatternCompileError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kDuplicateRule:
            return absl::StatusCode::kAlreadyExists;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kBlocked:
            return absl::StatusCode::kPermissionDenied;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "OK";
        case ErrorCode::kInvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound: return "NOT_FOUND";
        case ErrorCode::kFailedPrecondition: return "FAILED_PRECONDITION";
        case ErrorCode::kInternal: return "INTERNAL";
        case ErrorCode::kConfigurationError: return "CONFIGURATION_ERROR";
        case ErrorCode::kPatternCompileError: return "PATTERN_COMPILE_ERROR";
        case ErrorCode::kDuplicateRule: return "DUPLICATE_RULE";
        case ErrorCode::kBlocked: return "BLOCKED";
        case ErrorCode::kUnknown:
        default: return "UNKNOWN";
    }
}

std::optional<ErrorCode> GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }
    auto payload = status.GetPayload(kErrorCodePayloadKey);
    if (!payload) {
        return std::nullopt;
    }
    const std::string name(*payload);
    for (ErrorCode code : kAllCodes) {
        if (ErrorCodeName(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), message);
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadKey, absl::Cord(ErrorCodeName(code)));
    }
    return status;
}

}  // namespace agentguard
