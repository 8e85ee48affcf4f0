#pragma once

/// @file error.h
/// @brief Error reporting with absl::Status
///
/// Errors raised by AgentGuard itself carry their ErrorCode as a status
/// payload, so a ConfigurationError stays distinguishable from any other
/// FailedPrecondition after it has been propagated.

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace agentguard {

enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,

    kConfigurationError,   ///< Malformed configuration, fatal at startup
    kPatternCompileError,  ///< Rule pattern is not a valid regular expression
    kDuplicateRule,        ///< Rule id already registered
    kBlocked,              ///< Input refused by the monitor
};

/// @brief Status payload key holding the ErrorCode name
inline constexpr char kErrorCodePayloadKey[] = "agentguard.error_code";

/// @brief Canonical absl code for an ErrorCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable name, e.g. "CONFIGURATION_ERROR"
std::string_view ErrorCodeName(ErrorCode code);

/// @brief ErrorCode recorded on a status by MakeError, nullopt for foreign statuses
std::optional<ErrorCode> GetErrorCode(const absl::Status& status);

inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Error status with the given code and message, tagged with the code
absl::Status MakeError(ErrorCode code, std::string_view message);

inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

inline absl::Status InvalidArgumentError(std::string_view message) {
    return MakeError(ErrorCode::kInvalidArgument, message);
}

inline absl::Status NotFoundError(std::string_view message) {
    return MakeError(ErrorCode::kNotFound, message);
}

/// @brief Return if status is not OK
#define AGENTGUARD_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define AGENTGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    AGENTGUARD_ASSIGN_OR_RETURN_IMPL(                                          \
        AGENTGUARD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define AGENTGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define AGENTGUARD_CONCAT(a, b) AGENTGUARD_CONCAT_IMPL(a, b)
#define AGENTGUARD_CONCAT_IMPL(a, b) a##b

}  // namespace agentguard
