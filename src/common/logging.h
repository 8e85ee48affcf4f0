#pragma once

/// @file logging.h
/// @brief Diagnostic and security-audit logging on top of spdlog
///
/// Two loggers exist. The diagnostic logger ("agentguard") writes to stderr
/// and optionally to a rotating file; it is what the AGENTGUARD_LOG_* macros
/// use. The audit logger ("agentguard.audit") is off unless a file is
/// configured and receives one line per security decision taken by the
/// monitor, independent of the diagnostic level.

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace agentguard {

class Config;

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

struct LogConfig {
    std::string name = "agentguard";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Rotating diagnostic file, in addition to stderr
    bool enable_file = false;
    std::string file_path = "agentguard.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;

    /// Security audit trail; empty disables it
    std::string audit_file;
};

/// @brief (Re)build the loggers from the given configuration
///
/// Safe to call again after ShutdownLogging(), e.g. once the configuration
/// file has been read.
void InitLogging(const LogConfig& config = {});

/// @brief Diagnostic logger, initialised with defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Audit logger, or nullptr when no audit file is configured
std::shared_ptr<spdlog::logger> GetAuditLogger();

void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off"). Unknown names map to kInfo.
LogLevel ParseLogLevel(std::string_view name);

/// @brief Log settings from the `logging:` section of a configuration
///
/// `cli_level`, when non-empty, overrides `logging.level`.
LogConfig LogConfigFromConfig(const Config& config, std::string_view cli_level = "",
                              LogLevel default_level = LogLevel::kWarn);

void FlushLogs();

/// @brief Flush and drop both loggers
void ShutdownLogging();

#define AGENTGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::agentguard::GetLogger(), __VA_ARGS__)
#define AGENTGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::agentguard::GetLogger(), __VA_ARGS__)
#define AGENTGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::agentguard::GetLogger(), __VA_ARGS__)
#define AGENTGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::agentguard::GetLogger(), __VA_ARGS__)
#define AGENTGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::agentguard::GetLogger(), __VA_ARGS__)
#define AGENTGUARD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::agentguard::GetLogger(), __VA_ARGS__)

/// Writes to the audit trail when one is configured, otherwise does nothing
#define AGENTGUARD_AUDIT(...)                                                  \
    do {                                                                       \
        if (auto _agentguard_audit = ::agentguard::GetAuditLogger()) {         \
            _agentguard_audit->info(__VA_ARGS__);                              \
        }                                                                      \
    } while (0)

}  // namespace agentguard
