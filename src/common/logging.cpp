#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "config.h"

namespace agentguard {

namespace {

constexpr char kAuditLoggerName[] = "agentguard.audit";
constexpr char kAuditPattern[] = "%Y-%m-%dT%H:%M:%S.%e %v";

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<spdlog::logger> g_audit_logger;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

std::shared_ptr<spdlog::logger> BuildLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // stderr keeps --json output on stdout parseable
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(ToSpdlog(config.level));
    sinks.push_back(console_sink);

    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(ToSpdlog(config.level));
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(ToSpdlog(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> BuildAuditLogger(const std::string& path) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
    auto logger = std::make_shared<spdlog::logger>(kAuditLoggerName, sink);
    logger->set_level(spdlog::level::info);
    logger->set_pattern(kAuditPattern);
    // Every decision reaches disk before the host acts on it
    logger->flush_on(spdlog::level::info);
    return logger;
}

}  // namespace

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_logger = BuildLogger(config);
    spdlog::set_default_logger(g_logger);

    if (g_audit_logger) {
        g_audit_logger->flush();
        g_audit_logger.reset();
    }
    if (!config.audit_file.empty()) {
        try {
            g_audit_logger = BuildAuditLogger(config.audit_file);
        } catch (const spdlog::spdlog_ex& e) {
            g_logger->error("Cannot open audit log '{}': {}", config.audit_file, e.what());
        }
    }
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    InitLogging();
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_logger;
}

std::shared_ptr<spdlog::logger> GetAuditLogger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_audit_logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    logger->set_level(ToSpdlog(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(ToSpdlog(level));
    }
}

LogLevel ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(name);
    if (lower == "trace") return LogLevel::kTrace;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    if (lower == "critical") return LogLevel::kCritical;
    if (lower == "off") return LogLevel::kOff;
    return LogLevel::kInfo;
}

LogConfig LogConfigFromConfig(const Config& config, std::string_view cli_level,
                              LogLevel default_level) {
    LogConfig result;
    if (!cli_level.empty()) {
        result.level = ParseLogLevel(cli_level);
    } else if (config.HasKey("logging.level")) {
        result.level = ParseLogLevel(config.GetString("logging.level"));
    } else {
        result.level = default_level;
    }
    if (config.HasKey("logging.file")) {
        result.enable_file = true;
        result.file_path = config.GetString("logging.file");
    }
    result.audit_file = config.GetString("logging.audit_file");
    return result;
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    if (g_audit_logger) {
        g_audit_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_audit_logger) {
        g_audit_logger->flush();
        g_audit_logger.reset();
    }
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
    spdlog::shutdown();
}

}  // namespace agentguard
