// common/logging/logger.cpp
#include "common/logging/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <mutex>

namespace durableflow::logging {

namespace {

constexpr const char* kLoggerName = "durableflow";

std::mutex g_logger_mutex;

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("DURABLEFLOW_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? "info" : config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("DURABLEFLOW_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern;
}

std::shared_ptr<spdlog::logger> create_logger_locked() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;
    // stderr keeps stdout free for CLI output
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::from_str(resolve_level(LoggingConfig{})));
    return created;
}

} // namespace

void init_logging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    auto log = create_logger_locked();
    log->set_level(spdlog::level::from_str(resolve_level(config)));
    const std::string pattern = resolve_pattern(config);
    if (!pattern.empty()) {
        log->set_pattern(pattern);
    }
}

std::shared_ptr<spdlog::logger> logger() {
    // 热路径：已创建时直接返回
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return create_logger_locked();
}

} // namespace durableflow::logging
