#ifndef DURABLEFLOW_COMMON_LOGGING_LOGGER_H
#define DURABLEFLOW_COMMON_LOGGING_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace durableflow::logging {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [%t] %v";
};

// Creates (or reconfigures) the shared "durableflow" logger.
// DURABLEFLOW_LOG_LEVEL / DURABLEFLOW_LOG_PATTERN override the config values.
void init_logging(const LoggingConfig& config);

// Returns the shared logger, creating it with defaults on first use
std::shared_ptr<spdlog::logger> logger();

} // namespace durableflow::logging

#define DF_LOG_DEBUG(...) ::durableflow::logging::logger()->debug(__VA_ARGS__)
#define DF_LOG_INFO(...)  ::durableflow::logging::logger()->info(__VA_ARGS__)
#define DF_LOG_WARN(...)  ::durableflow::logging::logger()->warn(__VA_ARGS__)
#define DF_LOG_ERROR(...) ::durableflow::logging::logger()->error(__VA_ARGS__)

#endif // DURABLEFLOW_COMMON_LOGGING_LOGGER_H
