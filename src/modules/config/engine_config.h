// modules/config/engine_config.h
#ifndef DURABLEFLOW_MODULES_CONFIG_ENGINE_CONFIG_H
#define DURABLEFLOW_MODULES_CONFIG_ENGINE_CONFIG_H

#include "common/logging/logger.h"
#include "modules/substrate/retry_policy.h"
#include <chrono>
#include <string>

namespace durableflow {

struct ActivitySettings {
    ActivityOptions node = ActivityOptions::standard();
    ActivityOptions agent = ActivityOptions::standard();
    ActivityOptions events = ActivityOptions::fire_and_forget();
};

struct AgentSettings {
    int continue_as_new_threshold = 50;
    int incremental_save_interval = 10;
    std::chrono::milliseconds user_input_timeout{300000};
    int default_max_iterations = 100;
};

struct HistorySettings {
    std::string store = "memory"; // memory | file
    std::string path = "durableflow-history";
};

// engine.yaml:
//   logging:    {level, pattern}
//   activities: {node|agent|events: {timeout_ms, heartbeat_timeout_ms, retry: {...}}}
//   agent:      {continue_as_new_threshold, incremental_save_interval, user_input_timeout_ms, default_max_iterations}
//   history:    {store: memory|file, path}
struct EngineConfig {
    logging::LoggingConfig logging;
    ActivitySettings activities;
    AgentSettings agent;
    HistorySettings history;

    // A missing file yields the defaults; malformed content throws ConfigError
    static EngineConfig load_from_file(const std::string& file_path);
    static EngineConfig load_from_string(const std::string& yaml_content);
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_CONFIG_ENGINE_CONFIG_H
