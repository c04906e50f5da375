// modules/config/engine_config.cpp
#include "modules/config/engine_config.h"
#include "common/errors.h"
#include "common/utils/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace durableflow {

namespace {

const nlohmann::json& section(const nlohmann::json& root, const char* name) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!root.contains(name) || root.at(name).is_null()) return kEmpty;
    const auto& value = root.at(name);
    if (!value.is_object()) {
        throw ConfigError(std::string("config section '") + name + "' must be a mapping");
    }
    return value;
}

int positive_int(const nlohmann::json& sec, const char* key, int fallback) {
    if (!sec.contains(key)) return fallback;
    const auto& value = sec.at(key);
    if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
        throw ConfigError(std::string("'") + key + "' must be a positive integer");
    }
    return value.get<int>();
}

void apply_logging(const nlohmann::json& sec, logging::LoggingConfig& out) {
    if (sec.contains("level")) {
        static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
        const std::string level = sec.at("level").is_string() ? sec.at("level").get<std::string>() : "";
        bool known = false;
        for (const char* candidate : kLevels) {
            if (level == candidate) known = true;
        }
        if (!known) {
            throw ConfigError("Unknown logging.level: '" + level + "'");
        }
        out.level = level;
    }
    if (sec.contains("pattern")) {
        if (!sec.at("pattern").is_string()) {
            throw ConfigError("logging.pattern must be a string");
        }
        out.pattern = sec.at("pattern").get<std::string>();
    }
}

void apply_activity(const nlohmann::json& activities, const char* name, ActivityOptions& out) {
    const auto& sec = section(activities, name);
    try {
        from_json(sec, out);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("activities.") + name + ": " + e.what());
    }
}

} // namespace

EngineConfig EngineConfig::load_from_file(const std::string& file_path) {
    if (!std::filesystem::exists(file_path)) {
        return EngineConfig{};
    }
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open engine config: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

EngineConfig EngineConfig::load_from_string(const std::string& yaml_content) {
    nlohmann::json root;
    try {
        root = yaml_to_json(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid engine config YAML: ") + e.what());
    }

    EngineConfig config;
    if (root.is_null()) return config;
    if (!root.is_object()) {
        throw ConfigError("Engine config must be a mapping");
    }

    apply_logging(section(root, "logging"), config.logging);

    const auto& activities = section(root, "activities");
    apply_activity(activities, "node", config.activities.node);
    apply_activity(activities, "agent", config.activities.agent);
    apply_activity(activities, "events", config.activities.events);

    const auto& agent = section(root, "agent");
    config.agent.continue_as_new_threshold =
        positive_int(agent, "continue_as_new_threshold", config.agent.continue_as_new_threshold);
    config.agent.incremental_save_interval =
        positive_int(agent, "incremental_save_interval", config.agent.incremental_save_interval);
    config.agent.user_input_timeout = std::chrono::milliseconds{
        positive_int(agent, "user_input_timeout_ms", static_cast<int>(config.agent.user_input_timeout.count()))};
    config.agent.default_max_iterations =
        positive_int(agent, "default_max_iterations", config.agent.default_max_iterations);

    const auto& history = section(root, "history");
    if (history.contains("store")) {
        const std::string store = history.at("store").is_string() ? history.at("store").get<std::string>() : "";
        if (store != "memory" && store != "file") {
            throw ConfigError("history.store must be 'memory' or 'file'");
        }
        config.history.store = store;
    }
    if (history.contains("path")) {
        if (!history.at("path").is_string()) {
            throw ConfigError("history.path must be a string");
        }
        config.history.path = history.at("path").get<std::string>();
    }
    return config;
}

} // namespace durableflow
