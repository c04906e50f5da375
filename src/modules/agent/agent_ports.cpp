// modules/agent/agent_ports.cpp
#include "modules/agent/agent_ports.h"
#include "common/errors.h"

namespace durableflow {

void InMemoryAgentConfigProvider::put(AgentConfig config, std::string owner_user_id) {
    if (config.id.empty()) {
        throw ConfigError("Agent config requires an id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = config.id;
    agents_[id] = Entry{std::move(config), std::move(owner_user_id)};
}

AgentConfig InMemoryAgentConfigProvider::get(const std::string& agent_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end() ||
        (!it->second.owner_user_id.empty() && it->second.owner_user_id != user_id)) {
        throw ConfigError("Agent " + agent_id + " not found or access denied");
    }
    return it->second.config;
}

void to_json(nlohmann::json& j, const ToolDefinition& tool) {
    j = nlohmann::json{
        {"name", tool.name},
        {"description", tool.description},
        {"type", tool.type},
        {"schema", tool.parameters},
        {"config", tool.config}
    };
}

void from_json(const nlohmann::json& j, ToolDefinition& tool) {
    tool.name = j.at("name").get<std::string>();
    tool.description = j.value("description", std::string{});
    tool.type = j.value("type", std::string("function"));
    if (j.contains("schema")) {
        tool.parameters = j.at("schema");
    } else if (j.contains("parameters")) {
        tool.parameters = j.at("parameters");
    }
    tool.config = j.contains("config") ? j.at("config") : nlohmann::json::object();
}

void to_json(nlohmann::json& j, const MemoryConfig& memory) {
    j = nlohmann::json{{"type", memory.type}, {"max_messages", memory.max_messages}};
}

void from_json(const nlohmann::json& j, MemoryConfig& memory) {
    memory.type = j.value("type", std::string("buffer"));
    memory.max_messages = j.value("max_messages", 50);
    if (memory.max_messages < 2) {
        throw ConfigError("memory_config.max_messages must be at least 2");
    }
}

void to_json(nlohmann::json& j, const AgentConfig& config) {
    j = nlohmann::json{
        {"id", config.id},
        {"name", config.name},
        {"system_prompt", config.system_prompt},
        {"model", config.model},
        {"provider", config.provider},
        {"connection_id", config.connection_id ? nlohmann::json(*config.connection_id) : nlohmann::json(nullptr)},
        {"temperature", config.temperature},
        {"max_tokens", config.max_tokens},
        {"max_iterations", config.max_iterations},
        {"available_tools", config.available_tools},
        {"memory_config", config.memory_config}
    };
}

void from_json(const nlohmann::json& j, AgentConfig& config) {
    config.id = j.at("id").get<std::string>();
    config.name = j.value("name", config.id);
    config.system_prompt = j.value("system_prompt", std::string{});
    config.model = j.value("model", std::string{});
    config.provider = j.value("provider", std::string{});
    if (j.contains("connection_id") && j.at("connection_id").is_string()) {
        config.connection_id = j.at("connection_id").get<std::string>();
    }
    config.temperature = j.value("temperature", 0.7);
    config.max_tokens = j.value("max_tokens", 4096);
    config.max_iterations = j.value("max_iterations", 0);
    config.available_tools = j.value("available_tools", std::vector<ToolDefinition>{});
    if (j.contains("memory_config")) {
        config.memory_config = j.at("memory_config").get<MemoryConfig>();
    }
}

void to_json(nlohmann::json& j, const LlmRequest& request) {
    j = nlohmann::json{
        {"model", request.model},
        {"provider", request.provider},
        {"connectionId", request.connection_id ? nlohmann::json(*request.connection_id) : nlohmann::json(nullptr)},
        {"messages", request.messages},
        {"tools", request.tools},
        {"temperature", request.temperature},
        {"maxTokens", request.max_tokens}
    };
}

void from_json(const nlohmann::json& j, LlmRequest& request) {
    request.model = j.value("model", std::string{});
    request.provider = j.value("provider", std::string{});
    if (j.contains("connectionId") && j.at("connectionId").is_string()) {
        request.connection_id = j.at("connectionId").get<std::string>();
    }
    request.messages = j.value("messages", std::vector<ConversationMessage>{});
    request.tools = j.value("tools", std::vector<ToolDefinition>{});
    request.temperature = j.value("temperature", 0.7);
    request.max_tokens = j.value("maxTokens", 4096);
}

void to_json(nlohmann::json& j, const LlmResponse& response) {
    j = nlohmann::json{{"content", response.content}, {"requiresUserInput", response.requires_user_input}};
    if (!response.tool_calls.empty()) j["tool_calls"] = response.tool_calls;
}

void from_json(const nlohmann::json& j, LlmResponse& response) {
    response.content = j.value("content", std::string{});
    response.tool_calls.clear();
    if (j.contains("tool_calls") && j.at("tool_calls").is_array()) {
        response.tool_calls = j.at("tool_calls").get<std::vector<ToolCall>>();
    }
    response.requires_user_input = j.value("requiresUserInput", false);
}

} // namespace durableflow
