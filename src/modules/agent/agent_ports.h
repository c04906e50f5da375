// modules/agent/agent_ports.h
#ifndef DURABLEFLOW_MODULES_AGENT_AGENT_PORTS_H
#define DURABLEFLOW_MODULES_AGENT_AGENT_PORTS_H

#include "core/types/conversation.h"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace durableflow {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string type = "function";
    nlohmann::json parameters = nlohmann::json::object(); // JSON schema
    nlohmann::json config = nlohmann::json::object();
};

struct MemoryConfig {
    std::string type = "buffer";
    int max_messages = 50;
};

struct AgentConfig {
    std::string id;
    std::string name;
    std::string system_prompt;
    std::string model;
    std::string provider;
    std::optional<std::string> connection_id;
    double temperature = 0.7;
    int max_tokens = 4096;
    int max_iterations = 0; // 0 表示使用引擎默认值
    std::vector<ToolDefinition> available_tools;
    MemoryConfig memory_config;
};

struct LlmRequest {
    std::string model;
    std::string provider;
    std::optional<std::string> connection_id;
    std::vector<ConversationMessage> messages;
    std::vector<ToolDefinition> tools;
    double temperature = 0.7;
    int max_tokens = 4096;
};

struct LlmResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    bool requires_user_input = false;
};

// Agent Config port. Throws ConfigError for an unknown or inaccessible agent.
class AgentConfigProvider {
public:
    virtual ~AgentConfigProvider() = default;
    virtual AgentConfig get(const std::string& agent_id, const std::string& user_id) = 0;
};

// LLM Call port. Throws LlmError on failure.
class LlmClient {
public:
    virtual ~LlmClient() = default;
    virtual LlmResponse call(const LlmRequest& request) = 0;
};

// Tool Execution port. Failures are thrown and turned into tool messages by the caller.
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;
    virtual nlohmann::json execute(const std::string& execution_id,
                                   const ToolCall& call,
                                   const std::vector<ToolDefinition>& available_tools,
                                   const std::string& user_id,
                                   const std::string& agent_id) = 0;
};

class InMemoryAgentConfigProvider : public AgentConfigProvider {
public:
    // An empty owner makes the agent visible to every user
    void put(AgentConfig config, std::string owner_user_id = "");
    AgentConfig get(const std::string& agent_id, const std::string& user_id) override;

private:
    struct Entry {
        AgentConfig config;
        std::string owner_user_id;
    };
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> agents_;
};

void to_json(nlohmann::json& j, const ToolDefinition& tool);
void from_json(const nlohmann::json& j, ToolDefinition& tool);
void to_json(nlohmann::json& j, const MemoryConfig& memory);
void from_json(const nlohmann::json& j, MemoryConfig& memory);
void to_json(nlohmann::json& j, const AgentConfig& config);
void from_json(const nlohmann::json& j, AgentConfig& config);
void to_json(nlohmann::json& j, const LlmRequest& request);
void from_json(const nlohmann::json& j, LlmRequest& request);
void to_json(nlohmann::json& j, const LlmResponse& response);
void from_json(const nlohmann::json& j, LlmResponse& response);

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_AGENT_AGENT_PORTS_H
