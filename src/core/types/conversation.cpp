// core/types/conversation.cpp
#include "core/types/conversation.h"
#include "common/errors.h"

namespace durableflow {

std::string to_string(MessageRole role) {
    switch (role) {
        case MessageRole::SYSTEM:    return "system";
        case MessageRole::USER:      return "user";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::TOOL:      return "tool";
    }
    return "user";
}

MessageRole parse_message_role(const std::string& value) {
    if (value == "system") return MessageRole::SYSTEM;
    if (value == "user") return MessageRole::USER;
    if (value == "assistant") return MessageRole::ASSISTANT;
    if (value == "tool") return MessageRole::TOOL;
    throw ConfigError("Unknown message role '" + value + "'");
}

void to_json(nlohmann::json& j, const ToolCall& call) {
    j = nlohmann::json{{"id", call.id}, {"name", call.name}, {"arguments", call.arguments}};
}

void from_json(const nlohmann::json& j, ToolCall& call) {
    call.id = j.value("id", std::string{});
    call.name = j.at("name").get<std::string>();
    call.arguments = j.contains("arguments") ? j.at("arguments") : nlohmann::json::object();
}

void to_json(nlohmann::json& j, const ConversationMessage& message) {
    j = nlohmann::json{
        {"id", message.id},
        {"role", to_string(message.role)},
        {"content", message.content},
        {"timestamp", message.timestamp_ms}
    };
    if (!message.tool_calls.empty()) j["tool_calls"] = message.tool_calls;
    if (message.tool_name) j["tool_name"] = *message.tool_name;
    if (message.tool_call_id) j["tool_call_id"] = *message.tool_call_id;
}

void from_json(const nlohmann::json& j, ConversationMessage& message) {
    message = ConversationMessage{};
    message.id = j.at("id").get<std::string>();
    message.role = parse_message_role(j.at("role").get<std::string>());
    message.content = j.value("content", std::string{});
    message.timestamp_ms = j.value("timestamp", int64_t{0});
    if (j.contains("tool_calls") && j.at("tool_calls").is_array()) {
        message.tool_calls = j.at("tool_calls").get<std::vector<ToolCall>>();
    }
    if (j.contains("tool_name") && j.at("tool_name").is_string()) {
        message.tool_name = j.at("tool_name").get<std::string>();
    }
    if (j.contains("tool_call_id") && j.at("tool_call_id").is_string()) {
        message.tool_call_id = j.at("tool_call_id").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const Checkpoint& checkpoint) {
    j = nlohmann::json{
        {"messages", checkpoint.messages},
        {"savedMessageIds", checkpoint.saved_message_ids},
        {"metadata", checkpoint.metadata},
        {"iterations", checkpoint.iterations}
    };
}

void from_json(const nlohmann::json& j, Checkpoint& checkpoint) {
    checkpoint.messages = j.at("messages").get<std::vector<ConversationMessage>>();
    checkpoint.saved_message_ids = j.value("savedMessageIds", std::vector<std::string>{});
    checkpoint.metadata = j.contains("metadata") && j.at("metadata").is_object()
        ? j.at("metadata") : nlohmann::json::object();
    checkpoint.iterations = j.value("iterations", 0);
}

} // namespace durableflow
