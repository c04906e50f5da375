#ifndef DURABLEFLOW_TYPES_CONVERSATION_H
#define DURABLEFLOW_TYPES_CONVERSATION_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace durableflow {

enum class MessageRole : uint8_t {
    SYSTEM,
    USER,
    ASSISTANT,
    TOOL
};

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ConversationMessage {
    std::string id;
    MessageRole role = MessageRole::USER;
    std::string content;
    std::vector<ToolCall> tool_calls;        // assistant only
    std::optional<std::string> tool_name;    // tool only
    std::optional<std::string> tool_call_id; // tool only
    int64_t timestamp_ms = 0;
};

// 跨 continue-as-new 边界传递的完整状态
struct Checkpoint {
    std::vector<ConversationMessage> messages;
    std::vector<std::string> saved_message_ids;
    nlohmann::json metadata = nlohmann::json::object();
    int iterations = 0;
};

std::string to_string(MessageRole role);
MessageRole parse_message_role(const std::string& value);

void to_json(nlohmann::json& j, const ToolCall& call);
void from_json(const nlohmann::json& j, ToolCall& call);
void to_json(nlohmann::json& j, const ConversationMessage& message);
void from_json(const nlohmann::json& j, ConversationMessage& message);
void to_json(nlohmann::json& j, const Checkpoint& checkpoint);
void from_json(const nlohmann::json& j, Checkpoint& checkpoint);

} // namespace durableflow

#endif // DURABLEFLOW_TYPES_CONVERSATION_H
