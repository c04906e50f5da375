// modules/agent/conversation_state.h
#ifndef DURABLEFLOW_MODULES_AGENT_CONVERSATION_STATE_H
#define DURABLEFLOW_MODULES_AGENT_CONVERSATION_STATE_H

#include "core/types/conversation.h"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace durableflow {

// Message list of one agent run plus the ids already persisted. Plain data
// only, so that it replays deterministically and survives continue-as-new.
class ConversationState {
public:
    ConversationState() = default;
    explicit ConversationState(const Checkpoint& restored);

    void add(ConversationMessage message, bool saved = false);

    const std::vector<ConversationMessage>& messages() const { return messages_; }
    const std::vector<std::string>& saved_ids() const { return saved_ids_; }
    nlohmann::json& metadata() { return metadata_; }
    const nlohmann::json& metadata() const { return metadata_; }
    size_t size() const { return messages_.size(); }

    std::vector<ConversationMessage> unsaved() const;
    void mark_saved(const std::vector<ConversationMessage>& messages);

    Checkpoint to_checkpoint(int iterations) const;

    // At most max_messages entries: the system message first, then the most
    // recent messages. Saved ids are filtered to the survivors.
    Checkpoint summarize(size_t max_messages, int iterations) const;

private:
    std::vector<ConversationMessage> messages_;
    std::vector<std::string> saved_ids_;
    std::unordered_set<std::string> saved_lookup_;
    nlohmann::json metadata_ = nlohmann::json::object();
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_AGENT_CONVERSATION_STATE_H
