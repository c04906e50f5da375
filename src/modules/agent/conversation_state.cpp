// modules/agent/conversation_state.cpp
#include "modules/agent/conversation_state.h"
#include <algorithm>

namespace durableflow {

ConversationState::ConversationState(const Checkpoint& restored)
    : messages_(restored.messages),
      saved_ids_(restored.saved_message_ids),
      saved_lookup_(restored.saved_message_ids.begin(), restored.saved_message_ids.end()),
      metadata_(restored.metadata.is_object() ? restored.metadata : nlohmann::json::object()) {}

void ConversationState::add(ConversationMessage message, bool saved) {
    if (saved && saved_lookup_.insert(message.id).second) {
        saved_ids_.push_back(message.id);
    }
    messages_.push_back(std::move(message));
}

std::vector<ConversationMessage> ConversationState::unsaved() const {
    std::vector<ConversationMessage> pending;
    for (const auto& message : messages_) {
        if (saved_lookup_.count(message.id) == 0) {
            pending.push_back(message);
        }
    }
    return pending;
}

void ConversationState::mark_saved(const std::vector<ConversationMessage>& messages) {
    for (const auto& message : messages) {
        if (saved_lookup_.insert(message.id).second) {
            saved_ids_.push_back(message.id);
        }
    }
}

Checkpoint ConversationState::to_checkpoint(int iterations) const {
    return Checkpoint{messages_, saved_ids_, metadata_, iterations};
}

Checkpoint ConversationState::summarize(size_t max_messages, int iterations) const {
    if (messages_.size() <= max_messages) {
        return to_checkpoint(iterations);
    }

    Checkpoint summarized;
    summarized.metadata = metadata_;
    summarized.iterations = iterations;

    auto system = std::find_if(messages_.begin(), messages_.end(),
                               [](const ConversationMessage& m) { return m.role == MessageRole::SYSTEM; });
    const size_t keep = system != messages_.end() ? max_messages - 1 : max_messages;
    if (system != messages_.end()) {
        summarized.messages.push_back(*system);
    }

    // 从尾部取最近的 keep 条（跳过 system）
    std::vector<ConversationMessage> recent;
    for (auto it = messages_.rbegin(); it != messages_.rend() && recent.size() < keep; ++it) {
        if (system != messages_.end() && it->id == system->id) continue;
        recent.push_back(*it);
    }
    summarized.messages.insert(summarized.messages.end(), recent.rbegin(), recent.rend());

    std::unordered_set<std::string> kept;
    for (const auto& message : summarized.messages) {
        kept.insert(message.id);
    }
    for (const auto& id : saved_ids_) {
        if (kept.count(id) > 0) {
            summarized.saved_message_ids.push_back(id);
        }
    }
    return summarized;
}

} // namespace durableflow
