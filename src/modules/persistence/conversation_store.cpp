// modules/persistence/conversation_store.cpp
#include "modules/persistence/conversation_store.h"

namespace durableflow {

size_t InMemoryConversationStore::save_incremental(const std::string& execution_id,
                                                   const std::vector<ConversationMessage>& messages) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& conversation = conversations_[execution_id];
    size_t added = 0;
    for (const auto& message : messages) {
        if (conversation.ids.insert(message.id).second) {
            conversation.messages.push_back(message);
            ++added;
        }
    }
    return added;
}

void InMemoryConversationStore::save_checkpoint(const std::string& execution_id, const Checkpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    conversations_[execution_id].checkpoint = checkpoint;
}

std::vector<ConversationMessage> InMemoryConversationStore::load_messages(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(execution_id);
    if (it == conversations_.end()) return {};
    return it->second.messages;
}

std::optional<Checkpoint> InMemoryConversationStore::load_checkpoint(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(execution_id);
    if (it == conversations_.end()) return std::nullopt;
    return it->second.checkpoint;
}

} // namespace durableflow
