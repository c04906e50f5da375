// modules/persistence/conversation_store.h
#ifndef DURABLEFLOW_MODULES_PERSISTENCE_CONVERSATION_STORE_H
#define DURABLEFLOW_MODULES_PERSISTENCE_CONVERSATION_STORE_H

#include "core/types/conversation.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace durableflow {

// Conversation Persistence port
class ConversationStore {
public:
    virtual ~ConversationStore() = default;

    // Idempotent by message id; returns how many messages were new
    virtual size_t save_incremental(const std::string& execution_id,
                                    const std::vector<ConversationMessage>& messages) = 0;
    virtual void save_checkpoint(const std::string& execution_id, const Checkpoint& checkpoint) = 0;

    // Every message ever saved for the execution, in save order
    virtual std::vector<ConversationMessage> load_messages(const std::string& execution_id) const = 0;
    virtual std::optional<Checkpoint> load_checkpoint(const std::string& execution_id) const = 0;
};

class InMemoryConversationStore : public ConversationStore {
public:
    size_t save_incremental(const std::string& execution_id,
                            const std::vector<ConversationMessage>& messages) override;
    void save_checkpoint(const std::string& execution_id, const Checkpoint& checkpoint) override;
    std::vector<ConversationMessage> load_messages(const std::string& execution_id) const override;
    std::optional<Checkpoint> load_checkpoint(const std::string& execution_id) const override;

private:
    struct Conversation {
        std::vector<ConversationMessage> messages;
        std::unordered_set<std::string> ids;
        std::optional<Checkpoint> checkpoint;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Conversation> conversations_;
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_PERSISTENCE_CONVERSATION_STORE_H
