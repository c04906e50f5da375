// tests/test_conversation_state.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/agent/conversation_state.h"
#include "modules/persistence/conversation_store.h"
#include <string>
#include <vector>

using namespace durableflow;

namespace {

ConversationMessage message(const std::string& id, MessageRole role, const std::string& content = "") {
    ConversationMessage m;
    m.id = id;
    m.role = role;
    m.content = content.empty() ? id : content;
    return m;
}

// sys-0 (saved), user-0, then asst-i / tool-i-0 pairs
ConversationState build_state(int turns) {
    ConversationState state;
    state.add(message("sys-0", MessageRole::SYSTEM), true);
    state.add(message("user-0", MessageRole::USER));
    for (int i = 0; i < turns; ++i) {
        state.add(message("asst-" + std::to_string(i), MessageRole::ASSISTANT));
        state.add(message("tool-" + std::to_string(i) + "-0", MessageRole::TOOL));
    }
    return state;
}

std::vector<std::string> ids_of(const std::vector<ConversationMessage>& messages) {
    std::vector<std::string> ids;
    for (const auto& m : messages) ids.push_back(m.id);
    return ids;
}

} // namespace

TEST_CASE("Unsaved messages exclude the ones already persisted", "[conversation]") {
    ConversationState state = build_state(1);
    REQUIRE(ids_of(state.unsaved()) == std::vector<std::string>{"user-0", "asst-0", "tool-0-0"});

    state.mark_saved(state.unsaved());
    REQUIRE(state.unsaved().empty());
    REQUIRE(state.saved_ids() == std::vector<std::string>{"sys-0", "user-0", "asst-0", "tool-0-0"});

    // 重复标记不会产生重复 id
    state.mark_saved({message("user-0", MessageRole::USER)});
    REQUIRE(state.saved_ids().size() == 4);
}

TEST_CASE("Summarize leaves short conversations untouched", "[conversation]") {
    ConversationState state = build_state(1);
    Checkpoint checkpoint = state.summarize(10, 1);
    REQUIRE(checkpoint.messages.size() == 4);
    REQUIRE(checkpoint.iterations == 1);
    REQUIRE(checkpoint.saved_message_ids == std::vector<std::string>{"sys-0"});
}

TEST_CASE("Summarize keeps the system message and the most recent tail", "[conversation]") {
    ConversationState state = build_state(5); // 12 messages
    state.mark_saved(state.unsaved());
    state.metadata()["topic"] = "math";

    Checkpoint checkpoint = state.summarize(4, 5);
    REQUIRE(ids_of(checkpoint.messages) == std::vector<std::string>{"sys-0", "tool-3-0", "asst-4", "tool-4-0"});
    REQUIRE(checkpoint.messages.front().role == MessageRole::SYSTEM);
    REQUIRE(checkpoint.saved_message_ids == std::vector<std::string>{"sys-0", "tool-3-0", "asst-4", "tool-4-0"});
    REQUIRE(checkpoint.metadata.at("topic") == "math");

    // 原状态不受影响
    REQUIRE(state.size() == 12);
}

TEST_CASE("Restored state remembers what was saved", "[conversation]") {
    ConversationState state = build_state(2);
    state.mark_saved({state.messages()[1], state.messages()[2]});

    ConversationState restored(state.to_checkpoint(2));
    REQUIRE(restored.size() == state.size());
    REQUIRE(ids_of(restored.unsaved()) == ids_of(state.unsaved()));

    restored.add(message("asst-2", MessageRole::ASSISTANT));
    REQUIRE(restored.unsaved().back().id == "asst-2");
}

TEST_CASE("Conversation store saves each message id once", "[conversation][persistence]") {
    InMemoryConversationStore store;
    std::vector<ConversationMessage> batch{message("user-0", MessageRole::USER), message("asst-0", MessageRole::ASSISTANT)};

    REQUIRE(store.save_incremental("exec-1", batch) == 2);
    REQUIRE(store.save_incremental("exec-1", batch) == 0);
    batch.push_back(message("tool-0-0", MessageRole::TOOL));
    REQUIRE(store.save_incremental("exec-1", batch) == 1);
    REQUIRE(ids_of(store.load_messages("exec-1")) == std::vector<std::string>{"user-0", "asst-0", "tool-0-0"});
    REQUIRE(store.load_messages("other").empty());

    REQUIRE_FALSE(store.load_checkpoint("exec-1").has_value());
    Checkpoint checkpoint;
    checkpoint.messages = batch;
    checkpoint.iterations = 7;
    store.save_checkpoint("exec-1", checkpoint);
    REQUIRE(store.load_checkpoint("exec-1")->iterations == 7);
}
