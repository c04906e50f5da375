// tests/test_agent_orchestrator.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "test_helpers.h"
#include "durableflow/core/engine.h"
#include "common/tools/registry.h"
#include "modules/agent/agent_orchestrator.h"
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using namespace durableflow;
using Catch::Matchers::ContainsSubstring;
using durableflow::testing::wait_for_query;
using nlohmann::json;
using namespace std::chrono_literals;

namespace {

// LLM stub driven by a script of (request, call index) -> response
class ScriptedLlm : public LlmClient {
public:
    using Script = std::function<LlmResponse(const LlmRequest&, int)>;

    explicit ScriptedLlm(Script script) : script_(std::move(script)) {}

    LlmResponse call(const LlmRequest& request) override {
        int index = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            index = static_cast<int>(requests_.size());
            requests_.push_back(request);
        }
        return script_(request, index);
    }

    std::vector<LlmRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    Script script_;
    mutable std::mutex mutex_;
    std::vector<LlmRequest> requests_;
};

class FailingTools : public ToolExecutor {
public:
    json execute(const std::string&, const ToolCall& call, const std::vector<ToolDefinition>&,
                 const std::string&, const std::string&) override {
        throw ToolError("tool " + call.name + " is down");
    }
};

LlmResponse final_answer(const std::string& text) {
    LlmResponse response;
    response.content = text;
    return response;
}

LlmResponse calculate_call(int index) {
    LlmResponse response;
    response.content = "calculating";
    response.tool_calls.push_back(ToolCall{"call-" + std::to_string(index), "calculate",
                                           json{{"a", index}, {"b", 1}, {"op", "+"}}});
    return response;
}

AgentConfig make_agent() {
    AgentConfig agent;
    agent.id = "helper";
    agent.name = "Helper";
    agent.system_prompt = "You are a careful assistant.";
    agent.model = "test-model";
    agent.provider = "test";
    ToolDefinition calculate;
    calculate.name = "calculate";
    calculate.description = "Basic arithmetic";
    agent.available_tools.push_back(calculate);
    return agent;
}

struct AgentFixture {
    std::shared_ptr<InMemoryAgentConfigProvider> agents = std::make_shared<InMemoryAgentConfigProvider>();
    std::shared_ptr<ScriptedLlm> llm;
    std::shared_ptr<InMemoryConversationStore> conversations = std::make_shared<InMemoryConversationStore>();
    std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();
    std::shared_ptr<EventSink> event_sink; // replaces `events` when set
    std::shared_ptr<InMemoryHistoryStore> history = std::make_shared<InMemoryHistoryStore>();
    EngineConfig config;
    std::unique_ptr<DurableFlowEngine> engine;

    AgentFixture(ScriptedLlm::Script script, AgentConfig agent = make_agent())
        : llm(std::make_shared<ScriptedLlm>(std::move(script))) {
        agents->put(std::move(agent), "user-1");
        config.activities.agent = durableflow::testing::quick_options(2);
    }

    void start(std::shared_ptr<ToolExecutor> tools = nullptr,
               const std::optional<std::string>& message = std::string("What is 2 + 1?")) {
        EnginePorts ports;
        ports.agent_configs = agents;
        ports.llm = llm;
        ports.tools = std::move(tools);
        ports.conversations = conversations;
        ports.events = event_sink ? event_sink : events;
        engine = std::make_unique<DurableFlowEngine>(config, ports, history);
        engine->start_agent("agent-1", "helper", "user-1", message);
    }

    json outcome() {
        auto result = engine->wait_result("agent-1", 10s);
        REQUIRE(result.has_value());
        return *result;
    }

    json result() {
        json done = outcome();
        REQUIRE(done.at("status") == "completed");
        return done.at("result");
    }
};

} // namespace

TEST_CASE("Final answer on the first call ends after one iteration", "[agent]") {
    AgentFixture fixture([](const LlmRequest&, int) { return final_answer("3"); });
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == true);
    REQUIRE(result.at("finalMessage") == "3");
    REQUIRE(result.at("iterations") == 1);
    REQUIRE(fixture.llm->requests().size() == 1);

    const LlmRequest first = fixture.llm->requests().at(0);
    REQUIRE(first.messages.size() == 2);
    REQUIRE(first.messages[0].role == MessageRole::SYSTEM);
    REQUIRE(first.messages[0].content == "You are a careful assistant.");
    REQUIRE(first.messages[1].id == "user-0");
    REQUIRE(first.tools.size() == 1);

    auto saved = fixture.conversations->load_messages("agent-1");
    REQUIRE(saved.size() == 2);
    REQUIRE(saved[0].id == "user-0");
    REQUIRE(saved[1].id == "asst-0");
    REQUIRE(fixture.conversations->load_checkpoint("agent-1").has_value());

    REQUIRE(fixture.events->count(events::kExecutionStarted) == 1);
    REQUIRE(fixture.events->count(events::kAgentThinking) == 1);
    REQUIRE(fixture.events->count(events::kExecutionCompleted) == 1);
}

TEST_CASE("Tool results flow back to the model", "[agent][tools]") {
    AgentFixture fixture([](const LlmRequest&, int index) {
        return index == 0 ? calculate_call(2) : final_answer("It is 3");
    });
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == true);
    REQUIRE(result.at("iterations") == 2);

    const LlmRequest second = fixture.llm->requests().at(1);
    const ConversationMessage& tool = second.messages.back();
    REQUIRE(tool.role == MessageRole::TOOL);
    REQUIRE(tool.id == "tool-0-0");
    REQUIRE(tool.tool_call_id == std::optional<std::string>("call-2"));
    REQUIRE(json::parse(tool.content).at("result") == 3.0);
    REQUIRE(fixture.events->count(events::kToolCallStarted) == 1);
    REQUIRE(fixture.events->count(events::kToolCallCompleted) == 1);
}

TEST_CASE("A failing tool becomes an error message and the loop continues", "[agent][tools]") {
    AgentFixture fixture([](const LlmRequest&, int index) {
        return index == 0 ? calculate_call(1) : final_answer("Sorry, the tool failed");
    });
    fixture.start(std::make_shared<FailingTools>());
    json result = fixture.result();

    REQUIRE(result.at("success") == true);
    REQUIRE(fixture.llm->requests().size() == 2);

    const ConversationMessage& tool = fixture.llm->requests().at(1).messages.back();
    REQUIRE(tool.role == MessageRole::TOOL);
    const json content = json::parse(tool.content);
    REQUIRE(content.contains("error"));
    REQUIRE_THAT(content.at("error").get<std::string>(), ContainsSubstring("is down"));
    REQUIRE(fixture.events->count(events::kToolCallFailed) == 1);
}

TEST_CASE("Checkpoint carries a bounded conversation into the next run", "[agent][checkpoint]") {
    AgentConfig agent = make_agent();
    agent.memory_config.max_messages = 4;
    AgentFixture fixture([](const LlmRequest&, int index) {
        return index < 5 ? calculate_call(index) : final_answer("done");
    }, agent);
    fixture.config.agent.continue_as_new_threshold = 3;
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == true);
    REQUIRE(result.at("iterations") == 6);

    const auto requests = fixture.llm->requests();
    REQUIRE(requests.size() == 6);
    // 第 3 轮由新的 run 执行，看到的是压缩后的对话
    const auto& restarted = requests.at(3).messages;
    REQUIRE(restarted.size() <= 4);
    REQUIRE(restarted.front().id == "sys-0");
    REQUIRE(restarted.front().role == MessageRole::SYSTEM);
    REQUIRE(restarted.back().id == "tool-2-0");
    REQUIRE(requests.at(2).messages.size() == 6);

    auto history = fixture.history->load("agent-1");
    REQUIRE(history->run_number == 2);
    REQUIRE(history->input.at("iterations") == 3);
    REQUIRE(history->input.at("checkpoint").at("messages").size() <= 4);

    // 每条消息只持久化一次
    auto saved = fixture.conversations->load_messages("agent-1");
    std::set<std::string> ids;
    for (const auto& message : saved) {
        REQUIRE(ids.insert(message.id).second);
    }
    REQUIRE(ids.count("user-0") == 1);
    REQUIRE(ids.count("asst-5") == 1);
}

TEST_CASE("Agent waits for the user when asked", "[agent][signal]") {
    AgentFixture fixture([](const LlmRequest& request, int index) {
        if (index == 0) {
            LlmResponse response = final_answer("Which color?");
            response.requires_user_input = true;
            return response;
        }
        return final_answer("You picked " + request.messages.back().content);
    });
    fixture.start();

    REQUIRE(wait_for_query(*fixture.engine, "agent-1", kHasReceivedUserMessageQuery) == false);
    fixture.engine->signal("agent-1", kUserMessageSignal, "blue");
    json result = fixture.result();

    REQUIRE(result.at("success") == true);
    REQUIRE(result.at("finalMessage") == "You picked blue");
    REQUIRE(result.at("iterations") == 2);
    REQUIRE(fixture.events->count(events::kAgentMessage) == 3);
}

TEST_CASE("Unanswered user input times out", "[agent][signal]") {
    AgentFixture fixture([](const LlmRequest&, int) {
        LlmResponse response = final_answer("Are you there?");
        response.requires_user_input = true;
        return response;
    });
    fixture.config.agent.user_input_timeout = 20ms;
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == false);
    REQUIRE(result.at("error") == "User input timeout after 20ms");
    REQUIRE(fixture.events->count(events::kExecutionFailed) == 1);
}

TEST_CASE("LLM failure aborts the run", "[agent][errors]") {
    AgentFixture fixture([](const LlmRequest&, int) -> LlmResponse {
        throw LlmError("model overloaded");
    });
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == false);
    REQUIRE_THAT(result.at("error").get<std::string>(), ContainsSubstring("model overloaded"));
    REQUIRE(result.at("iterations") == 0);
    REQUIRE(result.at("conversation").at("messages").size() == 2);
    // LlmError 可重试，按策略调用两次
    REQUIRE(fixture.llm->requests().size() == 2);
}

TEST_CASE("Max iterations ends the run with the conversation", "[agent][errors]") {
    AgentConfig agent = make_agent();
    agent.max_iterations = 2;
    AgentFixture fixture([](const LlmRequest&, int index) { return calculate_call(index); }, agent);
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == false);
    REQUIRE(result.at("error") == "Max iterations (2) reached");
    REQUIRE(result.at("iterations") == 2);
    // user-0, asst-0, tool-0-0, asst-1, tool-1-0
    REQUIRE(fixture.conversations->load_messages("agent-1").size() == 5);
    REQUIRE(fixture.conversations->load_checkpoint("agent-1")->iterations == 2);
}

TEST_CASE("Unknown agent fails the execution with ConfigError", "[agent][errors]") {
    AgentFixture fixture([](const LlmRequest&, int) { return final_answer("unused"); });
    EnginePorts ports;
    ports.agent_configs = fixture.agents;
    ports.llm = fixture.llm;
    DurableFlowEngine engine(fixture.config, ports);
    engine.start_agent("agent-x", "nobody", "user-1");

    auto outcome = engine.wait_result("agent-x", 10s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->at("status") == "failed");
    REQUIRE(outcome->at("kind") == "ConfigError");
    REQUIRE_THAT(outcome->at("error").get<std::string>(), ContainsSubstring("not found or access denied"));
    REQUIRE(fixture.llm->requests().empty());
}

TEST_CASE("Conversation is saved every N tool iterations", "[agent][persistence]") {
    auto store = std::make_shared<InMemoryConversationStore>();
    auto saved_before_fourth_call = std::make_shared<std::vector<std::string>>();
    AgentFixture fixture([store, saved_before_fourth_call](const LlmRequest&, int index) {
        if (index == 3) {
            for (const auto& message : store->load_messages("agent-1")) {
                saved_before_fourth_call->push_back(message.id);
            }
        }
        return index < 4 ? calculate_call(index) : final_answer("done");
    });
    fixture.conversations = store;
    fixture.config.agent.incremental_save_interval = 2;
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == true);
    REQUIRE(result.at("iterations") == 5);
    // the save after iteration 2 covers everything up to that iteration's tool result
    REQUIRE(*saved_before_fourth_call == std::vector<std::string>{
        "user-0", "asst-0", "tool-0-0", "asst-1", "tool-1-0", "asst-2", "tool-2-0"});

    std::set<std::string> final_ids;
    for (const auto& message : store->load_messages("agent-1")) {
        final_ids.insert(message.id);
    }
    REQUIRE(final_ids.count("asst-4") == 1);
    REQUIRE(final_ids.count("tool-3-0") == 1);
}

TEST_CASE("A failing event sink does not change the agent result", "[agent][events]") {
    auto sink = std::make_shared<durableflow::testing::ThrowingEventSink>();
    AgentFixture fixture([](const LlmRequest&, int index) {
        return index == 0 ? calculate_call(index) : final_answer("3");
    });
    fixture.event_sink = sink;
    fixture.start();
    json result = fixture.result();

    REQUIRE(result.at("success") == true);
    REQUIRE(result.at("finalMessage") == "3");
    REQUIRE(result.at("iterations") == 2);
    REQUIRE(sink->rejected() > 0);
    REQUIRE(fixture.events->events().empty());
}
