// modules/agent/agent_orchestrator.cpp
#include "modules/agent/agent_orchestrator.h"
#include "core/activity_names.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include "modules/trace/event_sink.h"

namespace durableflow {

namespace {

std::string user_message_text(const nlohmann::json& payload) {
    if (payload.is_string()) return payload.get<std::string>();
    if (payload.is_object() && payload.contains("content") && payload.at("content").is_string()) {
        return payload.at("content").get<std::string>();
    }
    return payload.dump();
}

} // namespace

AgentOrchestrator::AgentOrchestrator(ExecutionSession& session, AgentOrchestratorOptions options)
    : session_(session), options_(std::move(options)) {}

int64_t AgentOrchestrator::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(session_.now().time_since_epoch()).count();
}

ConversationMessage AgentOrchestrator::make_message(std::string id, MessageRole role, std::string content) {
    ConversationMessage message;
    message.id = std::move(id);
    message.role = role;
    message.content = std::move(content);
    message.timestamp_ms = now_ms();
    return message;
}

void AgentOrchestrator::emit(const char* event_type, nlohmann::json payload) {
    payload["executionId"] = execution_id_;
    try {
        session_.execute_activity(activities::kEmitEvent, options_.events,
                                  nlohmann::json{{"type", event_type}, {"payload", std::move(payload)}});
    } catch (const ActivityFailure& e) {
        if (!session_.is_replaying()) {
            DF_LOG_DEBUG("[Agent] Dropped {} event: {}", event_type, e.what());
        }
    }
}

AgentConfig AgentOrchestrator::load_agent() {
    nlohmann::json raw;
    try {
        raw = session_.execute_activity(activities::kGetAgentConfig, options_.agent,
                                        nlohmann::json{{"agentId", agent_id_}, {"userId", user_id_}});
    } catch (const ActivityFailure& e) {
        throw ConfigError(e.what());
    }
    try {
        return raw.get<AgentConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid agent config: ") + e.what());
    }
}

LlmResponse AgentOrchestrator::call_llm() {
    LlmRequest request;
    request.model = agent_.model;
    request.provider = agent_.provider;
    request.connection_id = agent_.connection_id;
    request.messages = state_.messages();
    request.tools = agent_.available_tools;
    request.temperature = agent_.temperature;
    request.max_tokens = agent_.max_tokens;

    const nlohmann::json raw = session_.execute_activity(activities::kCallLlm, options_.agent, nlohmann::json(request));
    try {
        return raw.get<LlmResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw LlmError(std::string("Malformed LLM response: ") + e.what());
    }
}

void AgentOrchestrator::run_tool_calls(const std::vector<ToolCall>& calls, int iteration) {
    const bool live = !session_.is_replaying();
    for (size_t i = 0; i < calls.size(); ++i) {
        const ToolCall& call = calls[i];
        emit(events::kToolCallStarted, nlohmann::json{{"toolCallId", call.id},
                                                      {"toolName", call.name},
                                                      {"arguments", call.arguments}});
        nlohmann::json content;
        bool failed = false;
        try {
            content = session_.execute_activity(activities::kExecuteToolCall, options_.agent, nlohmann::json{
                {"executionId", execution_id_},
                {"toolCall", call},
                {"availableTools", agent_.available_tools},
                {"userId", user_id_},
                {"agentId", agent_id_}});
        } catch (const ActivityFailure& e) {
            // 工具失败作为 tool 消息交给模型，循环继续
            failed = true;
            content = nlohmann::json{{"error", e.what()}};
            if (live) {
                DF_LOG_WARN("[Agent] Tool {} failed: {}", call.name, e.what());
            }
        }

        ConversationMessage message = make_message("tool-" + std::to_string(iteration) + "-" + std::to_string(i),
                                                   MessageRole::TOOL, content.dump());
        message.tool_name = call.name;
        message.tool_call_id = call.id;
        state_.add(message);

        if (failed) {
            emit(events::kToolCallFailed, nlohmann::json{{"toolCallId", call.id},
                                                         {"toolName", call.name},
                                                         {"error", content.at("error")}});
        } else {
            emit(events::kToolCallCompleted, nlohmann::json{{"toolCallId", call.id},
                                                            {"toolName", call.name},
                                                            {"result", content}});
        }
    }
}

void AgentOrchestrator::persist_unsaved() {
    const std::vector<ConversationMessage> pending = state_.unsaved();
    if (pending.empty()) return;
    session_.execute_activity(activities::kSaveConversationIncremental, options_.agent,
                              nlohmann::json{{"executionId", execution_id_}, {"messages", pending}});
    state_.mark_saved(pending);
    if (!session_.is_replaying()) {
        DF_LOG_DEBUG("[Agent] Saved {} messages for {}", pending.size(), execution_id_);
    }
}

void AgentOrchestrator::save_checkpoint(const Checkpoint& checkpoint) {
    session_.execute_activity(activities::kSaveCheckpoint, options_.agent,
                              nlohmann::json{{"executionId", execution_id_}, {"checkpoint", checkpoint}});
}

void AgentOrchestrator::restart(SignalWait& user_input, int iteration) {
    persist_unsaved();
    Checkpoint checkpoint = state_.summarize(static_cast<size_t>(agent_.memory_config.max_messages), iteration);
    // 已收到但尚未处理的用户消息随 checkpoint 带到下一个 run
    if (user_input.has_received()) {
        checkpoint.metadata["pendingUserMessage"] = user_input.consume();
    }
    save_checkpoint(checkpoint);
    if (!session_.is_replaying()) {
        DF_LOG_INFO("[Agent] Continuing as new at iteration {} with {} messages",
                    iteration, checkpoint.messages.size());
    }
    session_.continue_as_new(nlohmann::json{
        {"executionId", execution_id_},
        {"agentId", agent_id_},
        {"userId", user_id_},
        {"checkpoint", checkpoint},
        {"iterations", iteration}});
}

nlohmann::json AgentOrchestrator::finish(int iterations, const std::string& final_message) {
    persist_unsaved();
    save_checkpoint(state_.to_checkpoint(iterations));
    if (!session_.is_replaying()) {
        DF_LOG_INFO("[Agent] Completed {} after {} iterations", execution_id_, iterations);
    }
    emit(events::kExecutionCompleted, nlohmann::json{{"finalMessage", final_message}, {"iterations", iterations}});
    return nlohmann::json{{"success", true},
                          {"finalMessage", final_message},
                          {"iterations", iterations},
                          {"conversation", state_.to_checkpoint(iterations)}};
}

nlohmann::json AgentOrchestrator::fail(int iterations, const std::string& error) {
    if (!session_.is_replaying()) {
        DF_LOG_ERROR("[Agent] {} failed: {}", execution_id_, error);
    }
    emit(events::kExecutionFailed, nlohmann::json{{"error", error}, {"iterations", iterations}});
    return nlohmann::json{{"success", false},
                          {"error", error},
                          {"iterations", iterations},
                          {"conversation", state_.to_checkpoint(iterations)}};
}

nlohmann::json AgentOrchestrator::run(const nlohmann::json& input) {
    if (!input.is_object() || !input.contains("agentId")) {
        throw ConfigError("Agent orchestration requires an 'agentId'");
    }
    execution_id_ = input.value("executionId", session_.execution_id());
    agent_id_ = input.at("agentId").get<std::string>();
    user_id_ = input.value("userId", std::string());

    agent_ = load_agent();
    const int max_iterations = agent_.max_iterations > 0
        ? agent_.max_iterations
        : options_.settings.default_max_iterations;
    const int threshold = options_.settings.continue_as_new_threshold;
    const int save_interval = options_.settings.incremental_save_interval;

    int iteration = input.value("iterations", 0);
    const int start_iteration = iteration;

    if (input.contains("checkpoint") && input.at("checkpoint").is_object()) {
        state_ = ConversationState(input.at("checkpoint").get<Checkpoint>());
        if (!session_.is_replaying()) {
            DF_LOG_INFO("[Agent] Resuming {} at iteration {} with {} messages",
                        execution_id_, iteration, state_.size());
        }
    } else {
        state_ = ConversationState();
        state_.add(make_message("sys-0", MessageRole::SYSTEM, agent_.system_prompt), true);
        if (input.contains("initialMessage") && !input.at("initialMessage").is_null()) {
            state_.add(make_message("user-0", MessageRole::USER, user_message_text(input.at("initialMessage"))));
        }
        if (!session_.is_replaying()) {
            DF_LOG_INFO("[Agent] Starting {} with agent {}", execution_id_, agent_id_);
        }
        emit(events::kExecutionStarted, nlohmann::json{{"agentId", agent_id_}, {"agentName", agent_.name}});
    }

    SignalWait user_input(session_, kUserMessageSignal, kHasReceivedUserMessageQuery);
    if (state_.metadata().contains("pendingUserMessage")) {
        user_input.signal(state_.metadata().at("pendingUserMessage"));
        state_.metadata().erase("pendingUserMessage");
    }

    while (iteration < max_iterations) {
        if (threshold > 0 && iteration > 0 && iteration != start_iteration && iteration % threshold == 0) {
            restart(user_input, iteration);
        }

        emit(events::kAgentThinking, nlohmann::json{{"iteration", iteration}});
        LlmResponse response;
        try {
            response = call_llm();
        } catch (const ActivityFailure& e) {
            return fail(iteration, e.what());
        } catch (const LlmError& e) {
            return fail(iteration, e.what());
        }

        ConversationMessage reply = make_message("asst-" + std::to_string(iteration),
                                                 MessageRole::ASSISTANT, response.content);
        reply.tool_calls = response.tool_calls;
        state_.add(reply);
        emit(events::kAgentMessage, nlohmann::json{{"message", reply}});

        if (response.tool_calls.empty()) {
            if (!response.requires_user_input) {
                return finish(iteration + 1, response.content);
            }

            const nlohmann::json waited = user_input.wait(options_.settings.user_input_timeout);
            if (!waited.value("received", false)) {
                return fail(iteration + 1, "User input timeout after " +
                                           std::to_string(options_.settings.user_input_timeout.count()) + "ms");
            }
            ConversationMessage answer = make_message("user-" + std::to_string(iteration + 1), MessageRole::USER,
                                                      user_message_text(user_input.consume()));
            state_.add(answer);
            emit(events::kAgentMessage, nlohmann::json{{"message", answer}});
            ++iteration;
            continue;
        }

        run_tool_calls(response.tool_calls, iteration);

        if (save_interval > 0 && iteration > 0 && iteration % save_interval == 0) {
            persist_unsaved();
        }
        ++iteration;
    }

    persist_unsaved();
    save_checkpoint(state_.to_checkpoint(iteration));
    return fail(iteration, "Max iterations (" + std::to_string(max_iterations) + ") reached");
}

nlohmann::json run_agent_workflow(ExecutionSession& session, const nlohmann::json& input,
                                  const AgentOrchestratorOptions& options) {
    AgentOrchestrator orchestrator(session, options);
    return orchestrator.run(input);
}

} // namespace durableflow
