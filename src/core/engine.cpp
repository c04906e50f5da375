// src/core/engine.cpp
#include "durableflow/core/engine.h"
#include "core/activity_names.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include "common/tools/registry.h"
#include "modules/agent/agent_orchestrator.h"
#include "modules/parser/workflow_parser.h"
#include "modules/scheduler/dag_orchestrator.h"
#include "modules/signal/user_input_workflow.h"
#include <chrono>

namespace durableflow {

namespace {

std::shared_ptr<HistoryStore> make_history_store(const HistorySettings& settings) {
    if (settings.store == "file") {
        return std::make_shared<FileHistoryStore>(settings.path);
    }
    if (settings.store == "memory") {
        return std::make_shared<InMemoryHistoryStore>();
    }
    throw ConfigError("Unknown history store: " + settings.store);
}

// 输入格式错误不可重试
template <typename T>
T field(const nlohmann::json& input, const char* key) {
    try {
        return input.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid activity input '") + key + "': " + e.what());
    }
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

DurableFlowEngine::DurableFlowEngine(EngineConfig config, EnginePorts ports, std::shared_ptr<HistoryStore> history)
    : config_(std::move(config)), ports_(std::move(ports)) {
    if (!ports_.node_executor) ports_.node_executor = std::make_shared<NodeRegistry>();
    if (!ports_.agent_configs) ports_.agent_configs = std::make_shared<InMemoryAgentConfigProvider>();
    if (!ports_.tools) ports_.tools = std::make_shared<ToolRegistry>();
    if (!ports_.conversations) ports_.conversations = std::make_shared<InMemoryConversationStore>();
    if (!ports_.executions) ports_.executions = std::make_shared<InMemoryExecutionStore>();
    if (!ports_.events) ports_.events = std::make_shared<LoggingEventSink>();
    if (!history) history = make_history_store(config_.history);

    host_ = std::make_unique<ExecutionHost>(std::move(history));
    register_activities();
    register_workflows();
}

DurableFlowEngine::~DurableFlowEngine() {
    host_->stop();
}

std::unique_ptr<DurableFlowEngine> DurableFlowEngine::from_config_file(const std::string& config_path,
                                                                       EnginePorts ports) {
    EngineConfig config = EngineConfig::load_from_file(config_path);
    logging::init_logging(config.logging);
    DF_LOG_INFO("Engine configured from {} (history: {})", config_path, config.history.store);
    return std::make_unique<DurableFlowEngine>(std::move(config), std::move(ports));
}

void DurableFlowEngine::register_workflows() {
    DagOrchestratorOptions dag_options{config_.activities.node, config_.activities.events};
    host_->register_workflow(kDagWorkflowType, [dag_options](ExecutionSession& session, const nlohmann::json& input) {
        return run_dag_workflow(session, input, dag_options);
    });

    AgentOrchestratorOptions agent_options{config_.activities.agent, config_.activities.events, config_.agent};
    host_->register_workflow(kAgentWorkflowType, [agent_options](ExecutionSession& session, const nlohmann::json& input) {
        return run_agent_workflow(session, input, agent_options);
    });

    host_->register_workflow(kUserInputWorkflowType, run_user_input_workflow);
}

void DurableFlowEngine::register_activities() {
    auto ports = ports_;

    host_->register_activity(activities::kExecuteNode, [ports](ActivityContext&, const nlohmann::json& input) {
        const Value context = input.contains("context") ? input.at("context") : nlohmann::json::object();
        const Value config = input.contains("config") ? input.at("config") : nlohmann::json::object();
        return ports.node_executor->execute(field<std::string>(input, "nodeType"), config, context);
    });

    host_->register_activity(activities::kGetAgentConfig, [ports](ActivityContext&, const nlohmann::json& input) {
        return nlohmann::json(ports.agent_configs->get(field<std::string>(input, "agentId"),
                                                       input.value("userId", std::string())));
    });

    host_->register_activity(activities::kCallLlm, [ports](ActivityContext&, const nlohmann::json& input) {
        if (!ports.llm) {
            throw LlmError("No LLM client configured");
        }
        LlmRequest request;
        try {
            request = input.get<LlmRequest>();
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("Invalid LLM request: ") + e.what());
        }
        return nlohmann::json(ports.llm->call(request));
    });

    host_->register_activity(activities::kExecuteToolCall, [ports](ActivityContext&, const nlohmann::json& input) {
        return ports.tools->execute(field<std::string>(input, "executionId"),
                                    field<ToolCall>(input, "toolCall"),
                                    field<std::vector<ToolDefinition>>(input, "availableTools"),
                                    input.value("userId", std::string()),
                                    input.value("agentId", std::string()));
    });

    host_->register_activity(activities::kSaveConversationIncremental,
                             [ports](ActivityContext&, const nlohmann::json& input) {
        const size_t saved = ports.conversations->save_incremental(
            field<std::string>(input, "executionId"),
            field<std::vector<ConversationMessage>>(input, "messages"));
        return nlohmann::json{{"saved", saved}};
    });

    host_->register_activity(activities::kSaveCheckpoint, [ports](ActivityContext&, const nlohmann::json& input) {
        ports.conversations->save_checkpoint(field<std::string>(input, "executionId"),
                                             field<Checkpoint>(input, "checkpoint"));
        return nlohmann::json::object();
    });

    host_->register_activity(activities::kEmitEvent, [ports](ActivityContext&, const nlohmann::json& input) {
        const std::string type = field<std::string>(input, "type");
        try {
            ports.events->emit(type, input.value("payload", nlohmann::json::object()));
        } catch (const TelemetryError& e) {
            DF_LOG_DEBUG("Event sink rejected {}: {}", type, e.what());
        }
        return nlohmann::json::object();
    });

    host_->register_activity(activities::kUpdateExecutionStatus,
                             [ports](ActivityContext&, const nlohmann::json& input) {
        std::optional<nlohmann::json> outputs;
        std::optional<std::string> error;
        if (input.contains("outputs")) outputs = input.at("outputs");
        if (input.contains("error")) error = field<std::string>(input, "error");
        const ExecutionRecord record = ports.executions->update_status(
            field<std::string>(input, "executionId"),
            parse_execution_status(field<std::string>(input, "status")),
            outputs, error);
        return nlohmann::json(record);
    });
}

void DurableFlowEngine::start_workflow(const std::string& execution_id,
                                       const WorkflowDefinition& definition,
                                       const nlohmann::json& inputs) {
    WorkflowParser::validate(definition);

    ExecutionRecord record;
    record.id = execution_id;
    record.workflow_id = definition.name;
    record.inputs = inputs.is_object() ? inputs : nlohmann::json::object();
    record.created_at_ms = now_ms();
    ports_.executions->create(record);

    host_->start(execution_id, kDagWorkflowType, nlohmann::json{
        {"executionId", execution_id},
        {"workflowDefinition", definition},
        {"inputs", record.inputs}});
    DF_LOG_INFO("Started workflow execution {}", execution_id);
}

void DurableFlowEngine::start_agent(const std::string& execution_id,
                                    const std::string& agent_id,
                                    const std::string& user_id,
                                    const std::optional<std::string>& initial_message) {
    nlohmann::json input{{"executionId", execution_id}, {"agentId", agent_id}, {"userId", user_id}};
    if (initial_message) input["initialMessage"] = *initial_message;
    host_->start(execution_id, kAgentWorkflowType, input);
    DF_LOG_INFO("Started agent execution {} for agent {}", execution_id, agent_id);
}

void DurableFlowEngine::start_user_input(const std::string& execution_id, const nlohmann::json& request) {
    nlohmann::json input = request.is_object() ? request : nlohmann::json::object();
    input["executionId"] = execution_id;
    host_->start(execution_id, kUserInputWorkflowType, input);
}

void DurableFlowEngine::signal(const std::string& execution_id,
                               const std::string& signal_name,
                               const nlohmann::json& payload) {
    host_->signal(execution_id, signal_name, payload);
}

nlohmann::json DurableFlowEngine::query(const std::string& execution_id, const std::string& query_name) {
    return host_->query(execution_id, query_name);
}

std::optional<nlohmann::json> DurableFlowEngine::wait_result(const std::string& execution_id,
                                                             std::chrono::milliseconds timeout) {
    return host_->wait_result(execution_id, timeout);
}

std::vector<std::string> DurableFlowEngine::resume_pending() {
    return host_->resume_pending();
}

void DurableFlowEngine::stop() {
    host_->stop();
}

} // namespace durableflow
