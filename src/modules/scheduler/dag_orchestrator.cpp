// modules/scheduler/dag_orchestrator.cpp
#include "modules/scheduler/dag_orchestrator.h"
#include "core/activity_names.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include "modules/context/context_engine.h"
#include "modules/parser/workflow_parser.h"
#include "modules/trace/event_sink.h"
#include <cmath>

namespace durableflow {

DagOrchestrator::DagOrchestrator(ExecutionSession& session, DagOrchestratorOptions options)
    : session_(session), options_(std::move(options)) {}

int64_t DagOrchestrator::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(session_.now().time_since_epoch()).count();
}

void DagOrchestrator::emit(const char* event_type, nlohmann::json payload) {
    payload["executionId"] = execution_id_;
    try {
        session_.execute_activity(activities::kEmitEvent, options_.events,
                                  nlohmann::json{{"type", event_type}, {"payload", std::move(payload)}});
    } catch (const ActivityFailure& e) {
        // 事件发送失败不影响控制流
        if (!session_.is_replaying()) {
            DF_LOG_DEBUG("[Orchestrator] Dropped {} event: {}", event_type, e.what());
        }
    }
}

void DagOrchestrator::update_status(const char* status, const nlohmann::json& outputs, const std::string& error) {
    nlohmann::json request{{"executionId", execution_id_}, {"status", status}};
    if (!outputs.is_null()) request["outputs"] = outputs;
    if (!error.empty()) request["error"] = error;
    try {
        session_.execute_activity(activities::kUpdateExecutionStatus, options_.node, request);
    } catch (const ActivityFailure& e) {
        if (!session_.is_replaying()) {
            DF_LOG_WARN("[Orchestrator] Could not record status '{}' for {}: {}", status, execution_id_, e.what());
        }
    }
}

void DagOrchestrator::build_graph() {
    arena_.clear();
    index_.clear();
    arena_.reserve(definition_.nodes.size());
    for (const auto& node : definition_.nodes) {
        index_[node.id] = arena_.size();
        arena_.push_back(NodeRecord{&node, {}, {}});
    }
    for (const auto& edge : definition_.edges) {
        auto source = index_.find(edge.source);
        auto target = index_.find(edge.target);
        if (source == index_.end() || target == index_.end()) {
            throw ConfigError("Edge '" + edge.id + "' references an unknown node");
        }
        arena_[source->second].outgoing.push_back(target->second);
        arena_[target->second].incoming.push_back(source->second);
    }
    visited_.assign(arena_.size(), false);
    failed_.assign(arena_.size(), false);
}

std::vector<size_t> DagOrchestrator::start_nodes() const {
    std::vector<size_t> starts;
    if (definition_.entry_point) {
        starts.push_back(index_.at(*definition_.entry_point));
    }
    for (size_t i = 0; i < arena_.size(); ++i) {
        if (arena_[i].node->type == "input" || arena_[i].incoming.empty()) {
            if (definition_.entry_point && arena_[i].node->id == *definition_.entry_point) continue;
            starts.push_back(i);
        }
    }
    return starts;
}

void DagOrchestrator::visit(size_t start) {
    // 显式栈代替递归：依赖先于节点执行，节点先于下游执行
    std::vector<Frame> stack;
    stack.push_back(Frame{start});

    while (!stack.empty()) {
        const size_t top = stack.size() - 1;
        const size_t index = stack[top].index;

        switch (stack[top].phase) {
            case Phase::ENTER:
                if (visited_[index]) {
                    stack.pop_back();
                    break;
                }
                // 先标记再访问依赖，环上的重复访问直接返回
                visited_[index] = true;
                stack[top].phase = Phase::DEPS;
                break;

            case Phase::DEPS: {
                const auto& incoming = arena_[index].incoming;
                if (stack[top].next < incoming.size()) {
                    const size_t dep = incoming[stack[top].next++];
                    if (!visited_[dep]) {
                        stack.push_back(Frame{dep});
                    }
                    break;
                }
                std::vector<size_t> targets = execute_node(index);
                stack[top].targets = std::move(targets);
                stack[top].next = 0;
                stack[top].phase = Phase::DEPENDENTS;
                break;
            }

            case Phase::DEPENDENTS:
                if (stack[top].next < stack[top].targets.size()) {
                    const size_t target = stack[top].targets[stack[top].next++];
                    stack.push_back(Frame{target});
                } else {
                    stack.pop_back();
                }
                break;
        }
    }
}

void DagOrchestrator::mark_failed(size_t index, const std::string& message) {
    failed_[index] = true;
    errors_[arena_[index].node->id] = message;
}

std::vector<size_t> DagOrchestrator::execute_node(size_t index) {
    const WorkflowNode& node = *arena_[index].node;
    const bool live = !session_.is_replaying();

    for (size_t dep : arena_[index].incoming) {
        if (failed_[dep]) {
            if (live) {
                DF_LOG_INFO("[Orchestrator] Skipping {} due to failed dependency", node.id);
            }
            mark_failed(index, "Dependency failed");
            emit(events::kNodeFailed, nlohmann::json{{"nodeId", node.id}, {"error", "Dependency failed"}});
            // 下游只被标记为失败，节点体不会执行
            return arena_[index].outgoing;
        }
    }

    if (live) {
        DF_LOG_INFO("[Orchestrator] Executing node {} ({})", node.id, node.type);
    }
    emit(events::kNodeStarted, nlohmann::json{{"nodeId", node.id}, {"nodeName", node.name}, {"nodeType", node.type}});
    const int64_t started_ms = now_ms();

    if (node.type == "input") {
        const std::string input_name = node.config.is_object()
            ? node.config.value("inputName", std::string("input"))
            : std::string("input");
        Value value = inputs_.contains(input_name) ? inputs_.at(input_name) : Value(nullptr);
        context_[input_name] = value;
        complete_node(index, Value{{input_name, std::move(value)}}, started_ms);
        return arena_[index].outgoing;
    }

    Value outputs;
    try {
        outputs = session_.execute_activity(activities::kExecuteNode, options_.node,
                                            nlohmann::json{{"nodeId", node.id},
                                                           {"nodeType", node.type},
                                                           {"config", node.config},
                                                           {"context", context_}});
    } catch (const ActivityFailure& e) {
        return handle_failure(index, e.what());
    }

    ContextEngine::merge(context_, outputs);
    complete_node(index, outputs, started_ms);
    return arena_[index].outgoing;
}

void DagOrchestrator::complete_node(size_t index, const Value& outputs, int64_t started_ms) {
    const WorkflowNode& node = *arena_[index].node;
    ++completed_;
    emit(events::kNodeCompleted, nlohmann::json{{"nodeId", node.id},
                                                {"output", outputs},
                                                {"duration", now_ms() - started_ms}});

    emit_progress();
}

void DagOrchestrator::emit_progress() {
    const size_t total = arena_.size();
    const int percentage = static_cast<int>(std::lround(100.0 * static_cast<double>(completed_) / static_cast<double>(total)));
    emit(events::kExecutionProgress, nlohmann::json{{"completed", completed_}, {"total", total}, {"percentage", percentage}});
}

std::vector<size_t> DagOrchestrator::handle_failure(size_t index, const std::string& message) {
    const WorkflowNode& node = *arena_[index].node;
    const OnErrorPolicy& policy = node.on_error;
    if (!session_.is_replaying()) {
        DF_LOG_ERROR("[Orchestrator] Node {} failed ({}): {}", node.id, to_string(policy.strategy), message);
    }

    switch (policy.strategy) {
        case OnErrorStrategy::CONTINUE: {
            emit(events::kNodeFailed, nlohmann::json{{"nodeId", node.id}, {"error", message}, {"handled", true}});
            warnings_.push_back("Node " + node.id + " failed and was skipped: " + message);
            ++completed_;
            emit_progress();
            return arena_[index].outgoing;
        }
        case OnErrorStrategy::FALLBACK: {
            const Value fallback = policy.fallback_value.value_or(Value(nullptr));
            ContextEngine::merge_fallback(context_, node.id, fallback);
            warnings_.push_back("Node " + node.id + " failed; fallback value used: " + message);
            const Value outputs = fallback.is_object() ? fallback : Value{{node.id, fallback}};
            complete_node(index, outputs, now_ms());
            return arena_[index].outgoing;
        }
        case OnErrorStrategy::GOTO: {
            emit(events::kNodeFailed, nlohmann::json{{"nodeId", node.id}, {"error", message}, {"handled", true}});
            const std::string target = policy.goto_node.value_or("");
            warnings_.push_back("Node " + node.id + " failed; continuing at " + target + ": " + message);
            auto it = index_.find(target);
            if (it == index_.end()) {
                mark_failed(index, message);
                return arena_[index].outgoing;
            }
            return {it->second};
        }
        case OnErrorStrategy::FAIL:
            break;
    }

    mark_failed(index, message);
    emit(events::kNodeFailed, nlohmann::json{{"nodeId", node.id}, {"error", message}});
    return arena_[index].outgoing;
}

nlohmann::json DagOrchestrator::run(const nlohmann::json& input) {
    if (!input.is_object() || !input.contains("workflowDefinition")) {
        throw ConfigError("Workflow orchestration requires a 'workflowDefinition'");
    }
    execution_id_ = input.value("executionId", session_.execution_id());
    inputs_ = input.contains("inputs") && input.at("inputs").is_object() ? input.at("inputs") : nlohmann::json::object();
    context_ = inputs_;

    try {
        // nodes 可以是 id -> node 的映射，也可以是列表
        WorkflowParser parser;
        definition_ = parser.from_json(nlohmann::ordered_json(input.at("workflowDefinition")));
        build_graph();
    } catch (const ConfigError& e) {
        update_status("failed", nullptr, e.what());
        throw;
    }

    if (!session_.is_replaying()) {
        DF_LOG_INFO("[Orchestrator] Starting workflow with {} nodes, {} edges",
                    definition_.nodes.size(), definition_.edges.size());
    }
    update_status("running", nullptr, "");
    emit(events::kExecutionStarted, nlohmann::json{
        {"workflowName", definition_.name.empty() ? std::string("Unnamed Workflow") : definition_.name},
        {"totalNodes", definition_.nodes.size()}});
    const int64_t started_ms = now_ms();

    nlohmann::json result;
    try {
        for (size_t start : start_nodes()) {
            visit(start);
        }
    } catch (const NonDeterminismError&) {
        throw;
    } catch (const std::exception& e) {
        const std::string message = e.what();
        if (!session_.is_replaying()) {
            DF_LOG_ERROR("[Orchestrator] Workflow failed: {}", message);
        }
        emit(events::kExecutionFailed, nlohmann::json{{"error", message}});
        update_status("failed", context_, message);
        return nlohmann::json{{"success", false}, {"outputs", context_}, {"error", message}};
    }

    if (!errors_.empty()) {
        const std::string message = "Workflow completed with errors: " + errors_.dump();
        const std::string failed_node = errors_.begin().key();
        emit(events::kExecutionFailed, nlohmann::json{{"error", message}, {"failedNodeId", failed_node}});
        update_status("failed", context_, message);
        result = nlohmann::json{{"success", false}, {"outputs", context_}, {"error", message}};
    } else {
        if (!session_.is_replaying()) {
            DF_LOG_INFO("[Orchestrator] Workflow completed successfully");
        }
        emit(events::kExecutionCompleted, nlohmann::json{{"outputs", context_}, {"duration", now_ms() - started_ms}});
        update_status("completed", context_, "");
        result = nlohmann::json{{"success", true}, {"outputs", context_}};
    }
    if (!warnings_.empty()) {
        result["warnings"] = warnings_;
    }
    return result;
}

nlohmann::json run_dag_workflow(ExecutionSession& session, const nlohmann::json& input,
                                const DagOrchestratorOptions& options) {
    DagOrchestrator orchestrator(session, options);
    return orchestrator.run(input);
}

} // namespace durableflow
