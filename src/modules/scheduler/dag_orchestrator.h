// modules/scheduler/dag_orchestrator.h
#ifndef DURABLEFLOW_MODULES_SCHEDULER_DAG_ORCHESTRATOR_H
#define DURABLEFLOW_MODULES_SCHEDULER_DAG_ORCHESTRATOR_H

#include "core/types/workflow.h"
#include "core/types/workflow.h"
#include "modules/substrate/execution_session.h"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace durableflow {

inline constexpr const char* kDagWorkflowType = "workflowOrchestrator";

struct DagOrchestratorOptions {
    ActivityOptions node = ActivityOptions::standard();
    ActivityOptions events = ActivityOptions::fire_and_forget();
};

// 按依赖顺序执行静态 DAG。节点体逐个串行执行，输出合并进共享 context。
//
// input:  {executionId?, workflowDefinition, inputs?}
// result: {success, outputs, error?, warnings?}
class DagOrchestrator {
public:
    DagOrchestrator(ExecutionSession& session, DagOrchestratorOptions options);

    nlohmann::json run(const nlohmann::json& input);

private:
    struct NodeRecord {
        const WorkflowNode* node = nullptr;
        std::vector<size_t> incoming;
        std::vector<size_t> outgoing;
    };

    enum class Phase { ENTER, DEPS, DEPENDENTS };

    struct Frame {
        size_t index;
        Phase phase = Phase::ENTER;
        size_t next = 0;
        std::vector<size_t> targets;
    };

    ExecutionSession& session_;
    DagOrchestratorOptions options_;

    std::string execution_id_;
    WorkflowDefinition definition_;
    nlohmann::json inputs_;
    Context context_;

    std::vector<NodeRecord> arena_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<bool> visited_;
    std::vector<bool> failed_;
    nlohmann::ordered_json errors_ = nlohmann::ordered_json::object();
    std::vector<std::string> warnings_;
    size_t completed_ = 0;

    void build_graph();
    std::vector<size_t> start_nodes() const;
    void visit(size_t start);
    // Runs one node; returns the nodes to visit next
    std::vector<size_t> execute_node(size_t index);
    std::vector<size_t> handle_failure(size_t index, const std::string& message);
    void mark_failed(size_t index, const std::string& message);
    void complete_node(size_t index, const Value& outputs, int64_t started_ms);
    void emit_progress();

    void emit(const char* event_type, nlohmann::json payload);
    void update_status(const char* status, const nlohmann::json& outputs, const std::string& error);
    int64_t now_ms();
};

// WorkflowFunction entry point for the host
nlohmann::json run_dag_workflow(ExecutionSession& session, const nlohmann::json& input,
                                const DagOrchestratorOptions& options);

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SCHEDULER_DAG_ORCHESTRATOR_H
