#ifndef DURABLEFLOW_TYPES_WORKFLOW_H
#define DURABLEFLOW_TYPES_WORKFLOW_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace durableflow {

// 节点配置、输出与执行上下文都是 JSON 值
using Value = nlohmann::json;
using Context = nlohmann::json;

using NodeId = std::string;

enum class OnErrorStrategy : uint8_t {
    CONTINUE,
    FALLBACK,
    GOTO,
    FAIL
};

struct OnErrorPolicy {
    OnErrorStrategy strategy = OnErrorStrategy::FAIL;
    std::optional<nlohmann::json> fallback_value;
    std::optional<NodeId> goto_node;
};

// Position 是编辑器元数据，引擎不读取
struct WorkflowNode {
    NodeId id;
    std::string type;
    std::string name;
    nlohmann::json config = nlohmann::json::object();
    OnErrorPolicy on_error;
};

struct WorkflowEdge {
    std::string id;
    NodeId source;
    NodeId target;
    std::optional<std::string> source_handle;
};

struct WorkflowDefinition {
    std::string name;
    std::vector<WorkflowNode> nodes; // declaration order, ids unique
    std::vector<WorkflowEdge> edges;
    std::optional<NodeId> entry_point;

    const WorkflowNode* find_node(const NodeId& id) const;
};

std::string to_string(OnErrorStrategy strategy);
OnErrorStrategy parse_on_error_strategy(const std::string& value);

// nlohmann ADL hooks. Nodes serialize as an ordered array so that declaration
// order survives the history store round trip; WorkflowParser reads them back.
void to_json(nlohmann::json& j, const OnErrorPolicy& policy);
void from_json(const nlohmann::json& j, OnErrorPolicy& policy);
void to_json(nlohmann::json& j, const WorkflowNode& node);
void to_json(nlohmann::json& j, const WorkflowEdge& edge);
void to_json(nlohmann::json& j, const WorkflowDefinition& def);

} // namespace durableflow

#endif // DURABLEFLOW_TYPES_WORKFLOW_H
