// core/types/workflow.cpp
#include "core/types/workflow.h"
#include "common/errors.h"

namespace durableflow {

const WorkflowNode* WorkflowDefinition::find_node(const NodeId& id) const {
    for (const auto& node : nodes) {
        if (node.id == id) return &node;
    }
    return nullptr;
}

std::string to_string(OnErrorStrategy strategy) {
    switch (strategy) {
        case OnErrorStrategy::CONTINUE: return "continue";
        case OnErrorStrategy::FALLBACK: return "fallback";
        case OnErrorStrategy::GOTO:     return "goto";
        case OnErrorStrategy::FAIL:     return "fail";
    }
    return "fail";
}

OnErrorStrategy parse_on_error_strategy(const std::string& value) {
    if (value == "continue") return OnErrorStrategy::CONTINUE;
    if (value == "fallback") return OnErrorStrategy::FALLBACK;
    if (value == "goto") return OnErrorStrategy::GOTO;
    if (value == "fail") return OnErrorStrategy::FAIL;
    throw ConfigError("Unknown onError strategy '" + value + "'");
}

void to_json(nlohmann::json& j, const OnErrorPolicy& policy) {
    j = nlohmann::json{{"strategy", to_string(policy.strategy)}};
    if (policy.fallback_value) j["fallbackValue"] = *policy.fallback_value;
    if (policy.goto_node) j["gotoNode"] = *policy.goto_node;
}

void from_json(const nlohmann::json& j, OnErrorPolicy& policy) {
    policy = OnErrorPolicy{};
    if (j.is_string()) {
        policy.strategy = parse_on_error_strategy(j.get<std::string>());
        return;
    }
    if (!j.is_object()) {
        throw ConfigError("'onError' must be a string or an object");
    }
    policy.strategy = parse_on_error_strategy(j.value("strategy", std::string("fail")));
    if (j.contains("fallbackValue")) policy.fallback_value = j.at("fallbackValue");
    if (j.contains("gotoNode") && j.at("gotoNode").is_string()) {
        policy.goto_node = j.at("gotoNode").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const WorkflowNode& node) {
    j = nlohmann::json{
        {"id", node.id},
        {"type", node.type},
        {"name", node.name},
        {"config", node.config},
        {"onError", node.on_error}
    };
}

void to_json(nlohmann::json& j, const WorkflowEdge& edge) {
    j = nlohmann::json{{"id", edge.id}, {"source", edge.source}, {"target", edge.target}};
    if (edge.source_handle) j["sourceHandle"] = *edge.source_handle;
}

void to_json(nlohmann::json& j, const WorkflowDefinition& def) {
    j = nlohmann::json{
        {"name", def.name},
        {"nodes", def.nodes},
        {"edges", def.edges}
    };
    if (def.entry_point) j["entryPoint"] = *def.entry_point;
}

} // namespace durableflow
