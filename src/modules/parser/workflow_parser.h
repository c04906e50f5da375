// modules/parser/workflow_parser.h
#ifndef DURABLEFLOW_MODULES_PARSER_WORKFLOW_PARSER_H
#define DURABLEFLOW_MODULES_PARSER_WORKFLOW_PARSER_H

#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <string>

namespace durableflow {

// Loads a WorkflowDefinition from JSON or YAML. `nodes` may be a mapping
// id -> node (declaration order kept) or an array of nodes carrying "id".
// All failures are reported as ConfigError.
class WorkflowParser {
public:
    WorkflowDefinition parse_json_string(const std::string& content);
    WorkflowDefinition parse_yaml_string(const std::string& content);
    // .json, .yaml and .yml
    WorkflowDefinition parse_from_file(const std::string& file_path);

    WorkflowDefinition from_json(const nlohmann::ordered_json& root);

    // Unique non-empty ids, known edge endpoints, entryPoint and gotoNode targets exist
    static void validate(const WorkflowDefinition& def);

private:
    WorkflowNode create_node_from_json(const std::string& id, const nlohmann::ordered_json& node_json);
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_PARSER_WORKFLOW_PARSER_H
