// modules/parser/workflow_parser.cpp
#include "modules/parser/workflow_parser.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include "common/utils/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace durableflow {

namespace {

nlohmann::json to_plain(const nlohmann::ordered_json& value) {
    return nlohmann::json::parse(value.dump());
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open workflow file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

WorkflowDefinition WorkflowParser::parse_json_string(const std::string& content) {
    nlohmann::ordered_json root;
    try {
        root = nlohmann::ordered_json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Invalid workflow JSON: ") + e.what());
    }
    return from_json(root);
}

WorkflowDefinition WorkflowParser::parse_yaml_string(const std::string& content) {
    YAML::Node yaml_root;
    try {
        yaml_root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid workflow YAML: ") + e.what());
    }
    return from_json(yaml_to_ordered_json(yaml_root));
}

WorkflowDefinition WorkflowParser::parse_from_file(const std::string& file_path) {
    const std::string ext = std::filesystem::path(file_path).extension().string();
    const std::string content = read_file(file_path);
    if (ext == ".json") {
        return parse_json_string(content);
    }
    if (ext == ".yaml" || ext == ".yml") {
        return parse_yaml_string(content);
    }
    throw ConfigError("Unsupported workflow file extension '" + ext + "': " + file_path);
}

WorkflowNode WorkflowParser::create_node_from_json(const std::string& id, const nlohmann::ordered_json& node_json) {
    if (!node_json.is_object()) {
        throw ConfigError("Node '" + id + "' must be an object");
    }
    if (!node_json.contains("type") || !node_json.at("type").is_string() ||
        node_json.at("type").get<std::string>().empty()) {
        throw ConfigError("Missing 'type' in node: " + id);
    }

    WorkflowNode node;
    node.id = id;
    node.type = node_json.at("type").get<std::string>();
    node.name = node_json.value("name", id);
    if (node_json.contains("config") && !node_json.at("config").is_null()) {
        node.config = to_plain(node_json.at("config"));
    }
    if (node_json.contains("onError")) {
        try {
            node.on_error = to_plain(node_json.at("onError")).get<OnErrorPolicy>();
        } catch (const ConfigError& e) {
            throw ConfigError("Node '" + id + "': " + e.what());
        }
    }
    // position 等编辑器字段直接忽略
    return node;
}

WorkflowDefinition WorkflowParser::from_json(const nlohmann::ordered_json& root) {
    if (!root.is_object()) {
        throw ConfigError("Workflow definition must be an object");
    }
    if (!root.contains("nodes")) {
        throw ConfigError("Workflow definition requires 'nodes'");
    }

    WorkflowDefinition def;
    def.name = root.value("name", std::string{});

    const auto& nodes = root.at("nodes");
    if (nodes.is_object()) {
        for (auto it = nodes.begin(); it != nodes.end(); ++it) {
            def.nodes.push_back(create_node_from_json(it.key(), it.value()));
        }
    } else if (nodes.is_array()) {
        for (const auto& node_json : nodes) {
            if (!node_json.is_object() || !node_json.contains("id") || !node_json.at("id").is_string()) {
                throw ConfigError("Nodes given as a list must each carry a string 'id'");
            }
            def.nodes.push_back(create_node_from_json(node_json.at("id").get<std::string>(), node_json));
        }
    } else {
        throw ConfigError("'nodes' must be a mapping or a list");
    }

    if (root.contains("edges") && !root.at("edges").is_null()) {
        const auto& edges = root.at("edges");
        if (!edges.is_array()) {
            throw ConfigError("'edges' must be a list");
        }
        for (const auto& edge_json : edges) {
            if (!edge_json.is_object() || !edge_json.contains("source") || !edge_json.contains("target") ||
                !edge_json.at("source").is_string() || !edge_json.at("target").is_string()) {
                throw ConfigError("Every edge requires string 'source' and 'target'");
            }
            WorkflowEdge edge;
            edge.source = edge_json.at("source").get<std::string>();
            edge.target = edge_json.at("target").get<std::string>();
            edge.id = edge_json.value("id", "e-" + edge.source + "-" + edge.target);
            if (edge_json.contains("sourceHandle") && edge_json.at("sourceHandle").is_string()) {
                edge.source_handle = edge_json.at("sourceHandle").get<std::string>();
            }
            def.edges.push_back(std::move(edge));
        }
    }

    if (root.contains("entryPoint") && root.at("entryPoint").is_string()) {
        def.entry_point = root.at("entryPoint").get<std::string>();
    }

    validate(def);
    DF_LOG_DEBUG("[Parser] Loaded workflow '{}' ({} nodes, {} edges)", def.name, def.nodes.size(), def.edges.size());
    return def;
}

void WorkflowParser::validate(const WorkflowDefinition& def) {
    std::unordered_set<std::string> ids;
    for (const auto& node : def.nodes) {
        if (node.id.empty()) {
            throw ConfigError("Node id must not be empty");
        }
        if (!ids.insert(node.id).second) {
            throw ConfigError("Duplicate node id: " + node.id);
        }
    }
    for (const auto& edge : def.edges) {
        if (ids.count(edge.source) == 0) {
            throw ConfigError("Edge '" + edge.id + "' references unknown source node: " + edge.source);
        }
        if (ids.count(edge.target) == 0) {
            throw ConfigError("Edge '" + edge.id + "' references unknown target node: " + edge.target);
        }
    }
    if (def.entry_point && ids.count(*def.entry_point) == 0) {
        throw ConfigError("entryPoint references unknown node: " + *def.entry_point);
    }
    for (const auto& node : def.nodes) {
        if (node.on_error.strategy == OnErrorStrategy::GOTO) {
            if (!node.on_error.goto_node) {
                throw ConfigError("Node '" + node.id + "' uses onError goto without 'gotoNode'");
            }
            if (ids.count(*node.on_error.goto_node) == 0) {
                throw ConfigError("Node '" + node.id + "' goto target is unknown: " + *node.on_error.goto_node);
            }
        }
    }
}

} // namespace durableflow
