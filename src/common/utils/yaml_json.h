#ifndef DURABLEFLOW_COMMON_UTILS_YAML_JSON_H
#define DURABLEFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace durableflow {

// 将 YAML::Node 转换为 nlohmann::json（标量按 YAML 1.2 core schema 推断类型，引号标量保持字符串）
nlohmann::json yaml_to_json(const YAML::Node& node);

// Same conversion, preserving mapping key order
nlohmann::ordered_json yaml_to_ordered_json(const YAML::Node& node);

} // namespace durableflow

#endif // DURABLEFLOW_COMMON_UTILS_YAML_JSON_H
