// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>

namespace durableflow {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

template <class Json>
Json convert(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // "!" 标签表示引号标量，不做类型推断
            if (node.Tag() == "!") return s;

            if (s == "true" || s == "True")  return true;
            if (s == "false" || s == "False") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // too large for a number; keep the text
                } catch (const std::invalid_argument&) {
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            Json arr = Json::array();
            for (const auto& item : node) {
                arr.push_back(convert<Json>(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Json obj = Json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = convert<Json>(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    return convert<nlohmann::json>(node);
}

nlohmann::ordered_json yaml_to_ordered_json(const YAML::Node& node) {
    return convert<nlohmann::ordered_json>(node);
}

} // namespace durableflow
