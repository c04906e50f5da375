// modules/executor/node_executor.cpp
#include "modules/executor/node_executor.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include "common/utils/template_renderer.h"
#include "modules/context/context_engine.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace durableflow {

namespace {

std::string require_string(const Value& config, const char* key, const char* node_type) {
    if (!config.is_object() || !config.contains(key) || !config.at(key).is_string() ||
        config.at(key).get_ref<const std::string&>().empty()) {
        throw ConfigError(std::string(node_type) + " node requires a non-empty '" + key + "'");
    }
    return config.at(key).get<std::string>();
}

std::string to_text(const Value& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

Value convert_value(const Value& value, const std::string& value_type) {
    if (value_type == "auto") {
        return value;
    }
    if (value_type == "string") {
        return to_text(value);
    }
    if (value_type == "number") {
        if (value.is_number()) return value;
        if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
        const std::string text = to_text(value);
        errno = 0;
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
            throw ConfigError("Cannot convert '" + text + "' to a number");
        }
        return parsed;
    }
    if (value_type == "boolean") {
        if (value.is_boolean()) return value;
        return value.is_string() && value.get<std::string>() == "true";
    }
    if (value_type == "json") {
        if (!value.is_string()) return value;
        Value parsed = Value::parse(value.get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) {
            throw ConfigError("variable value is not valid JSON");
        }
        return parsed;
    }
    throw ConfigError("Unsupported valueType: " + value_type);
}

} // namespace

NodeRegistry::NodeRegistry(bool with_builtins) {
    if (with_builtins) {
        register_handler("output", &NodeRegistry::execute_output);
        register_handler("variable", &NodeRegistry::execute_variable);
    }
}

void NodeRegistry::register_handler(std::string node_type, NodeHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[std::move(node_type)] = std::move(handler);
}

bool NodeRegistry::has_handler(const std::string& node_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(node_type) > 0;
}

std::vector<std::string> NodeRegistry::list_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(handlers_.size());
    for (const auto& [type, _] : handlers_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

Value NodeRegistry::execute(const std::string& node_type, const Value& config, const Context& context) {
    NodeHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(node_type);
        if (it == handlers_.end()) {
            throw NodeNotImplementedError(node_type);
        }
        handler = it->second;
    }
    return handler(config, context);
}

Value NodeRegistry::execute_output(const Value& config, const Context& context) {
    const std::string output_name = require_string(config, "outputName", "output");
    const Value raw = config.contains("value") ? config.at("value") : Value(nullptr);
    Value value = InjaTemplateRenderer::resolve(raw, context);
    DF_LOG_DEBUG("[Output] {} = {}", output_name, value.dump().substr(0, 100));
    return Value{{output_name, std::move(value)}};
}

Value NodeRegistry::execute_variable(const Value& config, const Context& context) {
    const std::string operation = config.is_object() ? config.value("operation", std::string("set")) : "set";
    const std::string name = require_string(config, "variableName", "variable");
    const std::string scope = config.value("scope", std::string("workflow"));
    if (scope == "global") {
        throw ConfigError("Storage for scope 'global' not available");
    }

    if (operation == "set") {
        const Value raw = config.contains("value") ? config.at("value") : Value("");
        Value value = InjaTemplateRenderer::resolve(raw, context);
        value = convert_value(value, config.value("valueType", std::string("auto")));
        DF_LOG_DEBUG("[Variable] Set '{}' = {}", name, value.dump().substr(0, 100));
        return Value{{name, std::move(value)}};
    }
    if (operation == "get") {
        auto it = context.is_object() ? context.find(name) : context.end();
        Value value = (context.is_object() && it != context.end()) ? *it : Value(nullptr);
        return Value{{name, std::move(value)}};
    }
    if (operation == "delete") {
        DF_LOG_DEBUG("[Variable] Deleted '{}'", name);
        return Value{{ContextEngine::kUnsetKey, Value::array({name})}};
    }
    throw ConfigError("Unsupported variable operation: " + operation);
}

} // namespace durableflow
