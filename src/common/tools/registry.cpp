// common/tools/registry.cpp
#include "common/tools/registry.h"
#include "common/errors.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <regex>

namespace durableflow {

ToolRegistry::ToolRegistry() {
    register_default_tools();
}

void ToolRegistry::register_default_tools() {
    register_tool("calculate", [](const nlohmann::json& args) -> nlohmann::json {
        if (!args.contains("a") || !args.contains("b") || !args.contains("op")) {
            throw ToolError("calculate requires arguments: a, b, op");
        }
        if (!args.at("a").is_number() || !args.at("b").is_number() || !args.at("op").is_string()) {
            throw ToolError("calculate expects numeric a, b and a string op");
        }
        const double a = args.at("a").get<double>();
        const double b = args.at("b").get<double>();
        const std::string op = args.at("op").get<std::string>();

        if (op == "/" && b == 0.0) {
            throw ToolError("Division by zero");
        }
        double result = 0.0;
        if (op == "+") result = a + b;
        else if (op == "-") result = a - b;
        else if (op == "*") result = a * b;
        else if (op == "/") result = a / b;
        else throw ToolError("Unsupported operator: " + op);
        return nlohmann::json{{"result", result}};
    });

    register_tool("parse_json", [](const nlohmann::json& args) -> nlohmann::json {
        if (!args.contains("json") || !args.at("json").is_string()) {
            throw ToolError("parse_json requires 'json' string argument");
        }
        nlohmann::json parsed = nlohmann::json::parse(args.at("json").get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) {
            return nlohmann::json{{"success", false}, {"error", "Invalid JSON"}};
        }
        return nlohmann::json{{"success", true}, {"data", parsed}};
    });

    register_tool("validate_email", [](const nlohmann::json& args) -> nlohmann::json {
        if (!args.contains("email") || !args.at("email").is_string()) {
            throw ToolError("validate_email requires 'email' string argument");
        }
        static const std::regex kEmail(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
        const std::string email = args.at("email").get<std::string>();
        const bool valid = std::regex_match(email, kEmail);
        return nlohmann::json{
            {"email", email},
            {"isValid", valid},
            {"reason", valid ? "Valid email format" : "Invalid email format"}
        };
    });
}

void ToolRegistry::register_tool(std::string name, ToolFunction func) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[std::move(name)] = std::move(func);
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

std::vector<std::string> ToolRegistry::list_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json ToolRegistry::execute(const std::string& execution_id,
                                     const ToolCall& call,
                                     const std::vector<ToolDefinition>& available_tools,
                                     const std::string& /*user_id*/,
                                     const std::string& agent_id) {
    auto def = std::find_if(available_tools.begin(), available_tools.end(),
                            [&](const ToolDefinition& t) { return t.name == call.name; });
    if (def == available_tools.end()) {
        throw ToolError("Tool \"" + call.name + "\" not found in available tools");
    }
    if (def->type != "function") {
        throw ToolError("Unknown tool type: " + def->type);
    }

    const std::string function_name = def->config.is_object()
        ? def->config.value("functionName", def->name)
        : def->name;

    ToolFunction func;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(function_name);
        if (it == tools_.end()) {
            throw ToolError("Unknown function: " + function_name);
        }
        func = it->second;
    }

    DF_LOG_DEBUG("[Tools] {} calling {} for agent {}", execution_id, function_name, agent_id);
    return func(call.arguments);
}

} // namespace durableflow
