// common/tools/registry.h
#ifndef DURABLEFLOW_COMMON_TOOLS_REGISTRY_H
#define DURABLEFLOW_COMMON_TOOLS_REGISTRY_H

#include "modules/agent/agent_ports.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace durableflow {

using ToolFunction = std::function<nlohmann::json(const nlohmann::json& arguments)>;

// Function-tool implementation of the Tool Execution port. A call must name a
// tool in the agent's available_tools; "function" tools dispatch on
// config.functionName (falling back to the tool name).
class ToolRegistry : public ToolExecutor {
public:
    ToolRegistry(); // 构造时注册内置函数

    void register_tool(std::string name, ToolFunction func);
    bool has_tool(const std::string& name) const;
    std::vector<std::string> list_tools() const;

    nlohmann::json execute(const std::string& execution_id,
                           const ToolCall& call,
                           const std::vector<ToolDefinition>& available_tools,
                           const std::string& user_id,
                           const std::string& agent_id) override;

private:
    void register_default_tools();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolFunction> tools_;
};

} // namespace durableflow

#endif // DURABLEFLOW_COMMON_TOOLS_REGISTRY_H
