// modules/executor/node_executor.h
#ifndef DURABLEFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
#define DURABLEFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H

#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace durableflow {

// Node Executor port: runs one node body and returns the keys to merge into
// the execution context. Unknown types throw NodeNotImplementedError.
class NodeExecutor {
public:
    virtual ~NodeExecutor() = default;
    virtual Value execute(const std::string& node_type, const Value& config, const Context& context) = 0;
};

using NodeHandler = std::function<Value(const Value& config, const Context& context)>;

// 开放式注册表：节点类型名 -> handler。内置 output 与 variable 两种类型
class NodeRegistry : public NodeExecutor {
public:
    explicit NodeRegistry(bool with_builtins = true);

    // Replaces any handler already registered under node_type
    void register_handler(std::string node_type, NodeHandler handler);
    bool has_handler(const std::string& node_type) const;
    std::vector<std::string> list_types() const;

    Value execute(const std::string& node_type, const Value& config, const Context& context) override;

    // {outputName, value}: value is resolved against the context
    static Value execute_output(const Value& config, const Context& context);
    // {operation: set|get|delete, variableName, value?, valueType?: auto|string|number|boolean|json}
    static Value execute_variable(const Value& config, const Context& context);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, NodeHandler> handlers_;
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
