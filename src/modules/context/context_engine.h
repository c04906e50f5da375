// modules/context/context_engine.h
#ifndef DURABLEFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H
#define DURABLEFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H

#include "core/types/workflow.h"
#include <string>

namespace durableflow {

// ExecutionContext 的合并规则：节点输出按顶层 key 写入，后写覆盖先写
class ContextEngine {
public:
    // Reserved output key: an array of variable names to erase from the context
    static constexpr const char* kUnsetKey = "$unset";

    // Copies every top-level key of `source` into `target`, then erases the
    // names listed under kUnsetKey. A non-object source is ignored.
    static void merge(Context& target, const Context& source);

    // onError=fallback: an object is merged key by key, anything else is
    // stored under the node id
    static void merge_fallback(Context& target, const std::string& node_id, const Value& fallback);
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_CONTEXT_CONTEXT_ENGINE_H
