// modules/context/context_engine.cpp
#include "modules/context/context_engine.h"

namespace durableflow {

void ContextEngine::merge(Context& target, const Context& source) {
    if (!source.is_object()) {
        return;
    }
    if (!target.is_object()) {
        target = Context::object();
    }
    for (auto it = source.begin(); it != source.end(); ++it) {
        if (it.key() == kUnsetKey) {
            continue;
        }
        target[it.key()] = it.value();
    }
    auto unset = source.find(kUnsetKey);
    if (unset != source.end() && unset->is_array()) {
        for (const auto& name : *unset) {
            if (name.is_string()) {
                target.erase(name.get<std::string>());
            }
        }
    }
}

void ContextEngine::merge_fallback(Context& target, const std::string& node_id, const Value& fallback) {
    if (fallback.is_object()) {
        merge(target, fallback);
        return;
    }
    if (!target.is_object()) {
        target = Context::object();
    }
    target[node_id] = fallback;
}

} // namespace durableflow
