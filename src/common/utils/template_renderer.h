// common/utils/template_renderer.h
#ifndef DURABLEFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define DURABLEFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/workflow.h"
#include <inja/inja.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace durableflow {

// ${path} 插值，path 支持 a.b、a[0].b 与 a['k'] 形式
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Renders every ${...} placeholder; an unresolvable path throws ConfigError
    static std::string render(std::string_view template_str, const Context& context);

    // Resolves a config value against the context:
    //  - a string that is exactly one "${path}" yields the raw JSON value at path
    //  - other strings are rendered; a result shaped like a JSON object/array is parsed
    //  - objects and arrays are resolved element by element
    static Value resolve(const Value& raw, const Context& context);

    // Looks up a dotted/bracketed path; std::nullopt when any segment is missing
    static std::optional<Value> lookup(const Context& context, std::string_view path);

    // Path of a string consisting of a single placeholder, e.g. "${x}" -> "x"
    static std::optional<std::string> single_placeholder(std::string_view text);

private:
    inja::Environment env_;
    void configure_security();

    static std::string normalize_path(std::string_view path);
    static std::string normalize_template(std::string_view template_str);
};

} // namespace durableflow

#endif // DURABLEFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
