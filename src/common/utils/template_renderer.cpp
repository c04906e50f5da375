// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include "common/errors.h"
#include <cctype>
#include <vector>

namespace durableflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("${", "}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("%%"); // "##" would swallow markdown headings in node values
    env_.set_throw_at_missing_includes(true);

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    // Templates come from workflow definitions; never read files
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::normalize_path(std::string_view path) {
    // a[0] -> a.0, a['k'] / a["k"] -> a.k
    std::string out;
    out.reserve(path.size());
    size_t i = 0;
    while (i < path.size()) {
        const char c = path[i];
        if (c == '[') {
            size_t close = path.find(']', i);
            if (close == std::string_view::npos) {
                out.append(path.substr(i));
                break;
            }
            std::string_view key = path.substr(i + 1, close - i - 1);
            if (key.size() >= 2 && (key.front() == '\'' || key.front() == '"') && key.back() == key.front()) {
                key = key.substr(1, key.size() - 2);
            }
            if (!out.empty() && out.back() != '.') out.push_back('.');
            out.append(key);
            i = close + 1;
            continue;
        }
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
        ++i;
    }
    return out;
}

std::string InjaTemplateRenderer::normalize_template(std::string_view template_str) {
    std::string out;
    out.reserve(template_str.size());
    size_t pos = 0;
    while (pos < template_str.size()) {
        size_t open = template_str.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(template_str.substr(pos));
            break;
        }
        size_t close = template_str.find('}', open + 2);
        if (close == std::string_view::npos) {
            out.append(template_str.substr(pos));
            break;
        }
        out.append(template_str.substr(pos, open - pos));
        out.append("${");
        out.append(normalize_path(template_str.substr(open + 2, close - open - 2)));
        out.append("}");
        pos = close + 1;
    }
    return out;
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& context) {
    static InjaTemplateRenderer renderer;
    if (template_str.find("${") == std::string_view::npos && template_str.find("{%") == std::string_view::npos) {
        return std::string(template_str);
    }
    try {
        return renderer.env_.render(normalize_template(template_str), context);
    } catch (const inja::InjaError& e) {
        throw ConfigError("Template render error: " + std::string(e.message));
    }
}

std::optional<std::string> InjaTemplateRenderer::single_placeholder(std::string_view text) {
    if (text.size() < 4 || text.substr(0, 2) != "${" || text.back() != '}') return std::nullopt;
    std::string_view inner = text.substr(2, text.size() - 3);
    if (inner.find('}') != std::string_view::npos || inner.find("${") != std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(inner);
}

std::optional<Value> InjaTemplateRenderer::lookup(const Context& context, std::string_view path) {
    const std::string normalized = normalize_path(path);
    const Value* current = &context;
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t dot = normalized.find('.', start);
        std::string key = normalized.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (key.empty()) return std::nullopt;

        if (current->is_object()) {
            auto it = current->find(key);
            if (it == current->end()) return std::nullopt;
            current = &*it;
        } else if (current->is_array()) {
            size_t index = 0;
            for (char c : key) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
                index = index * 10 + static_cast<size_t>(c - '0');
            }
            if (index >= current->size()) return std::nullopt;
            current = &(*current)[index];
        } else {
            return std::nullopt;
        }

        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return *current;
}

Value InjaTemplateRenderer::resolve(const Value& raw, const Context& context) {
    if (raw.is_object()) {
        Value out = Value::object();
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            out[it.key()] = resolve(it.value(), context);
        }
        return out;
    }
    if (raw.is_array()) {
        Value out = Value::array();
        for (const auto& item : raw) {
            out.push_back(resolve(item, context));
        }
        return out;
    }
    if (!raw.is_string()) {
        return raw;
    }

    const std::string& text = raw.get_ref<const std::string&>();
    if (auto path = single_placeholder(text)) {
        auto value = lookup(context, *path);
        if (!value) {
            throw ConfigError("Template render error: variable '" + *path + "' not found");
        }
        return *value;
    }

    std::string rendered = render(text, context);
    size_t first = rendered.find_first_not_of(" \t\r\n");
    size_t last = rendered.find_last_not_of(" \t\r\n");
    if (first != std::string::npos &&
        ((rendered[first] == '{' && rendered[last] == '}') || (rendered[first] == '[' && rendered[last] == ']'))) {
        Value parsed = Value::parse(rendered, nullptr, false);
        if (!parsed.is_discarded()) return parsed;
    }
    return rendered;
}

} // namespace durableflow
