#include "stencil/engine/renderer.hpp"
#include "stencil/engine/format_spec.hpp"
#include "stencil/log.hpp"

namespace stencil {
namespace engine {

namespace {

// Falsy: false, null, empty list, empty map
bool is_truthy(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
            return false;
        case Value::value_t::boolean:
            return value.get<bool>();
        case Value::value_t::array:
        case Value::value_t::object:
            return !value.empty();
        default:
            return true;
    }
}

const char* type_name(const Value& value) {
    return value.is_array() ? "list" : "map";
}

} // namespace

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

Expected<RenderResult> Renderer::run(const Context& context) {
    if (!context.is_null() && !context.is_object()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidContext,
            std::string("render context must be a map, got ") + context.type_name()
        });
    }

    scopes_.clear();
    map_scopes_.clear();
    result_ = RenderResult{};
    result_.text.reserve(template_.source().size());

    if (context.is_object()) {
        push_scope(&context);
    }

    auto rendered = render_tree();
    if (!rendered) {
        return tl::unexpected(rendered.error());
    }
    return std::move(result_);
}

struct Renderer::Frame {
    const NodeList* nodes;
    std::size_t next = 0;
    const Value* items = nullptr;  ///< List a section iterates over, else nullptr
    std::size_t item = 0;
    bool scoped = false;           ///< Frame pushed a scope that must be popped
};

Expected<void> Renderer::render_tree() {
    std::vector<Frame> frames;
    frames.push_back(Frame{&template_.nodes()});

    while (!frames.empty()) {
        auto& frame = frames.back();

        if (frame.next == frame.nodes->size()) {
            if (frame.scoped) {
                pop_scope();
            }
            if (frame.items != nullptr && ++frame.item < frame.items->size()) {
                push_scope(&(*frame.items)[frame.item]);
                frame.next = 0;
                continue;
            }
            frames.pop_back();
            continue;
        }

        const auto& node = (*frame.nodes)[frame.next++];
        Expected<void> step;
        if (auto* literal = node.get_if<LiteralNode>()) {
            result_.text += literal->text;
        } else if (auto* placeholder = node.get_if<PlaceholderNode>()) {
            step = render_placeholder(*placeholder, node.offset);
        } else if (auto* variable = node.get_if<VariableNode>()) {
            step = render_variable(*variable, node.offset);
        } else if (auto* section = node.get_if<SectionNode>()) {
            enter_section(*section, frames);
        }
        if (!step) {
            return step;
        }
    }
    return {};
}

Expected<void> Renderer::render_placeholder(const PlaceholderNode& node, std::size_t offset) {
    const Value* value = lookup(node.name);
    if (value == nullptr) {
        if (node.default_value) {
            emit(*node.default_value, options_.escape_output);
            return {};
        }
        return missing(node.name, offset);
    }

    if (value->is_array() || value->is_object()) {
        return tl::unexpected(positioned(ErrorCode::TypeCoercion,
                                         "cannot substitute a " + std::string(type_name(*value)) +
                                             " for '" + node.name + "'",
                                         offset, node.name));
    }

    if (node.format_spec) {
        auto formatted = apply_format_spec(*value, *node.format_spec);
        if (!formatted) {
            return tl::unexpected(positioned(ErrorCode::FormatSpec,
                                             "format spec '" + *node.format_spec + "' for '" + node.name +
                                                 "': " + formatted.error(),
                                             offset, *node.format_spec));
        }
        emit(*formatted, options_.escape_output);
        return {};
    }

    emit(*scalar_to_string(*value), options_.escape_output);
    return {};
}

Expected<void> Renderer::render_variable(const VariableNode& node, std::size_t offset) {
    const Value* value = lookup(node.name);
    if (value == nullptr) {
        return missing(node.name, offset);
    }

    auto text = scalar_to_string(*value);
    if (!text) {
        return tl::unexpected(positioned(ErrorCode::TypeCoercion,
                                         "cannot substitute a " + std::string(type_name(*value)) +
                                             " for '" + node.name + "'",
                                         offset, node.name));
    }

    emit(*text, node.escaped && options_.escape_output);
    return {};
}

void Renderer::enter_section(const SectionNode& node, std::vector<Frame>& frames) {
    const Value* value = lookup(node.name);
    bool truthy = value != nullptr && is_truthy(*value);

    if (node.inverted) {
        if (!truthy) {
            frames.push_back(Frame{&node.body});
        }
        return;
    }
    if (!truthy) {
        return;
    }

    Frame frame{&node.body};
    frame.scoped = true;
    if (value->is_array()) {
        // Truthy lists are non-empty
        frame.items = value;
        push_scope(&(*value)[0]);
    } else {
        push_scope(value);
    }
    frames.push_back(frame);
}

void Renderer::push_scope(const Value* scope) {
    scopes_.push_back(scope);
    if (scope->is_object()) {
        map_scopes_.push_back(scope);
    }
}

void Renderer::pop_scope() {
    if (scopes_.back()->is_object()) {
        map_scopes_.pop_back();
    }
    scopes_.pop_back();
}

const Value* Renderer::lookup(const std::string& name) const {
    if (name == ".") {
        return scopes_.empty() ? nullptr : scopes_.back();
    }

    auto dot = name.find('.');
    auto head = name.substr(0, dot);

    const Value* current = nullptr;
    for (auto it = map_scopes_.rbegin(); it != map_scopes_.rend(); ++it) {
        const Value* scope = *it;
        auto found = scope->find(head);
        if (found != scope->end()) {
            current = &*found;
            break;
        }
    }

    while (current != nullptr && dot != std::string::npos) {
        auto start = dot + 1;
        dot = name.find('.', start);
        auto segment = name.substr(start, dot == std::string::npos ? dot : dot - start);
        if (!current->is_object()) return nullptr;
        auto found = current->find(segment);
        current = found == current->end() ? nullptr : &*found;
    }
    return current;
}

Expected<void> Renderer::missing(const std::string& name, std::size_t offset) {
    if (options_.missing_variable_policy == MissingVariablePolicy::Lenient) {
        log::logger()->debug("Variable '{}' missing from context; substituting empty string", name);
        result_.missing_variables.push_back(name);
        return {};
    }
    return tl::unexpected(positioned(ErrorCode::MissingVariable,
                                     "variable '" + name + "' is not in the context", offset, name));
}

Error Renderer::positioned(ErrorCode code, std::string message, std::size_t offset, std::string name) const {
    return Error{code, std::move(message), locate(template_.source(), offset), std::move(name)};
}

void Renderer::emit(const std::string& text, bool escape) {
    if (escape) {
        result_.text += html_escape(text);
    } else {
        result_.text += text;
    }
}

Expected<RenderResult> render_detailed(const Template& tmpl, const Context& context, const RenderOptions& options) {
    if (auto valid = options.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return Renderer(tmpl, options).run(context);
}

Expected<std::string> render(const Template& tmpl, const Context& context, const RenderOptions& options) {
    auto result = render_detailed(tmpl, context, options);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return std::move(result->text);
}

} // namespace engine
} // namespace stencil
