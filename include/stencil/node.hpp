#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace stencil {

struct Node;

/// Ordered node sequence: a template root or a section body.
using NodeList = std::vector<Node>;

/**
 * @brief Raw text emitted verbatim
 *
 * `raw` is the source slice the literal came from. It differs from `text`
 * only where FmtString brace escapes were collapsed ("{{" -> "{").
 */
struct LiteralNode {
    std::string text;
    std::string raw;

    bool operator==(const LiteralNode& other) const {
        return text == other.text && raw == other.raw;
    }
};

/** @brief FmtString substitution point: {name|default:spec} */
struct PlaceholderNode {
    std::string name;                          ///< Variable name or dotted path
    std::optional<std::string> format_spec;    ///< Opaque spec text after ':'
    std::optional<std::string> default_value;  ///< Fallback text after '|'
    std::string tag;                           ///< Raw placeholder source, braces included

    bool operator==(const PlaceholderNode& other) const {
        return name == other.name &&
               format_spec == other.format_spec &&
               default_value == other.default_value &&
               tag == other.tag;
    }
};

/** @brief Mustache scalar tag: {{name}}, {{{name}}} or {{&name}} */
struct VariableNode {
    std::string name;    ///< Variable name, dotted path, or "." for the current scope
    bool escaped = true; ///< False for triple-brace and '&' tags
    std::string tag;     ///< Raw tag source

    bool operator==(const VariableNode& other) const {
        return name == other.name && escaped == other.escaped && tag == other.tag;
    }
};

/**
 * @brief Mustache block: {{#name}}...{{/name}} or {{^name}}...{{/name}}
 *
 * Copy, comparison and destruction walk nested bodies with an explicit
 * stack, so a section tree of any depth is safe to handle by value.
 */
struct SectionNode {
    std::string name;
    NodeList body;
    bool inverted = false;
    std::string open_tag;
    std::string close_tag;

    SectionNode() = default;
    SectionNode(const SectionNode& other);
    SectionNode(SectionNode&& other) noexcept;
    SectionNode& operator=(const SectionNode& other);
    SectionNode& operator=(SectionNode&& other) noexcept;
    ~SectionNode();

    bool operator==(const SectionNode& other) const;
};

/**
 * @brief One element of a parsed template
 *
 * Tagged variant over the four node shapes both parsers converge on, plus
 * the byte offset at which the node starts in the raw source.
 */
struct Node {
    std::variant<LiteralNode, PlaceholderNode, VariableNode, SectionNode> value;
    std::size_t offset = 0;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(value); }

    template<typename T>
    const T& as() const { return std::get<T>(value); }

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&value); }

    bool operator==(const Node& other) const {
        return offset == other.offset && value == other.value;
    }

    bool operator!=(const Node& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Reassemble source text from nodes
 *
 * Concatenates literal raw text and tag markers; for a parsed template this
 * reproduces the raw source byte-for-byte.
 */
void append_source(const NodeList& nodes, std::string& out);

} // namespace stencil
