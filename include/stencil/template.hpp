#pragma once

#include "error.hpp"
#include "node.hpp"
#include "types.hpp"
#include "engine/tag_scanner.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace stencil {

class Template;

/// Result of parse(): a Template, or every problem found in the source.
using ParseResult = tl::expected<Template, ErrorSet>;

ParseResult parse(std::string_view source);
ParseResult parse(std::string_view source, const engine::ITagScanner& scanner);

/**
 * @brief Immutable parsed template
 *
 * Holds the raw source, the style decided at parse time and the node tree.
 * Only parse() constructs one, so every Template is valid. Instances never
 * change after construction and may be shared read-only across threads.
 *
 * @code
 * auto tmpl = stencil::parse("Hello, {name}!");
 * if (!tmpl) {
 *     for (const auto& err : tmpl.error()) std::cerr << err.to_string() << "\n";
 * }
 * @endcode
 */
class Template {
public:
    const std::string& source() const { return source_; }
    Style style() const { return style_; }
    const NodeList& nodes() const { return nodes_; }

    /**
     * @brief Names referenced by the template
     *
     * Unique, in order of first occurrence. Section names are included;
     * "." and names used inside sections are reported as written.
     */
    std::vector<std::string> variables() const;

    /** @brief Rebuild the raw source from the node tree. */
    std::string to_source() const;

    bool operator==(const Template& other) const {
        return style_ == other.style_ && source_ == other.source_ && nodes_ == other.nodes_;
    }

    bool operator!=(const Template& other) const {
        return !(*this == other);
    }

private:
    Template(std::string source, Style style, NodeList nodes)
        : source_(std::move(source))
        , style_(style)
        , nodes_(std::move(nodes))
    {}

    std::string source_;
    Style style_;
    NodeList nodes_;

    friend ParseResult parse(std::string_view source, const engine::ITagScanner& scanner);
};

} // namespace stencil
