#pragma once

#include "../error.hpp"
#include "../node.hpp"
#include <string_view>

namespace stencil {
namespace engine {

/**
 * @brief Parses FmtString-style source into literal and placeholder nodes
 *
 * Grammar:
 *   placeholder := '{' ws* name ws* ('|' default)? (':' format_spec)? '}'
 *   "{{" is a literal '{', "}}" a literal '}'
 *
 * Single pass, linear in source length. Every local failure is reported to
 * the ErrorReporter and scanning resumes after the offending brace, so one
 * call surfaces every brace problem in the source. Format specs are not
 * interpreted here.
 *
 * @threadsafety Stateless; safe to call concurrently.
 */
class FmtStringParser {
public:
    explicit FmtStringParser(ErrorReporter& reporter)
        : reporter_(reporter)
    {}

    /**
     * @brief Parse source into nodes
     *
     * Adjacent literal text, escapes included, is merged into one node.
     * The returned list is only meaningful when no errors were reported.
     */
    NodeList parse(std::string_view source);

private:
    ErrorReporter& reporter_;

    // Parses the braces at [open, close]; false when the placeholder is rejected
    bool parse_placeholder(std::string_view source, std::size_t open, std::size_t close, NodeList& out);
};

} // namespace engine
} // namespace stencil
