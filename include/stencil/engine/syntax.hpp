#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace stencil {
namespace engine {

// ============================================================================
// Name Rules
// ============================================================================

inline bool is_identifier_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool is_identifier_char(char c) {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/** @brief [A-Za-z_][A-Za-z0-9_]* */
inline bool is_identifier(std::string_view s) {
    if (s.empty() || !is_identifier_start(s.front())) return false;
    for (char c : s) {
        if (!is_identifier_char(c)) return false;
    }
    return true;
}

/** @brief Identifier or dotted path of identifiers ("user.name"). */
inline bool is_name_path(std::string_view s) {
    std::size_t start = 0;
    while (true) {
        auto dot = s.find('.', start);
        if (!is_identifier(s.substr(start, dot == std::string_view::npos ? dot : dot - start))) {
            return false;
        }
        if (dot == std::string_view::npos) return true;
        start = dot + 1;
    }
}

/** @brief Name accepted in a Mustache tag: a name path or "." for the current scope. */
inline bool is_mustache_name(std::string_view s) {
    return s == "." || is_name_path(s);
}

inline std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// ============================================================================
// Mustache Tag Shape
// ============================================================================

/** @brief Character after the opening "{{" that selects the tag kind. */
enum class TagSigil {
    None,      ///< {{name}}
    Section,   ///< {{#name}}
    Inverted,  ///< {{^name}}
    Close,     ///< {{/name}}
    Raw        ///< {{&name}}
};

inline TagSigil sigil_from_char(char c) {
    switch (c) {
        case '#': return TagSigil::Section;
        case '^': return TagSigil::Inverted;
        case '/': return TagSigil::Close;
        case '&': return TagSigil::Raw;
        default: return TagSigil::None;
    }
}

/**
 * @brief Exact Mustache tag occupying source at a position
 *
 * Strict form used for style detection: no whitespace between the
 * delimiters and the name, so "{{ and }}" stays a pair of FmtString escapes.
 */
struct TagMatch {
    TagSigil sigil = TagSigil::None;
    bool triple = false;        ///< {{{name}}}
    std::string_view name;      ///< Empty for "{{}}"
    std::size_t length = 0;     ///< Bytes from the first '{' through the last '}'
};

/**
 * @brief Match a well-formed Mustache tag starting at pos
 *
 * Accepts `{{{name}}}` and `{{` [sigil] name-or-empty `}}` where the name is a
 * dotted path or ".". Returns nullopt for anything else.
 */
inline std::optional<TagMatch> match_mustache_tag(std::string_view source, std::size_t pos) {
    if (source.compare(pos, 2, "{{") != 0) return std::nullopt;

    TagMatch match;
    if (source.compare(pos, 3, "{{{") == 0) {
        auto close = source.find("}}}", pos + 3);
        if (close == std::string_view::npos) return std::nullopt;
        auto name = source.substr(pos + 3, close - pos - 3);
        if (!is_mustache_name(name)) return std::nullopt;
        match.triple = true;
        match.name = name;
        match.length = close + 3 - pos;
        return match;
    }

    auto close = source.find("}}", pos + 2);
    if (close == std::string_view::npos) return std::nullopt;
    auto inner = source.substr(pos + 2, close - pos - 2);
    if (!inner.empty()) {
        match.sigil = sigil_from_char(inner.front());
        if (match.sigil != TagSigil::None) inner.remove_prefix(1);
    }
    if (!inner.empty() && !is_mustache_name(inner)) return std::nullopt;

    match.name = inner;
    match.length = close + 2 - pos;
    return match;
}

} // namespace engine
} // namespace stencil
