#include "stencil/engine/bustache_scanner.hpp"
#include "stencil/engine/syntax.hpp"
#include "stencil/log.hpp"

#include <bustache/format.hpp>

#include <algorithm>
#include <functional>
#include <limits>
#include <optional>

namespace stencil {
namespace engine {

namespace {

constexpr auto npos = std::string_view::npos;

// One element of bustache's tree flattened into source order
struct Piece {
    std::optional<TokenKind> tag;  ///< Unset for text runs
    std::string_view text;         ///< Points into the scanned source
};

std::size_t skip_space(std::string_view source, std::size_t pos) {
    while (pos < source.size() && is_space(source[pos])) ++pos;
    return pos;
}

// One past the tag opening at `open`, read the way bustache reads it; npos if unterminated
std::size_t tag_end(std::string_view source, std::size_t open) {
    auto pos = skip_space(source, open + 2);
    if (pos < source.size() && source[pos] == '{') {
        for (auto brace = source.find('}', pos + 1); brace != npos; brace = source.find('}', brace + 1)) {
            auto after = skip_space(source, brace + 1);
            if (source.compare(after, 2, "}}") == 0) {
                return after + 2;
            }
        }
        return npos;
    }
    auto close = source.find("}}", pos);
    return close == npos ? npos : close + 2;
}

// Kind selected by the character after "{{"; nullopt for unsupported tags
std::optional<TokenKind> lexical_kind(std::string_view source, std::size_t open) {
    auto pos = skip_space(source, open + 2);
    if (pos >= source.size()) return std::nullopt;

    char c = source[pos];
    switch (c) {
        case '{':
        case '&': return TokenKind::RawVariable;
        case '#': return TokenKind::SectionOpen;
        case '^': return TokenKind::InvertedOpen;
        case '/': return TokenKind::SectionClose;
        default: break;
    }
    if (is_identifier_char(c) || c == '.' || c == '}') return TokenKind::Variable;
    return std::nullopt;
}

std::string tag_name(std::string_view raw, TokenKind kind) {
    auto inner = trim(raw.substr(2, raw.size() - 4));
    if (kind == TokenKind::Variable) {
        return std::string(inner);
    }
    bool triple = inner.front() == '{';
    inner.remove_prefix(1);
    if (triple) inner.remove_suffix(1);
    return std::string(trim(inner));
}

// nullopt when the tree holds constructs outside the supported syntax
std::optional<std::vector<Piece>> flatten(const bustache::ast::view& view) {
    namespace ast = bustache::ast;

    struct Level {
        const ast::content_list* contents;
        std::size_t next;
        bool block;  ///< Body of a section; its close tag follows
    };

    std::vector<Piece> pieces;
    std::vector<Level> stack{{&view.contents, 0, false}};
    while (!stack.empty()) {
        auto& level = stack.back();
        if (level.next == level.contents->size()) {
            if (level.block) {
                pieces.push_back(Piece{TokenKind::SectionClose, {}});
            }
            stack.pop_back();
            continue;
        }

        const ast::content content = (*level.contents)[level.next++];
        switch (content.kind) {
            case ast::type::text:
                pieces.push_back(Piece{std::nullopt, view.ctx.texts[content.index]});
                break;
            case ast::type::var_escaped:
                pieces.push_back(Piece{TokenKind::Variable, {}});
                break;
            case ast::type::var_raw:
                pieces.push_back(Piece{TokenKind::RawVariable, {}});
                break;
            case ast::type::section:
            case ast::type::inversion:
                pieces.push_back(Piece{content.kind == ast::type::section ? TokenKind::SectionOpen
                                                                          : TokenKind::InvertedOpen,
                                       {}});
                stack.push_back(Level{&view.ctx.blocks[content.index].contents, 0, true});
                break;
            default:
                return std::nullopt;
        }
    }
    return pieces;
}

/**
 * Rebuild the positioned token stream. Text runs anchor the pieces to the
 * source; the tags between two runs are matched in order against the "{{"
 * tags found in that gap. Returns nullopt when source and tree disagree.
 */
std::optional<std::vector<ScanToken>> assemble(std::string_view source, const std::vector<Piece>& pieces) {
    std::vector<ScanToken> tokens;
    std::size_t pos = 0;

    auto add_text = [&](std::size_t begin, std::size_t end) {
        if (begin == end) return;
        if (!tokens.empty() && tokens.back().kind == TokenKind::Text) {
            tokens.back().raw.append(source.substr(begin, end - begin));
        } else {
            tokens.push_back(ScanToken{TokenKind::Text, {}, std::string(source.substr(begin, end - begin)), begin});
        }
    };

    // Tags pieces[from, to) must lie in source[pos, limit)
    auto place_tags = [&](std::size_t limit, std::size_t from, std::size_t to, bool at_end) {
        std::size_t cursor = pos;
        std::size_t next = from;
        for (auto open = source.find("{{", cursor); open != npos && open < limit;
             open = source.find("{{", cursor)) {
            if (next == to) return false;
            auto end = tag_end(source, open);
            auto kind = lexical_kind(source, open);
            if (end == npos || end > limit || !kind || *kind != *pieces[next].tag) return false;

            add_text(cursor, open);
            auto raw = source.substr(open, end - open);
            tokens.push_back(ScanToken{*kind, tag_name(raw, *kind), std::string(raw), open});
            cursor = end;
            ++next;
        }
        add_text(cursor, limit);
        pos = limit;

        // Only sections left open at end of input have no closing tag
        for (; next < to; ++next) {
            if (!at_end || *pieces[next].tag != TokenKind::SectionClose) return false;
        }
        return true;
    };

    const char* begin = source.data();
    const char* end = source.data() + source.size();
    std::size_t from = 0;
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        if (pieces[i].tag) continue;

        auto text = pieces[i].text;
        if (std::less<const char*>{}(text.data(), begin) || std::less<const char*>{}(end, text.data() + text.size())) {
            return std::nullopt;
        }
        auto offset = static_cast<std::size_t>(text.data() - begin);
        if (offset < pos || !place_tags(offset, from, i, false)) {
            return std::nullopt;
        }
        add_text(offset, offset + text.size());
        pos = offset + text.size();
        from = i + 1;
    }
    if (!place_tags(source.size(), from, pieces.size(), true)) {
        return std::nullopt;
    }
    return tokens;
}

} // namespace

std::size_t estimate_section_depth(std::string_view source) {
    std::size_t depth = 0;
    std::size_t deepest = 0;

    auto open = source.find("{{");
    while (open != npos) {
        auto pos = skip_space(source, open + 2);
        if (pos >= source.size()) break;

        char c = source[pos];
        if (c == '=') {
            return std::numeric_limits<std::size_t>::max();
        }
        if (c == '/') {
            if (depth > 0) --depth;
        } else if (!is_identifier_char(c) && c != '.' && c != '{' && c != '&' && c != '!' && c != '>' &&
                   c != '}') {
            // Any other sigil may open a block
            deepest = std::max(deepest, ++depth);
        }

        auto end = tag_end(source, open);
        if (end == npos) break;
        open = source.find("{{", end);
    }
    return deepest;
}

std::vector<ScanToken> BustacheTagScanner::scan(std::string_view source) const {
    if (estimate_section_depth(source) > kMaxLibraryDepth) {
        log::logger()->debug("Template nests sections beyond {}; using the basic scanner", kMaxLibraryDepth);
        return fallback_.scan(source);
    }

    std::optional<std::vector<Piece>> pieces;
    try {
        bustache::format format(source.data(), source.data() + source.size());
        pieces = flatten(format.view());
    } catch (const bustache::format_error& e) {
        log::logger()->debug("bustache rejected template: {}", e.what());
        return fallback_.scan(source);
    }

    if (pieces) {
        if (auto tokens = assemble(source, *pieces)) {
            return std::move(*tokens);
        }
    }
    return fallback_.scan(source);
}

} // namespace engine
} // namespace stencil
