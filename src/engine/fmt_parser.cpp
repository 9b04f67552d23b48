#include "stencil/engine/fmt_parser.hpp"
#include "stencil/engine/syntax.hpp"

namespace stencil {
namespace engine {

namespace {

// Appends to the trailing literal node, starting one when needed
void append_literal(NodeList& nodes, std::size_t offset, std::string_view text, std::string_view raw) {
    if (!nodes.empty()) {
        if (auto* literal = std::get_if<LiteralNode>(&nodes.back().value)) {
            literal->text.append(text);
            literal->raw.append(raw);
            return;
        }
    }
    nodes.push_back(Node{LiteralNode{std::string(text), std::string(raw)}, offset});
}

} // namespace

NodeList FmtStringParser::parse(std::string_view source) {
    NodeList nodes;

    std::size_t pos = 0;
    std::size_t run_start = 0;  // Start of pending plain text

    auto flush = [&](std::size_t end) {
        if (end > run_start) {
            auto text = source.substr(run_start, end - run_start);
            append_literal(nodes, run_start, text, text);
        }
    };

    while (pos < source.size()) {
        char c = source[pos];

        if (c == '{') {
            flush(pos);
            if (pos + 1 < source.size() && source[pos + 1] == '{') {
                append_literal(nodes, pos, "{", "{{");
                pos += 2;
                run_start = pos;
                continue;
            }

            auto close = source.find_first_of("{}", pos + 1);
            if (close == std::string_view::npos || source[close] == '{') {
                reporter_.report(ErrorCode::UnbalancedBrace, pos,
                                 "unmatched '{': no closing '}' for this placeholder");
                // Keep the brace as text and look for later problems
                run_start = pos;
                ++pos;
                continue;
            }

            parse_placeholder(source, pos, close, nodes);
            pos = close + 1;
            run_start = pos;
            continue;
        }

        if (c == '}') {
            flush(pos);
            if (pos + 1 < source.size() && source[pos + 1] == '}') {
                append_literal(nodes, pos, "}", "}}");
                pos += 2;
                run_start = pos;
                continue;
            }

            reporter_.report(ErrorCode::UnbalancedBrace, pos,
                             "unmatched '}': write '}}' for a literal brace");
            run_start = pos;
            ++pos;
            continue;
        }

        ++pos;
    }
    flush(pos);

    return nodes;
}

bool FmtStringParser::parse_placeholder(std::string_view source, std::size_t open, std::size_t close,
                                        NodeList& out) {
    auto tag = source.substr(open, close - open + 1);
    auto inner = source.substr(open + 1, close - open - 1);

    PlaceholderNode placeholder;
    placeholder.tag = std::string(tag);

    auto colon = inner.find(':');
    auto head = inner.substr(0, colon);
    if (colon != std::string_view::npos && colon + 1 < inner.size()) {
        placeholder.format_spec = std::string(inner.substr(colon + 1));
    }

    auto bar = head.find('|');
    if (bar != std::string_view::npos) {
        placeholder.default_value = std::string(head.substr(bar + 1));
        head = head.substr(0, bar);
    }

    auto name = trim(head);
    if (name.empty()) {
        reporter_.report(ErrorCode::EmptyPlaceholder, open, "placeholder has no variable name");
        return false;
    }
    if (!is_name_path(name)) {
        reporter_.report(ErrorCode::InvalidPlaceholder, open,
                         "'" + std::string(name) + "' is not a valid variable name",
                         std::string(name));
        return false;
    }

    placeholder.name = std::string(name);
    out.push_back(Node{std::move(placeholder), open});
    return true;
}

} // namespace engine
} // namespace stencil
