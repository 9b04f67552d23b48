#include "stencil/engine/mustache_parser.hpp"
#include "stencil/engine/syntax.hpp"

namespace stencil {
namespace engine {

namespace {

// One open section awaiting its closing tag
struct Frame {
    SectionNode section;
    std::size_t offset;
};

} // namespace

NodeList MustacheParser::parse(std::string_view source) {
    NodeList root;
    std::vector<Frame> stack;

    auto current = [&]() -> NodeList& {
        return stack.empty() ? root : stack.back().section.body;
    };

    for (auto& token : scanner_.scan(source)) {
        switch (token.kind) {
            case TokenKind::Text:
                current().push_back(Node{LiteralNode{token.raw, token.raw}, token.offset});
                break;

            case TokenKind::Variable:
            case TokenKind::RawVariable:
                if (check_name(token)) {
                    VariableNode variable;
                    variable.name = std::move(token.name);
                    variable.escaped = token.kind == TokenKind::Variable;
                    variable.tag = std::move(token.raw);
                    current().push_back(Node{std::move(variable), token.offset});
                }
                break;

            case TokenKind::SectionOpen:
            case TokenKind::InvertedOpen: {
                // Bad names still open a frame so the matching close pairs up
                check_name(token);
                Frame frame{SectionNode{}, token.offset};
                frame.section.name = std::move(token.name);
                frame.section.inverted = token.kind == TokenKind::InvertedOpen;
                frame.section.open_tag = std::move(token.raw);
                stack.push_back(std::move(frame));
                break;
            }

            case TokenKind::SectionClose: {
                if (token.name.empty()) {
                    reporter_.report(ErrorCode::EmptyPlaceholder, token.offset, "closing tag has no section name");
                    break;
                }
                if (stack.empty()) {
                    auto& err = reporter_.report(ErrorCode::SectionMismatch, token.offset,
                                                 "closing tag {{/" + token.name + "}} has no open section");
                    err.found = token.name;
                    break;
                }
                if (stack.back().section.name != token.name) {
                    const auto& expected = stack.back().section.name;
                    auto& err = reporter_.report(ErrorCode::SectionMismatch, token.offset,
                                                 "expected {{/" + expected + "}} but found {{/" + token.name + "}}",
                                                 expected);
                    err.found = token.name;

                    // Unwind to an enclosing section of that name when there is one
                    auto it = stack.rbegin();
                    while (it != stack.rend() && it->section.name != token.name) ++it;
                    if (it == stack.rend()) break;
                    while (stack.back().section.name != token.name) {
                        auto& open = stack.back();
                        reporter_.report(ErrorCode::UnclosedSection, open.offset,
                                         "section '" + open.section.name + "' is never closed",
                                         open.section.name);
                        Frame orphan = std::move(stack.back());
                        stack.pop_back();
                        current().push_back(Node{std::move(orphan.section), orphan.offset});
                    }
                }

                Frame done = std::move(stack.back());
                stack.pop_back();
                done.section.close_tag = std::move(token.raw);
                current().push_back(Node{std::move(done.section), done.offset});
                break;
            }

            case TokenKind::Unterminated:
                reporter_.report(ErrorCode::UnbalancedBrace, token.offset, "'{{' has no closing '}}'");
                current().push_back(Node{LiteralNode{token.raw, token.raw}, token.offset});
                break;
        }
    }

    while (!stack.empty()) {
        Frame open = std::move(stack.back());
        stack.pop_back();
        reporter_.report(ErrorCode::UnclosedSection, open.offset,
                         "section '" + open.section.name + "' is never closed", open.section.name);
        current().push_back(Node{std::move(open.section), open.offset});
    }

    return root;
}

bool MustacheParser::check_name(const ScanToken& token) {
    if (token.name.empty()) {
        reporter_.report(ErrorCode::EmptyPlaceholder, token.offset, "tag has no variable name");
        return false;
    }
    if (!is_mustache_name(token.name)) {
        reporter_.report(ErrorCode::InvalidPlaceholder, token.offset,
                         "'" + token.name + "' is not a valid tag name", token.name);
        return false;
    }
    return true;
}

} // namespace engine
} // namespace stencil
