#include "stencil/engine/tag_scanner.hpp"
#include "stencil/engine/bustache_scanner.hpp"
#include "stencil/engine/syntax.hpp"

namespace stencil {
namespace engine {

std::vector<ScanToken> BasicTagScanner::scan(std::string_view source) const {
    std::vector<ScanToken> tokens;

    std::size_t pos = 0;
    while (pos < source.size()) {
        auto open = source.find("{{", pos);
        if (open == std::string_view::npos) {
            break;
        }
        if (open > pos) {
            tokens.push_back(ScanToken{TokenKind::Text, {}, std::string(source.substr(pos, open - pos)), pos});
        }

        ScanToken tag;
        tag.offset = open;

        bool triple = open + 2 < source.size() && source[open + 2] == '{';
        std::string_view closer = triple ? "}}}" : "}}";
        auto content_start = open + (triple ? 3 : 2);
        auto close = source.find(closer, content_start);

        if (close == std::string_view::npos) {
            tag.kind = TokenKind::Unterminated;
            tag.raw = std::string(source.substr(open));
            tokens.push_back(std::move(tag));
            return tokens;
        }

        auto inner = trim(source.substr(content_start, close - content_start));
        if (triple) {
            tag.kind = TokenKind::RawVariable;
        } else {
            tag.kind = TokenKind::Variable;
            if (!inner.empty()) {
                switch (sigil_from_char(inner.front())) {
                    case TagSigil::Section: tag.kind = TokenKind::SectionOpen; break;
                    case TagSigil::Inverted: tag.kind = TokenKind::InvertedOpen; break;
                    case TagSigil::Close: tag.kind = TokenKind::SectionClose; break;
                    case TagSigil::Raw: tag.kind = TokenKind::RawVariable; break;
                    case TagSigil::None: break;
                }
                if (tag.kind != TokenKind::Variable) {
                    inner = trim(inner.substr(1));
                }
            }
        }

        pos = close + closer.size();
        tag.name = std::string(inner);
        tag.raw = std::string(source.substr(open, pos - open));
        tokens.push_back(std::move(tag));
    }

    if (pos < source.size()) {
        tokens.push_back(ScanToken{TokenKind::Text, {}, std::string(source.substr(pos)), pos});
    }
    return tokens;
}

std::unique_ptr<ITagScanner> create_tag_scanner() {
    return std::make_unique<BustacheTagScanner>();
}

const ITagScanner& default_tag_scanner() {
    static const BustacheTagScanner scanner;
    return scanner;
}

} // namespace engine
} // namespace stencil
