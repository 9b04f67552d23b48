#include "stencil/engine/style_detector.hpp"
#include "stencil/engine/syntax.hpp"

namespace stencil {
namespace engine {

StyleScan scan_styles(std::string_view source) {
    StyleScan scan;

    std::size_t pos = 0;
    while (pos < source.size()) {
        char c = source[pos];
        if (c != '{' && c != '}') {
            ++pos;
            continue;
        }

        if (c == '{') {
            if (auto tag = match_mustache_tag(source, pos)) {
                if (!scan.first_mustache) scan.first_mustache = pos;
                pos += tag->length;
                continue;
            }
        }

        if (!scan.first_fmt) scan.first_fmt = pos;
        // Escape pairs are consumed whole so "{{{x}" reads as "{{" + "{x}"
        bool doubled = pos + 1 < source.size() && source[pos + 1] == c;
        pos += doubled ? 2 : 1;
    }

    return scan;
}

Expected<Style> detect_style(std::string_view source) {
    auto scan = scan_styles(source);

    if (scan.mixed()) {
        auto fmt_at = locate(source, *scan.first_fmt);
        auto mustache_at = locate(source, *scan.first_mustache);
        Error err{
            ErrorCode::MixedFormat,
            "template mixes FmtString braces (line " + std::to_string(fmt_at.line) + ":" +
                std::to_string(fmt_at.column) + ") with Mustache tags (line " +
                std::to_string(mustache_at.line) + ":" + std::to_string(mustache_at.column) + ")",
            fmt_at
        };
        err.related = mustache_at;
        return tl::unexpected(std::move(err));
    }
    if (scan.first_mustache) return Style::Mustache;
    if (scan.first_fmt) return Style::FmtString;
    return Style::Literal;
}

} // namespace engine
} // namespace stencil
