#include "stencil/template.hpp"
#include "stencil/engine/fmt_parser.hpp"
#include "stencil/engine/mustache_parser.hpp"
#include "stencil/engine/style_detector.hpp"
#include "stencil/log.hpp"

#include <algorithm>
#include <utility>

namespace stencil {

namespace {

// Pre-order walk with an explicit stack so deep section nesting is safe
void collect_variables(const NodeList& nodes, std::vector<std::string>& out) {
    auto add = [&out](const std::string& name) {
        if (std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    };

    std::vector<std::pair<const NodeList*, std::size_t>> stack{{&nodes, 0}};
    while (!stack.empty()) {
        auto& [list, next] = stack.back();
        if (next == list->size()) {
            stack.pop_back();
            continue;
        }

        const auto& node = (*list)[next++];
        if (auto* placeholder = node.get_if<PlaceholderNode>()) {
            add(placeholder->name);
        } else if (auto* variable = node.get_if<VariableNode>()) {
            if (variable->name != ".") add(variable->name);
        } else if (auto* section = node.get_if<SectionNode>()) {
            add(section->name);
            stack.emplace_back(&section->body, 0);
        }
    }
}

} // namespace

std::vector<std::string> Template::variables() const {
    std::vector<std::string> names;
    collect_variables(nodes_, names);
    return names;
}

std::string Template::to_source() const {
    std::string out;
    out.reserve(source_.size());
    append_source(nodes_, out);
    return out;
}

ParseResult parse(std::string_view source) {
    return parse(source, engine::default_tag_scanner());
}

ParseResult parse(std::string_view source, const engine::ITagScanner& scanner) {
    ErrorReporter reporter(source);
    auto scan = engine::scan_styles(source);

    Style style = Style::Literal;
    NodeList nodes;

    if (scan.mixed()) {
        // Report what each parser finds too, so one pass shows every problem
        engine::FmtStringParser(reporter).parse(source);
        engine::MustacheParser(scanner, reporter).parse(source);

        auto mustache_at = reporter.locate(*scan.first_mustache);
        auto& err = reporter.report(ErrorCode::MixedFormat, *scan.first_fmt,
                                    "template mixes FmtString braces with Mustache tags (first Mustache tag at line " +
                                        std::to_string(mustache_at.line) + ":" +
                                        std::to_string(mustache_at.column) + ")");
        err.related = mustache_at;
    } else if (scan.first_mustache) {
        style = Style::Mustache;
        nodes = engine::MustacheParser(scanner, reporter).parse(source);
    } else if (scan.first_fmt) {
        style = Style::FmtString;
        nodes = engine::FmtStringParser(reporter).parse(source);
    } else if (!source.empty()) {
        nodes.push_back(Node{LiteralNode{std::string(source), std::string(source)}, 0});
    }

    if (!reporter.empty()) {
        auto errors = reporter.take();
        log::logger()->debug("Template parse failed with {} error(s); first: {}", errors.size(),
                             errors.front().to_string());
        return tl::unexpected(std::move(errors));
    }

    return Template(std::string(source), style, std::move(nodes));
}

} // namespace stencil
