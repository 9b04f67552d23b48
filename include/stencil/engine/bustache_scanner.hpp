#pragma once

#include "tag_scanner.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace stencil {
namespace engine {

/**
 * @brief Tag scanner backed by the bustache Mustache library
 *
 * bustache parses the source; its syntax tree supplies the kind of every tag,
 * section structure and the position of every text run. Tag extents are
 * recovered from the gaps between text runs and checked against the tree.
 *
 * Some sources are tokenized by the BasicTagScanner instead, so the parser
 * can still report every problem with its position:
 * - Sources bustache rejects (it stops at the first error)
 * - Constructs outside the supported syntax: comments, partials, delimiter
 *   changes and bustache's extension blocks
 * - Sections nested deeper than kMaxLibraryDepth, since bustache parses by
 *   recursive descent
 *
 * Stateless; safe to call concurrently.
 */
class BustacheTagScanner : public ITagScanner {
public:
    /// Section nesting above which bustache is not asked to parse
    static constexpr std::size_t kMaxLibraryDepth = 256;

    std::vector<ScanToken> scan(std::string_view source) const override;

private:
    BasicTagScanner fallback_;
};

/**
 * @brief Upper bound on the section nesting of a Mustache source
 *
 * Counts opening and closing section tags in order. A source that changes
 * delimiters yields the maximum size_t, since tags after the change cannot
 * be counted.
 */
std::size_t estimate_section_depth(std::string_view source);

} // namespace engine
} // namespace stencil
