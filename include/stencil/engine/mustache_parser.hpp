#pragma once

#include "../error.hpp"
#include "../node.hpp"
#include "tag_scanner.hpp"
#include <string_view>

namespace stencil {
namespace engine {

/**
 * @brief Builds a Mustache node tree from a scanner's token stream
 *
 * Tokenizing is delegated to an ITagScanner; this class owns section
 * nesting and name validation. All problems are reported to the
 * ErrorReporter and parsing continues, so unbalanced sections and bad names
 * anywhere in the source surface together.
 *
 * Open sections are tracked on an explicit stack, so nesting depth is bounded
 * only by memory.
 */
class MustacheParser {
public:
    MustacheParser(const ITagScanner& scanner, ErrorReporter& reporter)
        : scanner_(scanner)
        , reporter_(reporter)
    {}

    /**
     * @brief Parse source into nodes
     *
     * The returned list is only meaningful when no errors were reported.
     */
    NodeList parse(std::string_view source);

private:
    const ITagScanner& scanner_;
    ErrorReporter& reporter_;

    // False (after reporting) when the tag's name is empty or malformed
    bool check_name(const ScanToken& token);
};

} // namespace engine
} // namespace stencil
