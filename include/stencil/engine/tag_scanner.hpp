#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace stencil {
namespace engine {

/**
 * @brief Kind of one scanned Mustache token
 */
enum class TokenKind {
    Text,          ///< Literal run between tags
    Variable,      ///< {{name}}
    RawVariable,   ///< {{{name}}} or {{&name}}
    SectionOpen,   ///< {{#name}}
    InvertedOpen,  ///< {{^name}}
    SectionClose,  ///< {{/name}}
    Unterminated   ///< "{{" with no closing delimiter; runs to end of input
};

/**
 * @brief One text run or tag produced by a scanner
 *
 * `name` is the tag content with the sigil removed and surrounding whitespace
 * trimmed; it is not validated. `raw` is the exact source slice, so the raw
 * fields of a token stream concatenate back to the scanned source.
 */
struct ScanToken {
    TokenKind kind = TokenKind::Text;
    std::string name;
    std::string raw;
    std::size_t offset = 0;

    bool operator==(const ScanToken& other) const {
        return kind == other.kind && name == other.name && raw == other.raw && offset == other.offset;
    }
};

/**
 * @brief Abstract Mustache tag scanning capability
 *
 * The Mustache parser builds nodes and typed errors from the token stream;
 * any scanner honoring this contract can be substituted:
 * - Tokens are in source order and tile the source without gaps
 * - Scanning never fails; malformed input becomes Unterminated tokens or
 *   names the parser rejects
 *
 * Implementations must be safe to call concurrently from multiple threads.
 */
class ITagScanner {
public:
    virtual ~ITagScanner() = default;

    /**
     * @brief Split source into text runs and tags
     *
     * @param source Raw template source
     * @return Ordered token stream covering the whole source
     */
    virtual std::vector<ScanToken> scan(std::string_view source) const = 0;
};

/**
 * @brief Lexical scanner for the standard "{{ }}" delimiters
 *
 * Recognizes variables, triple-brace and '&' raw variables, sections and
 * inverted sections. Set-delimiter, comment and partial tags are not part of
 * the supported syntax; their content surfaces as a name the parser rejects.
 *
 * Tokenizes malformed and arbitrarily deep sources in one iterative pass, so
 * BustacheTagScanner hands it whatever bustache cannot tokenize.
 */
class BasicTagScanner : public ITagScanner {
public:
    std::vector<ScanToken> scan(std::string_view source) const override;
};

/**
 * @brief Factory function for the default scanner
 *
 * @return std::unique_ptr<ITagScanner> A BustacheTagScanner
 */
std::unique_ptr<ITagScanner> create_tag_scanner();

/**
 * @brief Process-wide default scanner used by parse()
 */
const ITagScanner& default_tag_scanner();

} // namespace engine
} // namespace stencil
