#pragma once

#include "../types.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace stencil {
namespace engine {

/**
 * @brief Where each placeholder family first appears in a source string
 */
struct StyleScan {
    std::optional<std::size_t> first_fmt;       ///< First FmtString-family brace
    std::optional<std::size_t> first_mustache;  ///< First well-formed Mustache tag

    bool mixed() const { return first_fmt.has_value() && first_mustache.has_value(); }

    bool operator==(const StyleScan& other) const {
        return first_fmt == other.first_fmt && first_mustache == other.first_mustache;
    }
};

/**
 * @brief Single left-to-right scan classifying every brace
 *
 * A well-formed Mustache tag (see match_mustache_tag) counts as one Mustache
 * occurrence and is skipped whole. Every other '{' or '}' is FmtString family:
 * single-brace placeholders, escape pairs that are not Mustache tags, and
 * stray braces alike.
 */
StyleScan scan_styles(std::string_view source);

/**
 * @brief Classify a template source
 *
 * @return The style, or ErrorCode::MixedFormat when both families occur. The
 *         error's location is the first FmtString occurrence and `related`
 *         the first Mustache occurrence.
 */
Expected<Style> detect_style(std::string_view source);

} // namespace engine

using engine::detect_style;

} // namespace stencil
