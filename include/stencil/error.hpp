#pragma once

#include <tl/expected.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * Error codes are grouped into ranges by the stage that produces them:
 * - 100-199: Parse errors (template source is malformed)
 * - 200-299: Render errors (context does not fit the template)
 * - 300-399: Configuration errors
 */
enum class ErrorCode {
    // Parse errors (100-199)
    UnbalancedBrace = 100,
    EmptyPlaceholder = 101,
    InvalidPlaceholder = 102,
    MixedFormat = 103,
    UnclosedSection = 104,
    SectionMismatch = 105,

    // Render errors (200-299)
    MissingVariable = 200,
    TypeCoercion = 201,
    FormatSpec = 202,
    InvalidContext = 203,

    // Configuration errors (300-399)
    InvalidConfig = 300,
    InvalidRole = 301,
    InvalidTemplate = 302,

    // Unknown
    Unknown = 999
};

/**
 * @brief Stable machine-readable name for an error code
 *
 * These strings are part of the public contract: tooling may match on them.
 */
[[nodiscard]] inline const char* error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnbalancedBrace: return "unbalanced_brace";
        case ErrorCode::EmptyPlaceholder: return "empty_placeholder";
        case ErrorCode::InvalidPlaceholder: return "invalid_placeholder";
        case ErrorCode::MixedFormat: return "mixed_format";
        case ErrorCode::UnclosedSection: return "unclosed_section";
        case ErrorCode::SectionMismatch: return "section_mismatch";
        case ErrorCode::MissingVariable: return "missing_variable";
        case ErrorCode::TypeCoercion: return "type_coercion";
        case ErrorCode::FormatSpec: return "format_spec";
        case ErrorCode::InvalidContext: return "invalid_context";
        case ErrorCode::InvalidConfig: return "invalid_config";
        case ErrorCode::InvalidRole: return "invalid_role";
        case ErrorCode::InvalidTemplate: return "invalid_template";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

/** @brief True for codes produced while parsing template source. */
inline bool is_parse_error(ErrorCode code) {
    auto value = static_cast<int>(code);
    return value >= 100 && value < 200;
}

// ============================================================================
// Source Positions
// ============================================================================

/**
 * @brief Position of a byte in template source
 *
 * `line` and `column` are 1-based; `column` counts bytes from the start of
 * the line.
 */
struct SourceLocation {
    std::size_t offset = 0;  ///< Byte offset into the raw source
    std::size_t line = 1;    ///< 1-based line number
    std::size_t column = 1;  ///< 1-based byte column

    bool operator==(const SourceLocation& other) const {
        return offset == other.offset && line == other.line && column == other.column;
    }

    bool operator!=(const SourceLocation& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Compute line and column for an offset in source
 *
 * Offsets past the end are clamped to the end of input.
 */
SourceLocation locate(std::string_view source, std::size_t offset);

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error information with code, position, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                          ///< Categorized error code
    std::string message;                     ///< Human-readable error description
    SourceLocation location;                 ///< Offending position in the template source
    std::string name;                        ///< Subject of the error (variable, section or format spec)
    std::optional<std::string> found;        ///< Closing name for section mismatches
    std::optional<SourceLocation> related;   ///< Second position (first Mustache tag for mixed formats)
    std::optional<std::string> context;      ///< Additional context (e.g., file paths, message index)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    Error(ErrorCode code, std::string message, SourceLocation location, std::string name = {})
        : code(code), message(std::move(message)), location(location), name(std::move(name)) {}

    const char* kind() const { return error_kind(code); }

    std::size_t offset() const { return location.offset; }

    std::string to_string() const;

    bool operator==(const Error& other) const {
        return code == other.code &&
               message == other.message &&
               location == other.location &&
               name == other.name &&
               found == other.found &&
               related == other.related &&
               context == other.context;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

/// Every problem found in one parse, ordered by offset.
using ErrorSet = std::vector<Error>;

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// ErrorReporter
// ============================================================================

/**
 * @brief Accumulates positioned errors against one source string
 *
 * Parsers report every local failure here and keep scanning, so a single
 * parse surfaces all detectable problems. Line starts are indexed once at
 * construction.
 *
 * @threadsafety Not thread-safe. One reporter per parse.
 */
class ErrorReporter {
public:
    explicit ErrorReporter(std::string_view source);

    /**
     * @brief Record an error at a byte offset
     *
     * @return Reference to the stored error, valid until the next report()
     */
    Error& report(ErrorCode code, std::size_t offset, std::string message, std::string name = {});

    /** @brief Resolve an offset to line and column. */
    SourceLocation locate(std::size_t offset) const;

    bool empty() const { return errors_.empty(); }
    std::size_t size() const { return errors_.size(); }
    const ErrorSet& errors() const { return errors_; }

    /**
     * @brief Move the accumulated errors out, sorted by offset
     *
     * Errors of the same kind at the same offset are reported once.
     */
    ErrorSet take();

private:
    std::string_view source_;
    std::vector<std::size_t> line_starts_;
    ErrorSet errors_;
};

} // namespace stencil
