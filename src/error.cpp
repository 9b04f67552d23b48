#include "stencil/error.hpp"
#include <algorithm>

namespace stencil {

SourceLocation locate(std::string_view source, std::size_t offset) {
    offset = std::min(offset, source.size());

    SourceLocation loc;
    loc.offset = offset;
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < offset; ++i) {
        if (source[i] == '\n') {
            ++loc.line;
            line_start = i + 1;
        }
    }
    loc.column = offset - line_start + 1;
    return loc;
}

std::string Error::to_string() const {
    std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + kind();
    if (is_parse_error(code) || code == ErrorCode::MissingVariable ||
        code == ErrorCode::TypeCoercion || code == ErrorCode::FormatSpec) {
        result += " at " + std::to_string(location.line) + ":" + std::to_string(location.column);
    }
    result += ": " + message;
    if (context.has_value()) {
        result += " | Context: " + *context;
    }
    return result;
}

ErrorReporter::ErrorReporter(std::string_view source)
    : source_(source)
{
    line_starts_.push_back(0);
    for (std::size_t i = 0; i < source_.size(); ++i) {
        if (source_[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }
}

SourceLocation ErrorReporter::locate(std::size_t offset) const {
    offset = std::min(offset, source_.size());

    // Last line start not greater than offset
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    auto line_index = static_cast<std::size_t>(std::distance(line_starts_.begin(), it)) - 1;

    SourceLocation loc;
    loc.offset = offset;
    loc.line = line_index + 1;
    loc.column = offset - line_starts_[line_index] + 1;
    return loc;
}

Error& ErrorReporter::report(ErrorCode code, std::size_t offset, std::string message, std::string name) {
    errors_.emplace_back(code, std::move(message), locate(offset), std::move(name));
    return errors_.back();
}

ErrorSet ErrorReporter::take() {
    // Same-kind duplicates from both parsers must end up adjacent for unique()
    std::stable_sort(errors_.begin(), errors_.end(), [](const Error& a, const Error& b) {
        if (a.location.offset != b.location.offset) {
            return a.location.offset < b.location.offset;
        }
        return static_cast<int>(a.code) < static_cast<int>(b.code);
    });

    auto last = std::unique(errors_.begin(), errors_.end(), [](const Error& a, const Error& b) {
        return a.code == b.code && a.location.offset == b.location.offset;
    });
    errors_.erase(last, errors_.end());

    ErrorSet out = std::move(errors_);
    errors_.clear();
    return out;
}

} // namespace stencil
