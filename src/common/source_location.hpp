#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace aliasorder {

/// Represents a position in source code (1-based line and column).
struct SourcePosition {
    uint32_t line   = 1;
    uint32_t column = 1;

    [[nodiscard]] bool operator==(const SourcePosition&) const = default;
    [[nodiscard]] auto operator<=>(const SourcePosition&) const = default;
};

/// Represents a location in a source file (file + position).
struct SourceLocation {
    std::string_view filename;
    SourcePosition position;
    uint32_t offset = 0; // byte offset from start of source

    [[nodiscard]] std::string to_string() const {
        return std::string(filename) + ":" + std::to_string(position.line) + ":" +
               std::to_string(position.column);
    }
};

/// A half-open byte range [begin, end) in a source buffer.
struct SourceSpan {
    uint32_t begin = 0;
    uint32_t end   = 0;

    [[nodiscard]] uint32_t length() const { return end - begin; }

    /// The text covered by this span. The span must lie inside `source`.
    [[nodiscard]] std::string_view text(std::string_view source) const {
        return source.substr(begin, length());
    }

    /// Smallest span covering both `a` and `b`.
    [[nodiscard]] static SourceSpan cover(const SourceSpan& a, const SourceSpan& b) {
        return SourceSpan{a.begin < b.begin ? a.begin : b.begin, a.end > b.end ? a.end : b.end};
    }
};

} // namespace aliasorder
