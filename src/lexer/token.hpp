#pragma once

#include "common/source_location.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace aliasorder {

/// Token kinds for the C# subset needed to locate using directives and
/// namespace declarations. Operators that never matter for that purpose
/// collapse into `Other`.
enum class TokenKind : uint16_t {
    // Special tokens
    Invalid,
    Eof,

    // Literals
    Identifier,
    NumberLiteral,
    CharLiteral,
    StringLiteral,

    // Punctuation
    Dot,        // .
    ColonColon, // ::
    Colon,      // :
    Semicolon,  // ;
    Assign,     // =
    Comma,      // ,
    Less,       // <
    Greater,    // >
    Question,   // ?
    Star,       // *
    LParen,     // (
    RParen,     // )
    LBracket,   // [
    RBracket,   // ]
    LBrace,     // {
    RBrace,     // }
    Other,      // any other operator

    // Keywords relevant to directive structure
    KW_extern,
    KW_global,
    KW_namespace,
    KW_static,
    KW_using,
};

/// Returns the string representation of a token kind.
[[nodiscard]] std::string_view token_kind_to_string(TokenKind kind);

/// Look up a keyword from a string. Returns TokenKind::Identifier if not a keyword.
[[nodiscard]] TokenKind lookup_keyword(std::string_view word);

/// A single token from the lexer.
struct Token {
    TokenKind kind = TokenKind::Invalid;
    std::string_view text;
    SourceLocation location;

    [[nodiscard]] bool is(TokenKind k) const { return kind == k; }

    /// Byte range of the token text in the source buffer.
    [[nodiscard]] SourceSpan span() const {
        return SourceSpan{location.offset, location.offset + static_cast<uint32_t>(text.size())};
    }
};

} // namespace aliasorder
