#pragma once

#include "common/diagnostic.hpp"
#include "common/source_location.hpp"
#include "lexer/token.hpp"

#include <string_view>
#include <vector>

namespace aliasorder {

/// Lexer for C# source code.
/// Produces enough of the token stream to recover using directives and
/// namespace nesting: comments and preprocessor lines are dropped, and
/// every literal form is consumed whole so that braces inside strings
/// never reach the parser.
class Lexer {
public:
    Lexer(std::string_view source, std::string_view filename, DiagnosticEngine& diag);

    /// Get the next token from the source.
    [[nodiscard]] Token next();

    /// Tokenize the entire source and return all tokens, ending with Eof.
    [[nodiscard]] std::vector<Token> tokenize_all();

    /// Check if we've reached the end of the source.
    [[nodiscard]] bool at_end() const;

    [[nodiscard]] std::string_view source() const { return source_; }

private:
    std::string_view source_;
    std::string_view filename_;
    DiagnosticEngine& diag_;
    uint32_t offset_ = 0;
    uint32_t line_   = 1;
    uint32_t column_ = 1;

    // True until the first token of the current line; '#' only starts a
    // preprocessor directive at the beginning of a line.
    bool at_line_start_ = true;

    [[nodiscard]] char peek() const;
    [[nodiscard]] char peek_next() const;
    [[nodiscard]] char peek_at(uint32_t ahead) const;
    char advance();
    bool match_char(char expected);
    void skip_trivia();
    [[nodiscard]] SourceLocation current_location() const;

    Token scan_token();
    Token make_token(TokenKind kind, uint32_t start_offset, SourceLocation loc) const;
    Token scan_identifier(uint32_t start_offset, SourceLocation loc);
    Token scan_number(SourceLocation loc);
    Token scan_char(SourceLocation loc);
    Token scan_string_literal(uint32_t start_offset, SourceLocation loc, bool verbatim,
                              bool interpolated);
    void scan_quoted_body(SourceLocation loc, bool verbatim, bool interpolated);
    void scan_raw_body(SourceLocation loc, uint32_t quote_count);
    void scan_interpolation_hole(SourceLocation loc, bool verbatim);
    void scan_format_clause(bool verbatim);
    void skip_line_comment();
    void skip_block_comment();
    void skip_preprocessor_line();

    [[nodiscard]] static bool is_ident_start(char c);
    [[nodiscard]] static bool is_ident_part(char c);
    [[nodiscard]] static bool is_digit(char c);
};

} // namespace aliasorder
