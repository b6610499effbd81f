#include "lexer/lexer.hpp"

namespace aliasorder {

// ============================================================================
// Token utility functions
// ============================================================================

std::string_view token_kind_to_string(TokenKind kind) {
    switch (kind) {
    case TokenKind::Invalid:       return "Invalid";
    case TokenKind::Eof:           return "EOF";
    case TokenKind::Identifier:    return "Identifier";
    case TokenKind::NumberLiteral: return "NumberLiteral";
    case TokenKind::CharLiteral:   return "CharLiteral";
    case TokenKind::StringLiteral: return "StringLiteral";
    case TokenKind::Dot:           return ".";
    case TokenKind::ColonColon:    return "::";
    case TokenKind::Colon:         return ":";
    case TokenKind::Semicolon:     return ";";
    case TokenKind::Assign:        return "=";
    case TokenKind::Comma:         return ",";
    case TokenKind::Less:          return "<";
    case TokenKind::Greater:       return ">";
    case TokenKind::Question:      return "?";
    case TokenKind::Star:          return "*";
    case TokenKind::LParen:        return "(";
    case TokenKind::RParen:        return ")";
    case TokenKind::LBracket:      return "[";
    case TokenKind::RBracket:      return "]";
    case TokenKind::LBrace:        return "{";
    case TokenKind::RBrace:        return "}";
    case TokenKind::Other:         return "Other";
    case TokenKind::KW_extern:     return "extern";
    case TokenKind::KW_global:     return "global";
    case TokenKind::KW_namespace:  return "namespace";
    case TokenKind::KW_static:     return "static";
    case TokenKind::KW_using:      return "using";
    }
    return "Unknown";
}

TokenKind lookup_keyword(std::string_view word) {
    if (word == "using")     return TokenKind::KW_using;
    if (word == "namespace") return TokenKind::KW_namespace;
    if (word == "static")    return TokenKind::KW_static;
    if (word == "global")    return TokenKind::KW_global;
    if (word == "extern")    return TokenKind::KW_extern;
    return TokenKind::Identifier;
}

// ============================================================================
// Character classification helpers
// ============================================================================

// Bytes >= 0x80 belong to UTF-8 encoded identifier characters. C# allows a
// wide range of Unicode letters there and nothing else we lex starts with one.
bool Lexer::is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool Lexer::is_ident_part(char c) {
    return is_ident_start(c) || is_digit(c);
}

bool Lexer::is_digit(char c) {
    return c >= '0' && c <= '9';
}

// ============================================================================
// Lexer core
// ============================================================================

Lexer::Lexer(std::string_view source, std::string_view filename, DiagnosticEngine& diag)
    : source_(source), filename_(filename), diag_(diag) {
    // UTF-8 byte order mark
    if (source_.size() >= 3 && source_.substr(0, 3) == "\xEF\xBB\xBF") {
        offset_ = 3;
    }
}

bool Lexer::at_end() const {
    return offset_ >= source_.size();
}

char Lexer::peek() const {
    if (at_end()) return '\0';
    return source_[offset_];
}

char Lexer::peek_next() const {
    return peek_at(1);
}

char Lexer::peek_at(uint32_t ahead) const {
    if (offset_ + ahead >= source_.size()) return '\0';
    return source_[offset_ + ahead];
}

char Lexer::advance() {
    char c = source_[offset_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
        at_line_start_ = true;
    } else {
        ++column_;
    }
    return c;
}

bool Lexer::match_char(char expected) {
    if (at_end() || source_[offset_] != expected) return false;
    advance();
    return true;
}

SourceLocation Lexer::current_location() const {
    return SourceLocation{filename_, {line_, column_}, offset_};
}

Token Lexer::make_token(TokenKind kind, uint32_t start_offset, SourceLocation loc) const {
    return Token{kind, source_.substr(start_offset, offset_ - start_offset), loc};
}

// ============================================================================
// Whitespace, comments and preprocessor lines
// ============================================================================

void Lexer::skip_trivia() {
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
            advance();
        } else if (c == '/' && peek_next() == '/') {
            advance(); // /
            advance(); // /
            skip_line_comment();
        } else if (c == '/' && peek_next() == '*') {
            advance(); // /
            advance(); // *
            skip_block_comment();
        } else if (c == '#' && at_line_start_) {
            skip_preprocessor_line();
        } else {
            break;
        }
    }
}

void Lexer::skip_line_comment() {
    // "//" already consumed; the newline is left for skip_trivia.
    while (!at_end() && peek() != '\n') {
        advance();
    }
}

void Lexer::skip_block_comment() {
    auto loc = current_location();
    while (!at_end()) {
        if (peek() == '*' && peek_next() == '/') {
            advance(); // *
            advance(); // /
            return;
        }
        advance();
    }
    diag_.error(loc, "unterminated block comment");
}

// #if/#region/#pragma and friends. Conditional sections are not evaluated:
// every branch is lexed as live code.
void Lexer::skip_preprocessor_line() {
    while (!at_end() && peek() != '\n') {
        advance();
    }
}

// ============================================================================
// Identifiers and numbers
// ============================================================================

Token Lexer::scan_identifier(uint32_t start, SourceLocation loc) {
    while (!at_end() && is_ident_part(peek())) {
        advance();
    }
    auto text = source_.substr(start, offset_ - start);
    // A verbatim identifier (@using) is never a keyword.
    TokenKind kind = text.front() == '@' ? TokenKind::Identifier : lookup_keyword(text);
    return Token{kind, text, loc};
}

// Numeric literals only need to be consumed whole: digits, hex/binary
// prefixes, separators, suffixes and a fractional part.
Token Lexer::scan_number(SourceLocation loc) {
    uint32_t start = offset_ - 1;
    while (!at_end()) {
        if (is_ident_part(peek())) {
            advance();
        } else if (peek() == '.' && is_digit(peek_next())) {
            advance();
        } else {
            break;
        }
    }
    return make_token(TokenKind::NumberLiteral, start, loc);
}

// ============================================================================
// Character and string literals
// ============================================================================

Token Lexer::scan_char(SourceLocation loc) {
    uint32_t start = offset_ - 1; // opening ' already consumed

    while (!at_end()) {
        char c = peek();
        if (c == '\'') {
            advance();
            return make_token(TokenKind::CharLiteral, start, loc);
        }
        if (c == '\n') {
            diag_.error(current_location(), "newline in character literal");
            return make_token(TokenKind::CharLiteral, start, loc);
        }
        advance();
        if (c == '\\' && !at_end()) {
            advance();
        }
    }

    diag_.error(loc, "unterminated character literal");
    return make_token(TokenKind::CharLiteral, start, loc);
}

// Called with any @ / $ prefixes consumed and peek() at the first quote.
Token Lexer::scan_string_literal(uint32_t start, SourceLocation loc, bool verbatim,
                                 bool interpolated) {
    uint32_t quotes = 0;
    while (peek_at(quotes) == '"') {
        ++quotes;
    }

    if (!verbatim && quotes >= 3) {
        for (uint32_t i = 0; i < quotes; ++i) {
            advance();
        }
        scan_raw_body(loc, quotes);
    } else {
        advance(); // opening "
        scan_quoted_body(loc, verbatim, interpolated);
    }
    return make_token(TokenKind::StringLiteral, start, loc);
}

void Lexer::scan_quoted_body(SourceLocation loc, bool verbatim, bool interpolated) {
    while (!at_end()) {
        char c = peek();
        if (c == '"') {
            advance();
            if (verbatim && peek() == '"') {
                advance(); // "" escape
                continue;
            }
            return;
        }
        if (!verbatim && c == '\n') {
            diag_.error(current_location(), "newline in string literal");
            return;
        }
        if (!verbatim && c == '\\') {
            advance();
            if (!at_end()) {
                advance();
            }
            continue;
        }
        if (interpolated && c == '{') {
            advance();
            if (peek() == '{') {
                advance(); // {{ escape
                continue;
            }
            scan_interpolation_hole(loc, verbatim);
            continue;
        }
        advance();
    }

    diag_.error(loc, "unterminated string literal");
}

// Raw string literals end at the first run of exactly as many quotes as
// opened them.
void Lexer::scan_raw_body(SourceLocation loc, uint32_t quote_count) {
    while (!at_end()) {
        if (peek() != '"') {
            advance();
            continue;
        }
        uint32_t run = 0;
        while (peek() == '"') {
            advance();
            ++run;
        }
        if (run >= quote_count) {
            return;
        }
    }

    diag_.error(loc, "unterminated raw string literal");
}

// An interpolation hole is ordinary expression code up to the matching '}'.
// Nested literals are scanned as tokens so that their braces do not count.
// A ':' outside any bracket starts the format clause, which is plain text.
void Lexer::scan_interpolation_hole(SourceLocation loc, bool verbatim) {
    int depth = 1;
    int nesting = 0;
    while (true) {
        skip_trivia();
        if (at_end()) {
            return; // the enclosing string reports the missing quote
        }
        Token tok = scan_token();
        switch (tok.kind) {
        case TokenKind::LBrace:
            ++depth;
            break;
        case TokenKind::RBrace:
            if (--depth == 0) {
                return;
            }
            break;
        case TokenKind::LParen:
        case TokenKind::LBracket:
            ++nesting;
            break;
        case TokenKind::RParen:
        case TokenKind::RBracket:
            if (nesting > 0) {
                --nesting;
            }
            break;
        case TokenKind::Colon:
            if (depth == 1 && nesting == 0) {
                scan_format_clause(verbatim);
                return;
            }
            break;
        case TokenKind::Invalid:
            diag_.note(loc, "in interpolated string starting here");
            break;
        default:
            break;
        }
    }
}

// {value:hh\\:mm} - everything after the ':' up to '}' belongs to the format.
// Stops without consuming a quote or a line break so that the enclosing
// string body ends the literal as usual.
void Lexer::scan_format_clause(bool verbatim) {
    while (!at_end()) {
        char c = peek();
        if (c == '}') {
            advance();
            return;
        }
        if (c == '"' || (!verbatim && c == '\n')) {
            return;
        }
        advance();
        if (!verbatim && c == '\\' && !at_end() && peek() != '\n') {
            advance();
        }
    }
}

// ============================================================================
// Main token dispatch
// ============================================================================

Token Lexer::next() {
    skip_trivia();

    if (at_end()) {
        return Token{TokenKind::Eof, "", current_location()};
    }

    Token tok = scan_token();
    at_line_start_ = false;
    return tok;
}

Token Lexer::scan_token() {
    auto loc = current_location();
    uint32_t start = offset_;
    at_line_start_ = false;

    if (peek() == '"') {
        return scan_string_literal(start, loc, false, false);
    }

    char c = advance();

    if (is_ident_start(c)) {
        return scan_identifier(start, loc);
    }

    if (is_digit(c) || (c == '.' && is_digit(peek()))) {
        return scan_number(loc);
    }

    switch (c) {
    case '\'':
        return scan_char(loc);

    case '@':
        if (peek() == '"') {
            return scan_string_literal(start, loc, true, false);
        }
        if (peek() == '$' && peek_next() == '"') {
            advance(); // $
            return scan_string_literal(start, loc, true, true);
        }
        if (is_ident_start(peek())) {
            return scan_identifier(start, loc);
        }
        break;

    case '$': {
        while (peek() == '$') {
            advance(); // $$""" raw interpolation
        }
        if (peek() == '@' && peek_next() == '"') {
            advance(); // @
            return scan_string_literal(start, loc, true, true);
        }
        if (peek() == '"') {
            return scan_string_literal(start, loc, false, true);
        }
        break;
    }

    case '.':  return Token{TokenKind::Dot,       ".", loc};
    case ';':  return Token{TokenKind::Semicolon, ";", loc};
    case ',':  return Token{TokenKind::Comma,     ",", loc};
    case '<':  return Token{TokenKind::Less,      "<", loc};
    case '>':  return Token{TokenKind::Greater,   ">", loc};
    case '?':  return Token{TokenKind::Question,  "?", loc};
    case '*':  return Token{TokenKind::Star,      "*", loc};
    case '(':  return Token{TokenKind::LParen,    "(", loc};
    case ')':  return Token{TokenKind::RParen,    ")", loc};
    case '[':  return Token{TokenKind::LBracket,  "[", loc};
    case ']':  return Token{TokenKind::RBracket,  "]", loc};
    case '{':  return Token{TokenKind::LBrace,    "{", loc};
    case '}':  return Token{TokenKind::RBrace,    "}", loc};

    case ':':
        if (match_char(':')) return Token{TokenKind::ColonColon, "::", loc};
        return Token{TokenKind::Colon, ":", loc};

    case '=':
        // == and => never appear inside a directive
        if (match_char('=') || match_char('>')) return make_token(TokenKind::Other, start, loc);
        return Token{TokenKind::Assign, "=", loc};

    case '+': case '-': case '/': case '%': case '&': case '|':
    case '^': case '!': case '~': case '#':
        return make_token(TokenKind::Other, start, loc);

    default:
        break;
    }

    diag_.error(loc, "unexpected character '{}'", c);
    return make_token(TokenKind::Invalid, start, loc);
}

std::vector<Token> Lexer::tokenize_all() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next());
        if (tokens.back().is(TokenKind::Eof)) {
            break;
        }
    }
    return tokens;
}

} // namespace aliasorder
