#include "parser/parser.hpp"

#include <fmt/format.h>

namespace aliasorder {

using namespace ast;

Parser::Parser(Lexer& lexer, DiagnosticEngine& diag)
    : lexer_(lexer), diag_(diag) {}

bool Parser::parse() {
    uint32_t errors_before = diag_.error_count();

    tokens_ = lexer_.tokenize_all();
    pos_ = 0;

    unit_ = std::make_unique<CompilationUnit>();
    unit_->loc = current().location;
    parse_body(unit_->body, /*braced=*/false);

    return diag_.error_count() == errors_before;
}

// ============================================================================
// Token navigation
// ============================================================================

const Token& Parser::token_at(size_t index) const {
    // tokenize_all() always ends the stream with Eof
    if (index >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[index];
}

void Parser::advance() {
    if (!at_end()) {
        ++pos_;
    }
}

bool Parser::expect(TokenKind kind) {
    if (current().kind == kind) {
        advance();
        return true;
    }
    error_expected(fmt::format("'{}'", token_kind_to_string(kind)));
    return false;
}

bool Parser::match(TokenKind kind) {
    if (current().kind == kind) {
        advance();
        return true;
    }
    return false;
}

// ============================================================================
// Error handling & recovery
// ============================================================================

void Parser::error(std::string_view msg) {
    diag_.error(current().location, "{}", msg);
}

void Parser::error_expected(std::string_view what) {
    if (at_end()) {
        diag_.error(current().location, "expected {}, got end of file", what);
    } else {
        diag_.error(current().location, "expected {}, got '{}'", what, current().text);
    }
}

void Parser::sync_to_semicolon() {
    while (!at_end()) {
        if (at(TokenKind::Semicolon)) {
            advance();
            return;
        }
        if (at(TokenKind::RBrace) || at(TokenKind::LBrace)) {
            return;
        }
        advance();
    }
}

void Parser::skip_balanced_braces() {
    SourceLocation open = current().location;
    int depth = 0;
    do {
        if (at(TokenKind::LBrace)) {
            ++depth;
        } else if (at(TokenKind::RBrace)) {
            --depth;
        }
        advance();
    } while (depth > 0 && !at_end());

    if (depth > 0) {
        diag_.error(open, "unbalanced '{': missing '}' before end of file");
    }
}

// ============================================================================
// Scope structure
// ============================================================================

// Body of a compilation unit or namespace:
//   extern-alias* using-directive* (namespace | member)*
// A braced body stops at its closing '}' without consuming it.
void Parser::parse_body(ScopeBody& body, bool braced) {
    bool directives_allowed = true;

    while (!at_end()) {
        if (at(TokenKind::RBrace)) {
            if (braced) {
                return;
            }
            error("unexpected '}'");
            advance();
            continue;
        }

        if (at_extern_alias()) {
            if (!directives_allowed) {
                error("extern alias declarations must precede all other elements");
            }
            parse_extern_alias(body);
            continue;
        }

        if (at_using_directive()) {
            if (!directives_allowed) {
                error("a using clause must precede all other elements defined in the namespace "
                      "except extern alias declarations");
                sync_to_semicolon();
                continue;
            }
            parse_using_directive(body);
            continue;
        }

        directives_allowed = false;

        if (at(TokenKind::KW_namespace)) {
            auto ns = parse_namespace_decl();
            bool file_scoped = ns->file_scoped;
            body.namespaces.push_back(std::move(ns));
            if (file_scoped) {
                return; // the file-scoped namespace owns the rest of the file
            }
            continue;
        }

        skip_member();
    }
}

bool Parser::at_extern_alias() const {
    return at(TokenKind::KW_extern) && peek().is(TokenKind::Identifier) &&
           peek().text == "alias";
}

void Parser::parse_extern_alias(ScopeBody& body) {
    ExternAlias ext;
    ext.loc = current().location;
    advance(); // extern
    advance(); // alias

    if (!at(TokenKind::Identifier)) {
        error_expected("extern alias name");
        sync_to_semicolon();
        return;
    }
    ext.name = current().text;
    advance();

    if (!expect(TokenKind::Semicolon)) {
        sync_to_semicolon();
    }
    body.externs.push_back(ext);
}

// Distinguishes directives from the using statements that may follow them
// in a file with top-level statements:
//   using (var r = Open()) ...      resource statement
//   using var r = Open();           using declaration
bool Parser::at_using_directive() const {
    size_t ahead = 0;
    if (at(TokenKind::KW_global)) {
        if (!peek().is(TokenKind::KW_using)) {
            return false;
        }
        ahead = 1;
    } else if (!at(TokenKind::KW_using)) {
        return false;
    }

    const Token& next = peek(ahead + 1);
    if (next.is(TokenKind::KW_static)) {
        return true;
    }
    if (next.is(TokenKind::Identifier) || next.is(TokenKind::KW_global)) {
        return !peek(ahead + 2).is(TokenKind::Identifier);
    }
    return false;
}

void Parser::parse_using_directive(ScopeBody& body) {
    UsingDirective directive;
    directive.loc = current().location;
    directive.is_global = match(TokenKind::KW_global);
    advance(); // using
    directive.is_static = match(TokenKind::KW_static);

    if (at(TokenKind::Identifier) && peek().is(TokenKind::Assign)) {
        directive.alias = current().text;
        advance(); // alias
        advance(); // =
    }

    auto target = parse_target_text();
    if (!target) {
        error_expected(directive.has_alias() ? "aliased type" : "namespace or type name");
        sync_to_semicolon();
        return;
    }
    directive.name = target->text(lexer_.source());

    // A missing ';' is reported but the directive is kept; recovery happens
    // at whatever token ended the name.
    (void)expect(TokenKind::Semicolon);
    body.usings.push_back(directive);
}

// namespace A.B { body } [;]
// namespace A.B; body-to-end-of-file
std::unique_ptr<NamespaceDecl> Parser::parse_namespace_decl() {
    auto ns = std::make_unique<NamespaceDecl>();
    ns->loc = current().location;
    advance(); // namespace

    if (auto name = parse_qualified_name()) {
        ns->name = name->text(lexer_.source());
    } else {
        error_expected("namespace name");
    }

    if (match(TokenKind::Semicolon)) {
        ns->file_scoped = true;
        parse_body(ns->body, /*braced=*/false);
        return ns;
    }

    if (!expect(TokenKind::LBrace)) {
        return ns;
    }

    parse_body(ns->body, /*braced=*/true);
    if (!match(TokenKind::RBrace)) {
        error_expected("'}' to close namespace");
    }
    (void)match(TokenKind::Semicolon);
    return ns;
}

// Skips one type declaration, attribute list, or top-level statement.
// Stops after a balanced {...} group or a ';', or before a token that
// belongs to the enclosing body.
void Parser::skip_member() {
    bool consumed = false;
    while (!at_end()) {
        if (at(TokenKind::LBrace)) {
            skip_balanced_braces();
            return;
        }
        if (at(TokenKind::Semicolon)) {
            advance();
            return;
        }
        if (consumed && (at(TokenKind::RBrace) || at(TokenKind::KW_namespace))) {
            return;
        }
        advance();
        consumed = true;
    }
}

// ============================================================================
// Names
// ============================================================================

// identifier ('.' identifier)*
std::optional<SourceSpan> Parser::parse_qualified_name() {
    if (!at(TokenKind::Identifier)) {
        return std::nullopt;
    }
    SourceSpan span = current().span();
    advance();

    while (at(TokenKind::Dot) && peek().is(TokenKind::Identifier)) {
        advance(); // .
        span = SourceSpan::cover(span, current().span());
        advance();
    }
    return span;
}

// The target of a directive, kept as source text: qualified names with
// global:: qualifiers, generic arguments, arrays, pointers, nullables and
// tuples. Ends before ';' or before the first token that cannot continue
// the name.
std::optional<SourceSpan> Parser::parse_target_text() {
    std::optional<SourceSpan> span;
    bool prev_was_word = false;
    int nesting = 0;

    while (!at_end()) {
        bool is_word = at(TokenKind::Identifier) || at(TokenKind::KW_global);
        bool continues = false;

        switch (current().kind) {
        case TokenKind::Identifier:
        case TokenKind::KW_global:
            // Two adjacent words only belong together inside a tuple element
            continues = !prev_was_word || nesting > 0;
            break;
        case TokenKind::LParen:
        case TokenKind::LBracket:
            ++nesting;
            continues = true;
            break;
        case TokenKind::RParen:
        case TokenKind::RBracket:
            continues = nesting > 0;
            if (continues) {
                --nesting;
            }
            break;
        case TokenKind::Dot:
        case TokenKind::ColonColon:
        case TokenKind::Less:
        case TokenKind::Greater:
        case TokenKind::Comma:
        case TokenKind::Question:
        case TokenKind::Star:
            continues = true;
            break;
        default:
            break;
        }

        if (!continues) {
            break;
        }
        span = span ? SourceSpan::cover(*span, current().span()) : current().span();
        prev_was_word = is_word;
        advance();
    }
    return span;
}

} // namespace aliasorder
