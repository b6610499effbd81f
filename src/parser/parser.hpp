#pragma once

#include "ast/ast.hpp"
#include "common/diagnostic.hpp"
#include "lexer/lexer.hpp"
#include "lexer/token.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace aliasorder {

/// Recursive descent parser for the directive structure of a C# file.
/// Only extern aliases, using directives and namespace declarations are
/// turned into nodes; every other member is skipped with its braces
/// balanced.
class Parser {
public:
    Parser(Lexer& lexer, DiagnosticEngine& diag);

    /// Parse a complete C# source file.
    /// Returns true if this file produced no lexer or parser errors.
    [[nodiscard]] bool parse();

    /// Get the parsed tree (valid after parse(), even when it failed).
    [[nodiscard]] const ast::CompilationUnit* unit() const { return unit_.get(); }

private:
    Lexer& lexer_;
    DiagnosticEngine& diag_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    std::unique_ptr<ast::CompilationUnit> unit_;

    // ---- Token navigation ----
    [[nodiscard]] const Token& current() const { return token_at(pos_); }
    [[nodiscard]] const Token& peek(size_t ahead = 1) const { return token_at(pos_ + ahead); }
    [[nodiscard]] const Token& token_at(size_t index) const;
    [[nodiscard]] bool at(TokenKind kind) const { return current().kind == kind; }
    [[nodiscard]] bool at_end() const { return current().kind == TokenKind::Eof; }
    void advance();
    bool expect(TokenKind kind);
    bool match(TokenKind kind);

    // ---- Error handling ----
    void error(std::string_view msg);
    void error_expected(std::string_view what);
    void sync_to_semicolon();
    void skip_balanced_braces();

    // ---- Scope structure ----
    void parse_body(ast::ScopeBody& body, bool braced);
    void parse_extern_alias(ast::ScopeBody& body);
    [[nodiscard]] bool at_extern_alias() const;
    [[nodiscard]] bool at_using_directive() const;
    void parse_using_directive(ast::ScopeBody& body);
    std::unique_ptr<ast::NamespaceDecl> parse_namespace_decl();
    void skip_member();

    // ---- Names ----
    std::optional<SourceSpan> parse_qualified_name();
    std::optional<SourceSpan> parse_target_text();
};

} // namespace aliasorder
