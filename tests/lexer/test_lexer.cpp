#include "common/diagnostic.hpp"
#include "lexer/lexer.hpp"
#include "lexer/token.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace aliasorder;

// ============================================================================
// Test helpers
// ============================================================================

// Tokenize expecting no errors. Returns all tokens excluding EOF.
static std::vector<Token> tokenize_ok(std::string_view source) {
    DiagnosticEngine diag;
    Lexer lexer(source, "Test.cs", diag);
    auto tokens = lexer.tokenize_all();
    EXPECT_FALSE(diag.has_errors()) << "Unexpected errors tokenizing: " << source;
    if (!tokens.empty() && tokens.back().kind == TokenKind::Eof) {
        tokens.pop_back();
    }
    return tokens;
}

static std::vector<TokenKind> kinds_of(const std::vector<Token>& tokens) {
    std::vector<TokenKind> kinds;
    for (const auto& tok : tokens) {
        kinds.push_back(tok.kind);
    }
    return kinds;
}

// Tokenize and report whether any error was produced.
static bool tokenize_has_errors(std::string_view source) {
    DiagnosticEngine diag;
    Lexer lexer(source, "Test.cs", diag);
    (void)lexer.tokenize_all();
    return diag.has_errors();
}

// ============================================================================
// Token utility tests
// ============================================================================

TEST(TokenTest, TokenKindToString) {
    EXPECT_EQ(token_kind_to_string(TokenKind::Eof), "EOF");
    EXPECT_EQ(token_kind_to_string(TokenKind::KW_using), "using");
    EXPECT_EQ(token_kind_to_string(TokenKind::KW_namespace), "namespace");
    EXPECT_EQ(token_kind_to_string(TokenKind::ColonColon), "::");
    EXPECT_EQ(token_kind_to_string(TokenKind::Semicolon), ";");
}

TEST(TokenTest, LookupKeyword) {
    EXPECT_EQ(lookup_keyword("using"), TokenKind::KW_using);
    EXPECT_EQ(lookup_keyword("global"), TokenKind::KW_global);
    EXPECT_EQ(lookup_keyword("Using"), TokenKind::Identifier);
    EXPECT_EQ(lookup_keyword("alias"), TokenKind::Identifier);
    EXPECT_EQ(lookup_keyword("class"), TokenKind::Identifier);
}

// ============================================================================
// Directives
// ============================================================================

TEST(LexerTest, UsingDirective) {
    auto tokens = tokenize_ok("using System.Collections.Generic;");
    std::vector<TokenKind> expected = {
        TokenKind::KW_using, TokenKind::Identifier, TokenKind::Dot, TokenKind::Identifier,
        TokenKind::Dot,      TokenKind::Identifier, TokenKind::Semicolon,
    };
    EXPECT_EQ(kinds_of(tokens), expected);
    EXPECT_EQ(tokens[1].text, "System");
    EXPECT_EQ(tokens[5].text, "Generic");
}

TEST(LexerTest, GlobalQualifiedAlias) {
    auto tokens = tokenize_ok("using IO = global::System.IO;");
    std::vector<TokenKind> expected = {
        TokenKind::KW_using,   TokenKind::Identifier, TokenKind::Assign,
        TokenKind::KW_global,  TokenKind::ColonColon, TokenKind::Identifier,
        TokenKind::Dot,        TokenKind::Identifier, TokenKind::Semicolon,
    };
    EXPECT_EQ(kinds_of(tokens), expected);
}

TEST(LexerTest, GenericArgumentsKeepSingleAngles) {
    auto tokens = tokenize_ok("A<B<C>>");
    std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::Less,    TokenKind::Identifier, TokenKind::Less,
        TokenKind::Identifier, TokenKind::Greater, TokenKind::Greater,
    };
    EXPECT_EQ(kinds_of(tokens), expected);
}

TEST(LexerTest, Locations) {
    auto tokens = tokenize_ok("using A;\n  using B;");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].location.position.line, 1u);
    EXPECT_EQ(tokens[0].location.position.column, 1u);
    EXPECT_EQ(tokens[3].location.position.line, 2u);
    EXPECT_EQ(tokens[3].location.position.column, 3u);
    EXPECT_EQ(tokens[3].location.offset, 11u);
    EXPECT_EQ(tokens[3].location.filename, "Test.cs");
}

TEST(LexerTest, ByteOrderMarkSkipped) {
    auto tokens = tokenize_ok("\xEF\xBB\xBFusing A;");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KW_using);
    EXPECT_EQ(tokens[0].location.position.column, 1u);
    EXPECT_EQ(tokens[0].location.offset, 3u);
}

TEST(LexerTest, VerbatimIdentifierIsNotKeyword) {
    auto tokens = tokenize_ok("@namespace @using");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[0].text, "@namespace");
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
}

TEST(LexerTest, OperatorsCollapseToOther) {
    auto tokens = tokenize_ok("a == b => c = d + e");
    std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::Other,  TokenKind::Identifier, TokenKind::Other,
        TokenKind::Identifier, TokenKind::Assign, TokenKind::Identifier, TokenKind::Other,
        TokenKind::Identifier,
    };
    EXPECT_EQ(kinds_of(tokens), expected);
}

TEST(LexerTest, Numbers) {
    auto tokens = tokenize_ok("1.5e3f 0xFF 1_000 .25");
    ASSERT_EQ(tokens.size(), 4u);
    for (const auto& tok : tokens) {
        EXPECT_EQ(tok.kind, TokenKind::NumberLiteral);
    }
    EXPECT_EQ(tokens[0].text, "1.5e3f");
    EXPECT_EQ(tokens[3].text, ".25");
}

// ============================================================================
// Trivia
// ============================================================================

TEST(LexerTest, CommentsSkipped) {
    auto tokens = tokenize_ok("// using A;\n/* using B; */ using C;");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KW_using);
    EXPECT_EQ(tokens[0].location.position.line, 2u);
    EXPECT_EQ(tokens[1].text, "C");
}

TEST(LexerTest, PreprocessorLinesSkipped) {
    auto tokens = tokenize_ok("#if DEBUG\nusing A;\n  #endif\n#region Usings { \n");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KW_using);
}

TEST(LexerTest, HashInsideLineIsOther) {
    auto tokens = tokenize_ok("a # b");
    std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::Other, TokenKind::Identifier,
    };
    EXPECT_EQ(kinds_of(tokens), expected);
}

// ============================================================================
// Literals
// ============================================================================

TEST(LexerTest, StringHidesBraces) {
    auto tokens = tokenize_ok(R"(var s = "{ } \" {";)");
    std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::Identifier, TokenKind::Assign,
        TokenKind::StringLiteral, TokenKind::Semicolon,
    };
    EXPECT_EQ(kinds_of(tokens), expected);
    EXPECT_EQ(tokens[3].text, R"("{ } \" {")");
}

TEST(LexerTest, VerbatimString) {
    auto tokens = tokenize_ok(R"(x = @"C:\dir\""{";)");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[2].text, R"(@"C:\dir\""{")");
}

TEST(LexerTest, VerbatimStringSpansLines) {
    auto tokens = tokenize_ok("x = @\"line1\n{line2\";\nusing A;");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[2].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[4].kind, TokenKind::KW_using);
    EXPECT_EQ(tokens[4].location.position.line, 3u);
}

TEST(LexerTest, InterpolatedStringWithNestedLiterals) {
    auto tokens = tokenize_ok(R"($"{a} {{ {b("}")} }}";)");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].kind, TokenKind::Semicolon);
}

TEST(LexerTest, InterpolatedVerbatimString) {
    auto tokens = tokenize_ok("$@\"{x}\n\"\"{y}\"\"\" @$\"{z}\"");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].kind, TokenKind::StringLiteral);
}

TEST(LexerTest, InterpolationFormatSpecifier) {
    auto tokens = tokenize_ok(R"($"{value:#,##0}";)");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
}

TEST(LexerTest, InterpolationFormatWithEscapedColon) {
    auto tokens = tokenize_ok(R"(return $"{ts:hh\\:mm}";)");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].text, R"($"{ts:hh\\:mm}")");
    EXPECT_EQ(tokens[2].kind, TokenKind::Semicolon);
}

TEST(LexerTest, InterpolationDateFormat) {
    auto tokens = tokenize_ok(R"($"{d:dd/MM/yyyy} {t,8:HH':'mm}" + x;)");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[2].kind, TokenKind::Identifier);
}

TEST(LexerTest, InterpolationConditionalIsNotFormat) {
    auto tokens = tokenize_ok(R"($"{(ok ? "}" : "{")}";)");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
}

TEST(LexerTest, VerbatimInterpolationFormat) {
    auto tokens = tokenize_ok("$@\"{ts:hh\\:mm}\\\";");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
}

TEST(LexerTest, FormatClauseErrorsStayInsideLiteral) {
    EXPECT_FALSE(tokenize_has_errors(R"(class C { string M(TimeSpan ts) { return $"{ts:hh\\:mm}"; } })"));
    EXPECT_TRUE(tokenize_has_errors("$\"{x:N2\n\";"));
}

TEST(LexerTest, RawString) {
    auto tokens = tokenize_ok("\"\"\"\n { \"\" }\n \"\"\";");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].kind, TokenKind::Semicolon);
}

TEST(LexerTest, EmptyString) {
    auto tokens = tokenize_ok("\"\";");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].text, "\"\"");
}

TEST(LexerTest, CharLiterals) {
    auto tokens = tokenize_ok(R"('{' '\'' '}')");
    ASSERT_EQ(tokens.size(), 3u);
    for (const auto& tok : tokens) {
        EXPECT_EQ(tok.kind, TokenKind::CharLiteral);
    }
    EXPECT_EQ(tokens[1].text, R"('\'')");
}

// ============================================================================
// Errors
// ============================================================================

TEST(LexerErrorTest, UnterminatedString) {
    EXPECT_TRUE(tokenize_has_errors("\"abc"));
}

TEST(LexerErrorTest, NewlineInString) {
    EXPECT_TRUE(tokenize_has_errors("\"abc\ndef"));
}

TEST(LexerErrorTest, UnterminatedBlockComment) {
    EXPECT_TRUE(tokenize_has_errors("using A; /* never closed"));
}

TEST(LexerErrorTest, UnterminatedChar) {
    EXPECT_TRUE(tokenize_has_errors("'a"));
}

TEST(LexerErrorTest, UnterminatedRawString) {
    EXPECT_TRUE(tokenize_has_errors("\"\"\" open"));
}

TEST(LexerErrorTest, UnexpectedCharacter) {
    DiagnosticEngine diag;
    Lexer lexer("using `A;", "Test.cs", diag);
    auto tokens = lexer.tokenize_all();
    EXPECT_TRUE(diag.has_errors());
    ASSERT_EQ(diag.diagnostics().size(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].message, "unexpected character '`'");
    EXPECT_EQ(tokens[1].kind, TokenKind::Invalid);
    EXPECT_EQ(tokens.back().kind, TokenKind::Eof);
}
