#pragma once

#include "ast/ast.hpp"

#include <string>
#include <string_view>

namespace aliasorder {
namespace ast {

/// Pretty-prints the directive tree of a compilation unit, one node per line.
class AstPrinter {
public:
    [[nodiscard]] std::string print(const CompilationUnit* unit);

private:
    std::string output_;
    int indent_ = 0;

    void print_body(const ScopeBody& body);
    void print_using(const UsingDirective& directive);
    void print_namespace(const NamespaceDecl& ns);

    void line(std::string_view text);
    void indent();
    void dedent();
};

} // namespace ast
} // namespace aliasorder
