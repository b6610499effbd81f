#include "ast/ast_printer.hpp"

#include <fmt/format.h>

namespace aliasorder {
namespace ast {

std::string AstPrinter::print(const CompilationUnit* unit) {
    output_.clear();
    indent_ = 0;
    if (unit) {
        line("CompilationUnit");
        indent();
        print_body(unit->body);
        dedent();
    }
    return output_;
}

void AstPrinter::line(std::string_view text) {
    for (int i = 0; i < indent_; ++i) {
        output_ += "  ";
    }
    output_ += text;
    output_ += '\n';
}

void AstPrinter::indent() { ++indent_; }
void AstPrinter::dedent() { --indent_; }

void AstPrinter::print_body(const ScopeBody& body) {
    for (const auto& ext : body.externs) {
        line(fmt::format("ExternAlias: {}", ext.name));
    }
    for (const auto& directive : body.usings) {
        print_using(directive);
    }
    for (const auto& ns : body.namespaces) {
        print_namespace(*ns);
    }
}

void AstPrinter::print_using(const UsingDirective& directive) {
    std::string label = directive.has_alias() ? "UsingAlias" : "Using";
    if (directive.is_global) label += " global";
    if (directive.is_static) label += " static";

    if (directive.has_alias()) {
        line(fmt::format("{}: {} = {}", label, *directive.alias, directive.name));
    } else {
        line(fmt::format("{}: {}", label, directive.name));
    }
}

void AstPrinter::print_namespace(const NamespaceDecl& ns) {
    line(fmt::format("Namespace: {}{}", ns.name, ns.file_scoped ? " (file-scoped)" : ""));
    indent();
    print_body(ns.body);
    dedent();
}

} // namespace ast
} // namespace aliasorder
