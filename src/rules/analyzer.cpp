#include "rules/analyzer.hpp"

#include "rules/generated_code.hpp"
#include "rules/rule_descriptor.hpp"

namespace aliasorder {
namespace rules {

AliasOrderAnalyzer::AliasOrderAnalyzer(DiagnosticEngine& diag, AnalyzerOptions options)
    : diag_(diag), options_(options) {}

std::optional<uint32_t> AliasOrderAnalyzer::analyze(const ast::CompilationUnit& unit,
                                                    std::string_view path,
                                                    std::string_view source) {
    if (!options_.include_generated && is_generated_code(path, source)) {
        return std::nullopt;
    }
    return check_scope(unit.body);
}

uint32_t AliasOrderAnalyzer::check_scope(const ast::ScopeBody& body) {
    auto directives = collect_directives(body);
    auto violations = check_alias_order(directives);
    for (const auto& violation : violations) {
        report(violation);
    }

    auto count = static_cast<uint32_t>(violations.size());
    for (const auto& ns : body.namespaces) {
        count += check_scope(ns->body);
    }
    return count;
}

void AliasOrderAnalyzer::report(const Violation& violation) {
    diag_.report(options_.severity.value_or(kAliasOrderRule.default_severity),
                 kAliasOrderRule.id, violation.location, format_violation(violation));
}

std::vector<Directive> AliasOrderAnalyzer::collect_directives(const ast::ScopeBody& body) {
    std::vector<Directive> directives;
    directives.reserve(body.usings.size());
    for (const auto& using_directive : body.usings) {
        directives.push_back(Directive{using_directive.alias, using_directive.name,
                                       using_directive.is_static, using_directive.loc});
    }
    return directives;
}

} // namespace rules
} // namespace aliasorder
