#pragma once

#include "ast/ast.hpp"
#include "common/diagnostic.hpp"
#include "rules/alias_order.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace aliasorder {
namespace rules {

/// Settings the driver passes in from the command line.
struct AnalyzerOptions {
    /// Reported severity; the rule's default severity when unset.
    std::optional<DiagnosticSeverity> severity;

    /// Also check files recognized as generated code.
    bool include_generated = false;
};

/// Runs the alias-ordering rule over every directive scope of a parsed file
/// and reports violations into a DiagnosticEngine.
class AliasOrderAnalyzer {
public:
    explicit AliasOrderAnalyzer(DiagnosticEngine& diag, AnalyzerOptions options = {});

    /// Check one file: its compilation-unit scope first, then each namespace
    /// scope depth first in source order. `path` and `source` are only used
    /// for generated-code detection. Returns the number of violations
    /// reported, or nullopt when the file was skipped as generated code.
    /// A tree recovered from a failed parse is checked like any other.
    std::optional<uint32_t> analyze(const ast::CompilationUnit& unit, std::string_view path,
                                    std::string_view source);

    [[nodiscard]] const AnalyzerOptions& options() const { return options_; }

private:
    DiagnosticEngine& diag_;
    AnalyzerOptions options_;

    uint32_t check_scope(const ast::ScopeBody& body);
    void report(const Violation& violation);

    [[nodiscard]] static std::vector<Directive> collect_directives(const ast::ScopeBody& body);
};

} // namespace rules
} // namespace aliasorder
