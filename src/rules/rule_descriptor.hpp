#pragma once

#include "common/diagnostic.hpp"
#include "rules/alias_order.hpp"

#include <string>
#include <string_view>

namespace aliasorder {
namespace rules {

/// Identity of a lint rule, as printed by --list-rules and attached to
/// every diagnostic the rule reports.
struct RuleDescriptor {
    std::string_view id;
    std::string_view title;
    std::string_view message_format; // fmt-style, one {} per argument
    std::string_view category;
    std::string_view description;
    std::string_view help_link;
    DiagnosticSeverity default_severity;
};

inline constexpr RuleDescriptor kAliasOrderRule{
    "SA1209",
    "Using alias directives must be placed after other using directives",
    "Using alias directive for '{}' must appear after directive for '{}'",
    "StyleCop.CSharp.OrderingRules",
    "A using-alias directive is positioned before a regular using directive.",
    "http://www.stylecop.com/docs/SA1209.html",
    DiagnosticSeverity::Warning,
};

/// The diagnostic message for an alias-ordering violation.
[[nodiscard]] std::string format_violation(const Violation& violation);

/// Multi-line description of a rule for --list-rules.
[[nodiscard]] std::string describe_rule(const RuleDescriptor& rule);

} // namespace rules
} // namespace aliasorder
