#include "rules/rule_descriptor.hpp"

#include <fmt/format.h>

namespace aliasorder {
namespace rules {

std::string format_violation(const Violation& violation) {
    return fmt::format(fmt::runtime(kAliasOrderRule.message_format), violation.alias_name,
                       violation.required_predecessor_name);
}

std::string describe_rule(const RuleDescriptor& rule) {
    return fmt::format("{}: {}\n"
                       "  category:    {}\n"
                       "  severity:    {}\n"
                       "  description: {}\n"
                       "  help:        {}\n",
                       rule.id, rule.title, rule.category,
                       severity_name(rule.default_severity), rule.description, rule.help_link);
}

} // namespace rules
} // namespace aliasorder
