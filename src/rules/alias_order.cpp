#include "rules/alias_order.hpp"

namespace aliasorder {
namespace rules {

std::string_view strip_alias_qualifier(std::string_view name) {
    auto double_colon = name.find("::");
    if (double_colon == std::string_view::npos) {
        return name;
    }
    return name.substr(double_colon + 2);
}

std::vector<Violation> check_alias_order(std::span<const Directive> scope) {
    const Directive* anchor = nullptr;
    std::vector<const Directive*> misplaced;

    for (size_t i = 0; i < scope.size(); ++i) {
        const Directive& directive = scope[i];
        bool has_next = i + 1 < scope.size();

        if (directive.has_alias() && has_next) {
            // Aliases never anchor, flagged or not.
            const Directive& next = scope[i + 1];
            if (!next.has_alias() && !next.is_static) {
                misplaced.push_back(&directive);
            }
        } else {
            anchor = &directive;
        }
    }

    std::vector<Violation> violations;
    if (misplaced.empty() || anchor == nullptr) {
        return violations;
    }

    std::string predecessor(strip_alias_qualifier(anchor->target));
    violations.reserve(misplaced.size());
    for (const Directive* directive : misplaced) {
        violations.push_back(Violation{std::string(*directive->alias), predecessor,
                                       directive->loc});
    }
    return violations;
}

} // namespace rules
} // namespace aliasorder
