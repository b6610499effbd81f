#pragma once

#include "common/source_location.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aliasorder {
namespace rules {

/// One using directive as the ordering check sees it.
/// The views borrow from the caller and must outlive the check.
struct Directive {
    std::optional<std::string_view> alias; // set iff this is an alias directive
    std::string_view target;               // may carry an `alias::` qualifier
    bool is_static = false;
    SourceLocation loc;

    [[nodiscard]] bool has_alias() const { return alias.has_value(); }
};

/// An alias directive placed before a directive it must follow.
struct Violation {
    std::string alias_name;
    std::string required_predecessor_name;
    SourceLocation location;
};

/// Drops a leading `alias::` qualifier: "global::System.IO" -> "System.IO".
/// Only the first `::` is considered.
[[nodiscard]] std::string_view strip_alias_qualifier(std::string_view name);

/// Checks the directives of one scope (a file, or one namespace body).
///
/// An alias directive is reported when the directive right after it is
/// neither an alias nor a static directive. Every directive that is not an
/// alias, plus the last directive of the scope, serves as the anchor; all
/// violations of a scope name the last anchor seen as the directive they
/// must follow.
///
/// `scope` must be in source order. Violations come back in the same order.
[[nodiscard]] std::vector<Violation> check_alias_order(std::span<const Directive> scope);

} // namespace rules
} // namespace aliasorder
