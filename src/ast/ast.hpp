#pragma once

#include "common/source_location.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace aliasorder {
namespace ast {

// All string_views point into the source buffer the tree was parsed from;
// the buffer must outlive the tree.

struct NamespaceDecl;

/// `extern alias Name;`
struct ExternAlias {
    SourceLocation loc;
    std::string_view name;
};

/// One using directive:
///   [global] using [static] Name;
///   [global] using Alias = Type;
struct UsingDirective {
    SourceLocation loc; // first token of the directive
    bool is_global = false;
    bool is_static = false;
    std::optional<std::string_view> alias;
    std::string_view name; // source text of the target, e.g. "global::System.IO"

    [[nodiscard]] bool has_alias() const { return alias.has_value(); }
};

/// The directive-bearing part shared by a compilation unit and a namespace.
/// Using directives and nested namespaces are kept in source order.
struct ScopeBody {
    std::vector<ExternAlias> externs;
    std::vector<UsingDirective> usings;
    std::vector<std::unique_ptr<NamespaceDecl>> namespaces;
};

/// `namespace A.B { ... }` or the file-scoped `namespace A.B;`
struct NamespaceDecl {
    SourceLocation loc;
    std::string_view name;
    bool file_scoped = false;
    ScopeBody body;
};

struct CompilationUnit {
    SourceLocation loc;
    ScopeBody body;
};

} // namespace ast
} // namespace aliasorder
