#pragma once

#include <string_view>

namespace aliasorder {
namespace rules {

/// True for file names tooling reserves for generated sources
/// (Foo.designer.cs, Foo.g.cs, TemporaryGeneratedFile_*.cs, ...).
/// Any directory part is ignored; the comparison is case-insensitive.
[[nodiscard]] bool is_generated_file_name(std::string_view path);

/// True when a comment before the first token of the file carries an
/// <auto-generated> or <autogenerated> marker.
[[nodiscard]] bool has_generated_header(std::string_view source);

/// Files the analyzer skips unless generated code is explicitly included.
[[nodiscard]] bool is_generated_code(std::string_view path, std::string_view source);

} // namespace rules
} // namespace aliasorder
