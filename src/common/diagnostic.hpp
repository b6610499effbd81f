#pragma once

#include "source_location.hpp"

#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aliasorder {

/// Severity levels for diagnostics.
enum class DiagnosticSeverity : uint8_t {
    Note,
    Warning,
    Error,
};

/// Name of a severity as printed in diagnostics ("note", "warning", "error").
[[nodiscard]] std::string_view severity_name(DiagnosticSeverity severity);

/// Parse a severity name. Returns nullopt for anything but the three names.
[[nodiscard]] std::optional<DiagnosticSeverity> parse_severity(std::string_view name);

/// A single diagnostic message with location and severity.
/// `code` names the lint rule that produced it; front-end errors carry no code.
struct Diagnostic {
    DiagnosticSeverity severity;
    SourceLocation location;
    std::string message;
    std::string_view code;
};

/// Collects lexer, parser and rule diagnostics for one run.
class DiagnosticEngine {
public:
    using DiagnosticHandler = std::function<void(const Diagnostic&)>;

    /// Set a custom handler for diagnostics (e.g., for testing).
    void set_handler(DiagnosticHandler handler) { handler_ = std::move(handler); }

    void error(SourceLocation loc, std::string_view msg) {
        emit(DiagnosticSeverity::Error, loc, std::string(msg), {});
    }

    void warning(SourceLocation loc, std::string_view msg) {
        emit(DiagnosticSeverity::Warning, loc, std::string(msg), {});
    }

    void note(SourceLocation loc, std::string_view msg) {
        emit(DiagnosticSeverity::Note, loc, std::string(msg), {});
    }

    /// Report a formatted error diagnostic.
    template <typename... Args>
    void error(SourceLocation loc, fmt::format_string<Args...> fmt_str, Args&&... args) {
        emit(DiagnosticSeverity::Error, loc,
             fmt::format(fmt_str, std::forward<Args>(args)...), {});
    }

    /// Report a diagnostic produced by a lint rule.
    void report(DiagnosticSeverity severity, std::string_view code, SourceLocation loc,
                std::string msg) {
        emit(severity, loc, std::move(msg), code);
    }

    [[nodiscard]] bool has_errors() const { return error_count_ > 0; }
    [[nodiscard]] uint32_t error_count() const { return error_count_; }
    [[nodiscard]] uint32_t warning_count() const { return warning_count_; }
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    void clear() {
        diagnostics_.clear();
        error_count_ = 0;
        warning_count_ = 0;
    }

private:
    void emit(DiagnosticSeverity severity, SourceLocation loc, std::string msg,
              std::string_view code);

    std::vector<Diagnostic> diagnostics_;
    DiagnosticHandler handler_;
    uint32_t error_count_   = 0;
    uint32_t warning_count_ = 0;
};

/// Format a diagnostic for display:
/// `file:line:col: severity: message` with ` [CODE]` appended for rule diagnostics.
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diag);

} // namespace aliasorder
