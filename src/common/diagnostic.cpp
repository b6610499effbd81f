#include "common/diagnostic.hpp"

#include <fmt/format.h>

namespace aliasorder {

std::string_view severity_name(DiagnosticSeverity severity) {
    switch (severity) {
    case DiagnosticSeverity::Note:    return "note";
    case DiagnosticSeverity::Warning: return "warning";
    case DiagnosticSeverity::Error:   return "error";
    }
    return "unknown";
}

std::optional<DiagnosticSeverity> parse_severity(std::string_view name) {
    if (name == "note")    return DiagnosticSeverity::Note;
    if (name == "warning") return DiagnosticSeverity::Warning;
    if (name == "error")   return DiagnosticSeverity::Error;
    return std::nullopt;
}

void DiagnosticEngine::emit(DiagnosticSeverity severity, SourceLocation loc, std::string msg,
                            std::string_view code) {
    if (severity == DiagnosticSeverity::Error) {
        ++error_count_;
    } else if (severity == DiagnosticSeverity::Warning) {
        ++warning_count_;
    }

    diagnostics_.push_back(Diagnostic{severity, loc, std::move(msg), code});

    if (handler_) {
        handler_(diagnostics_.back());
    }
}

std::string format_diagnostic(const Diagnostic& diag) {
    if (diag.code.empty()) {
        return fmt::format("{}: {}: {}", diag.location.to_string(),
                           severity_name(diag.severity), diag.message);
    }
    return fmt::format("{}: {}: {} [{}]", diag.location.to_string(),
                       severity_name(diag.severity), diag.message, diag.code);
}

} // namespace aliasorder
