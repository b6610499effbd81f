#include "ast/ast_printer.hpp"
#include "common/diagnostic.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "rules/analyzer.hpp"
#include "rules/rule_descriptor.hpp"

#include <fmt/format.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(std::string_view program) {
    fmt::print("Usage: {} [options] <file.cs>...\n", program);
    fmt::print("\nOptions:\n");
    fmt::print("  --help                Show this help message\n");
    fmt::print("  --version             Show version information\n");
    fmt::print("  --list-rules          Describe the rules this tool checks and exit\n");
    fmt::print("  --dump-tokens         Dump lexer tokens and exit\n");
    fmt::print("  --dump-syntax         Dump the parsed directive tree and exit\n");
    fmt::print("  --severity <level>    Report violations as note, warning or error\n");
    fmt::print("  --include-generated   Also check generated files\n");
    fmt::print("  --verbose             Log each file as it is checked\n");
}

void print_version() {
    fmt::print("aliasorder 0.1.0\n");
    fmt::print("C# using directive ordering checker\n");
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void dump_tokens(aliasorder::Lexer& lexer) {
    auto tokens = lexer.tokenize_all();
    for (const auto& tok : tokens) {
        fmt::print("{:>4}:{:<3} {:14s} '{}'\n", tok.location.position.line,
                   tok.location.position.column, aliasorder::token_kind_to_string(tok.kind),
                   tok.text);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    bool dump_tokens_only = false;
    bool dump_syntax = false;
    bool verbose = false;
    aliasorder::rules::AnalyzerOptions options;
    std::vector<std::string> source_files;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--list-rules") {
            fmt::print("{}", aliasorder::rules::describe_rule(aliasorder::rules::kAliasOrderRule));
            return 0;
        } else if (arg == "--dump-tokens") {
            dump_tokens_only = true;
        } else if (arg == "--dump-syntax") {
            dump_syntax = true;
        } else if (arg == "--include-generated") {
            options.include_generated = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--severity") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "error: --severity requires an argument\n");
                return 1;
            }
            std::string_view level = argv[++i];
            options.severity = aliasorder::parse_severity(level);
            if (!options.severity) {
                fmt::print(stderr, "error: unknown severity '{}' (expected note, warning or error)\n",
                           level);
                return 1;
            }
        } else if (arg[0] == '-') {
            fmt::print(stderr, "error: unknown option '{}'\n", arg);
            return 1;
        } else {
            source_files.emplace_back(arg);
        }
    }

    if (source_files.empty()) {
        fmt::print(stderr, "error: no input files\n");
        return 1;
    }

    aliasorder::DiagnosticEngine diag;
    diag.set_handler([](const aliasorder::Diagnostic& d) {
        fmt::print(stderr, "{}\n", aliasorder::format_diagnostic(d));
    });

    aliasorder::rules::AliasOrderAnalyzer analyzer(diag, options);
    uint32_t violations = 0;
    uint32_t skipped = 0;

    // source_files outlives diag: diagnostics keep views of the file names.
    for (const auto& path : source_files) {
        auto source = read_file(path);
        if (!source) {
            diag.error(aliasorder::SourceLocation{path, {1, 1}, 0}, "cannot open file");
            continue;
        }

        aliasorder::Lexer lexer(*source, path, diag);
        if (dump_tokens_only) {
            dump_tokens(lexer);
            continue;
        }

        // Parse errors are already reported; the recovered tree is still
        // checked so that a broken member body does not hide violations.
        aliasorder::Parser parser(lexer, diag);
        bool parsed = parser.parse();

        if (dump_syntax) {
            aliasorder::ast::AstPrinter printer;
            fmt::print("{}", printer.print(parser.unit()));
            continue;
        }

        auto found = analyzer.analyze(*parser.unit(), path, *source);
        if (!found) {
            ++skipped;
            if (verbose) {
                fmt::print(stderr, "skipping generated file: {}\n", path);
            }
            continue;
        }
        violations += *found;
        if (verbose) {
            fmt::print(stderr, "checked: {}: {} violation(s){}\n", path, *found,
                       parsed ? "" : " (with parse errors)");
        }
    }

    if (verbose) {
        fmt::print(stderr, "{} file(s), {} skipped, {} violation(s), {} error(s)\n",
                   source_files.size(), skipped, violations, diag.error_count());
    }

    return diag.has_errors() ? 1 : 0;
}
