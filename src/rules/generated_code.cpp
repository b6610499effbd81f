#include "rules/generated_code.hpp"

#include <array>
#include <cctype>
#include <string>

namespace aliasorder {
namespace rules {

namespace {

constexpr std::array<std::string_view, 5> kGeneratedSuffixes = {
    ".designer.cs", ".generated.cs", ".g.cs", ".g.i.cs", ".assemblyattributes.cs",
};

constexpr std::string_view kTemporaryPrefix = "temporarygeneratedfile_";

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    for (char& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered;
}

bool mentions_generated(std::string_view comment) {
    return comment.find("<auto-generated") != std::string_view::npos ||
           comment.find("<autogenerated") != std::string_view::npos;
}

} // namespace

bool is_generated_file_name(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    std::string name = to_lower(slash == std::string_view::npos ? path : path.substr(slash + 1));

    if (name.starts_with(kTemporaryPrefix)) {
        return true;
    }
    for (auto suffix : kGeneratedSuffixes) {
        if (name.ends_with(suffix)) {
            return true;
        }
    }
    return false;
}

bool has_generated_header(std::string_view source) {
    size_t pos = 0;
    if (source.starts_with("\xEF\xBB\xBF")) {
        pos = 3;
    }

    while (pos < source.size()) {
        char c = source[pos];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }

        std::string_view rest = source.substr(pos);
        if (rest.starts_with("//") || rest.starts_with("#")) {
            // Line comments and preprocessor lines (#pragma warning disable ...)
            auto eol = rest.find('\n');
            std::string_view line = rest.substr(0, eol);
            if (rest.starts_with("//") && mentions_generated(line)) {
                return true;
            }
            if (eol == std::string_view::npos) {
                return false;
            }
            pos += eol + 1;
            continue;
        }
        if (rest.starts_with("/*")) {
            auto close = rest.find("*/", 2);
            std::string_view comment = rest.substr(0, close);
            if (mentions_generated(comment)) {
                return true;
            }
            if (close == std::string_view::npos) {
                return false;
            }
            pos += close + 2;
            continue;
        }
        return false; // first real token
    }
    return false;
}

bool is_generated_code(std::string_view path, std::string_view source) {
    return is_generated_file_name(path) || has_generated_header(source);
}

} // namespace rules
} // namespace aliasorder
