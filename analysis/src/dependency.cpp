#include "../include/stratum/analysis/dependency.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <string>
#include <utility>

namespace stratum::analysis {
namespace {

// `<-` goes before `chan ` so that `chan<- T` reduces to `T`.
constexpr std::array<std::string_view, 6> kNoiseTokens = {"...", "*", "[]", "map[", "<-", "chan "};

constexpr std::array<std::string_view, 24> kBuiltinTypes = {
    "bool",   "byte",   "complex64", "complex128", "error",  "float32", "float64", "int",
    "int8",   "int16",  "int32",     "int64",      "rune",   "string",  "uint",    "uint8",
    "uint16", "uint32", "uint64",    "uintptr",    "interface", "func", "struct",  "any",
};

[[nodiscard]] auto is_separator(char c) -> bool {
    switch (c) {
        case '(':
        case ')':
        case '[':
        case ']':
        case '{':
        case '}':
        case ',':
        case ' ':
        case '\t':
        case '\n':
            return true;
        default:
            return false;
    }
}

[[nodiscard]] auto strip_noise(std::string_view fragment) -> std::string {
    std::string cleaned(fragment);
    for (const auto noise : kNoiseTokens) {
        std::string::size_type pos = 0;
        while ((pos = cleaned.find(noise, pos)) != std::string::npos) {
            cleaned.erase(pos, noise.size());
        }
    }
    return cleaned;
}

[[nodiscard]] auto split_tokens(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current;
    for (const char c : text) {
        if (is_separator(c)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

[[nodiscard]] auto is_identifier_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] auto is_identifier_part(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // namespace

auto is_builtin_type(std::string_view name) -> bool {
    return std::find(kBuiltinTypes.begin(), kBuiltinTypes.end(), name) != kBuiltinTypes.end();
}

auto is_valid_identifier(std::string_view text) -> bool {
    if (text.empty() || !is_identifier_start(text.front())) {
        return false;
    }
    return std::all_of(text.begin() + 1, text.end(), is_identifier_part);
}

auto extract_type_dependencies(std::string_view fragment) -> std::vector<std::string> {
    std::set<std::string> names;

    for (const auto& token : split_tokens(strip_noise(fragment))) {
        if (is_builtin_type(token)) {
            continue;
        }

        const auto dot = token.find('.');
        if (dot != std::string::npos) {
            // Only `pkg.Name` is understood; deeper selectors are ignored.
            if (token.find('.', dot + 1) == std::string::npos) {
                const std::string member = token.substr(dot + 1);
                if (is_valid_identifier(member) && !is_builtin_type(member)) {
                    names.insert(member);
                }
            }
            continue;
        }

        if (is_valid_identifier(token)) {
            names.insert(token);
        }
    }

    return {names.begin(), names.end()};
}

auto collect_dependencies(const std::vector<std::string>& fragments, const std::string& self)
    -> std::vector<std::string> {
    std::set<std::string> names;
    for (const auto& fragment : fragments) {
        for (auto& name : extract_type_dependencies(fragment)) {
            if (name != self) {
                names.insert(std::move(name));
            }
        }
    }
    return {names.begin(), names.end()};
}

}  // namespace stratum::analysis
