#include "../include/stratum/codegen/signature.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <vector>

#include "stratum/analysis/dependency.h"

namespace stratum::codegen {
namespace {

constexpr std::array<std::string_view, 13> kIntegerTypes = {
    "int",    "int8",   "int16",  "int32",   "int64", "uint", "uint8",
    "uint16", "uint32", "uint64", "uintptr", "byte",  "rune",
};

[[nodiscard]] auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] auto starts_with(std::string_view text, std::string_view prefix) -> bool {
    return text.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] auto is_channel_type(std::string_view type) -> bool {
    return starts_with(type, "chan ") || starts_with(type, "chan\t") || starts_with(type, "chan<-") ||
           starts_with(type, "<-chan");
}

// True when `text` is one parenthesised group, as in `(int, error)` but not
// `(a) (b)`.
[[nodiscard]] auto is_wrapped(std::string_view text) -> bool {
    if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
        return false;
    }
    std::size_t depth = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '(') {
            ++depth;
        } else if (text[i] == ')') {
            --depth;
            if (depth == 0 && i + 1 != text.size()) {
                return false;
            }
        }
    }
    return depth == 0;
}

// Splits on commas outside any (), [] or {}.
[[nodiscard]] auto split_top_level(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        switch (text[i]) {
            case '(':
            case '[':
            case '{':
                ++depth;
                break;
            case ')':
            case ']':
            case '}':
                if (depth > 0) {
                    --depth;
                }
                break;
            case ',':
                if (depth == 0) {
                    parts.push_back(trim(text.substr(start, i - start)));
                    start = i + 1;
                }
                break;
            default:
                break;
        }
    }
    parts.push_back(trim(text.substr(start)));
    return parts;
}

// `err error` -> `error`, `f func(int) error` -> `func(int) error`. Unnamed
// types such as `func(int) error` or `chan int` are returned unchanged.
[[nodiscard]] auto strip_result_name(std::string_view part) -> std::string_view {
    const auto space = part.find_first_of(" \t");
    if (space == std::string_view::npos) {
        return part;
    }
    const std::string_view head = part.substr(0, space);
    if (!analysis::is_valid_identifier(head) || head == "func" || head == "chan" || head == "map" ||
        head == "struct" || head == "interface") {
        return part;
    }
    return trim(part.substr(space + 1));
}

}  // namespace

auto parse_method_signature(std::string_view signature) -> std::optional<MethodSignature> {
    const auto open = signature.find('(');
    if (open == std::string_view::npos) {
        return std::nullopt;
    }

    MethodSignature parsed;
    parsed.name = std::string{trim(signature.substr(0, open))};
    if (parsed.name.empty()) {
        return std::nullopt;
    }

    const std::string_view remainder = signature.substr(open + 1);
    std::size_t depth = 0;
    for (std::size_t i = 0; i < remainder.size(); ++i) {
        const char c = remainder[i];
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (depth == 0) {
                parsed.parameters = std::string{remainder.substr(0, i)};
                parsed.returns = std::string{trim(remainder.substr(i + 1))};
                return parsed;
            }
            --depth;
        }
    }
    return std::nullopt;
}

auto zero_value_for(std::string_view type) -> std::string {
    type = trim(type);
    if (starts_with(type, "*") || starts_with(type, "[]") || starts_with(type, "map[") || is_channel_type(type)) {
        return "nil";
    }
    if (starts_with(type, "func(") || starts_with(type, "interface{")) {
        return "nil";
    }

    if (type == "bool") {
        return "false";
    }
    if (type == "string") {
        return "\"\"";
    }
    if (std::find(kIntegerTypes.begin(), kIntegerTypes.end(), type) != kIntegerTypes.end()) {
        return "0";
    }
    if (type == "float32" || type == "float64") {
        return "0.0";
    }
    if (type == "complex64" || type == "complex128") {
        return "0+0i";
    }
    if (type == "error" || type == "any") {
        return "nil";
    }

    if (type.find('.') != std::string_view::npos) {
        return "nil";
    }
    return std::string{type} + "{}";
}

auto zero_values_for(std::string_view returns) -> std::string {
    returns = trim(returns);
    if (is_wrapped(returns)) {
        returns = trim(returns.substr(1, returns.size() - 2));
    }
    if (returns.empty()) {
        return {};
    }

    std::string joined;
    for (const auto part : split_top_level(returns)) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += zero_value_for(strip_result_name(part));
    }
    return joined;
}

}  // namespace stratum::codegen
