#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace stratum::codegen {

struct MethodSignature {
    std::string name;
    std::string parameters;  // text between the outer parentheses
    std::string returns;     // trimmed text after them, may be empty
};

// Splits `Name(params) returns`. Returns nullopt when there is no '(' or its
// closing ')' is missing, or when the name is empty.
[[nodiscard]] auto parse_method_signature(std::string_view signature) -> std::optional<MethodSignature>;

// Zero-value literal for one Go type.
[[nodiscard]] auto zero_value_for(std::string_view type) -> std::string;

// Comma-joined zero values for a return clause such as `(int, error)` or
// `(n int, err error)`. Empty for an empty clause.
[[nodiscard]] auto zero_values_for(std::string_view returns) -> std::string;

}  // namespace stratum::codegen
