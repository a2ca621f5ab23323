#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace stratum::analysis {

// Best-effort lexical scan of one rendered type or signature fragment.
// Returns the identifiers that may name other declarations: built-in type
// names are dropped and `pkg.Name` contributes `Name`. Never fails; malformed
// input only yields fewer names. The result is sorted and de-duplicated.
[[nodiscard]] auto extract_type_dependencies(std::string_view fragment) -> std::vector<std::string>;

// Union of the dependencies of every fragment, without `self`.
[[nodiscard]] auto collect_dependencies(const std::vector<std::string>& fragments, const std::string& self)
    -> std::vector<std::string>;

[[nodiscard]] auto is_builtin_type(std::string_view name) -> bool;
[[nodiscard]] auto is_valid_identifier(std::string_view text) -> bool;

}  // namespace stratum::analysis
