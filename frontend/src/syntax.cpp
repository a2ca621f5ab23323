#include "../include/stratum/frontend/syntax.h"

#include <string>
#include <vector>

namespace stratum::frontend {
namespace {

auto join(const std::vector<std::string>& parts) -> std::string {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += parts[i];
    }
    return joined;
}

}  // namespace

auto flatten_types(const std::vector<FieldGroup>& groups) -> std::vector<std::string> {
    std::vector<std::string> types;
    for (const auto& group : groups) {
        const size_t count = group.names.empty() ? 1 : group.names.size();
        for (size_t i = 0; i < count; ++i) {
            types.push_back(group.type);
        }
    }
    return types;
}

auto format_func_type(const std::vector<FieldGroup>& parameters, const std::vector<FieldGroup>& results)
    -> std::string {
    std::string rendered = "func(" + join(flatten_types(parameters)) + ")";
    const auto resultTypes = flatten_types(results);
    if (resultTypes.size() == 1) {
        rendered += " " + resultTypes.front();
    } else if (resultTypes.size() > 1) {
        rendered += " (" + join(resultTypes) + ")";
    }
    return rendered;
}

auto format_location(const std::string& path, const SourceLocation& location) -> std::string {
    std::string rendered = std::to_string(location.line) + ":" + std::to_string(location.column);
    if (path.empty()) {
        return rendered;
    }
    return path + ":" + rendered;
}

}  // namespace stratum::frontend
