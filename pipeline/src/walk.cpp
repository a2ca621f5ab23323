#include "../include/stratum/pipeline/walk.h"

#include <algorithm>
#include <system_error>
#include <vector>

namespace stratum::pipeline {

namespace fs = std::filesystem;

auto is_analysed_source(const fs::path& path) -> bool {
    const std::string name = path.filename().string();
    const auto endsWith = [&name](const std::string& suffix) {
        return name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return endsWith(".go") && !endsWith("_test.go");
}

auto walk_sources(const fs::path& root, const SourceVisitor& visit) -> std::optional<std::string> {
    std::error_code ec;
    if (fs::is_regular_file(root, ec)) {
        if (!is_analysed_source(root)) {
            return std::nullopt;
        }
        return visit(root);
    }

    fs::directory_iterator it(root, ec);
    if (ec) {
        return root.string() + ": " + ec.message();
    }
    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator{}; it.increment(ec)) {
        if (ec) {
            return root.string() + ": " + ec.message();
        }
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& lhs, const fs::directory_entry& rhs) {
        return lhs.path().filename() < rhs.path().filename();
    });

    for (const auto& entry : entries) {
        // A link back to an ancestor would otherwise recurse forever.
        if (entry.is_symlink(ec)) {
            continue;
        }
        if (entry.is_directory(ec)) {
            if (auto error = walk_sources(entry.path(), visit)) {
                return error;
            }
            continue;
        }
        if (entry.is_regular_file(ec) && is_analysed_source(entry.path())) {
            if (auto error = visit(entry.path())) {
                return error;
            }
        }
    }
    return std::nullopt;
}

}  // namespace stratum::pipeline
