#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace stratum::pipeline {

// Called for each analysed file; returns an error message to stop the walk.
using SourceVisitor = std::function<std::optional<std::string>(const std::filesystem::path&)>;

// `*.go` files other than `_test.go`.
[[nodiscard]] auto is_analysed_source(const std::filesystem::path& path) -> bool;

// Depth-first, entries of each directory in lexical order. Symbolic links are
// not followed. `root` may also name a single file. The first error, from the
// filesystem or from `visit`, ends the walk and is returned.
[[nodiscard]] auto walk_sources(const std::filesystem::path& root, const SourceVisitor& visit)
    -> std::optional<std::string>;

}  // namespace stratum::pipeline
