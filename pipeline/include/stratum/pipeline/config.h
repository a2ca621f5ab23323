#pragma once

#include <cstdint>
#include <string>

namespace stratum::pipeline {

enum class SortMode : std::uint8_t {
    Topological,
    Alphabetical,
};

struct ActiveKinds {
    bool structs = true;
    bool interfaces = true;
    bool functions = true;
    bool variables = true;
    bool constants = true;
    bool imports = true;
};

// Built once per run from the command line and passed down explicitly.
struct AnalysisConfig {
    ActiveKinds kinds;
    SortMode sort_mode = SortMode::Topological;
    bool generate_noop = false;
    std::string noop_dir;
    std::string noop_package = "main";
};

}  // namespace stratum::pipeline
