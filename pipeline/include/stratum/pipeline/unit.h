#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stratum/codegen/noop.h"
#include "stratum/codegen/writer.h"
#include "stratum/frontend/syntax.h"
#include "stratum/pipeline/config.h"

namespace stratum::pipeline {

struct UnitResult {
    bool success = false;
    std::string package;
    std::vector<frontend::Diagnostic> diagnostics;
    std::string report;
    std::vector<codegen::GeneratedStub> stubs;
    // Set when a no-op file was due for this unit.
    std::optional<codegen::WriteResult> noop_write;
};

// Scans one Go file and renders the sections enabled in `config`. With no-op
// generation on and a non-empty directory, the interface stubs are persisted
// through `writer` at `noop_output_path`.
[[nodiscard]] auto analyze_unit(const std::string& path, const std::string& source, const AnalysisConfig& config,
                                const codegen::ContentWriter& writer) -> UnitResult;

// `<dir>/noop_<file stem>_interfaces.go`.
[[nodiscard]] auto noop_output_path(const std::string& noopDir, const std::string& sourcePath) -> std::string;

}  // namespace stratum::pipeline
