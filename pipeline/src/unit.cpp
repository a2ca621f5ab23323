#include "../include/stratum/pipeline/unit.h"

#include <filesystem>
#include <sstream>
#include <utility>

#include "../include/stratum/pipeline/kinds.h"
#include "stratum/frontend/scanner.h"

namespace stratum::pipeline {
namespace {

template <typename T>
void feed(std::optional<AnalysisEngine<T>>& engine, const frontend::SyntaxNode& node) {
    if (engine.has_value()) {
        (void)engine->analyze(node);
    }
}

template <typename T>
void emit_section(std::ostringstream& out, const char* title, const std::optional<AnalysisEngine<T>>& engine) {
    if (!engine.has_value()) {
        return;
    }
    out << "\n--- " << title << " (Dependency Order) ---\n";
    out << engine->render();
}

}  // namespace

auto noop_output_path(const std::string& noopDir, const std::string& sourcePath) -> std::string {
    std::string base = std::filesystem::path{sourcePath}.filename().string();
    const std::string suffix = ".go";
    if (base.size() >= suffix.size() && base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0) {
        base.erase(base.size() - suffix.size());
    }
    return (std::filesystem::path{noopDir} / ("noop_" + base + "_interfaces.go")).string();
}

auto analyze_unit(const std::string& path, const std::string& source, const AnalysisConfig& config,
                  const codegen::ContentWriter& writer) -> UnitResult {
    UnitResult result;

    frontend::Scanner scanner(path, source);
    auto scan = scanner.scanFile();
    result.diagnostics = std::move(scan.diagnostics);
    if (!scan.success) {
        return result;
    }

    const UnitContext context{
        .path = path,
        .package = scan.file.package.value,
    };
    result.package = context.package;

    std::optional<AnalysisEngine<analysis::StructDecl>> structs;
    std::optional<AnalysisEngine<analysis::InterfaceDecl>> interfaces;
    std::optional<AnalysisEngine<analysis::FunctionDecl>> functions;
    std::optional<AnalysisEngine<analysis::VariableDecl>> variables;
    std::optional<AnalysisEngine<analysis::ConstantDecl>> constants;
    std::optional<AnalysisEngine<analysis::ImportDecl>> imports;

    if (config.kinds.structs) {
        structs.emplace(make_struct_engine(config, context));
    }
    if (config.kinds.interfaces) {
        interfaces.emplace(make_interface_engine(config, context));
    }
    if (config.kinds.functions) {
        functions.emplace(make_function_engine(config, context));
    }
    if (config.kinds.variables) {
        variables.emplace(make_variable_engine(config, context));
    }
    if (config.kinds.constants) {
        constants.emplace(make_constant_engine(config, context));
    }
    if (config.kinds.imports) {
        imports.emplace(make_import_engine(config, context));
    }

    for (const auto& node : scan.file.nodes) {
        feed(structs, node);
        feed(interfaces, node);
        feed(functions, node);
        feed(variables, node);
        feed(constants, node);
        feed(imports, node);
    }

    std::ostringstream out;
    out << "\n=== Analyzing file: " << path << " ===\n";
    emit_section(out, "Structs", structs);
    emit_section(out, "Interfaces", interfaces);

    if (interfaces.has_value() && interfaces->hasGenerator()) {
        result.stubs = interfaces->generateStubs();
        if (!config.noop_dir.empty()) {
            const std::string target = noop_output_path(config.noop_dir, path);
            result.noop_write = interfaces->writeGenerated(target, config.noop_package, writer);
            if (result.noop_write->success) {
                out << "Generated NoOp implementations: " << target << '\n';
            }
        }
    }

    emit_section(out, "Functions", functions);
    emit_section(out, "Variables", variables);
    emit_section(out, "Constants", constants);
    emit_section(out, "Imports", imports);

    result.report = out.str();
    result.success = true;
    return result;
}

}  // namespace stratum::pipeline
