#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "stratum/codegen/writer.h"
#include "stratum/frontend/syntax.h"
#include "stratum/pipeline/config.h"
#include "stratum/pipeline/unit.h"
#include "stratum/pipeline/walk.h"

namespace {

namespace fs = std::filesystem;

struct Options {
    std::string dirs = ".";
    bool dirsGiven = false;
    std::optional<std::string> filePath;
    bool showStructs = false;
    bool showInterfaces = false;
    bool showFunctions = false;
    bool showVariables = false;
    bool showConstants = false;
    bool showImports = false;
    bool showAll = false;
    bool alphabetical = false;
    bool generateNoOp = false;
    std::string noOpDir = "./noop";
    std::string noOpPackage = "main";
    bool help = false;
};

void printUsage() {
    std::cout << "Usage: stratum [--dirs <a,b,...>] [--file <path>] [options]\n"
                 "\n"
                 "Input options:\n"
                 "  --dirs <list>            Comma-separated directories to analyse (default: .)\n"
                 "  --file <path>            Analyse a single Go file\n"
                 "\n"
                 "Sections (all when none is given):\n"
                 "  --structs                Show structs\n"
                 "  --interfaces             Show interfaces\n"
                 "  --functions              Show functions and methods\n"
                 "  --variables              Show package variables\n"
                 "  --constants              Show constants\n"
                 "  --imports                Show imports\n"
                 "  --all                    Show every section\n"
                 "\n"
                 "Ordering options:\n"
                 "  --topo                   Order by dependencies (default)\n"
                 "  --alpha                  Order by name\n"
                 "\n"
                 "Generation options:\n"
                 "  --noop                   Generate NoOp implementations for interfaces\n"
                 "  --noop-dir <dir>         Output directory for NoOp files (default: ./noop)\n"
                 "  --noop-package <name>    Package clause of generated files (default: main)\n";
}

auto requireValue(int argc, char** argv, int& index, const std::string& flag) -> std::optional<std::string> {
    if (index + 1 >= argc) {
        std::cerr << "Missing value for " << flag << '\n';
        return std::nullopt;
    }
    return std::string{argv[++index]};
}

auto parseArgs(int argc, char** argv) -> std::optional<Options> {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg == "--dirs" || arg == "--file" || arg == "-f" || arg == "--noop-dir" || arg == "--noop-package") {
            auto value = requireValue(argc, argv, i, arg);
            if (!value.has_value()) {
                return std::nullopt;
            }
            if (arg == "--dirs") {
                opts.dirs = std::move(*value);
                opts.dirsGiven = true;
            } else if (arg == "--noop-dir") {
                opts.noOpDir = std::move(*value);
            } else if (arg == "--noop-package") {
                opts.noOpPackage = std::move(*value);
            } else {
                opts.filePath = std::move(*value);
            }
            continue;
        }
        if (arg == "--structs") {
            opts.showStructs = true;
            continue;
        }
        if (arg == "--interfaces") {
            opts.showInterfaces = true;
            continue;
        }
        if (arg == "--functions") {
            opts.showFunctions = true;
            continue;
        }
        if (arg == "--variables") {
            opts.showVariables = true;
            continue;
        }
        if (arg == "--constants") {
            opts.showConstants = true;
            continue;
        }
        if (arg == "--imports") {
            opts.showImports = true;
            continue;
        }
        if (arg == "--all") {
            opts.showAll = true;
            continue;
        }
        if (arg == "--topo") {
            continue;
        }
        if (arg == "--alpha") {
            opts.alphabetical = true;
            continue;
        }
        if (arg == "--noop") {
            opts.generateNoOp = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            return opts;
        }
        std::cerr << "Unknown argument: " << arg << '\n';
        return std::nullopt;
    }

    if (opts.noOpPackage.empty()) {
        std::cerr << "--noop-package must not be empty\n";
        return std::nullopt;
    }

    return opts;
}

auto makeConfig(const Options& opts) -> stratum::pipeline::AnalysisConfig {
    stratum::pipeline::AnalysisConfig config;
    const bool anySelected = opts.showStructs || opts.showInterfaces || opts.showFunctions || opts.showVariables ||
                             opts.showConstants || opts.showImports;
    if (!opts.showAll && anySelected) {
        config.kinds = stratum::pipeline::ActiveKinds{
            .structs = opts.showStructs,
            .interfaces = opts.showInterfaces,
            .functions = opts.showFunctions,
            .variables = opts.showVariables,
            .constants = opts.showConstants,
            .imports = opts.showImports,
        };
    }
    config.sort_mode =
        opts.alphabetical ? stratum::pipeline::SortMode::Alphabetical : stratum::pipeline::SortMode::Topological;
    config.generate_noop = opts.generateNoOp;
    config.noop_dir = opts.noOpDir;
    config.noop_package = opts.noOpPackage;
    return config;
}

auto splitDirectories(const std::string& list) -> std::vector<std::string> {
    std::vector<std::string> directories;
    std::string::size_type start = 0;
    while (start <= list.size()) {
        auto end = list.find(',', start);
        if (end == std::string::npos) {
            end = list.size();
        }
        std::string entry = list.substr(start, end - start);
        const auto first = entry.find_first_not_of(" \t");
        const auto last = entry.find_last_not_of(" \t");
        if (first != std::string::npos) {
            directories.push_back(entry.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    std::sort(directories.begin(), directories.end());
    return directories;
}

auto readFile(const std::string& path) -> std::optional<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::nullopt;
    }
    std::string contents((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    return contents;
}

void printDiagnostics(const std::string& path, const std::vector<stratum::frontend::Diagnostic>& diagnostics) {
    for (const auto& diag : diagnostics) {
        std::cerr << path << ":[" << diag.location.line << ':' << diag.location.column << "] " << diag.message
                  << '\n';
    }
}

// Returns an error message when the file could not be analysed.
auto processFile(const std::string& path, const stratum::pipeline::AnalysisConfig& config,
                 const stratum::codegen::ContentWriter& writer) -> std::optional<std::string> {
    const auto source = readFile(path);
    if (!source.has_value()) {
        return "failed to read " + path;
    }

    const auto unit = stratum::pipeline::analyze_unit(path, *source, config, writer);
    if (!unit.success) {
        printDiagnostics(path, unit.diagnostics);
        return "failed to parse " + path + " (" + std::to_string(unit.diagnostics.size()) + " diagnostics)";
    }

    std::cout << unit.report;
    if (unit.noop_write.has_value() && !unit.noop_write->success) {
        std::cerr << "Failed to generate NoOp file " << unit.noop_write->target << ": " << unit.noop_write->message
                  << '\n';
    }
    return std::nullopt;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    const auto options = parseArgs(argc, argv);
    if (!options.has_value()) {
        return 1;
    }
    if (options->help) {
        printUsage();
        return 0;
    }

    const auto config = makeConfig(*options);

    if (config.generate_noop && !config.noop_dir.empty()) {
        std::error_code ec;
        fs::create_directories(config.noop_dir, ec);
        if (ec) {
            std::cerr << "Failed to create NoOp directory " << config.noop_dir << ": " << ec.message() << '\n';
            return 1;
        }
    }

    std::cout << "Using " << (config.sort_mode == stratum::pipeline::SortMode::Topological ? "Topological"
                                                                                            : "Alphabetical")
              << " sorting";
    if (config.generate_noop) {
        std::cout << " with NoOp generation enabled (output: " << config.noop_dir << ")";
    }
    std::cout << '\n';

    const stratum::codegen::FileSystemWriter writer;
    bool failed = false;

    if (options->filePath.has_value()) {
        if (auto error = processFile(*options->filePath, config, writer)) {
            std::cerr << "Error analyzing file " << *options->filePath << ": " << *error << '\n';
            failed = true;
        }
    }

    // An explicit --file alone does not also walk the default directory.
    const bool walkDirs = !options->filePath.has_value() || options->dirsGiven;
    if (walkDirs) {
        for (const auto& dir : splitDirectories(options->dirs)) {
            std::cout << "\n=== Analyzing directory: " << dir << " ===\n";
            const auto visit = [&config, &writer](const fs::path& path) {
                return processFile(path.string(), config, writer);
            };
            if (auto error = stratum::pipeline::walk_sources(dir, visit)) {
                std::cerr << "Error analyzing directory " << dir << ": " << *error << '\n';
                failed = true;
            }
        }
    }

    return failed ? 2 : 0;
}
