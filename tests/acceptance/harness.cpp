#include "harness.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "stratum/codegen/writer.h"
#include "stratum/pipeline/config.h"
#include "stratum/pipeline/unit.h"

namespace stratum::tests::acceptance {
namespace {

using stratum::pipeline::AnalysisConfig;

// Keeps the generated document in memory instead of touching the disk.
class CapturingWriter final : public stratum::codegen::ContentWriter {
   public:
    [[nodiscard]] auto write(const std::string& target, const std::string& content) const
        -> stratum::codegen::WriteResult override {
        target_ = target;
        content_ = content;
        return stratum::codegen::WriteResult{.success = true, .target = target};
    }

    [[nodiscard]] auto target() const -> const std::string& { return target_; }
    [[nodiscard]] auto content() const -> const std::optional<std::string>& { return content_; }

   private:
    mutable std::string target_;
    mutable std::optional<std::string> content_;
};

[[nodiscard]] auto source_root() -> std::filesystem::path {
    static const std::filesystem::path root = std::filesystem::path{__FILE__}.parent_path();
    return root;
}

[[nodiscard]] auto cases_root() -> std::filesystem::path { return source_root() / "cases"; }

[[nodiscard]] auto read_text_file(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

[[nodiscard]] auto collect_cases() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> cases;
    const auto root = cases_root();
    if (!std::filesystem::exists(root)) {
        return cases;
    }
    for (const auto& entry : std::filesystem::directory_iterator(root)) {
        if (!entry.is_directory()) {
            continue;
        }
        if (std::filesystem::exists(entry.path() / "input.go")) {
            cases.push_back(entry.path());
        }
    }
    std::sort(cases.begin(), cases.end());
    return cases;
}

[[nodiscard]] auto compare_output(const std::filesystem::path& expected_path, const std::string& actual)
    -> std::optional<std::string> {
    const auto expected = read_text_file(expected_path);
    if (!expected.has_value()) {
        return "missing expectation: " + expected_path.filename().string();
    }
    if (*expected == actual) {
        return std::nullopt;
    }

    std::istringstream exp_stream(*expected);
    std::istringstream act_stream(actual);
    std::string exp_line;
    std::string act_line;
    std::size_t line = 1;
    while (true) {
        const bool exp_ok = static_cast<bool>(std::getline(exp_stream, exp_line));
        const bool act_ok = static_cast<bool>(std::getline(act_stream, act_line));
        if (!exp_ok && !act_ok) {
            break;
        }
        if (!exp_ok || !act_ok) {
            return std::string{"length mismatch at line "} + std::to_string(line);
        }
        if (exp_line != act_line) {
            std::ostringstream diff;
            diff << "line " << line << " differs\n  expected: " << exp_line << "\n    actual: " << act_line;
            return diff.str();
        }
        ++line;
    }

    return std::string{"trailing newline differs"};
}

[[nodiscard]] auto parse_kinds(std::string_view list, stratum::pipeline::ActiveKinds& kinds) -> bool {
    kinds = stratum::pipeline::ActiveKinds{false, false, false, false, false, false};
    std::string entry;
    std::istringstream stream{std::string{list}};
    while (std::getline(stream, entry, ',')) {
        if (entry == "structs") {
            kinds.structs = true;
        } else if (entry == "interfaces") {
            kinds.interfaces = true;
        } else if (entry == "functions") {
            kinds.functions = true;
        } else if (entry == "variables") {
            kinds.variables = true;
        } else if (entry == "constants") {
            kinds.constants = true;
        } else if (entry == "imports") {
            kinds.imports = true;
        } else {
            return false;
        }
    }
    return true;
}

// options.txt holds one directive per line:
//   kinds <a,b,...>   sort alpha   noop   package <name>
[[nodiscard]] auto load_config(const std::filesystem::path& case_path, std::vector<std::string>& errors)
    -> AnalysisConfig {
    AnalysisConfig config;
    config.noop_dir = "noop";

    const auto options = read_text_file(case_path / "options.txt");
    if (!options.has_value()) {
        return config;
    }

    std::istringstream lines(*options);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream words(line);
        std::string key;
        std::string value;
        words >> key >> value;
        if (key.empty()) {
            continue;
        }
        if (key == "kinds" && parse_kinds(value, config.kinds)) {
            continue;
        }
        if (key == "sort" && value == "alpha") {
            config.sort_mode = stratum::pipeline::SortMode::Alphabetical;
            continue;
        }
        if (key == "noop") {
            config.generate_noop = true;
            continue;
        }
        if (key == "package" && !value.empty()) {
            config.noop_package = value;
            continue;
        }
        errors.push_back("unknown option: " + line);
    }
    return config;
}

}  // namespace

auto run_suite() -> std::vector<CaseReport> {
    std::vector<CaseReport> reports;
    const auto case_paths = collect_cases();
    reports.reserve(case_paths.size());

    for (const auto& case_path : case_paths) {
        CaseReport report;
        report.name = case_path.filename().string();

        const auto source = read_text_file(case_path / "input.go");
        if (!source.has_value()) {
            report.messages.emplace_back("failed to read input.go");
            reports.push_back(std::move(report));
            continue;
        }

        const AnalysisConfig config = load_config(case_path, report.messages);
        if (!report.messages.empty()) {
            reports.push_back(std::move(report));
            continue;
        }

        const CapturingWriter writer;
        const auto unit = stratum::pipeline::analyze_unit("input.go", *source, config, writer);
        if (!unit.success) {
            for (const auto& diag : unit.diagnostics) {
                std::ostringstream message;
                message << "diagnostic [" << diag.location.line << ':' << diag.location.column << "] "
                        << diag.message;
                report.messages.emplace_back(message.str());
            }
            reports.push_back(std::move(report));
            continue;
        }

        bool success = true;
        if (const auto diff = compare_output(case_path / "expected.report.txt", unit.report)) {
            success = false;
            report.messages.emplace_back("report: " + *diff);
        }

        const auto noop_expected = case_path / "expected.noop.go";
        if (std::filesystem::exists(noop_expected)) {
            if (!writer.content().has_value()) {
                success = false;
                report.messages.emplace_back("noop: nothing was written");
            } else if (const auto diff = compare_output(noop_expected, *writer.content())) {
                success = false;
                report.messages.emplace_back("noop: " + *diff);
            }
        } else if (writer.content().has_value()) {
            success = false;
            report.messages.emplace_back("noop: unexpected output at " + writer.target());
        }

        report.success = success;
        reports.push_back(std::move(report));
    }

    return reports;
}

}  // namespace stratum::tests::acceptance
