#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "stratum/analysis/resolver.h"
#include "stratum/codegen/noop.h"
#include "stratum/codegen/writer.h"
#include "stratum/frontend/syntax.h"
#include "stratum/pipeline/capabilities.h"

namespace stratum::pipeline {

// Strategies plugged into an engine. `generator` and `namer` are optional;
// every other part is required.
template <typename T>
struct EngineParts {
    std::unique_ptr<NodeMapper<T>> mapper;
    std::unique_ptr<ItemValidator<T>> validator;
    std::unique_ptr<ResultCollector<T>> collector;
    std::unique_ptr<analysis::DependencyResolver<T>> resolver;
    std::unique_ptr<ItemRenderer<T>> renderer;
    std::unique_ptr<codegen::CodeGenerator<T>> generator;
    std::unique_ptr<codegen::ImplementationNamer<T>> namer;
};

// Drives one declaration kind: map and validate nodes, then sort, render or
// generate on request. Each request resolves the collected items afresh.
template <typename T>
class AnalysisEngine {
   public:
    explicit AnalysisEngine(EngineParts<T> parts) : parts_(std::move(parts)) {}

    // Returns true when the node produced a valid record.
    auto analyze(const frontend::SyntaxNode& node) -> bool {
        auto item = parts_.mapper->map(node);
        if (!item.has_value() || !parts_.validator->isValid(*item)) {
            return false;
        }
        parts_.collector->collect(std::move(*item));
        return true;
    }

    [[nodiscard]] auto size() const -> std::size_t { return parts_.collector->results().size(); }
    [[nodiscard]] auto hasGenerator() const -> bool { return parts_.generator != nullptr; }

    [[nodiscard]] auto sortedResults() const -> std::vector<T> {
        return parts_.resolver->resolve(parts_.collector->results());
    }

    // `[Level i] <entry>` per item; a generated implementation follows its
    // item when a generator is plugged in.
    [[nodiscard]] auto render() const -> std::string {
        std::ostringstream out;
        for (const auto& item : sortedResults()) {
            const std::string entry = parts_.renderer->render(item);
            if (entry.empty()) {
                continue;
            }
            out << "[Level " << item.level << "] " << entry << '\n';
            if (parts_.generator != nullptr) {
                const std::string code = parts_.generator->generate(item);
                if (!code.empty()) {
                    out << "\n--- NoOp Implementation ---\n" << code << '\n';
                }
            }
        }
        return out.str();
    }

    [[nodiscard]] auto generateStubs() const -> std::vector<codegen::GeneratedStub> {
        std::vector<codegen::GeneratedStub> stubs;
        if (parts_.generator == nullptr) {
            return stubs;
        }
        for (const auto& item : sortedResults()) {
            std::string code = parts_.generator->generate(item);
            if (code.empty()) {
                continue;
            }
            stubs.push_back(codegen::GeneratedStub{
                .name = parts_.namer != nullptr ? parts_.namer->implementationName(item) : std::string{},
                .level = item.level,
                .text = std::move(code),
            });
        }
        return stubs;
    }

    [[nodiscard]] auto generateDocument(const std::string& package) const -> std::optional<std::string> {
        if (parts_.generator == nullptr) {
            return std::nullopt;
        }
        return codegen::render_generated_file(package, generateStubs());
    }

    [[nodiscard]] auto writeGenerated(const std::string& target, const std::string& package,
                                      const codegen::ContentWriter& writer) const -> codegen::WriteResult {
        const auto document = generateDocument(package);
        if (!document.has_value()) {
            return codegen::WriteResult{
                .success = false,
                .target = target,
                .message = "code generator not available",
            };
        }
        return writer.write(target, *document);
    }

   private:
    EngineParts<T> parts_;
};

}  // namespace stratum::pipeline
