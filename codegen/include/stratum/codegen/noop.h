#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "stratum/analysis/declaration.h"

namespace stratum::codegen {

// Source text for one declaration; empty when nothing can be generated.
template <typename T>
class CodeGenerator {
   public:
    virtual ~CodeGenerator() = default;
    [[nodiscard]] virtual auto generate(const T& item) const -> std::string = 0;
};

template <typename T>
class ImplementationNamer {
   public:
    virtual ~ImplementationNamer() = default;
    [[nodiscard]] virtual auto implementationName(const T& item) const -> std::string = 0;
};

struct GeneratedStub {
    std::string name;
    std::size_t level = 0;
    std::string text;
};

// Emits `NoOp<Name>`: a struct carrying its level, a constructor, a level
// accessor, and one method per parsable signature returning zero values.
class InterfaceNoOpGenerator final : public CodeGenerator<analysis::InterfaceDecl> {
   public:
    [[nodiscard]] auto generate(const analysis::InterfaceDecl& item) const -> std::string override;
};

class InterfaceImplementationNamer final : public ImplementationNamer<analysis::InterfaceDecl> {
   public:
    [[nodiscard]] auto implementationName(const analysis::InterfaceDecl& item) const -> std::string override;
};

// One method body of `implName`, or an empty string when `signature` has no
// parsable `Name(params)` form.
[[nodiscard]] auto render_noop_method(const std::string& signature, const std::string& implName, std::size_t level)
    -> std::string;

// Header, package clause, then every stub in order.
[[nodiscard]] auto render_generated_file(const std::string& package, const std::vector<GeneratedStub>& stubs)
    -> std::string;

}  // namespace stratum::codegen
