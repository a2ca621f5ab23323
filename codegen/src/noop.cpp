#include "../include/stratum/codegen/noop.h"

#include <sstream>

#include "../include/stratum/codegen/signature.h"

namespace stratum::codegen {

auto render_noop_method(const std::string& signature, const std::string& implName, std::size_t level)
    -> std::string {
    const auto method = parse_method_signature(signature);
    if (!method.has_value()) {
        return {};
    }

    std::ostringstream out;
    out << "// " << method->name << " is a no-op implementation (Level " << level << ")\n";
    out << "func (n *" << implName << ") " << method->name << '(' << method->parameters << ')';
    if (!method->returns.empty()) {
        out << ' ' << method->returns;
    }
    out << " {\n";
    out << "\t// " << method->name << " does nothing (Level " << level << ")\n";

    const std::string zeros = zero_values_for(method->returns);
    if (!zeros.empty()) {
        out << "\treturn " << zeros << '\n';
    }
    out << '}';
    return out.str();
}

auto InterfaceNoOpGenerator::generate(const analysis::InterfaceDecl& item) const -> std::string {
    if (item.name.empty()) {
        return {};
    }

    const std::string implName = InterfaceImplementationNamer{}.implementationName(item);
    std::ostringstream out;

    out << "// " << implName << " is a no-op implementation of " << item.name << " interface (Level " << item.level
        << ")\n";
    out << "type " << implName << " struct {\n";
    out << "\tlevel int // Dependency level: " << item.level << '\n';
    out << "}\n\n";

    out << "// New" << implName << " creates a new no-op implementation at the specified level\n";
    out << "func New" << implName << "(level int) *" << implName << " {\n";
    out << "\treturn &" << implName << "{level: level}\n";
    out << "}\n\n";

    out << "// GetLevel returns the dependency level of this " << implName << '\n';
    out << "func (n *" << implName << ") GetLevel() int {\n";
    out << "\treturn n.level\n";
    out << "}\n\n";

    for (const auto& signature : item.methods) {
        const std::string method = render_noop_method(signature, implName, item.level);
        if (!method.empty()) {
            out << method << '\n';
        }
    }

    return out.str();
}

auto InterfaceImplementationNamer::implementationName(const analysis::InterfaceDecl& item) const -> std::string {
    return "NoOp" + item.name;
}

auto render_generated_file(const std::string& package, const std::vector<GeneratedStub>& stubs) -> std::string {
    std::ostringstream out;
    out << "// Code generated by stratum; DO NOT EDIT.\n\n";
    out << "package " << package << "\n\n";
    for (const auto& stub : stubs) {
        out << stub.text << '\n';
    }
    return out.str();
}

}  // namespace stratum::codegen
