#include "../include/stratum/pipeline/kinds.h"

#include <cstddef>
#include <memory>
#include <sstream>

#include "stratum/analysis/dependency.h"
#include "stratum/codegen/noop.h"

namespace stratum::pipeline {
namespace {

using frontend::FieldGroup;
using frontend::SyntaxNode;
using frontend::TypeSpec;

// `name type` per declared name, or the bare type when unnamed.
[[nodiscard]] auto describe_fields(const std::vector<FieldGroup>& groups) -> std::vector<std::string> {
    std::vector<std::string> described;
    for (const auto& group : groups) {
        if (group.names.empty()) {
            described.push_back(group.type);
            continue;
        }
        for (const auto& name : group.names) {
            described.push_back(name.value + " " + group.type);
        }
    }
    return described;
}

[[nodiscard]] auto join(const std::vector<std::string>& parts) -> std::string {
    std::ostringstream out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            out << ", ";
        }
        out << parts[i];
    }
    return out.str();
}

void append_level(std::ostringstream& out, std::size_t level) {
    if (level > 0) {
        out << "\n  Level: " << level;
    }
}

[[nodiscard]] auto position_of(const UnitContext& context, const SyntaxNode& node) -> std::string {
    return frontend::format_location(context.path, node.location);
}

template <typename T, typename Extractor, typename Names>
[[nodiscard]] auto make_resolver(const AnalysisConfig& config) -> std::unique_ptr<analysis::DependencyResolver<T>> {
    if (config.sort_mode == SortMode::Alphabetical) {
        return std::make_unique<analysis::AlphabeticalResolver<T>>(std::make_unique<Names>());
    }
    return std::make_unique<analysis::TopologicalResolver<T>>(std::make_unique<Extractor>(), std::make_unique<Names>());
}

template <typename T, typename Mapper, typename Validator, typename Extractor, typename Names, typename Renderer>
[[nodiscard]] auto make_parts(const AnalysisConfig& config, const UnitContext& context) -> EngineParts<T> {
    EngineParts<T> parts;
    parts.mapper = std::make_unique<Mapper>(context);
    parts.validator = std::make_unique<Validator>();
    parts.collector = std::make_unique<VectorCollector<T>>();
    parts.resolver = make_resolver<T, Extractor, Names>(config);
    parts.renderer = std::make_unique<Renderer>();
    return parts;
}

}  // namespace

// mappers

auto StructMapper::map(const SyntaxNode& node) const -> std::optional<analysis::StructDecl> {
    if (node.kind != SyntaxNode::Kind::Type || node.type_spec.shape != TypeSpec::Shape::Struct) {
        return std::nullopt;
    }
    return analysis::StructDecl{
        .name = node.type_spec.name.value,
        .package = context_.package,
        .fields = describe_fields(node.type_spec.fields),
        .position = position_of(context_, node),
    };
}

auto InterfaceMapper::map(const SyntaxNode& node) const -> std::optional<analysis::InterfaceDecl> {
    if (node.kind != SyntaxNode::Kind::Type || node.type_spec.shape != TypeSpec::Shape::Interface) {
        return std::nullopt;
    }

    std::vector<std::string> methods;
    for (const auto& element : node.type_spec.elements) {
        if (element.kind == frontend::InterfaceElement::Kind::Embedded) {
            methods.push_back(element.embedded_type);
            continue;
        }
        // `func(T) R` becomes `Name(T) R`.
        const std::string signature = frontend::format_func_type(element.parameters, element.results);
        methods.push_back(element.name.value + signature.substr(4));
    }

    return analysis::InterfaceDecl{
        .name = node.type_spec.name.value,
        .package = context_.package,
        .methods = std::move(methods),
        .position = position_of(context_, node),
    };
}

auto FunctionMapper::map(const SyntaxNode& node) const -> std::optional<analysis::FunctionDecl> {
    if (node.kind != SyntaxNode::Kind::Func) {
        return std::nullopt;
    }
    const auto& decl = node.func_decl;
    return analysis::FunctionDecl{
        .name = decl.name.value,
        .package = context_.package,
        .receiver = decl.receiver.value_or(std::string{}),
        .parameters = describe_fields(decl.parameters),
        .returns = describe_fields(decl.results),
        .position = position_of(context_, node),
    };
}

auto VariableMapper::map(const SyntaxNode& node) const -> std::optional<analysis::VariableDecl> {
    if (node.kind != SyntaxNode::Kind::Var || node.value_spec.names.empty()) {
        return std::nullopt;
    }
    const auto& spec = node.value_spec;
    std::string type = spec.type;
    if (type.empty() && !spec.values.empty()) {
        type = "inferred";
    }
    return analysis::VariableDecl{
        .name = spec.names.front().value,
        .package = context_.package,
        .type = std::move(type),
        .position = frontend::format_location(context_.path, spec.names.front().location),
    };
}

auto ConstantMapper::map(const SyntaxNode& node) const -> std::optional<analysis::ConstantDecl> {
    if (node.kind != SyntaxNode::Kind::Const || node.value_spec.names.empty()) {
        return std::nullopt;
    }
    const auto& spec = node.value_spec;
    return analysis::ConstantDecl{
        .name = spec.names.front().value,
        .package = context_.package,
        .type = spec.type,
        .value = spec.values.empty() ? std::string{} : spec.values.front(),
        .position = frontend::format_location(context_.path, spec.names.front().location),
    };
}

auto ImportMapper::map(const SyntaxNode& node) const -> std::optional<analysis::ImportDecl> {
    if (node.kind != SyntaxNode::Kind::Import) {
        return std::nullopt;
    }
    const auto& spec = node.import_spec;
    return analysis::ImportDecl{
        .name = spec.alias.has_value() ? spec.alias->value : std::string{},
        .path = spec.path,
        .position = position_of(context_, node),
    };
}

// validators and graph names

auto ImportValidator::isValid(const analysis::ImportDecl& item) const -> bool { return !item.path.empty(); }

auto FunctionNameProvider::typeName(const analysis::FunctionDecl& item) const -> std::string {
    if (item.receiver.empty()) {
        return item.name;
    }
    return item.receiver + "." + item.name;
}

auto ImportNameProvider::typeName(const analysis::ImportDecl& item) const -> std::string { return item.path; }

// dependency extractors

auto StructDependencies::extract(const analysis::StructDecl& item) const -> std::vector<std::string> {
    return analysis::collect_dependencies(item.fields, item.name);
}

auto InterfaceDependencies::extract(const analysis::InterfaceDecl& item) const -> std::vector<std::string> {
    return analysis::collect_dependencies(item.methods, item.name);
}

auto FunctionDependencies::extract(const analysis::FunctionDecl& item) const -> std::vector<std::string> {
    std::vector<std::string> fragments;
    if (!item.receiver.empty()) {
        fragments.push_back(item.receiver);
    }
    fragments.insert(fragments.end(), item.parameters.begin(), item.parameters.end());
    fragments.insert(fragments.end(), item.returns.begin(), item.returns.end());
    return analysis::collect_dependencies(fragments, FunctionNameProvider{}.typeName(item));
}

auto VariableDependencies::extract(const analysis::VariableDecl& item) const -> std::vector<std::string> {
    return analysis::collect_dependencies({item.type}, item.name);
}

auto ConstantDependencies::extract(const analysis::ConstantDecl& item) const -> std::vector<std::string> {
    return analysis::collect_dependencies({item.type}, item.name);
}

auto ImportDependencies::extract(const analysis::ImportDecl& /*item*/) const -> std::vector<std::string> {
    return {};
}

// renderers

auto StructRenderer::render(const analysis::StructDecl& item) const -> std::string {
    if (item.name.empty()) {
        return {};
    }
    std::ostringstream out;
    out << "Struct: " << item.name << " (Package: " << item.package << ") at " << item.position;
    if (!item.fields.empty()) {
        out << "\n  Fields: " << join(item.fields);
    }
    append_level(out, item.level);
    return out.str();
}

auto InterfaceRenderer::render(const analysis::InterfaceDecl& item) const -> std::string {
    if (item.name.empty()) {
        return {};
    }
    std::ostringstream out;
    out << "Interface: " << item.name << " (Package: " << item.package << ") at " << item.position;
    if (!item.methods.empty()) {
        out << "\n  Methods: " << join(item.methods);
    }
    append_level(out, item.level);
    return out.str();
}

auto FunctionRenderer::render(const analysis::FunctionDecl& item) const -> std::string {
    if (item.name.empty()) {
        return {};
    }
    std::ostringstream out;
    if (item.receiver.empty()) {
        out << "Function: " << item.name << " (Package: " << item.package << ") at " << item.position;
    } else {
        out << "Method: " << item.name << " (Receiver: " << item.receiver << ", Package: " << item.package
            << ") at " << item.position;
    }
    if (!item.parameters.empty()) {
        out << "\n  Parameters: " << join(item.parameters);
    }
    if (!item.returns.empty()) {
        out << "\n  Returns: " << join(item.returns);
    }
    append_level(out, item.level);
    return out.str();
}

auto VariableRenderer::render(const analysis::VariableDecl& item) const -> std::string {
    if (item.name.empty()) {
        return {};
    }
    std::ostringstream out;
    out << "Variable: " << item.name << ' ' << item.type << " (Package: " << item.package << ") at "
        << item.position;
    append_level(out, item.level);
    return out.str();
}

auto ConstantRenderer::render(const analysis::ConstantDecl& item) const -> std::string {
    if (item.name.empty()) {
        return {};
    }
    std::ostringstream out;
    out << "Constant: " << item.name;
    if (!item.type.empty()) {
        out << ' ' << item.type;
    }
    if (!item.value.empty()) {
        out << " = " << item.value;
    }
    out << " (Package: " << item.package << ") at " << item.position;
    append_level(out, item.level);
    return out.str();
}

auto ImportRenderer::render(const analysis::ImportDecl& item) const -> std::string {
    if (item.path.empty()) {
        return {};
    }
    std::ostringstream out;
    out << "Import: " << item.path;
    if (!item.name.empty() && item.name != ".") {
        out << " as " << item.name;
    }
    out << " at " << item.position;
    append_level(out, item.level);
    return out.str();
}

// engine assembly

auto make_struct_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::StructDecl> {
    using analysis::StructDecl;
    return AnalysisEngine<StructDecl>(make_parts<StructDecl, StructMapper, NamedValidator<StructDecl>,
                                                 StructDependencies, NameProvider<StructDecl>, StructRenderer>(
        config, context));
}

auto make_interface_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::InterfaceDecl> {
    using analysis::InterfaceDecl;
    auto parts = make_parts<InterfaceDecl, InterfaceMapper, NamedValidator<InterfaceDecl>, InterfaceDependencies,
                            NameProvider<InterfaceDecl>, InterfaceRenderer>(config, context);
    if (config.generate_noop) {
        parts.generator = std::make_unique<codegen::InterfaceNoOpGenerator>();
        parts.namer = std::make_unique<codegen::InterfaceImplementationNamer>();
    }
    return AnalysisEngine<InterfaceDecl>(std::move(parts));
}

auto make_function_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::FunctionDecl> {
    using analysis::FunctionDecl;
    return AnalysisEngine<FunctionDecl>(make_parts<FunctionDecl, FunctionMapper, NamedValidator<FunctionDecl>,
                                                   FunctionDependencies, FunctionNameProvider, FunctionRenderer>(
        config, context));
}

auto make_variable_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::VariableDecl> {
    using analysis::VariableDecl;
    return AnalysisEngine<VariableDecl>(make_parts<VariableDecl, VariableMapper, NamedValidator<VariableDecl>,
                                                   VariableDependencies, NameProvider<VariableDecl>, VariableRenderer>(
        config, context));
}

auto make_constant_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::ConstantDecl> {
    using analysis::ConstantDecl;
    return AnalysisEngine<ConstantDecl>(make_parts<ConstantDecl, ConstantMapper, NamedValidator<ConstantDecl>,
                                                   ConstantDependencies, NameProvider<ConstantDecl>, ConstantRenderer>(
        config, context));
}

auto make_import_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::ImportDecl> {
    using analysis::ImportDecl;
    return AnalysisEngine<ImportDecl>(make_parts<ImportDecl, ImportMapper, ImportValidator, ImportDependencies,
                                                 ImportNameProvider, ImportRenderer>(config, context));
}

}  // namespace stratum::pipeline
