#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "stratum/analysis/declaration.h"
#include "stratum/analysis/resolver.h"
#include "stratum/pipeline/capabilities.h"
#include "stratum/pipeline/config.h"
#include "stratum/pipeline/engine.h"

namespace stratum::pipeline {

// What a mapper needs to know about the file its nodes come from.
struct UnitContext {
    std::string path;
    std::string package;
};

// --- mappers ---------------------------------------------------------------

class StructMapper final : public NodeMapper<analysis::StructDecl> {
   public:
    explicit StructMapper(UnitContext context) : context_(std::move(context)) {}
    [[nodiscard]] auto map(const frontend::SyntaxNode& node) const -> std::optional<analysis::StructDecl> override;

   private:
    UnitContext context_;
};

class InterfaceMapper final : public NodeMapper<analysis::InterfaceDecl> {
   public:
    explicit InterfaceMapper(UnitContext context) : context_(std::move(context)) {}
    [[nodiscard]] auto map(const frontend::SyntaxNode& node) const -> std::optional<analysis::InterfaceDecl> override;

   private:
    UnitContext context_;
};

class FunctionMapper final : public NodeMapper<analysis::FunctionDecl> {
   public:
    explicit FunctionMapper(UnitContext context) : context_(std::move(context)) {}
    [[nodiscard]] auto map(const frontend::SyntaxNode& node) const -> std::optional<analysis::FunctionDecl> override;

   private:
    UnitContext context_;
};

class VariableMapper final : public NodeMapper<analysis::VariableDecl> {
   public:
    explicit VariableMapper(UnitContext context) : context_(std::move(context)) {}
    [[nodiscard]] auto map(const frontend::SyntaxNode& node) const -> std::optional<analysis::VariableDecl> override;

   private:
    UnitContext context_;
};

class ConstantMapper final : public NodeMapper<analysis::ConstantDecl> {
   public:
    explicit ConstantMapper(UnitContext context) : context_(std::move(context)) {}
    [[nodiscard]] auto map(const frontend::SyntaxNode& node) const -> std::optional<analysis::ConstantDecl> override;

   private:
    UnitContext context_;
};

class ImportMapper final : public NodeMapper<analysis::ImportDecl> {
   public:
    explicit ImportMapper(UnitContext context) : context_(std::move(context)) {}
    [[nodiscard]] auto map(const frontend::SyntaxNode& node) const -> std::optional<analysis::ImportDecl> override;

   private:
    UnitContext context_;
};

// --- validators --------------------------------------------------------------

// Every kind but imports is valid once it has a name.
template <typename T>
class NamedValidator final : public ItemValidator<T> {
   public:
    [[nodiscard]] auto isValid(const T& item) const -> bool override { return !item.name.empty(); }
};

class ImportValidator final : public ItemValidator<analysis::ImportDecl> {
   public:
    [[nodiscard]] auto isValid(const analysis::ImportDecl& item) const -> bool override;
};

// --- graph names -------------------------------------------------------------

template <typename T>
class NameProvider final : public analysis::TypeNameProvider<T> {
   public:
    [[nodiscard]] auto typeName(const T& item) const -> std::string override { return item.name; }
};

// `Receiver.Name` for methods.
class FunctionNameProvider final : public analysis::TypeNameProvider<analysis::FunctionDecl> {
   public:
    [[nodiscard]] auto typeName(const analysis::FunctionDecl& item) const -> std::string override;
};

class ImportNameProvider final : public analysis::TypeNameProvider<analysis::ImportDecl> {
   public:
    [[nodiscard]] auto typeName(const analysis::ImportDecl& item) const -> std::string override;
};

// --- dependency extractors ---------------------------------------------------

class StructDependencies final : public analysis::DependencyExtractor<analysis::StructDecl> {
   public:
    [[nodiscard]] auto extract(const analysis::StructDecl& item) const -> std::vector<std::string> override;
};

class InterfaceDependencies final : public analysis::DependencyExtractor<analysis::InterfaceDecl> {
   public:
    [[nodiscard]] auto extract(const analysis::InterfaceDecl& item) const -> std::vector<std::string> override;
};

class FunctionDependencies final : public analysis::DependencyExtractor<analysis::FunctionDecl> {
   public:
    [[nodiscard]] auto extract(const analysis::FunctionDecl& item) const -> std::vector<std::string> override;
};

class VariableDependencies final : public analysis::DependencyExtractor<analysis::VariableDecl> {
   public:
    [[nodiscard]] auto extract(const analysis::VariableDecl& item) const -> std::vector<std::string> override;
};

class ConstantDependencies final : public analysis::DependencyExtractor<analysis::ConstantDecl> {
   public:
    [[nodiscard]] auto extract(const analysis::ConstantDecl& item) const -> std::vector<std::string> override;
};

// Imports never depend on each other.
class ImportDependencies final : public analysis::DependencyExtractor<analysis::ImportDecl> {
   public:
    [[nodiscard]] auto extract(const analysis::ImportDecl& item) const -> std::vector<std::string> override;
};

// --- renderers ---------------------------------------------------------------

class StructRenderer final : public ItemRenderer<analysis::StructDecl> {
   public:
    [[nodiscard]] auto render(const analysis::StructDecl& item) const -> std::string override;
};

class InterfaceRenderer final : public ItemRenderer<analysis::InterfaceDecl> {
   public:
    [[nodiscard]] auto render(const analysis::InterfaceDecl& item) const -> std::string override;
};

class FunctionRenderer final : public ItemRenderer<analysis::FunctionDecl> {
   public:
    [[nodiscard]] auto render(const analysis::FunctionDecl& item) const -> std::string override;
};

class VariableRenderer final : public ItemRenderer<analysis::VariableDecl> {
   public:
    [[nodiscard]] auto render(const analysis::VariableDecl& item) const -> std::string override;
};

class ConstantRenderer final : public ItemRenderer<analysis::ConstantDecl> {
   public:
    [[nodiscard]] auto render(const analysis::ConstantDecl& item) const -> std::string override;
};

class ImportRenderer final : public ItemRenderer<analysis::ImportDecl> {
   public:
    [[nodiscard]] auto render(const analysis::ImportDecl& item) const -> std::string override;
};

// --- engine assembly ---------------------------------------------------------

[[nodiscard]] auto make_struct_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::StructDecl>;
// Carries the no-op generator when `config.generate_noop` is set.
[[nodiscard]] auto make_interface_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::InterfaceDecl>;
[[nodiscard]] auto make_function_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::FunctionDecl>;
[[nodiscard]] auto make_variable_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::VariableDecl>;
[[nodiscard]] auto make_constant_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::ConstantDecl>;
[[nodiscard]] auto make_import_engine(const AnalysisConfig& config, const UnitContext& context)
    -> AnalysisEngine<analysis::ImportDecl>;

}  // namespace stratum::pipeline
