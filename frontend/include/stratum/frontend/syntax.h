#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stratum::frontend {

struct SourceLocation {
    size_t line = 0;
    size_t column = 0;
};

struct Identifier {
    std::string value;
    SourceLocation location;
};

struct Diagnostic {
    SourceLocation location;
    std::string message;
};

// A run of names sharing one rendered type: `a, b int` or an unnamed `int`.
struct FieldGroup {
    std::vector<Identifier> names;
    std::string type;
};

struct InterfaceElement {
    enum class Kind : std::uint8_t {
        Method,
        Embedded,
    } kind = Kind::Method;

    Identifier name;
    std::vector<FieldGroup> parameters;
    std::vector<FieldGroup> results;
    std::string embedded_type;
};

struct TypeSpec {
    enum class Shape : std::uint8_t {
        Struct,
        Interface,
        Other,
    };

    Identifier name;
    Shape shape = Shape::Other;
    std::vector<FieldGroup> fields;
    std::vector<InterfaceElement> elements;
    std::string underlying;
};

struct FuncDecl {
    Identifier name;
    std::optional<std::string> receiver;
    std::vector<FieldGroup> parameters;
    std::vector<FieldGroup> results;
    bool has_body = false;
};

struct ValueSpec {
    std::vector<Identifier> names;
    std::string type;
    std::vector<std::string> values;
};

struct ImportSpec {
    std::optional<Identifier> alias;
    std::string path;
    SourceLocation location;
};

struct SyntaxNode {
    enum class Kind : std::uint8_t {
        Type,
        Func,
        Var,
        Const,
        Import,
    } kind = Kind::Type;

    SourceLocation location;
    TypeSpec type_spec;
    FuncDecl func_decl;
    ValueSpec value_spec;
    ImportSpec import_spec;
};

struct SourceFile {
    std::string path;
    Identifier package;
    std::vector<SyntaxNode> nodes;
};

struct ScanResult {
    SourceFile file;
    std::vector<Diagnostic> diagnostics;
    bool success = true;
};

// Renders a parameter or result list as a function type does: names dropped,
// the type repeated once per grouped name.
[[nodiscard]] auto flatten_types(const std::vector<FieldGroup>& groups) -> std::vector<std::string>;

// `func(T1, T2) R` / `func(T1) (R1, R2)`.
[[nodiscard]] auto format_func_type(const std::vector<FieldGroup>& parameters, const std::vector<FieldGroup>& results)
    -> std::string;

[[nodiscard]] auto format_location(const std::string& path, const SourceLocation& location) -> std::string;

}  // namespace stratum::frontend
