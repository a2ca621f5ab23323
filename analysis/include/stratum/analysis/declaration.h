#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stratum::analysis {

// Declaration records. Shape fields hold rendered type text; `level` is
// assigned by a resolver and is never read from the source.

struct StructDecl {
    std::string name;
    std::string package;
    std::vector<std::string> fields;  // "name type", or "type" when embedded
    std::string position;
    std::size_t level = 0;
};

struct InterfaceDecl {
    std::string name;
    std::string package;
    std::vector<std::string> methods;  // "Name(T1, T2) R", or an embedded type
    std::string position;
    std::size_t level = 0;
};

struct FunctionDecl {
    std::string name;
    std::string package;
    std::string receiver;
    std::vector<std::string> parameters;
    std::vector<std::string> returns;
    std::string position;
    std::size_t level = 0;
};

struct VariableDecl {
    std::string name;
    std::string package;
    std::string type;
    std::string position;
    std::size_t level = 0;
};

struct ConstantDecl {
    std::string name;
    std::string package;
    std::string type;
    std::string value;
    std::string position;
    std::size_t level = 0;
};

struct ImportDecl {
    std::string name;  // alias, empty when absent
    std::string path;
    std::string position;
    std::size_t level = 0;
};

}  // namespace stratum::analysis
