#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace stratum::analysis {

// Directed graph over declaration names. An edge runs from a dependency to
// each of its dependents; in-degree counts the dependencies of a vertex.
class DependencyGraph {
   public:
    void addVertex(const std::string& name);
    // Both endpoints must already be vertices. Returns false otherwise.
    auto addEdge(const std::string& dependency, const std::string& dependent) -> bool;

    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto inDegree(const std::string& name) const -> std::size_t;
    [[nodiscard]] auto dependents(const std::string& name) const -> const std::vector<std::string>&;
    [[nodiscard]] auto vertexCount() const -> std::size_t;

    // Kahn's algorithm. The lexicographically smallest ready vertex is emitted
    // at every step. Vertices on a cycle never become ready and are missing
    // from the result.
    [[nodiscard]] auto topologicalOrder() const -> std::vector<std::string>;

   private:
    std::unordered_map<std::string, std::vector<std::string>> dependents_;
    std::unordered_map<std::string, std::size_t> in_degree_;
};

}  // namespace stratum::analysis
