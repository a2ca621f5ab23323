#include "../include/stratum/analysis/graph.h"

#include <set>
#include <utility>

namespace stratum::analysis {

void DependencyGraph::addVertex(const std::string& name) {
    dependents_.try_emplace(name);
    in_degree_.try_emplace(name, 0);
}

auto DependencyGraph::addEdge(const std::string& dependency, const std::string& dependent) -> bool {
    if (!contains(dependency) || !contains(dependent)) {
        return false;
    }
    dependents_[dependency].push_back(dependent);
    ++in_degree_[dependent];
    return true;
}

auto DependencyGraph::contains(const std::string& name) const -> bool { return in_degree_.count(name) != 0; }

auto DependencyGraph::inDegree(const std::string& name) const -> std::size_t {
    const auto it = in_degree_.find(name);
    return it == in_degree_.end() ? 0 : it->second;
}

auto DependencyGraph::dependents(const std::string& name) const -> const std::vector<std::string>& {
    static const std::vector<std::string> kNone;
    const auto it = dependents_.find(name);
    return it == dependents_.end() ? kNone : it->second;
}

auto DependencyGraph::vertexCount() const -> std::size_t { return in_degree_.size(); }

auto DependencyGraph::topologicalOrder() const -> std::vector<std::string> {
    std::unordered_map<std::string, std::size_t> remaining = in_degree_;
    std::set<std::string> ready;
    for (const auto& [name, degree] : remaining) {
        if (degree == 0) {
            ready.insert(name);
        }
    }

    std::vector<std::string> order;
    order.reserve(remaining.size());
    while (!ready.empty()) {
        std::string current = *ready.begin();
        ready.erase(ready.begin());

        for (const auto& dependent : dependents(current)) {
            auto& degree = remaining[dependent];
            if (--degree == 0) {
                ready.insert(dependent);
            }
        }
        order.push_back(std::move(current));
    }
    return order;
}

}  // namespace stratum::analysis
