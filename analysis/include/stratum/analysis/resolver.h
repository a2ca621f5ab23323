#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "stratum/analysis/graph.h"

namespace stratum::analysis {

// Names of other declarations that `item` refers to, without itself.
template <typename T>
class DependencyExtractor {
   public:
    virtual ~DependencyExtractor() = default;
    [[nodiscard]] virtual auto extract(const T& item) const -> std::vector<std::string> = 0;
};

// The vertex name of `item` in the dependency graph.
template <typename T>
class TypeNameProvider {
   public:
    virtual ~TypeNameProvider() = default;
    [[nodiscard]] virtual auto typeName(const T& item) const -> std::string = 0;
};

// Orders a set of declarations and assigns each its level.
template <typename T>
class DependencyResolver {
   public:
    virtual ~DependencyResolver() = default;
    [[nodiscard]] virtual auto resolve(std::vector<T> items) const -> std::vector<T> = 0;
};

template <typename T>
class TopologicalResolver final : public DependencyResolver<T> {
   public:
    TopologicalResolver(std::unique_ptr<DependencyExtractor<T>> extractor, std::unique_ptr<TypeNameProvider<T>> names)
        : extractor_(std::move(extractor)), names_(std::move(names)) {}

    [[nodiscard]] auto resolve(std::vector<T> items) const -> std::vector<T> override {
        std::vector<std::string> keys;
        keys.reserve(items.size());
        // A later declaration with the same name replaces the earlier one.
        std::unordered_map<std::string, std::size_t> byName;
        for (std::size_t i = 0; i < items.size(); ++i) {
            keys.push_back(names_->typeName(items[i]));
            if (!keys.back().empty()) {
                byName[keys.back()] = i;
            }
        }

        DependencyGraph graph;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (isRegistered(byName, keys[i], i)) {
                graph.addVertex(keys[i]);
            }
        }
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (!isRegistered(byName, keys[i], i)) {
                continue;
            }
            for (const auto& dependency : extractor_->extract(items[i])) {
                // Unknown names cannot affect the order.
                (void)graph.addEdge(dependency, keys[i]);
            }
        }

        std::vector<T> ordered;
        ordered.reserve(items.size());
        std::unordered_set<std::string> processed;
        for (const auto& name : graph.topologicalOrder()) {
            ordered.push_back(items[byName.at(name)]);
            processed.insert(name);
        }

        // Declarations left on a cycle follow in input order.
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (processed.count(keys[i]) == 0) {
                ordered.push_back(std::move(items[i]));
            }
        }

        for (std::size_t level = 0; level < ordered.size(); ++level) {
            ordered[level].level = level;
        }
        return ordered;
    }

   private:
    [[nodiscard]] static auto isRegistered(const std::unordered_map<std::string, std::size_t>& byName,
                                           const std::string& key, std::size_t index) -> bool {
        const auto it = byName.find(key);
        return it != byName.end() && it->second == index;
    }

    std::unique_ptr<DependencyExtractor<T>> extractor_;
    std::unique_ptr<TypeNameProvider<T>> names_;
};

// Orders by graph name alone; dependencies are ignored.
template <typename T>
class AlphabeticalResolver final : public DependencyResolver<T> {
   public:
    explicit AlphabeticalResolver(std::unique_ptr<TypeNameProvider<T>> names) : names_(std::move(names)) {}

    [[nodiscard]] auto resolve(std::vector<T> items) const -> std::vector<T> override {
        std::stable_sort(items.begin(), items.end(),
                         [this](const T& lhs, const T& rhs) { return names_->typeName(lhs) < names_->typeName(rhs); });
        for (std::size_t level = 0; level < items.size(); ++level) {
            items[level].level = level;
        }
        return items;
    }

   private:
    std::unique_ptr<TypeNameProvider<T>> names_;
};

}  // namespace stratum::analysis
