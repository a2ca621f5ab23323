#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "../analysis/include/stratum/analysis/graph.h"
#include "../analysis/include/stratum/analysis/resolver.h"

using stratum::analysis::AlphabeticalResolver;
using stratum::analysis::DependencyExtractor;
using stratum::analysis::DependencyGraph;
using stratum::analysis::TopologicalResolver;
using stratum::analysis::TypeNameProvider;

namespace {

struct Item {
    std::string name;
    std::vector<std::string> uses;
    int tag = 0;
    std::size_t level = 0;
};

class ItemUses final : public DependencyExtractor<Item> {
   public:
    [[nodiscard]] auto extract(const Item& item) const -> std::vector<std::string> override {
        std::vector<std::string> uses;
        for (const auto& name : item.uses) {
            if (name != item.name) {
                uses.push_back(name);
            }
        }
        return uses;
    }
};

class ItemName final : public TypeNameProvider<Item> {
   public:
    [[nodiscard]] auto typeName(const Item& item) const -> std::string override { return item.name; }
};

auto topo(std::vector<Item> items) -> std::vector<Item> {
    const TopologicalResolver<Item> resolver(std::make_unique<ItemUses>(), std::make_unique<ItemName>());
    return resolver.resolve(std::move(items));
}

auto names(const std::vector<Item>& items) -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(items.size());
    for (const auto& item : items) {
        result.push_back(item.name);
    }
    return result;
}

void expectLevelsMatchPositions(const std::vector<Item>& items) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        EXPECT_EQ(items[i].level, i) << "at " << items[i].name;
    }
}

}  // namespace

TEST(GraphTest, IndependentItemsByName) {
    const auto ordered = topo({Item{.name = "Bravo"}, Item{.name = "Alpha"}});
    EXPECT_EQ(names(ordered), (std::vector<std::string>{"Alpha", "Bravo"}));
    expectLevelsMatchPositions(ordered);
}

TEST(GraphTest, ChainFollowsDependencies) {
    const auto ordered = topo({
        Item{.name = "C", .uses = {"B"}},
        Item{.name = "A"},
        Item{.name = "B", .uses = {"A"}},
    });
    EXPECT_EQ(names(ordered), (std::vector<std::string>{"A", "B", "C"}));
    expectLevelsMatchPositions(ordered);
}

TEST(GraphTest, DiamondIsOrderedAndValid) {
    const std::vector<Item> input = {
        Item{.name = "D", .uses = {"B", "C"}},
        Item{.name = "B", .uses = {"A"}},
        Item{.name = "E"},
        Item{.name = "C", .uses = {"A"}},
        Item{.name = "A"},
    };
    const auto ordered = topo(input);
    ASSERT_EQ(ordered.size(), input.size());
    EXPECT_EQ(names(ordered), (std::vector<std::string>{"A", "B", "C", "D", "E"}));

    // Every dependency appears before its dependent.
    const auto order = names(ordered);
    for (const auto& item : ordered) {
        const auto self = std::find(order.begin(), order.end(), item.name) - order.begin();
        for (const auto& dep : item.uses) {
            const auto used = std::find(order.begin(), order.end(), dep) - order.begin();
            EXPECT_LT(used, self) << dep << " before " << item.name;
        }
    }
}

TEST(GraphTest, OrderDoesNotDependOnInputOrder) {
    std::vector<Item> input = {
        Item{.name = "A"},
        Item{.name = "B", .uses = {"A"}},
        Item{.name = "C", .uses = {"A"}},
        Item{.name = "D", .uses = {"C"}},
        Item{.name = "E"},
    };
    const auto expected = names(topo(input));

    std::sort(input.begin(), input.end(), [](const Item& lhs, const Item& rhs) { return lhs.name < rhs.name; });
    do {
        EXPECT_EQ(names(topo(input)), expected);
    } while (std::next_permutation(input.begin(), input.end(),
                                   [](const Item& lhs, const Item& rhs) { return lhs.name < rhs.name; }));
}

TEST(GraphTest, CycleMembersFollowInInputOrder) {
    const auto ordered = topo({
        Item{.name = "Y", .uses = {"X"}},
        Item{.name = "X", .uses = {"Y"}},
        Item{.name = "Z"},
    });
    EXPECT_EQ(names(ordered), (std::vector<std::string>{"Z", "Y", "X"}));
    expectLevelsMatchPositions(ordered);
}

TEST(GraphTest, UnknownDependenciesAreIgnored) {
    const auto ordered = topo({
        Item{.name = "B", .uses = {"Missing", "A"}},
        Item{.name = "A", .uses = {"string"}},
    });
    EXPECT_EQ(names(ordered), (std::vector<std::string>{"A", "B"}));
}

TEST(GraphTest, DuplicateNameKeepsLastDeclaration) {
    const auto ordered = topo({
        Item{.name = "A", .tag = 1},
        Item{.name = "B", .uses = {"A"}},
        Item{.name = "A", .tag = 2},
    });
    ASSERT_EQ(ordered.size(), 2);
    EXPECT_EQ(ordered[0].name, "A");
    EXPECT_EQ(ordered[0].tag, 2);
    EXPECT_EQ(ordered[1].name, "B");
}

TEST(GraphTest, UnnamedItemGoesLast) {
    const auto ordered = topo({Item{.name = "", .tag = 7}, Item{.name = "B"}});
    ASSERT_EQ(ordered.size(), 2);
    EXPECT_EQ(ordered[0].name, "B");
    EXPECT_EQ(ordered[1].tag, 7);
    EXPECT_EQ(ordered[1].level, 1);
}

TEST(GraphTest, AlphabeticalResolverIgnoresDependencies) {
    const AlphabeticalResolver<Item> resolver(std::make_unique<ItemName>());
    const auto ordered = resolver.resolve({
        Item{.name = "b", .tag = 1},
        Item{.name = "A", .uses = {"b"}},
        Item{.name = "b", .tag = 2},
        Item{.name = "C"},
    });
    EXPECT_EQ(names(ordered), (std::vector<std::string>{"A", "C", "b", "b"}));
    EXPECT_EQ(ordered[2].tag, 1);
    EXPECT_EQ(ordered[3].tag, 2);
    expectLevelsMatchPositions(ordered);
}

TEST(GraphTest, EdgesRequireKnownVertices) {
    DependencyGraph graph;
    graph.addVertex("A");
    graph.addVertex("B");
    graph.addVertex("A");
    EXPECT_EQ(graph.vertexCount(), 2);
    EXPECT_TRUE(graph.contains("B"));
    EXPECT_FALSE(graph.contains("C"));

    EXPECT_TRUE(graph.addEdge("A", "B"));
    EXPECT_FALSE(graph.addEdge("C", "B"));
    EXPECT_FALSE(graph.addEdge("A", "C"));

    EXPECT_EQ(graph.inDegree("A"), 0);
    EXPECT_EQ(graph.inDegree("B"), 1);
    EXPECT_EQ(graph.dependents("A"), std::vector<std::string>{"B"});
    EXPECT_TRUE(graph.dependents("B").empty());
    EXPECT_EQ(graph.topologicalOrder(), (std::vector<std::string>{"A", "B"}));
}
