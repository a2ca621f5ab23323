#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../analysis/include/stratum/analysis/dependency.h"

using stratum::analysis::collect_dependencies;
using stratum::analysis::extract_type_dependencies;
using stratum::analysis::is_builtin_type;
using stratum::analysis::is_valid_identifier;

using Names = std::vector<std::string>;

TEST(DependencyTest, StripsModifiersAndBuiltins) {
    EXPECT_EQ(extract_type_dependencies("*[]map[string]UserService"), Names{"UserService"});
    EXPECT_EQ(extract_type_dependencies("int"), Names{});
    EXPECT_EQ(extract_type_dependencies("map[string]int"), Names{});
    EXPECT_EQ(extract_type_dependencies("[4]byte"), Names{});
    EXPECT_EQ(extract_type_dependencies(""), Names{});
}

TEST(DependencyTest, QualifiedNamesKeepMember) {
    EXPECT_EQ(extract_type_dependencies("pkg.Reader"), Names{"Reader"});
    EXPECT_EQ(extract_type_dependencies("Handler *services.UserHandler"), (Names{"Handler", "UserHandler"}));
    EXPECT_EQ(extract_type_dependencies("time.Duration"), Names{"Duration"});
    // Deeper selectors are not understood.
    EXPECT_EQ(extract_type_dependencies("a.b.c"), Names{});
    EXPECT_EQ(extract_type_dependencies("pkg.int"), Names{});
}

TEST(DependencyTest, SignaturesAndChannels) {
    EXPECT_EQ(extract_type_dependencies("func(ctx Context) (Result, error)"), (Names{"Context", "Result", "ctx"}));
    EXPECT_EQ(extract_type_dependencies("chan<- Event"), Names{"Event"});
    EXPECT_EQ(extract_type_dependencies("<-chan int"), Names{});
    EXPECT_EQ(extract_type_dependencies("...Option"), Names{"Option"});
    EXPECT_EQ(extract_type_dependencies("Find(Key, Key) (*Value, error)"), (Names{"Find", "Key", "Value"}));
}

TEST(DependencyTest, CollectExcludesSelf) {
    EXPECT_EQ(collect_dependencies({"next *Node", "value int"}, "Node"), (Names{"next", "value"}));
    EXPECT_EQ(collect_dependencies({"Left *Tree", "Right *Tree", "Meta"}, "Tree"), (Names{"Left", "Meta", "Right"}));
    EXPECT_EQ(collect_dependencies({}, "Empty"), Names{});
}

TEST(DependencyTest, IdentifierRules) {
    EXPECT_TRUE(is_valid_identifier("_x1"));
    EXPECT_TRUE(is_valid_identifier("User"));
    EXPECT_FALSE(is_valid_identifier("1x"));
    EXPECT_FALSE(is_valid_identifier(""));
    EXPECT_FALSE(is_valid_identifier("a-b"));

    EXPECT_TRUE(is_builtin_type("uintptr"));
    EXPECT_TRUE(is_builtin_type("any"));
    EXPECT_FALSE(is_builtin_type("Any"));
}
