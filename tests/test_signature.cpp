#include <gtest/gtest.h>
#include <string>

#include "../codegen/include/stratum/codegen/signature.h"

using stratum::codegen::parse_method_signature;
using stratum::codegen::zero_value_for;
using stratum::codegen::zero_values_for;

TEST(SignatureTest, SplitsNameParametersAndReturns) {
    const auto get = parse_method_signature("Get(ctx context.Context, key string) (*Item, error)");
    ASSERT_TRUE(get.has_value());
    EXPECT_EQ(get->name, "Get");
    EXPECT_EQ(get->parameters, "ctx context.Context, key string");
    EXPECT_EQ(get->returns, "(*Item, error)");

    // Nested parentheses stay inside the parameter list.
    const auto callback = parse_method_signature("Do(func(int) error) bool");
    ASSERT_TRUE(callback.has_value());
    EXPECT_EQ(callback->parameters, "func(int) error");
    EXPECT_EQ(callback->returns, "bool");

    const auto close = parse_method_signature("Close()");
    ASSERT_TRUE(close.has_value());
    EXPECT_EQ(close->name, "Close");
    EXPECT_TRUE(close->parameters.empty());
    EXPECT_TRUE(close->returns.empty());
}

TEST(SignatureTest, RejectsUnparsableSignatures) {
    EXPECT_FALSE(parse_method_signature("io.Reader").has_value());
    EXPECT_FALSE(parse_method_signature("Broken(int").has_value());
    EXPECT_FALSE(parse_method_signature("(int) error").has_value());
}

TEST(SignatureTest, ZeroValuesForBasicTypes) {
    EXPECT_EQ(zero_value_for("bool"), "false");
    EXPECT_EQ(zero_value_for("string"), "\"\"");
    EXPECT_EQ(zero_value_for("uintptr"), "0");
    EXPECT_EQ(zero_value_for("rune"), "0");
    EXPECT_EQ(zero_value_for("float64"), "0.0");
    EXPECT_EQ(zero_value_for("complex128"), "0+0i");
    EXPECT_EQ(zero_value_for("error"), "nil");
}

TEST(SignatureTest, ZeroValuesForCompositeTypes) {
    EXPECT_EQ(zero_value_for("*Widget"), "nil");
    EXPECT_EQ(zero_value_for("[]byte"), "nil");
    EXPECT_EQ(zero_value_for("map[string]int"), "nil");
    EXPECT_EQ(zero_value_for("<-chan Event"), "nil");
    EXPECT_EQ(zero_value_for("func() error"), "nil");
    EXPECT_EQ(zero_value_for("time.Duration"), "nil");
    EXPECT_EQ(zero_value_for("Widget"), "Widget{}");
}

TEST(SignatureTest, ZeroValuesForReturnClauses) {
    EXPECT_EQ(zero_values_for("(int, error)"), "0, nil");
    EXPECT_EQ(zero_values_for("(n int, err error)"), "0, nil");
    EXPECT_EQ(zero_values_for("string"), "\"\"");
    EXPECT_EQ(zero_values_for("(*Item, bool)"), "nil, false");
    EXPECT_EQ(zero_values_for(""), "");
    EXPECT_EQ(zero_values_for("()"), "");
}

TEST(SignatureTest, FunctionTypedReturnsStayWhole) {
    EXPECT_EQ(zero_values_for("(func(int, string) error, error)"), "nil, nil");
    EXPECT_EQ(zero_values_for("func() (int, error)"), "nil");
    EXPECT_EQ(zero_values_for("(handler func(ctx Context) (Result, error), ok bool)"), "nil, false");
    EXPECT_EQ(zero_values_for("(map[string]func(a, b int) bool, int)"), "nil, 0");
    EXPECT_EQ(zero_values_for("(chan int, <-chan Event)"), "nil, nil");
}

TEST(SignatureTest, ChannelKeywordOnlyAsPrefix) {
    EXPECT_EQ(zero_value_for("Exchange"), "Exchange{}");
    EXPECT_EQ(zero_value_for("chanState"), "chanState{}");
    EXPECT_EQ(zero_value_for("chan<- Event"), "nil");
    EXPECT_EQ(zero_values_for("(e Exchange, err error)"), "Exchange{}, nil");
}
