#include "cmdq/tokenizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace cmdq;

using Tokens = std::vector<std::string>;

TEST(TokenizerTest, SplitsOnWhitespace) {
    EXPECT_EQ(explode("a b  c\td"), (Tokens{"a", "b", "c", "d"}));
    EXPECT_EQ(explode("   padded   "), (Tokens{"padded"}));
}

TEST(TokenizerTest, EmptyInputHasNoTokens) {
    EXPECT_TRUE(explode("").empty());
    EXPECT_TRUE(explode("   ").empty());
}

TEST(TokenizerTest, DoubleQuotesGroupWords) {
    EXPECT_EQ(explode(R"(say "hello world" now)"), (Tokens{"say", "hello world", "now"}));
}

TEST(TokenizerTest, DoubleQuotesHonourEscapes) {
    EXPECT_EQ(explode(R"("a\"b" "tab\there" "back\\slash")"), (Tokens{"a\"b", "tab\there", "back\\slash"}));
}

TEST(TokenizerTest, SingleQuotesAreLiteral) {
    EXPECT_EQ(explode(R"('a\nb' 'two words')"), (Tokens{"a\\nb", "two words"}));
}

TEST(TokenizerTest, EmptyQuotesYieldEmptyToken) {
    EXPECT_EQ(explode(R"(x "" y)"), (Tokens{"x", "", "y"}));
}

TEST(TokenizerTest, QuotesJoinAdjacentText) {
    EXPECT_EQ(explode(R"(key="some value")"), (Tokens{"key=some value"}));
}

TEST(TokenizerTest, ExplodeValuesWrapsTokensAsStrings) {
    const auto values = explodeValues("1 two");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_TRUE(values[0].is<std::string>());
    EXPECT_EQ(values[0].as<std::string>(), "1");
    EXPECT_EQ(values[1].as<std::string>(), "two");
}

TEST(TokenizerTest, SplitStagesTrimsSegments) {
    EXPECT_EQ(splitStages("echo a | upper |count"), (Tokens{"echo a", "upper", "count"}));
}

TEST(TokenizerTest, SplitStagesWithoutDelimiterIsOneStage) {
    EXPECT_EQ(splitStages("  echo hello  "), (Tokens{"echo hello"}));
}

TEST(TokenizerTest, SplitStagesHonoursCustomDelimiter) {
    EXPECT_EQ(splitStages("a > b | c", '>'), (Tokens{"a", "b | c"}));
}

TEST(TokenizerTest, SplitStagesKeepsEmptySegments) {
    EXPECT_EQ(splitStages("a || b"), (Tokens{"a", "", "b"}));
}
