#include "sysprobe/utils/string_utils.hpp"

#include <gtest/gtest.h>

using sysprobe::utils::StringUtils;

TEST(StringUtils, TrimAndSplit)
{
  EXPECT_EQ(StringUtils::Trim("  a b \t\n"), "a b");
  EXPECT_EQ(StringUtils::Trim("   "), "");

  auto words = StringUtils::SplitWhitespace("  read   write\tclose ");
  ASSERT_EQ(words.size(), 3u);
  EXPECT_EQ(words[1], "write");
}

TEST(StringUtils, SplitTopLevelRespectsQuotesAndBrackets)
{
  auto tokens = StringUtils::SplitTopLevel(R"(3, "a, \"b\"", {x=1, y=[2, 3]}, f(1, 2))", ',');
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0], "3");
  EXPECT_EQ(tokens[1], R"("a, \"b\"")");
  EXPECT_EQ(tokens[2], "{x=1, y=[2, 3]}");
  EXPECT_EQ(tokens[3], "f(1, 2)");

  EXPECT_TRUE(StringUtils::SplitTopLevel("  ", ',').empty());
  EXPECT_EQ(StringUtils::SplitTopLevel("a,", ',').size(), 2u);
}

TEST(StringUtils, Predicates)
{
  EXPECT_TRUE(StringUtils::StartsWith("[stack:12]", "[stack"));
  EXPECT_FALSE(StringUtils::StartsWith("st", "stack"));
  EXPECT_TRUE(StringUtils::EndsWith("libc.so.6", ".6"));
  EXPECT_TRUE(StringUtils::Contains("/etc/passwd", "etc"));
  EXPECT_TRUE(StringUtils::ContainsIgnoreCase("/ETC/passwd", "etc/PASS"));
  EXPECT_EQ(StringUtils::ToLower("ENOENT"), "enoent");
}

TEST(StringUtils, ParseInteger)
{
  EXPECT_EQ(StringUtils::ParseInteger("42").value_or(0), 42);
  EXPECT_EQ(StringUtils::ParseInteger(" -7 ").value_or(0), -7);
  EXPECT_EQ(StringUtils::ParseInteger("0x1f").value_or(0), 31);
  EXPECT_EQ(StringUtils::ParseInteger("-0x10").value_or(0), -16);

  EXPECT_FALSE(StringUtils::ParseInteger("").has_value());
  EXPECT_FALSE(StringUtils::ParseInteger("0x").has_value());
  EXPECT_FALSE(StringUtils::ParseInteger("12abc").has_value());
  EXPECT_FALSE(StringUtils::ParseInteger("O_RDONLY").has_value());
  EXPECT_FALSE(StringUtils::ParseInteger("99999999999999999999999").has_value());
}

TEST(StringUtils, Unquote)
{
  EXPECT_EQ(StringUtils::Unquote(R"("plain")").value_or("?"), "plain");
  EXPECT_EQ(StringUtils::Unquote(R"("a\tb\n")").value_or("?"), "a\tb\n");
  EXPECT_EQ(StringUtils::Unquote(R"("say \"hi\"")").value_or("?"), "say \"hi\"");
  EXPECT_EQ(StringUtils::Unquote(R"("\x41\102")").value_or("?"), "AB");
  EXPECT_EQ(StringUtils::Unquote(R"("truncated"...)").value_or("?"), "truncated");
  EXPECT_EQ(StringUtils::Unquote(R"("")").value_or("?"), "");

  EXPECT_FALSE(StringUtils::Unquote("bare").has_value());
  EXPECT_FALSE(StringUtils::Unquote("\"").has_value());
}
