#include "braces/Compiler.hpp"
#include "braces/Constants.hpp"
#include "braces/Error.hpp"
#include "braces/Options.hpp"
#include "braces/Parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

braces::Result<braces::CompiledOutput> compileWith(std::string const& pattern, braces::Options const& options) {
  auto ast = braces::parse(pattern, options);
  if (!ast) {
    return std::unexpected(ast.error());
  }
  return braces::Compiler(options, pattern).compile(*ast);
}

std::vector<std::string> expanded(std::string const& pattern, braces::Options options = {}) {
  options.expand_ = true;
  auto result     = compileWith(pattern, options);
  if (!result) {
    ADD_FAILURE() << "compile error: " << result.error().message();
    return {};
  }
  auto const* expansion = std::get_if<braces::Expansion>(&*result);
  if (expansion == nullptr) {
    ADD_FAILURE() << "expected expansion output for " << pattern;
    return {};
  }
  return expansion->items_;
}

std::string regex(std::string const& pattern, braces::Options const& options = {}) {
  auto result = compileWith(pattern, options);
  if (!result) {
    ADD_FAILURE() << "compile error: " << result.error().message();
    return {};
  }
  auto const* source = std::get_if<braces::Pattern>(&*result);
  if (source == nullptr) {
    ADD_FAILURE() << "expected regex output for " << pattern;
    return {};
  }
  return source->source_;
}

using ExpandCase = std::pair<std::string, std::vector<std::string>>;
class Expand : public ::testing::TestWithParam<ExpandCase> {};

TEST_P(Expand, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(expanded(input), expected);
}

INSTANTIATE_TEST_SUITE_P(
    CompilerTest,
    Expand,
    ::testing::Values(
        // clang-format off
        ExpandCase{"a{b,c}d", {"abd", "acd"}},
        ExpandCase{"{a,b}{1,2}", {"a1", "a2", "b1", "b2"}},
        ExpandCase{"{a,b{1,2}c}", {"a", "b1c", "b2c"}},
        ExpandCase{"a{,b}", {"a", "ab"}},
        ExpandCase{"{1..5}", {"1", "2", "3", "4", "5"}},
        ExpandCase{"{5..1}", {"5", "4", "3", "2", "1"}},
        ExpandCase{"{1..10..3}", {"1", "4", "7", "10"}},
        ExpandCase{"{10..1..3}", {"10", "7", "4", "1"}},
        ExpandCase{"{01..03}", {"01", "02", "03"}},
        ExpandCase{"{-2..2}", {"-2", "-1", "0", "1", "2"}},
        ExpandCase{"{a..e..2}", {"a", "c", "e"}},
        ExpandCase{"x{C..A}", {"xC", "xB", "xA"}},
        ExpandCase{"{a{b,c}}", {"{ab}", "{ac}"}},
        ExpandCase{"{a}", {"{a}"}},
        ExpandCase{"{a,a,b}", {"a", "b"}},
        ExpandCase{"plain", {"plain"}} // clang-format on
    )
);

TEST(CompilerTest, KeepsDuplicatesWhenAsked) {
  EXPECT_EQ(expanded("{a,a,b}", {.nodupes_ = false}), (std::vector<std::string>{"a", "a", "b"}));
}

TEST(CompilerTest, RangeLimit) {
  EXPECT_EQ(expanded("{1..250}").size(), 250U);
  EXPECT_EQ(expanded("{1..300}", {.range_limit_ = 1000}).size(), 300U);

  auto result = compileWith("{1..300}", {.expand_ = true});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind_, braces::ErrorKind::RANGE);
  EXPECT_EQ(result.error().message(), "range {1..300} produces more than 250 items");
  EXPECT_EQ(result.error().pattern_, "{1..300}");
}

TEST(CompilerTest, RangeLimitAppliesToRegex) {
  auto result = compileWith("a{1..1000}", {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind_, braces::ErrorKind::RANGE);
}

TEST(CompilerTest, FullWidthRangeHitsLimit) {
  auto expanded_result = compileWith("a{-9223372036854775808..9223372036854775807}", {.expand_ = true});
  ASSERT_FALSE(expanded_result.has_value());
  EXPECT_EQ(expanded_result.error().kind_, braces::ErrorKind::RANGE);

  auto regex_result = compileWith("a{-9223372036854775808..9223372036854775807}", {});
  ASSERT_FALSE(regex_result.has_value());
  EXPECT_EQ(regex_result.error().kind_, braces::ErrorKind::RANGE);
}

TEST(CompilerTest, RangeStopsAtLastItemNearMaximum) {
  EXPECT_EQ(expanded("{9223372036854775806..9223372036854775807..5}"), (std::vector<std::string>{"9223372036854775806"}));
  EXPECT_EQ(
      expanded("{-9223372036854775807..-9223372036854775808..7}"), (std::vector<std::string>{"-9223372036854775807"})
  );
}

TEST(CompilerTest, EscapeMarksSurviveExpansion) {
  std::string const pattern = std::string("a") + braces::ESCAPE_MARK + ",{b,c}";
  EXPECT_EQ(
      expanded(pattern),
      (std::vector<std::string>{
          std::string("a") + braces::ESCAPE_MARK + ",b",
          std::string("a") + braces::ESCAPE_MARK + ",c",
      })
  );
}

using RegexCase = std::pair<std::string, std::string>;
class RegexSource : public ::testing::TestWithParam<RegexCase> {};

TEST_P(RegexSource, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(regex(input), expected);
}

INSTANTIATE_TEST_SUITE_P(
    CompilerTest,
    RegexSource,
    ::testing::Values(
        // clang-format off
        RegexCase{"a{b,c}d", "a(b|c)d"},
        RegexCase{"a.{b,c}", "a\\.(b|c)"},
        RegexCase{"{a,b{1,2}}", "(a|b(1|2))"},
        RegexCase{"{1..5}", "([1-5])"},
        RegexCase{"{a..e}", "([a-e])"},
        RegexCase{"{e..a}", "([a-e])"},
        RegexCase{"{1..10}", "(1|2|3|4|5|6|7|8|9|10)"},
        RegexCase{"{1..9..4}", "(1|5|9)"},
        RegexCase{"{01..03}", "(01|02|03)"},
        RegexCase{"{-1..1}", "(\\-1|0|1)"},
        RegexCase{"{a}", "\\{a\\}"} // clang-format on
    )
);

TEST(CompilerTest, MakeReWinsOverExpand) {
  EXPECT_EQ(regex("a{b,c}", {.expand_ = true, .make_re_ = true}), "a(b|c)");
}

TEST(CompilerTest, QuoteLiteral) {
  EXPECT_EQ(braces::quoteLiteral("a.b"), "a\\.b");
  EXPECT_EQ(braces::quoteLiteral(std::string("x") + braces::ESCAPE_MARK + "*"), "x\\*");
  EXPECT_EQ(braces::quoteLiteral("abc_1"), "abc_1");
}

} // namespace
