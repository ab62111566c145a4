#include "braces/Compiler.hpp"
#include "braces/Engine.hpp"
#include "braces/Error.hpp"
#include "braces/Escape.hpp"
#include "braces/Options.hpp"

#include <gtest/gtest.h>
#include <re2/re2.h>

#include <string>
#include <variant>
#include <vector>

TEST(EngineTest, MakeReAnchorsPattern) {
  braces::BraceEngine engine({});
  auto                regex = engine.makeRe("a{b,c}");
  ASSERT_TRUE(regex.has_value()) << regex.error().message();
  EXPECT_EQ((*regex)->pattern(), "^(?:a(b|c))$");
  EXPECT_TRUE(re2::RE2::FullMatch("ab", **regex));
  EXPECT_TRUE(re2::RE2::FullMatch("ac", **regex));
  EXPECT_FALSE(re2::RE2::FullMatch("a", **regex));
  EXPECT_FALSE(re2::RE2::PartialMatch("xabx", **regex));
}

TEST(EngineTest, MakeReIgnoresExpandMode) {
  braces::BraceEngine engine({.expand_ = true});
  auto                regex = engine.makeRe("{1..3}.txt");
  ASSERT_TRUE(regex.has_value());
  EXPECT_EQ((*regex)->pattern(), "^(?:([1-3])\\.txt)$");
  EXPECT_TRUE(re2::RE2::FullMatch("2.txt", **regex));
  EXPECT_FALSE(re2::RE2::FullMatch("2xtxt", **regex));
}

TEST(EngineTest, MakeReTreatsEscapesAsLiterals) {
  braces::BraceEngine engine({});
  auto                regex = engine.makeRe("a\\{b,c}");
  ASSERT_TRUE(regex.has_value());
  EXPECT_TRUE(re2::RE2::FullMatch("a{b,c}", **regex));
  EXPECT_FALSE(re2::RE2::FullMatch("ab", **regex));
}

TEST(EngineTest, MakeRePropagatesRangeError) {
  braces::BraceEngine engine({});
  auto                regex = engine.makeRe("{1..1000}");
  ASSERT_FALSE(regex.has_value());
  EXPECT_EQ(regex.error().kind_, braces::ErrorKind::RANGE);
}

TEST(EngineTest, MakeRePropagatesParseError) {
  braces::BraceEngine engine({.strict_errors_ = true});
  auto                regex = engine.makeRe("{a,b");
  ASSERT_FALSE(regex.has_value());
  EXPECT_EQ(regex.error().kind_, braces::ErrorKind::PARSE);
}

TEST(EngineTest, ParseThenCompile) {
  braces::Options     options{.expand_ = true};
  braces::BraceEngine engine(options);
  auto                ast = engine.parse(braces::escape("x{y,z}", options), options);
  ASSERT_TRUE(ast.has_value());
  auto output = engine.compile(*ast, options);
  ASSERT_TRUE(output.has_value());
  auto const* expansion = std::get_if<braces::Expansion>(&*output);
  ASSERT_NE(expansion, nullptr);
  EXPECT_EQ(expansion->items_, (std::vector<std::string>{"xy", "xz"}));
}

TEST(EngineTest, InvalidRegexSource) {
  auto regex = braces::compileRegex("p", "(");
  ASSERT_FALSE(regex.has_value());
  EXPECT_EQ(regex.error().kind_, braces::ErrorKind::REGEX);
  EXPECT_EQ(regex.error().pattern_, "p");
}

TEST(EngineTest, DefaultFactoryBuildsBraceEngine) {
  auto factory = braces::defaultEngineFactory();
  auto engine  = factory({});
  ASSERT_NE(engine, nullptr);
  EXPECT_NE(dynamic_cast<braces::BraceEngine*>(engine.get()), nullptr);
}
