#include "braces/Braces.hpp"
#include "braces/Compiler.hpp"
#include "braces/Engine.hpp"
#include "braces/Escape.hpp"
#include "braces/Log.hpp"

#include <algorithm>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <re2/re2.h>

namespace braces {

namespace {

std::string stripBackslashes(std::string_view pattern) {
  std::string out;
  out.reserve(pattern.size());
  std::ranges::copy_if(pattern, std::back_inserter(out), [](char c) { return c != '\\'; });
  return out;
}

} // namespace

Braces::Braces()
    : Braces(defaultEngineFactory()) {}

Braces::Braces(EngineFactory factory)
    : factory_(std::move(factory)) {}

Result<CompiledOutput> Braces::braces(std::string_view pattern, Options const& options) {
  std::string key(pattern);
  if (auto cached = outputs_.find(key)) {
    log::debug("output cache hit for '{}'", pattern);
    return std::move(*cached);
  }

  auto result = compile(pattern, options);
  if (!result) {
    return std::unexpected(result.error());
  }
  outputs_.store(std::move(key), *result);
  return result;
}

Result<CompiledOutput> Braces::compile(std::string_view pattern, Options const& options) const {
  auto engine = factory_(options);
  auto ast    = engine->parse(escape(pattern, options), options);
  if (!ast) {
    return std::unexpected(ast.error());
  }
  auto compiled = engine->compile(*ast, options);
  if (!compiled) {
    return std::unexpected(compiled.error());
  }

  if (auto* expansion = std::get_if<Expansion>(&*compiled)) {
    for (auto& item : expansion->items_) {
      item = unescape(item, options);
    }
  } else {
    auto& regex   = std::get<Pattern>(*compiled);
    regex.source_ = unescape(regex.source_, options);
  }
  return compiled;
}

Result<std::vector<std::string>> Braces::expand(std::string_view pattern, Options const& options) const {
  if (pattern.size() <= 2) {
    return std::vector<std::string>{std::string(pattern)};
  }

  Options forced   = options;
  forced.unescape_ = true;
  forced.expand_   = true;
  forced.make_re_  = false;

  auto compiled = compile(pattern, forced);
  if (!compiled) {
    return std::unexpected(compiled.error());
  }
  if (auto* expansion = std::get_if<Expansion>(&*compiled)) {
    return std::move(expansion->items_);
  }
  return std::vector<std::string>{std::move(std::get<Pattern>(*compiled).source_)};
}

Result<std::vector<std::string>>
Braces::match(std::span<std::string const> candidates, std::string_view pattern, Options const& options) {
  auto is_match = matcher(pattern, options);
  if (!is_match) {
    return std::unexpected(is_match.error());
  }

  std::vector<std::string> matched;
  std::ranges::copy_if(candidates, std::back_inserter(matched), [&](std::string const& candidate) {
    return (*is_match)(candidate);
  });

  if (matched.empty()) {
    if (options.failglob_) {
      auto error = noMatchError(pattern);
      log::debug("{}: {}", kindName(error.kind_), error.message());
      return std::unexpected(std::move(error));
    }
    if (options.nonull_ || options.nullglob_) {
      return std::vector<std::string>{stripBackslashes(pattern)};
    }
  }
  return matched;
}

Result<std::vector<std::string>>
Braces::match(std::string_view candidate, std::string_view pattern, Options const& options) {
  auto candidates = arrayify(candidate);
  return match(std::span<std::string const>(candidates), pattern, options);
}

Result<bool> Braces::isMatch(std::string_view candidate, std::string_view pattern, Options const& options) {
  auto key = cacheKey(pattern, options);
  if (auto cached = matchers_.find(key)) {
    return (*cached)(candidate);
  }

  auto built = matcher(pattern, options);
  if (!built) {
    return std::unexpected(built.error());
  }
  matchers_.store(std::move(key), *built);
  return (*built)(candidate);
}

Result<Matcher> Braces::matcher(std::string_view pattern, Options const& options) {
  auto regex = makeRe(pattern, options);
  if (!regex) {
    return std::unexpected(regex.error());
  }
  return Matcher([re = std::move(*regex)](std::string_view str) {
    return re2::RE2::FullMatch(str, *re);
  });
}

Result<Regex> Braces::makeRe(std::string_view pattern, Options const& options) {
  auto key = cacheKey(pattern, options);
  if (options.cache_) {
    if (auto cached = regexes_.find(key)) {
      log::debug("regex cache hit for '{}'", pattern);
      return std::move(*cached);
    }
  }

  auto regex = factory_(options)->makeRe(pattern);
  if (!regex) {
    return std::unexpected(regex.error());
  }
  regexes_.store(std::move(key), *regex);
  return regex;
}

size_t Braces::outputCacheSize() const {
  return outputs_.size();
}

size_t Braces::matcherCacheSize() const {
  return matchers_.size();
}

size_t Braces::regexCacheSize() const {
  return regexes_.size();
}

Braces& Braces::instance() {
  static Braces instance;
  return instance;
}

Result<CompiledOutput> braces(std::string_view pattern, Options const& options) {
  return Braces::instance().braces(pattern, options);
}

Result<CompiledOutput> compile(std::string_view pattern, Options const& options) {
  return Braces::instance().compile(pattern, options);
}

Result<std::vector<std::string>> expand(std::string_view pattern, Options const& options) {
  return Braces::instance().expand(pattern, options);
}

Result<std::vector<std::string>>
match(std::span<std::string const> candidates, std::string_view pattern, Options const& options) {
  return Braces::instance().match(candidates, pattern, options);
}

Result<std::vector<std::string>> match(std::string_view candidate, std::string_view pattern, Options const& options) {
  return Braces::instance().match(candidate, pattern, options);
}

Result<bool> isMatch(std::string_view candidate, std::string_view pattern, Options const& options) {
  return Braces::instance().isMatch(candidate, pattern, options);
}

Result<Matcher> matcher(std::string_view pattern, Options const& options) {
  return Braces::instance().matcher(pattern, options);
}

Result<Regex> makeRe(std::string_view pattern, Options const& options) {
  return Braces::instance().makeRe(pattern, options);
}

std::vector<std::string> arrayify(std::string_view value) {
  return {std::string(value)};
}

} // namespace braces
