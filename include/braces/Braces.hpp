#pragma once

#include "braces/Cache.hpp"
#include "braces/Compiler.hpp"
#include "braces/Engine.hpp"
#include "braces/Error.hpp"
#include "braces/Options.hpp"

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace braces {

using Matcher = std::function<bool(std::string_view)>;

// Entry point for compiling and matching brace patterns.
//
// A Braces object owns three independent memo stores:
//   - compiled output, keyed by the pattern text alone (options are ignored)
//   - matchers, keyed by cacheKey(pattern, options)
//   - regexes, keyed by cacheKey(pattern, options); options.cache_ == false
//     skips the lookup but the fresh regex is still stored
// None of them evicts. Braces::instance() lives for the whole process.
class Braces {
  EngineFactory              factory_;
  KeyedStore<CompiledOutput> outputs_;
  KeyedStore<Matcher>        matchers_;
  KeyedStore<Regex>          regexes_;

public:
  Braces();
  explicit Braces(EngineFactory factory);

  Braces(Braces const&)            = delete;
  Braces& operator=(Braces const&) = delete;
  Braces(Braces&&)                 = delete;
  Braces& operator=(Braces&&)      = delete;

  // Cached compile. A hit returns the first output stored for `pattern`
  // whatever `options` are passed now.
  Result<CompiledOutput> braces(std::string_view pattern, Options const& options = {});

  // Uncached escape -> parse -> compile -> unescape
  Result<CompiledOutput> compile(std::string_view pattern, Options const& options = {}) const;

  // Always expansion mode with unescaping; expand_, make_re_ and unescape_
  // from `options` are overridden.
  Result<std::vector<std::string>> expand(std::string_view pattern, Options const& options = {}) const;

  Result<std::vector<std::string>>
  match(std::span<std::string const> candidates, std::string_view pattern, Options const& options = {});
  Result<std::vector<std::string>>
  match(std::string_view candidate, std::string_view pattern, Options const& options = {});

  Result<bool>    isMatch(std::string_view candidate, std::string_view pattern, Options const& options = {});
  Result<Matcher> matcher(std::string_view pattern, Options const& options = {});
  Result<Regex>   makeRe(std::string_view pattern, Options const& options = {});

  [[nodiscard]] size_t outputCacheSize() const;
  [[nodiscard]] size_t matcherCacheSize() const;
  [[nodiscard]] size_t regexCacheSize() const;

  static Braces& instance();
};

// Process-wide shortcuts onto Braces::instance()
Result<CompiledOutput>           braces(std::string_view pattern, Options const& options = {});
Result<CompiledOutput>           compile(std::string_view pattern, Options const& options = {});
Result<std::vector<std::string>> expand(std::string_view pattern, Options const& options = {});
Result<std::vector<std::string>>
match(std::span<std::string const> candidates, std::string_view pattern, Options const& options = {});
Result<std::vector<std::string>>
match(std::string_view candidate, std::string_view pattern, Options const& options = {});
Result<bool>    isMatch(std::string_view candidate, std::string_view pattern, Options const& options = {});
Result<Matcher> matcher(std::string_view pattern, Options const& options = {});
Result<Regex>   makeRe(std::string_view pattern, Options const& options = {});

// Wraps a lone candidate into a one element list
std::vector<std::string> arrayify(std::string_view value);

} // namespace braces
