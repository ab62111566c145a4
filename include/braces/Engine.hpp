#pragma once

#include "braces/AST.hpp"
#include "braces/Compiler.hpp"
#include "braces/Error.hpp"
#include "braces/Options.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace re2 {
class RE2;
} // namespace re2

namespace braces {

using Regex = std::shared_ptr<re2::RE2 const>;

// Turns brace patterns into output. One engine is built per request and is
// bound to the options it was built with.
class Engine {
public:
  virtual ~Engine() = default;

  virtual Result<Ast>            parse(std::string_view escaped, Options const& options) = 0;
  virtual Result<CompiledOutput> compile(Ast const& ast, Options const& options)          = 0;
  virtual Result<Regex>          makeRe(std::string_view pattern)                         = 0;
};

class BraceEngine final : public Engine {
  Options options_;

public:
  explicit BraceEngine(Options options);

  Result<Ast>            parse(std::string_view escaped, Options const& options) override;
  Result<CompiledOutput> compile(Ast const& ast, Options const& options) override;
  Result<Regex>          makeRe(std::string_view pattern) override;
};

using EngineFactory = std::function<std::unique_ptr<Engine>(Options const&)>;

EngineFactory defaultEngineFactory();

// Builds an RE2 from `source`; failures are reported against `pattern`
Result<Regex> compileRegex(std::string_view pattern, std::string const& source);

} // namespace braces
