#include "braces/Engine.hpp"
#include "braces/Compiler.hpp"
#include "braces/Escape.hpp"
#include "braces/Log.hpp"
#include "braces/Parser.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <re2/re2.h>

namespace braces {

BraceEngine::BraceEngine(Options options)
    : options_(std::move(options)) {}

Result<Ast> BraceEngine::parse(std::string_view escaped, Options const& options) {
  return Parser(escaped, options).parse();
}

Result<CompiledOutput> BraceEngine::compile(Ast const& ast, Options const& options) {
  return Compiler(options, ast.source_).compile(ast);
}

Result<Regex> BraceEngine::makeRe(std::string_view pattern) {
  // Always regex mode, whatever the engine was configured with
  Options options  = options_;
  options.expand_  = false;
  options.make_re_ = true;

  auto ast = parse(escape(pattern, options), options);
  if (!ast) {
    return std::unexpected(ast.error());
  }
  auto compiled = compile(*ast, options);
  if (!compiled) {
    return std::unexpected(compiled.error());
  }
  auto const* source = std::get_if<Pattern>(&*compiled);
  if (source == nullptr) {
    return std::unexpected(regexError(pattern, "engine did not produce a regular expression"));
  }
  return compileRegex(pattern, fmt::format("^(?:{})$", source->source_));
}

EngineFactory defaultEngineFactory() {
  return [](Options const& options) -> std::unique_ptr<Engine> {
    log::debug("new engine");
    return std::make_unique<BraceEngine>(options);
  };
}

Result<Regex> compileRegex(std::string_view pattern, std::string const& source) {
  re2::RE2::Options re_options(re2::RE2::Quiet);
  auto              regex = std::make_shared<re2::RE2 const>(source, re_options);
  if (!regex->ok()) {
    return std::unexpected(regexError(pattern, fmt::format("invalid regular expression /{}/: {}", source, regex->error())));
  }
  log::debug("regex /{}/ for '{}'", source, pattern);
  return regex;
}

} // namespace braces
