#pragma once

#include "braces/AST.hpp"
#include "braces/Error.hpp"
#include "braces/Options.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace braces {

// Every string the pattern denotes, in enumeration order
struct Expansion {
  std::vector<std::string> items_;

  bool operator==(Expansion const&) const = default;
};

// One regular expression source matching every string the pattern denotes
struct Pattern {
  std::string source_;

  bool operator==(Pattern const&) const = default;
};

using CompiledOutput = std::variant<Expansion, Pattern>;

class Compiler {
  Options const&   options_;
  std::string_view source_;

public:
  Compiler(Options const& options, std::string_view source);

  Result<CompiledOutput> compile(Ast const& ast) const;

  Result<std::vector<std::string>> expandSequence(Sequence const& sequence) const;
  Result<std::string>              regexSequence(Sequence const& sequence) const;
  Result<std::vector<std::string>> rangeItems(Range const& range) const;

private:
  [[nodiscard]] Result<std::string> regexRange(Range const& range) const;
};

// Text of a literal with escape marks dropped, quoted for use inside a regex
std::string quoteLiteral(std::string_view text);

} // namespace braces
