#pragma once

#include "braces/AST.hpp"
#include "braces/Error.hpp"
#include "braces/Options.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace braces {

// Parses an escaped pattern (see escape()) into an Ast. Groups that are
// neither a comma set nor a valid range are kept as literal text, the way a
// POSIX shell leaves them alone.
class Parser {
  std::string_view src_;
  Options const&   options_;

public:
  Parser(std::string_view src, Options const& options);

  Result<Ast> parse();

private:
  [[nodiscard]] Result<void> checkBalanced() const;

  [[nodiscard]] Sequence              parseSequence(size_t begin, size_t end) const;
  [[nodiscard]] std::optional<size_t> findClose(size_t open, size_t end) const;
  [[nodiscard]] std::vector<size_t>   topLevelCommas(size_t begin, size_t end) const;
  [[nodiscard]] std::optional<Range>  parseRange(std::string_view body) const;
};

Result<Ast> parse(std::string_view escaped, Options const& options = {});

} // namespace braces
