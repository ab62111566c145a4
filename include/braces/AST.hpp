#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace braces {

// Plain text between groups. May carry ESCAPE_MARK pairs from escape().
struct Literal {
  std::string text_;
};

struct Range {
  enum struct Kind {
    NUMERIC,
    ALPHA
  };

  Kind      kind_  = Kind::NUMERIC;
  long long first_ = 0;
  long long last_  = 0;
  long long step_  = 1;
  // Zero padded digit count for numeric ranges, 0 when unpadded
  size_t      width_ = 0;
  std::string text_;
};

struct Sequence;

// A comma separated brace group: each item is a sequence of its own
struct Set {
  std::vector<Sequence> items_;
};

using Node = std::variant<Literal, Range, Set>;

struct Sequence {
  std::vector<Node> nodes_;
};

struct Ast {
  Sequence    root_;
  std::string source_;
};

} // namespace braces
