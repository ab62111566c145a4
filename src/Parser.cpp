#include "braces/Parser.hpp"
#include "braces/AST.hpp"
#include "braces/Constants.hpp"
#include "braces/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace braces {

namespace {

std::optional<long long> parseInteger(std::string_view str) {
  if (!str.empty() && str.front() == '+') {
    str.remove_prefix(1);
  }
  if (str.empty()) {
    return std::nullopt;
  }
  long long value = 0;
  if (auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
      ec == std::errc{} && ptr == str.data() + str.size()) {
    return value;
  }
  return std::nullopt;
}

bool isPadded(std::string_view str) {
  if (!str.empty() && (str.front() == '-' || str.front() == '+')) {
    str.remove_prefix(1);
  }
  return str.size() > 1 && str.front() == '0';
}

bool isLetter(std::string_view str) {
  return str.size() == 1 && std::isalpha(static_cast<unsigned char>(str.front())) != 0;
}

} // namespace

Parser::Parser(std::string_view src, Options const& options)
    : src_(src), options_(options) {}

Result<Ast> Parser::parse() {
  if (options_.strict_errors_) {
    if (auto balanced = checkBalanced(); !balanced) {
      return std::unexpected(balanced.error());
    }
  }
  Ast ast{parseSequence(0, src_.size()), std::string(src_)};
  log::debug("parsed '{}' into {} node(s)", src_, ast.root_.nodes_.size());
  return ast;
}

Result<void> Parser::checkBalanced() const {
  size_t depth = 0;
  size_t open  = 0;
  for (size_t i = 0; i < src_.size(); ++i) {
    if (src_[i] == ESCAPE_MARK) {
      ++i;
    } else if (src_[i] == '{') {
      if (depth++ == 0) {
        open = i;
      }
    } else if (src_[i] == '}') {
      if (depth == 0) {
        return std::unexpected(parseError(src_, fmt::format("unexpected '}}' at position {}", i)));
      }
      --depth;
    }
  }
  if (depth != 0) {
    return std::unexpected(parseError(src_, fmt::format("unclosed '{{' at position {}", open)));
  }
  return {};
}

Sequence Parser::parseSequence(size_t begin, size_t end) const {
  Sequence    seq;
  std::string text;

  auto flush = [&] {
    if (!text.empty()) {
      seq.nodes_.emplace_back(Literal{std::move(text)});
      text.clear();
    }
  };

  size_t i = begin;
  while (i < end) {
    char c = src_[i];
    if (c == ESCAPE_MARK && i + 1 < end) {
      text.append(src_.substr(i, 2));
      i += 2;
      continue;
    }

    if (c == '{') {
      if (auto close = findClose(i, end)) {
        if (auto commas = topLevelCommas(i + 1, *close); !commas.empty()) {
          flush();
          Set    set;
          size_t item = i + 1;
          for (size_t comma : commas) {
            set.items_.push_back(parseSequence(item, comma));
            item = comma + 1;
          }
          set.items_.push_back(parseSequence(item, *close));
          seq.nodes_.emplace_back(std::move(set));
          i = *close + 1;
          continue;
        }

        if (auto range = parseRange(src_.substr(i + 1, *close - i - 1))) {
          flush();
          seq.nodes_.emplace_back(std::move(*range));
          i = *close + 1;
          continue;
        }
      }
    }

    // Not a group: the brace is plain text and scanning continues inside it
    text.push_back(c);
    ++i;
  }

  flush();
  return seq;
}

std::optional<size_t> Parser::findClose(size_t open, size_t end) const {
  size_t depth = 0;
  for (size_t i = open; i < end; ++i) {
    if (src_[i] == ESCAPE_MARK) {
      ++i;
    } else if (src_[i] == '{') {
      ++depth;
    } else if (src_[i] == '}') {
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::nullopt;
}

std::vector<size_t> Parser::topLevelCommas(size_t begin, size_t end) const {
  std::vector<size_t> commas;
  size_t              depth = 0;
  for (size_t i = begin; i < end; ++i) {
    if (src_[i] == ESCAPE_MARK) {
      ++i;
    } else if (src_[i] == '{') {
      ++depth;
    } else if (src_[i] == '}') {
      --depth;
    } else if (src_[i] == ',' && depth == 0) {
      commas.push_back(i);
    }
  }
  return commas;
}

std::optional<Range> Parser::parseRange(std::string_view body) const {
  if (body.find_first_of("{},") != std::string_view::npos || body.find(ESCAPE_MARK) != std::string_view::npos) {
    return std::nullopt;
  }

  auto dots = body.find("..");
  if (dots == std::string_view::npos) {
    return std::nullopt;
  }
  auto first = body.substr(0, dots);
  auto rest  = body.substr(dots + 2);

  std::optional<std::string_view> step_text;
  if (auto more = rest.find(".."); more != std::string_view::npos) {
    step_text = rest.substr(more + 2);
    rest      = rest.substr(0, more);
  }
  auto last = rest;

  Range range;
  range.text_ = std::string(body);

  if (step_text) {
    auto step = parseInteger(*step_text);
    if (!step || *step == std::numeric_limits<long long>::min()) {
      return std::nullopt;
    }
    range.step_ = *step == 0 ? 1 : std::llabs(*step);
  }

  if (auto lo = parseInteger(first), hi = parseInteger(last); lo && hi) {
    range.kind_  = Range::Kind::NUMERIC;
    range.first_ = *lo;
    range.last_  = *hi;
    if (isPadded(first) || isPadded(last)) {
      range.width_ = std::max(first.size(), last.size());
    }
    return range;
  }

  if (isLetter(first) && isLetter(last)) {
    range.kind_  = Range::Kind::ALPHA;
    range.first_ = static_cast<unsigned char>(first.front());
    range.last_  = static_cast<unsigned char>(last.front());
    return range;
  }

  return std::nullopt;
}

Result<Ast> parse(std::string_view escaped, Options const& options) {
  return Parser(escaped, options).parse();
}

} // namespace braces
