#include "braces/Compiler.hpp"
#include "braces/AST.hpp"
#include "braces/Constants.hpp"
#include "braces/Log.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <re2/re2.h>

namespace braces {

namespace {

std::vector<std::string> product(std::vector<std::string> const& prefixes, std::vector<std::string> const& items) {
  std::vector<std::string> out;
  out.reserve(prefixes.size() * items.size());
  for (auto const& prefix : prefixes) {
    for (auto const& item : items) {
      out.push_back(prefix + item);
    }
  }
  return out;
}

void dedupe(std::vector<std::string>& items) {
  std::unordered_set<std::string> seen;
  std::vector<std::string>        unique;
  unique.reserve(items.size());
  for (auto& item : items) {
    if (seen.insert(item).second) {
      unique.push_back(std::move(item));
    }
  }
  items = std::move(unique);
}

bool isAlnum(long long c) {
  return c >= 0 && c <= 0x7f && std::isalnum(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string quoteLiteral(std::string_view text) {
  std::string plain;
  plain.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == ESCAPE_MARK && i + 1 < text.size()) {
      ++i;
    }
    plain.push_back(text[i]);
  }
  return re2::RE2::QuoteMeta(plain);
}

Compiler::Compiler(Options const& options, std::string_view source)
    : options_(options), source_(source) {}

Result<CompiledOutput> Compiler::compile(Ast const& ast) const {
  if (options_.expansionMode()) {
    auto items = expandSequence(ast.root_);
    if (!items) {
      return std::unexpected(items.error());
    }
    if (options_.nodupes_) {
      dedupe(*items);
    }
    log::debug("expanded '{}' to {} string(s)", source_, items->size());
    return Expansion{std::move(*items)};
  }

  auto source = regexSequence(ast.root_);
  if (!source) {
    return std::unexpected(source.error());
  }
  log::debug("compiled '{}' to /{}/", source_, *source);
  return Pattern{std::move(*source)};
}

Result<std::vector<std::string>> Compiler::expandSequence(Sequence const& sequence) const {
  std::vector<std::string> out{std::string{}};
  for (auto const& node : sequence.nodes_) {
    auto items = std::visit(
        [this](auto const& n) -> Result<std::vector<std::string>> {
          using N = std::decay_t<decltype(n)>;
          if constexpr (std::is_same_v<N, Literal>) {
            return std::vector<std::string>{n.text_};
          } else if constexpr (std::is_same_v<N, Range>) {
            return rangeItems(n);
          } else {
            std::vector<std::string> all;
            for (auto const& item : n.items_) {
              auto expanded = expandSequence(item);
              if (!expanded) {
                return std::unexpected(expanded.error());
              }
              all.insert(all.end(), std::make_move_iterator(expanded->begin()), std::make_move_iterator(expanded->end()));
            }
            return all;
          }
        },
        node
    );
    if (!items) {
      return std::unexpected(items.error());
    }
    out = product(out, *items);
  }
  return out;
}

Result<std::string> Compiler::regexSequence(Sequence const& sequence) const {
  std::string out;
  for (auto const& node : sequence.nodes_) {
    auto part = std::visit(
        [this](auto const& n) -> Result<std::string> {
          using N = std::decay_t<decltype(n)>;
          if constexpr (std::is_same_v<N, Literal>) {
            return quoteLiteral(n.text_);
          } else if constexpr (std::is_same_v<N, Range>) {
            return regexRange(n);
          } else {
            std::vector<std::string> alternatives;
            alternatives.reserve(n.items_.size());
            for (auto const& item : n.items_) {
              auto alternative = regexSequence(item);
              if (!alternative) {
                return std::unexpected(alternative.error());
              }
              alternatives.push_back(std::move(*alternative));
            }
            return fmt::format("({})", fmt::join(alternatives, "|"));
          }
        },
        node
    );
    if (!part) {
      return std::unexpected(part.error());
    }
    out += *part;
  }
  return out;
}

Result<std::vector<std::string>> Compiler::rangeItems(Range const& range) const {
  auto const lo    = std::min(range.first_, range.last_);
  auto const hi    = std::max(range.first_, range.last_);
  auto const span  = static_cast<unsigned long long>(hi) - static_cast<unsigned long long>(lo);
  auto const steps = span / static_cast<unsigned long long>(range.step_);
  // steps + 1 wraps when the range spans the whole long long domain
  if (steps >= options_.range_limit_) {
    return std::unexpected(rangeError(
        source_, fmt::format("range {{{}}} produces more than {} items", range.text_, options_.range_limit_)
    ));
  }
  auto const count = steps + 1;

  std::vector<std::string> items;
  items.reserve(count);
  long long const direction = range.first_ <= range.last_ ? 1 : -1;
  long long       value     = range.first_;
  for (unsigned long long i = 0; i < count; ++i) {
    if (range.kind_ == Range::Kind::ALPHA) {
      items.emplace_back(1, static_cast<char>(value));
    } else if (range.width_ > 0) {
      items.push_back(fmt::format("{:0{}}", value, range.width_));
    } else {
      items.push_back(fmt::format("{}", value));
    }
    if (i + 1 < count) {
      value += direction * range.step_;
    }
  }
  return items;
}

Result<std::string> Compiler::regexRange(Range const& range) const {
  auto const lo = std::min(range.first_, range.last_);
  auto const hi = std::max(range.first_, range.last_);

  if (range.step_ == 1 && range.width_ == 0) {
    bool const digits  = range.kind_ == Range::Kind::NUMERIC && lo >= 0 && hi <= 9;
    bool const letters = range.kind_ == Range::Kind::ALPHA && isAlnum(lo) && isAlnum(hi);
    if (digits || letters) {
      auto const as_char = [&](long long v) {
        return digits ? static_cast<char>('0' + v) : static_cast<char>(v);
      };
      return fmt::format("([{}-{}])", as_char(lo), as_char(hi));
    }
  }

  auto items = rangeItems(range);
  if (!items) {
    return std::unexpected(items.error());
  }
  for (auto& item : *items) {
    item = re2::RE2::QuoteMeta(item);
  }
  return fmt::format("({})", fmt::join(*items, "|"));
}

} // namespace braces
