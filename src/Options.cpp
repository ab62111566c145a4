#include "braces/Options.hpp"
#include "braces/Error.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace braces {

namespace {

struct BoolOption {
  std::string_view name_;
  bool Options::*  field_;
};

// cacheKey() emits these in this order
constexpr std::array BOOL_OPTIONS{
    BoolOption{"expand", &Options::expand_},
    BoolOption{"failglob", &Options::failglob_},
    BoolOption{"make_re", &Options::make_re_},
    BoolOption{"nodupes", &Options::nodupes_},
    BoolOption{"nonull", &Options::nonull_},
    BoolOption{"nullglob", &Options::nullglob_},
    BoolOption{"strict_errors", &Options::strict_errors_},
    BoolOption{"unescape", &Options::unescape_},
};

constexpr std::string_view CACHE_OPTION       = "cache";
constexpr std::string_view RANGE_LIMIT_OPTION = "range_limit";

std::string_view trim(std::string_view sv) {
  auto const first = sv.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  auto const last = sv.find_last_not_of(" \t");
  return sv.substr(first, last - first + 1);
}

Result<bool> parseBool(std::string_view name, std::string_view value) {
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  return std::unexpected(invalidOption(fmt::format("option {} expects true or false, got '{}'", name, value)));
}

Result<void> applyOption(Options& options, std::string_view name, std::optional<std::string_view> value) {
  if (name == RANGE_LIMIT_OPTION) {
    if (!value) {
      return std::unexpected(invalidOption(fmt::format("option {} requires a value", name)));
    }
    size_t limit = 0;
    if (auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), limit);
        ec != std::errc{} || ptr != value->data() + value->size()) {
      return std::unexpected(invalidOption(fmt::format("option {} expects a number, got '{}'", name, *value)));
    }
    options.range_limit_ = limit;
    return {};
  }

  bool Options::*field = nullptr;
  if (name == CACHE_OPTION) {
    field = &Options::cache_;
  } else if (auto it = std::ranges::find(BOOL_OPTIONS, name, &BoolOption::name_); it != BOOL_OPTIONS.end()) {
    field = it->field_;
  } else {
    return std::unexpected(invalidOption(fmt::format("unknown option '{}'", name)));
  }

  if (!value) {
    options.*field = true;
    return {};
  }
  auto flag = parseBool(name, *value);
  if (!flag) {
    return std::unexpected(flag.error());
  }
  options.*field = *flag;
  return {};
}

} // namespace

std::string cacheKey(std::string_view pattern, Options const& options) {
  std::string key(pattern);
  for (auto const& option : BOOL_OPTIONS) {
    fmt::format_to(std::back_inserter(key), ";{}={}", option.name_, options.*(option.field_));
  }
  fmt::format_to(std::back_inserter(key), ";{}={}", RANGE_LIMIT_OPTION, options.range_limit_);
  return key;
}

Result<Options> parseOptions(std::string_view text) {
  Options options;
  size_t  start = 0;
  while (start <= text.size()) {
    size_t end = text.find(',', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto item = trim(text.substr(start, end - start));
    start     = end + 1;
    if (item.empty()) {
      continue;
    }

    std::optional<std::string_view> value;
    auto                            name = item;
    if (auto eq = item.find('='); eq != std::string_view::npos) {
      name  = trim(item.substr(0, eq));
      value = trim(item.substr(eq + 1));
    }
    if (auto applied = applyOption(options, name, value); !applied) {
      return std::unexpected(applied.error());
    }
  }
  return options;
}

} // namespace braces
