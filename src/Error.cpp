#include "braces/Error.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace braces {

std::string_view kindName(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::PARSE:
    return "parse error";
  case ErrorKind::RANGE:
    return "range error";
  case ErrorKind::REGEX:
    return "regex error";
  case ErrorKind::NO_MATCH:
    return "no match";
  case ErrorKind::INVALID_OPTION:
    return "invalid option";
  }
  return "error";
}

Error parseError(std::string_view pattern, std::string message) {
  return Error{ErrorKind::PARSE, std::move(message), std::string(pattern)};
}

Error rangeError(std::string_view pattern, std::string message) {
  return Error{ErrorKind::RANGE, std::move(message), std::string(pattern)};
}

Error regexError(std::string_view pattern, std::string message) {
  return Error{ErrorKind::REGEX, std::move(message), std::string(pattern)};
}

Error noMatchError(std::string_view pattern) {
  return Error{ErrorKind::NO_MATCH, fmt::format("no matches found for \"{}\"", pattern), std::string(pattern)};
}

Error invalidOption(std::string message) {
  return Error{ErrorKind::INVALID_OPTION, std::move(message), {}};
}

} // namespace braces
