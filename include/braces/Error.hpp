#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace braces {

enum struct ErrorKind {
  PARSE,
  RANGE,
  REGEX,
  NO_MATCH,
  INVALID_OPTION
};

struct Error {
  ErrorKind   kind_;
  std::string message_;
  // Pattern text the failure was raised for, empty when not applicable
  std::string pattern_;

  [[nodiscard]] std::string const& message() const noexcept {
    return message_;
  }
};

template<typename T>
using Result = std::expected<T, Error>;

std::string_view kindName(ErrorKind kind) noexcept;

Error parseError(std::string_view pattern, std::string message);
Error rangeError(std::string_view pattern, std::string message);
Error regexError(std::string_view pattern, std::string message);
Error noMatchError(std::string_view pattern);
Error invalidOption(std::string message);

} // namespace braces
