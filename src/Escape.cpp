#include "braces/Escape.hpp"
#include "braces/Constants.hpp"

#include <string>
#include <string_view>

namespace braces {

std::string escape(std::string_view pattern, Options const& /*options*/) {
  std::string out;
  out.reserve(pattern.size());
  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\' && i + 1 < pattern.size()) {
      out.push_back(ESCAPE_MARK);
      out.push_back(pattern[i + 1]);
      ++i;
      continue;
    }
    if (c == ESCAPE_MARK) {
      out.push_back(ESCAPE_MARK);
    }
    out.push_back(c);
  }
  return out;
}

std::string unescape(std::string_view text, Options const& options) {
  if (!hasEscapes(text)) {
    return std::string(text);
  }
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == ESCAPE_MARK && i + 1 < text.size()) {
      // A doubled mark is a mark byte from the caller, never a backslash escape
      if (!options.unescape_ && text[i + 1] != ESCAPE_MARK) {
        out.push_back('\\');
      }
      out.push_back(text[i + 1]);
      ++i;
      continue;
    }
    out.push_back(c);
  }
  return out;
}

bool hasEscapes(std::string_view text) noexcept {
  return text.find(ESCAPE_MARK) != std::string_view::npos;
}

} // namespace braces
