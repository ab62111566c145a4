#pragma once

#include "braces/Options.hpp"

#include <string>
#include <string_view>

namespace braces {

// Replaces every backslash escape "\c" with ESCAPE_MARK followed by c, so the
// parser sees escaped bytes as plain literals. A raw ESCAPE_MARK byte in the
// pattern is doubled.
std::string escape(std::string_view pattern, Options const& options);

// Reverses escape(): a marked byte comes back bare when options.unescape_ is
// set and with its backslash otherwise.
std::string unescape(std::string_view text, Options const& options);

[[nodiscard]] bool hasEscapes(std::string_view text) noexcept;

} // namespace braces
