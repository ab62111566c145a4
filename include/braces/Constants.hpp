#pragma once

#include <cstddef>
#include <string_view>

namespace braces {

// Marks a byte that was backslash-escaped in the caller's pattern
static constexpr inline char ESCAPE_MARK = '\x1f';

static constexpr inline size_t DEFAULT_RANGE_LIMIT = 250;

// Environment variable read by the debug logger, matched against LOG_NAMESPACE
static constexpr inline std::string_view DEBUG_ENV     = "DEBUG";
static constexpr inline std::string_view LOG_NAMESPACE = "braces";

} // namespace braces
