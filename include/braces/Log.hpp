#pragma once

#include "braces/Constants.hpp"

#include <cstdio>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace braces::log {

// True when the DEBUG environment variable names this library (or is "*").
// Read once per process.
bool enabled() noexcept;

bool matchesNamespace(std::string_view debug_env) noexcept;

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (!enabled()) {
    return;
  }
  fmt::print(stderr, "{} {}\n", LOG_NAMESPACE, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace braces::log
