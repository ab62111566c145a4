#include "braces/Log.hpp"
#include "braces/Constants.hpp"

#include <cstdlib>
#include <string_view>

namespace braces::log {

bool matchesNamespace(std::string_view debug_env) noexcept {
  // Same shape as the `debug` convention: a comma or space separated list of
  // names where "*" enables everything
  size_t start = 0;
  while (start <= debug_env.size()) {
    size_t end = debug_env.find_first_of(", ", start);
    if (end == std::string_view::npos) {
      end = debug_env.size();
    }
    auto name = debug_env.substr(start, end - start);
    if (name == "*" || name == LOG_NAMESPACE || name == "braces:*") {
      return true;
    }
    start = end + 1;
  }
  return false;
}

bool enabled() noexcept {
  static bool const ENABLED = [] {
    char const* value = std::getenv(DEBUG_ENV.data());
    return value != nullptr && matchesNamespace(value);
  }();
  return ENABLED;
}

} // namespace braces::log
