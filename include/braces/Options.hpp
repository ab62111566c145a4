#pragma once

#include "braces/Constants.hpp"
#include "braces/Error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace braces {

struct Options {
  bool   expand_        = false;
  bool   make_re_       = false;
  bool   unescape_      = false;
  bool   cache_         = true;
  bool   failglob_      = false;
  bool   nonull_        = false;
  bool   nullglob_      = false;
  bool   nodupes_       = true;
  bool   strict_errors_ = false;
  size_t range_limit_   = DEFAULT_RANGE_LIMIT;

  // Expansion output is produced only when expand_ is set and make_re_ is not
  [[nodiscard]] bool expansionMode() const noexcept {
    return expand_ && !make_re_;
  }

  bool operator==(Options const&) const = default;
};

// Identity of a (pattern, options) pair for the matcher and regex stores.
// Options are appended as ";name=value" in a fixed order; `cache` is left out
// since it only controls whether a stored regex may be read back. As a result
// an isMatch() call with cache_ == false reuses a matcher stored by an earlier
// call that differed only in cache_.
std::string cacheKey(std::string_view pattern, Options const& options);

// Reads "name[=value],name[=value],..." into Options. Unknown names are rejected.
Result<Options> parseOptions(std::string_view text);

} // namespace braces
