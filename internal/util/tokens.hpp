#pragma once

#include <cstdint>
#include <string_view>

namespace kag::util {

/*
  Rough token estimate for budget checks.

  Real tokenization belongs to the inference engine; the cache only needs an
  upper-bound style guess to keep primed context under the configured budget.
*/

inline constexpr double kDefaultBytesPerToken = 4.0;

uint64_t EstimateTokens(std::string_view text, double bytes_per_token = kDefaultBytesPerToken);

} // namespace kag::util
