#include "tokens.hpp"

namespace kag::util {

uint64_t EstimateTokens(std::string_view text, double bytes_per_token) {
  if (bytes_per_token <= 0.0) {
    return text.size();
  }
  return static_cast<uint64_t>(static_cast<double>(text.size()) / bytes_per_token);
}

} // namespace kag::util
