#include "core/random/seeded_random.hpp"

#include <cmath>

#include "core/util/hash.hpp"

namespace advent {
namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

}  // namespace

std::string derive_seed(std::string_view blockhash, std::string_view salt) {
  return util::hmac_sha256_hex(blockhash, salt);
}

std::string derive_hour_seed(std::string_view blockhash, std::string_view salt, int hour) {
  std::string hour_salt{salt};
  hour_salt += std::to_string(hour);
  return derive_seed(blockhash, hour_salt);
}

std::uint32_t seed_prefix_value(std::string_view seed_hex) {
  std::uint32_t value = 0;
  const std::size_t limit = seed_hex.size() < 8U ? seed_hex.size() : 8U;
  for (std::size_t i = 0; i < limit; ++i) {
    const int digit = hex_value(seed_hex[i]);
    if (digit < 0) {
      break;
    }
    value = (value << 4U) | static_cast<std::uint32_t>(digit);
  }
  return value;
}

SeededRandom::SeededRandom(std::string_view seed_hex) : state_(seed_prefix_value(seed_hex)) {}

double SeededRandom::next() {
  // state < 2^32 on the first step and < kModulus afterwards, so the product fits.
  state_ = (state_ * kMultiplier + kIncrement) % kModulus;
  return static_cast<double>(state_) / static_cast<double>(kModulus);
}

std::size_t SeededRandom::next_index(std::size_t bound) {
  const double scaled = std::floor(next() * static_cast<double>(bound));
  const auto index = static_cast<std::size_t>(scaled);
  return index < bound ? index : bound - 1U;
}

}  // namespace advent
