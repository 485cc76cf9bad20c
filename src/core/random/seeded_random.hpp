#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace advent {

// seed = HMAC-SHA-256(message = blockhash, key = salt), lowercase hex.
std::string derive_seed(std::string_view blockhash, std::string_view salt);

// Seed for one hourly airdrop slot: the round salt suffixed with the decimal hour.
std::string derive_hour_seed(std::string_view blockhash, std::string_view salt, int hour);

// 32-bit linear congruential generator, s' = (s * 9301 + 49297) mod 233280,
// seeded from the first eight hex characters of a seed. Reproducible, not
// cryptographically strong: the unpredictability comes from the blockhash.
class SeededRandom {
public:
  static constexpr std::uint64_t kMultiplier = 9301;
  static constexpr std::uint64_t kIncrement = 49297;
  static constexpr std::uint64_t kModulus = 233280;

  explicit SeededRandom(std::string_view seed_hex);

  // Uniform draw in [0, 1).
  double next();

  // floor(next() * bound), bound > 0.
  std::size_t next_index(std::size_t bound);

  [[nodiscard]] std::uint64_t state() const { return state_; }

private:
  std::uint64_t state_ = 0;
};

// Parses up to the first eight hex characters; non-hex input stops the parse.
std::uint32_t seed_prefix_value(std::string_view seed_hex);

// Fisher-Yates from the back: for i = n-1 .. 1 swap items[i] with
// items[floor(draw * (i + 1))].
template <typename T>
std::vector<T> seeded_shuffle(std::vector<T> items, std::string_view seed_hex) {
  if (items.size() < 2U) {
    return items;
  }
  SeededRandom rng(seed_hex);
  for (std::size_t i = items.size() - 1U; i > 0U; --i) {
    const std::size_t j = rng.next_index(i + 1U);
    using std::swap;
    swap(items[i], items[j]);
  }
  return items;
}

}  // namespace advent
