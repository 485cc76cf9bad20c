#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/app_meta.hpp"
#include "core/model/types.hpp"

namespace advent {

using SaltLookup = std::function<std::optional<std::string>(int day)>;

// leaf = sha256(canonicalize(gift) || salt)
std::string compute_leaf(const nlohmann::json& gift, std::string_view salt);
std::string compute_leaf(const RoundSpec& spec, std::string_view salt);

// Requires exactly one spec per day in 1..round_count, each passing its schema.
Result check_season_layout(const std::vector<RoundSpec>& specs, int round_count);

class CommitmentBuilder {
public:
  explicit CommitmentBuilder(std::string season = std::string{kDefaultSeason}, int round_count = kRoundCount);

  Result build(const std::vector<RoundSpec>& specs, const SaltLookup& salt_of, SeasonCommitment& out) const;
  Result build(const std::vector<RoundSpec>& specs, const std::map<int, std::string>& salts,
               SeasonCommitment& out) const;

  [[nodiscard]] int round_count() const { return round_count_; }
  [[nodiscard]] const std::string& season() const { return season_; }

private:
  std::string season_;
  int round_count_ = kRoundCount;
};

}  // namespace advent
