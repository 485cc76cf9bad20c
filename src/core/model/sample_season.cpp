#include "core/model/sample_season.hpp"

#include <string>

#include "core/model/app_meta.hpp"
#include "core/model/spec_codec.hpp"

namespace advent {

std::vector<RoundSpec> sample_season(std::string_view ngo_wallet) {
  std::vector<RoundSpec> specs;
  specs.reserve(kRoundCount);

  for (int day = 1; day <= kRoundCount; ++day) {
    RoundSpec spec;
    spec.day = day;
    spec.distribution_source = std::string{kDefaultDistributionSource};

    if (day % 7 == 0) {
      spec.type = RoundType::FullDonationToNgo;
      spec.params = NgoDonationParams{.ngo_wallet = std::string{ngo_wallet}, .percent = 100};
      spec.hint = "A gift that travels further";
      spec.sub_hint = "Someone else unwraps this one";
    } else if (day % 5 == 0) {
      spec.type = RoundType::TopBuyersAirdrop;
      spec.params = TopBuyersParams{.top_n = 10, .allocation_percent = 40, .split = SplitMode::Proportional};
      spec.hint = "Early birds and big baskets";
      spec.sub_hint = "Volume speaks today";
    } else if (day % 3 == 0) {
      spec.type = RoundType::DeterministicRandom;
      spec.params = DeterministicRandomParams{
          .winner_count = 20, .allocation_percent = 40, .min_balance = 1000, .split = SplitMode::Equal};
      spec.hint = "Luck of the block";
      spec.sub_hint = "The chain rolls the dice";
    } else {
      spec.type = RoundType::ProportionalHolders;
      spec.params = ProportionalHoldersParams{.allocation_percent = 40, .min_balance = 100};
      spec.hint = "Every stocking gets filled";
      spec.sub_hint = "The more you hold, the more you get";
    }

    spec.notes = "Day " + std::to_string(day) + " gift - " + std::string{round_type_name(spec.type)};
    specs.push_back(std::move(spec));
  }

  return specs;
}

}  // namespace advent
