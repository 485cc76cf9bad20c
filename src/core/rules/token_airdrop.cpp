#include <set>
#include <string>
#include <vector>

#include "core/model/app_meta.hpp"
#include "core/random/seeded_random.hpp"
#include "core/rules/distribution_rule.hpp"
#include "core/util/amount.hpp"
#include "core/util/canonical.hpp"

namespace advent {

Result run_token_airdrop(const RuleContext& ctx, ExecutionResult& out) {
  if (!ctx.spec.token_airdrop.has_value() || !ctx.spec.token_airdrop->enabled) {
    return Result::success();
  }

  const Amount& total = ctx.spec.token_airdrop->total_amount;
  const Amount per_hour = total / kHoursPerDay;

  std::vector<std::set<std::string>> buyers_by_hour(static_cast<std::size_t>(kHoursPerDay));
  for (const auto& tx : ctx.inputs.transactions) {
    if (tx.kind != TransactionKind::Buy || tx.to_wallet.empty() || ctx.excluded(tx.to_wallet)) {
      continue;
    }
    buyers_by_hour[static_cast<std::size_t>(util::utc_hour_of(tx.block_time_unix))].insert(tx.to_wallet);
  }

  out.token_airdrops.clear();
  out.token_distributed = 0;
  for (int hour = 0; hour < kHoursPerDay; ++hour) {
    const auto& buyers = buyers_by_hour[static_cast<std::size_t>(hour)];
    if (buyers.empty() || per_hour == 0) {
      continue;
    }
    const std::string seed = derive_hour_seed(ctx.inputs.blockhash, ctx.salt, hour);
    const std::vector<std::string> shuffled =
        seeded_shuffle(std::vector<std::string>(buyers.begin(), buyers.end()), seed);
    out.token_airdrops.push_back({.wallet = shuffled.front(), .amount = per_hour, .hour = hour});
    out.token_distributed += per_hour;
  }
  out.token_remainder = total - out.token_distributed;

  ctx.step("token_airdrop", "Hourly token airdrop settled.",
           {{"hours_paid", std::to_string(out.token_airdrops.size())},
            {"per_hour", util::amount_to_string(per_hour)},
            {"token_remainder", util::amount_to_string(out.token_remainder)}});
  return Result::success();
}

}  // namespace advent
