#include <algorithm>
#include <cstddef>
#include <variant>

#include "core/random/seeded_random.hpp"
#include "core/rules/distribution_rule.hpp"
#include "core/util/amount.hpp"

namespace advent {
namespace {

std::vector<HolderSnapshot> eligible_holders(const RuleContext& ctx, const Amount& min_balance) {
  std::vector<HolderSnapshot> eligible;
  for (const auto& holder : ctx.inputs.holders) {
    if (ctx.excluded(holder.wallet) || holder.balance < min_balance) {
      continue;
    }
    eligible.push_back(holder);
  }

  ctx.step("filter_eligible_holders",
           "Found " + std::to_string(eligible.size()) + " eligible holders.",
           {{"total_holders", std::to_string(ctx.inputs.holders.size())},
            {"eligible", std::to_string(eligible.size())},
            {"min_balance", util::amount_to_string(min_balance)}});
  return eligible;
}

}  // namespace

Result ProportionalHoldersRule::apply(const RuleContext& ctx, ExecutionResult& out) const {
  const auto* params = std::get_if<ProportionalHoldersParams>(&ctx.spec.params);
  if (params == nullptr) {
    return Result::failure("proportional_holders requires proportional params.");
  }

  out.distribution_pool = util::percent_of(ctx.inputs.pool_amount, params->allocation_percent);
  const std::vector<HolderSnapshot> eligible = eligible_holders(ctx, params->min_balance);
  out.eligible_count = eligible.size();

  Amount total_balance = 0;
  for (const auto& holder : eligible) {
    total_balance += holder.balance;
  }
  if (eligible.empty() || total_balance == 0) {
    out.skip_reason = "no_eligible_holders";
    ctx.step("skip", "No eligible holders with a positive balance.");
    return Result::success("No eligible holders.");
  }

  ctx.step("calculate_total_balance", "Total eligible balance computed.",
           {{"total_balance", util::amount_to_string(total_balance)},
            {"distribution_pool", util::amount_to_string(out.distribution_pool)}});

  // share = floor(balance * pool * percent / (100 * total_balance))
  const Amount numerator_scale = ctx.inputs.pool_amount * params->allocation_percent;
  const Amount denominator = total_balance * 100;
  for (const auto& holder : eligible) {
    Winner winner;
    winner.wallet = holder.wallet;
    winner.amount = (holder.balance * numerator_scale) / denominator;
    winner.balance = holder.balance;
    winner.reason = "proportional_balance_" + util::amount_to_string(holder.balance);
    out.winners.push_back(std::move(winner));
  }

  ctx.step("calculate_shares", "Proportional shares assigned.",
           {{"winners", std::to_string(out.winners.size())}});
  return Result::success("Proportional distribution computed.");
}

Result DeterministicRandomRule::apply(const RuleContext& ctx, ExecutionResult& out) const {
  const auto* params = std::get_if<DeterministicRandomParams>(&ctx.spec.params);
  if (params == nullptr) {
    return Result::failure("deterministic_random requires random selection params.");
  }

  out.distribution_pool = util::percent_of(ctx.inputs.pool_amount, params->allocation_percent);
  const std::vector<HolderSnapshot> eligible = eligible_holders(ctx, params->min_balance);
  out.eligible_count = eligible.size();
  if (eligible.empty()) {
    out.skip_reason = "no_eligible_holders";
    ctx.step("skip", "No eligible holders.");
    return Result::success("No eligible holders.");
  }

  out.seed = derive_seed(ctx.inputs.blockhash, ctx.salt);
  ctx.step("generate_seed", "Seed derived from blockhash and round salt.", {{"seed", out.seed}});

  const std::vector<HolderSnapshot> shuffled = seeded_shuffle(eligible, out.seed);
  const std::size_t count = std::min<std::size_t>(params->winner_count, shuffled.size());
  const std::vector<HolderSnapshot> selected(shuffled.begin(), shuffled.begin() + static_cast<std::ptrdiff_t>(count));
  ctx.step("select_winners", "Selected " + std::to_string(count) + " winners.",
           {{"requested", std::to_string(params->winner_count)}, {"selected", std::to_string(count)}});

  std::vector<Amount> shares;
  if (params->split == SplitMode::Proportional) {
    std::vector<Amount> weights;
    weights.reserve(selected.size());
    for (const auto& holder : selected) {
      weights.push_back(holder.balance);
    }
    shares = split_by_weight(out.distribution_pool, weights);
  } else {
    shares = split_equally(out.distribution_pool, selected.size());
  }

  for (std::size_t i = 0; i < selected.size(); ++i) {
    Winner winner;
    winner.wallet = selected[i].wallet;
    winner.amount = shares[i];
    winner.balance = selected[i].balance;
    winner.reason = "random_selection";
    out.winners.push_back(std::move(winner));
  }
  return Result::success("Random selection computed.");
}

}  // namespace advent
