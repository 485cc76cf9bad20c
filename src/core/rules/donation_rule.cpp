#include <variant>

#include "core/rules/distribution_rule.hpp"
#include "core/util/amount.hpp"

namespace advent {

Result NgoDonationRule::apply(const RuleContext& ctx, ExecutionResult& out) const {
  const auto* params = std::get_if<NgoDonationParams>(&ctx.spec.params);
  if (params == nullptr || params->ngo_wallet.empty()) {
    return Result::failure(std::string{name()} + " requires an ngo_wallet.");
  }

  // A full donation ignores any configured percent.
  const std::uint32_t percent = full_donation_ ? 100U : params->percent;
  out.distribution_pool = util::percent_of(ctx.inputs.pool_amount, percent);
  out.eligible_count = 1;

  Winner winner;
  winner.wallet = params->ngo_wallet;
  winner.amount = out.distribution_pool;
  winner.reason = full_donation_ ? "full_donation_to_ngo" : "ngo_donation";
  out.winners.push_back(std::move(winner));

  ctx.step("donate", "Pool assigned to the NGO wallet.",
           {{"wallet", params->ngo_wallet},
            {"percent", std::to_string(percent)},
            {"amount", util::amount_to_string(out.distribution_pool)}});
  return Result::success("NGO donation computed.");
}

}  // namespace advent
