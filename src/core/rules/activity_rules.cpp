#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <variant>

#include "core/model/app_meta.hpp"
#include "core/random/seeded_random.hpp"
#include "core/rules/distribution_rule.hpp"
#include "core/util/amount.hpp"
#include "core/util/canonical.hpp"

namespace advent {
namespace {

template <typename Key>
std::vector<std::pair<std::string, Key>> rank_descending(const std::map<std::string, Key>& totals) {
  std::vector<std::pair<std::string, Key>> ranked(totals.begin(), totals.end());
  // Map order is lexical, so a stable sort leaves ties in wallet order.
  std::ranges::stable_sort(ranked, [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });
  return ranked;
}

}  // namespace

Result TopBuyersRule::apply(const RuleContext& ctx, ExecutionResult& out) const {
  const auto* params = std::get_if<TopBuyersParams>(&ctx.spec.params);
  if (params == nullptr) {
    return Result::failure("top_buyers_airdrop requires top buyer params.");
  }

  out.distribution_pool = util::percent_of(ctx.inputs.pool_amount, params->allocation_percent);

  std::map<std::string, Amount> volumes;
  std::size_t buy_count = 0;
  for (const auto& tx : ctx.inputs.transactions) {
    if (tx.kind != TransactionKind::Buy || tx.to_wallet.empty() || ctx.excluded(tx.to_wallet)) {
      continue;
    }
    ++buy_count;
    volumes[tx.to_wallet] += tx.amount;
  }
  ctx.step("filter_buy_transactions", "Aggregated buy volume per wallet.",
           {{"buy_transactions", std::to_string(buy_count)}, {"buyers", std::to_string(volumes.size())}});

  std::erase_if(volumes, [](const auto& entry) { return entry.second == 0; });
  out.eligible_count = volumes.size();
  if (volumes.empty()) {
    out.skip_reason = "no_buyers";
    ctx.step("skip", "No buy transactions in the round window.");
    return Result::success("No buyers.");
  }

  auto ranked = rank_descending(volumes);
  if (ranked.size() > params->top_n) {
    ranked.resize(params->top_n);
  }
  ctx.step("rank_buyers", "Selected top " + std::to_string(ranked.size()) + " buyers.",
           {{"top_n", std::to_string(params->top_n)}});

  std::vector<Amount> shares;
  if (params->split == SplitMode::Proportional) {
    std::vector<Amount> weights;
    weights.reserve(ranked.size());
    for (const auto& [wallet, volume] : ranked) {
      weights.push_back(volume);
    }
    shares = split_by_weight(out.distribution_pool, weights);
  } else {
    shares = split_equally(out.distribution_pool, ranked.size());
  }

  for (std::size_t i = 0; i < ranked.size(); ++i) {
    Winner winner;
    winner.wallet = ranked[i].first;
    winner.amount = shares[i];
    winner.reason = "top_buyer_volume_" + util::amount_to_string(ranked[i].second);
    out.winners.push_back(std::move(winner));
  }
  return Result::success("Top buyers computed.");
}

Result LastSecondHourRule::apply(const RuleContext& ctx, ExecutionResult& out) const {
  const auto* params = std::get_if<LastSecondHourParams>(&ctx.spec.params);
  if (params == nullptr) {
    return Result::failure("last_second_hour requires window params.");
  }

  out.distribution_pool = util::percent_of(ctx.inputs.pool_amount, params->allocation_percent);
  const int first_minute = 60 - static_cast<int>(params->window_minutes);

  std::set<std::string> wallets;
  std::size_t window_tx = 0;
  for (const auto& tx : ctx.inputs.transactions) {
    if (util::utc_hour_of(tx.block_time_unix) != kHoursPerDay - 1 || util::utc_minute_of(tx.block_time_unix) < first_minute) {
      continue;
    }
    ++window_tx;
    const std::string& wallet = participant_wallet(tx);
    if (!wallet.empty() && !ctx.excluded(wallet)) {
      wallets.insert(wallet);
    }
  }
  ctx.step("filter_last_window", "Collected wallets active in the final window.",
           {{"window_minutes", std::to_string(params->window_minutes)},
            {"transactions", std::to_string(window_tx)},
            {"wallets", std::to_string(wallets.size())}});

  out.eligible_count = wallets.size();
  if (wallets.empty()) {
    out.skip_reason = "no_window_transactions";
    ctx.step("skip", "No transactions in the final window.");
    return Result::success("No window transactions.");
  }

  out.seed = derive_seed(ctx.inputs.blockhash, ctx.salt);
  ctx.step("generate_seed", "Seed derived from blockhash and round salt.", {{"seed", out.seed}});

  std::vector<std::string> shuffled = seeded_shuffle(std::vector<std::string>(wallets.begin(), wallets.end()), out.seed);
  if (shuffled.size() > params->winner_count) {
    shuffled.resize(params->winner_count);
  }

  const std::vector<Amount> shares = split_equally(out.distribution_pool, shuffled.size());
  for (std::size_t i = 0; i < shuffled.size(); ++i) {
    Winner winner;
    winner.wallet = shuffled[i];
    winner.amount = shares[i];
    winner.reason = "last_second_hour";
    out.winners.push_back(std::move(winner));
  }
  ctx.step("select_winners", "Selected " + std::to_string(out.winners.size()) + " bonus winners.");
  return Result::success("Last window selection computed.");
}

Result MostActiveTraderRule::apply(const RuleContext& ctx, ExecutionResult& out) const {
  const auto* params = std::get_if<MostActiveTraderParams>(&ctx.spec.params);
  if (params == nullptr) {
    return Result::failure("most_active_trader requires trader params.");
  }

  out.distribution_pool = util::percent_of(ctx.inputs.pool_amount, params->allocation_percent);

  std::map<std::string, std::uint64_t> counts;
  for (const auto& tx : ctx.inputs.transactions) {
    const std::string& wallet = participant_wallet(tx);
    if (wallet.empty() || ctx.excluded(wallet)) {
      continue;
    }
    ++counts[wallet];
  }
  std::erase_if(counts, [&params](const auto& entry) { return entry.second < params->min_trades; });
  ctx.step("count_trades", "Counted trades per wallet.",
           {{"eligible", std::to_string(counts.size())}, {"min_trades", std::to_string(params->min_trades)}});

  out.eligible_count = counts.size();
  if (counts.empty()) {
    out.skip_reason = "no_eligible_traders";
    ctx.step("skip", "No wallet reached the minimum trade count.");
    return Result::success("No eligible traders.");
  }

  const auto ranked = rank_descending(counts);
  const auto& [wallet, trades] = ranked.front();

  Winner winner;
  winner.wallet = wallet;
  winner.amount = out.distribution_pool;
  winner.reason = "most_active_trader_" + std::to_string(trades) + "_transactions";
  out.winners.push_back(std::move(winner));
  ctx.step("select_winner", "Most active trader selected.", {{"wallet", wallet}, {"trades", std::to_string(trades)}});
  return Result::success("Most active trader computed.");
}

}  // namespace advent
