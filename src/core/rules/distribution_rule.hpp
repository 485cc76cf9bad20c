#pragma once

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace advent {

// Everything a rule may read. Transactions are already narrowed to the
// round's time window; the log is the caller's.
struct RuleContext {
  const RoundSpec& spec;
  std::string_view salt;
  const DayInputs& inputs;
  const std::set<std::string>& excluded_wallets;
  ExecutionLog& log;

  [[nodiscard]] bool excluded(std::string_view wallet) const;
  void step(std::string step_name, std::string message,
            std::vector<std::pair<std::string, std::string>> fields = {}) const;
};

class IDistributionRule {
public:
  virtual ~IDistributionRule() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  // Fills winners, distribution_pool, eligible_count, seed and skip_reason.
  // Totals and the remainder are settled by the evaluator.
  virtual Result apply(const RuleContext& ctx, ExecutionResult& out) const = 0;
};

class ProportionalHoldersRule final : public IDistributionRule {
public:
  [[nodiscard]] std::string_view name() const override { return "proportional_holders"; }
  Result apply(const RuleContext& ctx, ExecutionResult& out) const override;
};

class DeterministicRandomRule final : public IDistributionRule {
public:
  [[nodiscard]] std::string_view name() const override { return "deterministic_random"; }
  Result apply(const RuleContext& ctx, ExecutionResult& out) const override;
};

class TopBuyersRule final : public IDistributionRule {
public:
  [[nodiscard]] std::string_view name() const override { return "top_buyers_airdrop"; }
  Result apply(const RuleContext& ctx, ExecutionResult& out) const override;
};

class LastSecondHourRule final : public IDistributionRule {
public:
  [[nodiscard]] std::string_view name() const override { return "last_second_hour"; }
  Result apply(const RuleContext& ctx, ExecutionResult& out) const override;
};

class MostActiveTraderRule final : public IDistributionRule {
public:
  [[nodiscard]] std::string_view name() const override { return "most_active_trader"; }
  Result apply(const RuleContext& ctx, ExecutionResult& out) const override;
};

class NgoDonationRule final : public IDistributionRule {
public:
  explicit NgoDonationRule(bool full_donation) : full_donation_(full_donation) {}

  [[nodiscard]] std::string_view name() const override {
    return full_donation_ ? "full_donation_to_ngo" : "ngo_donation";
  }
  Result apply(const RuleContext& ctx, ExecutionResult& out) const override;

private:
  bool full_donation_ = false;
};

std::unique_ptr<IDistributionRule> make_distribution_rule(RoundType type);

// Hourly token lottery over each hour's buyers; fills token_airdrops,
// token_distributed and token_remainder. No-op when the round has no enabled airdrop.
Result run_token_airdrop(const RuleContext& ctx, ExecutionResult& out);

// Wallet credited with a transaction's activity: buyers receive, everyone else sends.
[[nodiscard]] const std::string& participant_wallet(const TransactionRecord& tx);

// Integer floor split of `pool` over `weights`; a zero total weight yields zeros.
[[nodiscard]] std::vector<Amount> split_by_weight(const Amount& pool, const std::vector<Amount>& weights);
[[nodiscard]] std::vector<Amount> split_equally(const Amount& pool, std::size_t count);

}  // namespace advent
