#include "core/rules/evaluator.hpp"

#include <utility>

#include "core/model/spec_codec.hpp"
#include "core/rules/distribution_rule.hpp"
#include "core/util/amount.hpp"

namespace advent {
namespace {

DayInputs window_filtered(const DayInputs& inputs) {
  if (inputs.window_start_unix == 0 && inputs.window_end_unix == 0) {
    return inputs;
  }

  DayInputs filtered;
  filtered.holders = inputs.holders;
  filtered.pool_amount = inputs.pool_amount;
  filtered.blockhash = inputs.blockhash;
  filtered.window_start_unix = inputs.window_start_unix;
  filtered.window_end_unix = inputs.window_end_unix;
  for (const auto& tx : inputs.transactions) {
    if (inputs.window_start_unix != 0 && tx.block_time_unix < inputs.window_start_unix) {
      continue;
    }
    if (inputs.window_end_unix != 0 && tx.block_time_unix >= inputs.window_end_unix) {
      continue;
    }
    filtered.transactions.push_back(tx);
  }
  return filtered;
}

bool needs_seed(const RoundSpec& spec) {
  if (spec.type == RoundType::DeterministicRandom || spec.type == RoundType::LastSecondHour) {
    return true;
  }
  return spec.token_airdrop.has_value() && spec.token_airdrop->enabled;
}

}  // namespace

Result evaluate_round(const RoundSpec& spec, std::string_view salt, const DayInputs& inputs,
                      const std::set<std::string>& excluded_wallets, ExecutionResult& out, ExecutionLog& log) {
  // Params are validated when the season is committed; this only guards hand-built specs.
  const Result valid = validate_round_spec(spec);
  if (!valid.ok) {
    return valid;
  }
  if (salt.empty()) {
    return Result::failure("Day " + std::to_string(spec.day) + ": round salt is missing.");
  }
  if (needs_seed(spec) && inputs.blockhash.empty()) {
    return Result::failure("Day " + std::to_string(spec.day) + ": a blockhash is required for seeded selection.");
  }

  const auto rule = make_distribution_rule(spec.type);
  if (!rule) {
    return Result::failure("Day " + std::to_string(spec.day) + ": no rule for type '" +
                           std::string{round_type_name(spec.type)} + "'.");
  }

  const DayInputs scoped = window_filtered(inputs);
  ExecutionLog local_log;
  const RuleContext ctx{
      .spec = spec,
      .salt = salt,
      .inputs = scoped,
      .excluded_wallets = excluded_wallets,
      .log = local_log,
  };

  ctx.step("start", "Evaluating round.",
           {{"holders", std::to_string(scoped.holders.size())},
            {"transactions", std::to_string(scoped.transactions.size())},
            {"pool_amount", util::amount_to_string(scoped.pool_amount)}});

  ExecutionResult result;
  result.day = spec.day;
  result.type = spec.type;

  const Result applied = rule->apply(ctx, result);
  if (!applied.ok) {
    return applied;
  }
  const Result airdrop = run_token_airdrop(ctx, result);
  if (!airdrop.ok) {
    return airdrop;
  }

  for (const auto& winner : result.winners) {
    result.total_distributed += winner.amount;
  }
  if (result.total_distributed > result.distribution_pool) {
    return Result::failure("Day " + std::to_string(spec.day) + ": distributed amount exceeds the pool.",
                           ErrorKind::Integrity);
  }
  result.remainder = result.distribution_pool - result.total_distributed;

  ctx.step("distribution_complete", "Round evaluated.",
           {{"winners", std::to_string(result.winners.size())},
            {"total_distributed", util::amount_to_string(result.total_distributed)},
            {"remainder", util::amount_to_string(result.remainder)}});

  out = std::move(result);
  log.steps.insert(log.steps.end(), local_log.steps.begin(), local_log.steps.end());
  return Result::success(applied.message);
}

}  // namespace advent
