#include "core/rules/distribution_rule.hpp"

#include "core/model/spec_codec.hpp"

namespace advent {

bool RuleContext::excluded(std::string_view wallet) const {
  return excluded_wallets.contains(std::string{wallet});
}

void RuleContext::step(std::string step_name, std::string message,
                       std::vector<std::pair<std::string, std::string>> fields) const {
  log.add(spec.day, std::string{round_type_name(spec.type)}, std::move(step_name), std::move(message),
          std::move(fields));
}

std::unique_ptr<IDistributionRule> make_distribution_rule(RoundType type) {
  switch (type) {
    case RoundType::ProportionalHolders:
      return std::make_unique<ProportionalHoldersRule>();
    case RoundType::DeterministicRandom:
      return std::make_unique<DeterministicRandomRule>();
    case RoundType::TopBuyersAirdrop:
      return std::make_unique<TopBuyersRule>();
    case RoundType::FullDonationToNgo:
      return std::make_unique<NgoDonationRule>(true);
    case RoundType::NgoDonation:
      return std::make_unique<NgoDonationRule>(false);
    case RoundType::LastSecondHour:
      return std::make_unique<LastSecondHourRule>();
    case RoundType::MostActiveTrader:
      return std::make_unique<MostActiveTraderRule>();
  }
  return nullptr;
}

const std::string& participant_wallet(const TransactionRecord& tx) {
  return tx.kind == TransactionKind::Buy ? tx.to_wallet : tx.from_wallet;
}

std::vector<Amount> split_by_weight(const Amount& pool, const std::vector<Amount>& weights) {
  Amount total = 0;
  for (const auto& weight : weights) {
    total += weight;
  }

  std::vector<Amount> shares(weights.size(), Amount{0});
  if (total == 0) {
    return shares;
  }
  for (std::size_t i = 0; i < weights.size(); ++i) {
    shares[i] = (weights[i] * pool) / total;
  }
  return shares;
}

std::vector<Amount> split_equally(const Amount& pool, std::size_t count) {
  if (count == 0U) {
    return {};
  }
  const Amount share = pool / count;
  return std::vector<Amount>(count, share);
}

}  // namespace advent
