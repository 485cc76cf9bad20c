#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>

namespace advent {

// Lamports, token base units and holder balances. Never negative.
using Amount = boost::multiprecision::cpp_int;

enum class ErrorKind {
  None,
  Configuration,
  Incomplete,
  NotRevealed,
  Storage,
  AlreadyExecuted,
  Integrity,
};

struct Result {
  bool ok = false;
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorKind::None, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg, ErrorKind kind = ErrorKind::Configuration) {
    return {false, kind, std::move(msg), {}};
  }
};

enum class RoundType {
  ProportionalHolders,
  DeterministicRandom,
  TopBuyersAirdrop,
  FullDonationToNgo,
  NgoDonation,
  LastSecondHour,
  MostActiveTrader,
};

enum class SplitMode {
  Equal,
  Proportional,
};

struct TokenAirdropParams {
  bool enabled = false;
  Amount total_amount = 0;
};

struct ProportionalHoldersParams {
  std::uint32_t allocation_percent = 0;
  Amount min_balance = 0;
};

struct DeterministicRandomParams {
  std::uint32_t winner_count = 0;
  std::uint32_t allocation_percent = 0;
  Amount min_balance = 0;
  SplitMode split = SplitMode::Equal;
};

struct TopBuyersParams {
  std::uint32_t top_n = 0;
  std::uint32_t allocation_percent = 0;
  SplitMode split = SplitMode::Proportional;
};

struct NgoDonationParams {
  std::string ngo_wallet;
  std::uint32_t percent = 100;
};

struct LastSecondHourParams {
  std::uint32_t winner_count = 0;
  std::uint32_t allocation_percent = 0;
  // Eligible window is the last `window_minutes` of hour 23 (UTC).
  std::uint32_t window_minutes = 15;
};

struct MostActiveTraderParams {
  std::uint32_t allocation_percent = 100;
  std::uint32_t min_trades = 1;
};

using RoundParams = std::variant<ProportionalHoldersParams, DeterministicRandomParams, TopBuyersParams,
                                 NgoDonationParams, LastSecondHourParams, MostActiveTraderParams>;

struct RoundSpec {
  int day = 0;
  RoundType type = RoundType::ProportionalHolders;
  std::string hint;
  std::string sub_hint;
  RoundParams params;
  std::optional<TokenAirdropParams> token_airdrop;
  std::string distribution_source = "treasury_daily_fees";
  std::string notes;
};

struct HolderSnapshot {
  std::string wallet;
  Amount balance = 0;
  std::uint32_t rank = 0;
};

enum class TransactionKind {
  Buy,
  Sell,
  Transfer,
};

struct TransactionRecord {
  std::string signature;
  std::string from_wallet;
  std::string to_wallet;
  Amount amount = 0;
  TransactionKind kind = TransactionKind::Transfer;
  std::int64_t block_time_unix = 0;
  Amount network_fee = 0;
  Amount creator_fee = 0;
};

struct Winner {
  std::string wallet;
  Amount amount = 0;
  std::optional<Amount> balance;
  std::string reason;
};

struct TokenAirdrop {
  std::string wallet;
  Amount amount = 0;
  int hour = 0;
};

struct ExecutionResult {
  int day = 0;
  RoundType type = RoundType::ProportionalHolders;
  std::vector<Winner> winners;
  Amount total_distributed = 0;
  Amount distribution_pool = 0;
  Amount remainder = 0;
  std::vector<TokenAirdrop> token_airdrops;
  Amount token_distributed = 0;
  Amount token_remainder = 0;
  std::size_t eligible_count = 0;
  std::string seed;
  std::string skip_reason;
};

struct ExecutionStep {
  int day = 0;
  std::string rule;
  std::string step;
  std::string message;
  std::vector<std::pair<std::string, std::string>> fields;
};

struct ExecutionLog {
  std::vector<ExecutionStep> steps;

  void add(int day, std::string rule, std::string step, std::string message,
           std::vector<std::pair<std::string, std::string>> fields = {}) {
    steps.push_back({day, std::move(rule), std::move(step), std::move(message), std::move(fields)});
  }
};

struct Commitment {
  std::string root;
  std::int64_t timestamp_unix = 0;
  std::string season;
};

struct RoundCommitmentArtifact {
  int day = 0;
  std::string salt;
  std::string leaf;
  std::vector<std::string> proof;
  std::size_t leaf_index = 0;
};

struct CommittedRound {
  RoundSpec spec;
  RoundCommitmentArtifact artifact;
};

struct SeasonCommitment {
  Commitment commitment;
  std::vector<RoundCommitmentArtifact> artifacts;
};

enum class RevealPhase {
  Hidden,
  HintOnly,
  FullyRevealed,
};

struct Disclosure {
  int day = 0;
  bool hint_only = false;
  std::string hint;
  std::string sub_hint;
  std::optional<nlohmann::json> gift;
  std::optional<std::string> salt;
  std::optional<std::string> leaf;
  std::optional<std::vector<std::string>> proof;
  std::optional<std::string> root;
};

struct VerificationReport {
  bool valid = false;
  bool root_matches = false;
  bool leaf_matches = false;
  bool proof_valid = false;
  bool day_matches = false;
  std::string computed_leaf;
  std::string computed_root;
  std::string details;
};

struct DayInputs {
  std::vector<TransactionRecord> transactions;
  std::vector<HolderSnapshot> holders;
  Amount pool_amount = 0;
  std::string blockhash;
  // Optional [start, end) filter on transaction block time; 0 disables it.
  std::int64_t window_start_unix = 0;
  std::int64_t window_end_unix = 0;
};

}  // namespace advent
