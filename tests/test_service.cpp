#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config/engine_config.hpp"
#include "core/model/sample_season.hpp"
#include "core/model/spec_codec.hpp"
#include "core/service/advent_service.hpp"
#include "core/storage/store.hpp"
#include "core/util/canonical.hpp"

namespace {

constexpr std::string_view kNgoWallet = "NGOwa11et1111111111111111111111111111111111";

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "advent-commit-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

advent::EngineConfig test_config(const std::filesystem::path& dir) {
  advent::EngineConfig config = advent::default_engine_config();
  config.season = "test-season";
  config.data_dir = dir.string();
  config.ngo_wallet = std::string{kNgoWallet};
  config.excluded_wallets = {"treasury"};
  return config;
}

std::chrono::sys_days date(std::string_view text) {
  return *advent::util::parse_iso_date(text);
}

advent::DayInputs holder_inputs() {
  advent::DayInputs inputs;
  inputs.pool_amount = 1000000;
  inputs.blockhash = "blockhash-for-tests";
  inputs.holders = {
      {.wallet = "holder-a", .balance = 600000, .rank = 1},
      {.wallet = "holder-b", .balance = 300000, .rank = 2},
      {.wallet = "treasury", .balance = 9000000, .rank = 0},
      {.wallet = "holder-c", .balance = 50, .rank = 3},
  };
  return inputs;
}

void test_engine_config_parsing() {
  advent::EngineConfig config = advent::default_engine_config();
  assert(advent::util::format_iso_date(config.season_start) == "2025-12-01");
  assert(config.salt_bytes == advent::kDefaultSaltBytes);

  const advent::Result parsed = advent::parse_engine_config(
      "# season settings\n"
      "season = 2026-season-2\n"
      "season_start=2026-12-01\n"
      "\n"
      "excluded_wallets = treasury, dev-wallet ,,\n"
      "allow_future_reveals = yes\n"
      "salt_bytes = 48\n"
      "ngo_wallet = ngo-1\n"
      "unknown_key = kept quiet\n",
      config);
  assert(parsed.ok);
  assert(config.season == "2026-season-2");
  assert(advent::util::format_iso_date(config.season_start) == "2026-12-01");
  assert(config.excluded_wallets.size() == 2U);
  assert(config.excluded_wallets.contains("dev-wallet"));
  assert(config.allow_future_reveals);
  assert(config.salt_bytes == 48U);
  assert(config.ngo_wallet == "ngo-1");

  advent::EngineConfig untouched = advent::default_engine_config();
  advent::Result bad = advent::parse_engine_config("salt_bytes = 8\n", untouched);
  assert(!bad.ok);
  assert(bad.kind == advent::ErrorKind::Configuration);
  assert(untouched.salt_bytes == advent::kDefaultSaltBytes);

  bad = advent::parse_engine_config("season_start = 2025-13-01\n", untouched);
  assert(!bad.ok);
  bad = advent::parse_engine_config("allow_future_reveals = maybe\n", untouched);
  assert(!bad.ok);
  bad = advent::parse_engine_config("just words\n", untouched);
  assert(!bad.ok);
  assert(bad.message.find("line 1") != std::string::npos);

  const auto dir = temp_dir("config");
  const auto path = dir / "advent.conf";
  {
    std::ofstream out(path);
    out << "data_dir = " << (dir / "season").string() << "\n";
  }
  const advent::Result loaded = advent::load_engine_config(path.string(), untouched);
  assert(loaded.ok);
  assert(untouched.data_dir == (dir / "season").string());
  const advent::Result missing = advent::load_engine_config((dir / "missing.conf").string(), untouched);
  assert(!missing.ok);
}

void test_commit_and_reveal_flow() {
  const auto dir = temp_dir("reveal");
  advent::AdventService service;
  const advent::Result init = service.init(test_config(dir));
  assert(init.ok);
  assert(!service.commitment_status().committed);

  advent::Disclosure disclosure;
  const advent::Result uncommitted = service.disclose(1, date("2025-12-02"), disclosure);
  assert(uncommitted.kind == advent::ErrorKind::Storage);

  advent::SeasonCommitment commitment;
  const auto specs = advent::sample_season(kNgoWallet);
  const advent::Result committed = service.commit_season(specs, commitment);
  assert(committed.ok);
  assert(committed.data == commitment.commitment.root);
  assert(std::filesystem::exists(dir / "commitment.json"));
  assert(std::filesystem::exists(dir / "round-01.json"));
  assert(std::filesystem::exists(dir / "round-24.json"));

  advent::SeasonCommitment again;
  const advent::Result twice = service.commit_season(specs, again);
  assert(!twice.ok);
  assert(twice.kind == advent::ErrorKind::Storage);

  const advent::Result hidden = service.disclose(5, date("2025-12-04"), disclosure);
  assert(!hidden.ok);
  assert(hidden.kind == advent::ErrorKind::NotRevealed);

  const advent::Result hinted = service.disclose(5, date("2025-12-05"), disclosure);
  assert(hinted.ok);
  assert(disclosure.hint_only);
  assert(!disclosure.gift.has_value());

  const advent::Result revealed = service.disclose(5, date("2025-12-06"), disclosure);
  assert(revealed.ok);
  assert(!disclosure.hint_only);
  advent::VerificationReport report;
  advent::Result verified = service.verify(disclosure, report);
  assert(verified.ok);
  assert(report.valid);

  advent::AdventService reopened;
  const advent::Result reinit = reopened.init(test_config(dir));
  assert(reinit.ok);
  const advent::SeasonStatus status = reopened.commitment_status();
  assert(status.committed);
  assert(status.root == commitment.commitment.root);
  assert(status.round_count == static_cast<std::size_t>(advent::kRoundCount));
  assert(status.season_start == "2025-12-01");

  advent::Disclosure later;
  const advent::Result last_day = reopened.disclose(24, date("2026-01-01"), later);
  assert(last_day.ok);
  verified = reopened.verify(later, report);
  assert(verified.ok);
  assert(report.valid);

  // A service whose season does not match the stored one stays unusable.
  advent::EngineConfig other = test_config(dir);
  other.season = "different-season";
  advent::AdventService mismatched;
  const advent::Result wrong_season = mismatched.init(other);
  assert(!wrong_season.ok);

  advent::Disclosure refused;
  const advent::Result blocked_disclose = mismatched.disclose(5, date("2025-12-06"), refused);
  assert(!blocked_disclose.ok);
  assert(!refused.gift.has_value());

  advent::ExecutionResult result;
  advent::ExecutionLog log;
  const advent::Result blocked_execute = mismatched.execute_day(1, holder_inputs(), result, log);
  assert(!blocked_execute.ok);
  assert(log.steps.empty());
  assert(!std::filesystem::exists(dir / "execution-01.json"));

  advent::SeasonCommitment recommit;
  const advent::Result blocked_commit = mismatched.commit_season(specs, recommit);
  assert(!blocked_commit.ok);
}

void test_allow_future_reveals() {
  advent::EngineConfig config = test_config(temp_dir("future"));
  config.allow_future_reveals = true;
  advent::AdventService service;
  const advent::Result init = service.init(config, std::make_unique<advent::MemorySeasonRepository>());
  assert(init.ok);

  advent::SeasonCommitment commitment;
  const advent::Result committed = service.commit_season(advent::sample_season(kNgoWallet), commitment);
  assert(committed.ok);

  advent::Disclosure disclosure;
  const advent::Result early = service.disclose(24, date("2025-11-01"), disclosure);
  assert(early.ok);
  assert(disclosure.gift.has_value());
  assert(disclosure.leaf == commitment.artifacts[23].leaf);
}

void test_execute_day_once() {
  const auto dir = temp_dir("execute");
  advent::AdventService service;
  const advent::Result init = service.init(test_config(dir));
  assert(init.ok);

  advent::ExecutionResult result;
  advent::ExecutionLog log;
  const advent::Result uncommitted = service.execute_day(1, holder_inputs(), result, log);
  assert(uncommitted.kind == advent::ErrorKind::Configuration);

  advent::SeasonCommitment commitment;
  const advent::Result committed = service.commit_season(advent::sample_season(kNgoWallet), commitment);
  assert(committed.ok);

  const advent::Result executed = service.execute_day(1, holder_inputs(), result, log);
  assert(executed.ok);
  assert(result.day == 1);
  assert(result.type == advent::RoundType::ProportionalHolders);
  assert(result.winners.size() == 2U);
  assert(std::ranges::none_of(result.winners, [](const advent::Winner& w) { return w.wallet == "treasury"; }));
  assert(result.distribution_pool == 400000);
  assert(result.total_distributed + result.remainder == result.distribution_pool);
  assert(!log.steps.empty());
  assert(std::filesystem::exists(dir / "execution-01.json"));

  advent::ExecutionResult repeat;
  advent::ExecutionLog repeat_log;
  const advent::Result second = service.execute_day(1, holder_inputs(), repeat, repeat_log);
  assert(!second.ok);
  assert(second.kind == advent::ErrorKind::AlreadyExecuted);
  assert(repeat_log.steps.empty());

  advent::AdventService reopened;
  const advent::Result reinit = reopened.init(test_config(dir));
  assert(reinit.ok);
  const advent::Result after_reopen = reopened.execute_day(1, holder_inputs(), repeat, repeat_log);
  assert(after_reopen.kind == advent::ErrorKind::AlreadyExecuted);
  const advent::SeasonStatus status = reopened.commitment_status();
  assert(status.executed_days == std::vector<int>{1});

  advent::FileSeasonRepository repository;
  const advent::Result opened = repository.open(dir.string());
  assert(opened.ok);
  const auto stored = repository.execution(1);
  assert(stored.has_value());
  assert(advent::execution_result_to_json(*stored) == advent::execution_result_to_json(result));

  advent::ExecutionResult donation;
  const advent::Result donated = reopened.execute_day(7, holder_inputs(), donation, repeat_log);
  assert(donated.ok);
  assert(donation.winners.size() == 1U);
  assert(donation.winners[0].wallet == kNgoWallet);
  assert(donation.total_distributed == 1000000);
}

void commit_sample_season(const std::filesystem::path& dir) {
  advent::AdventService service;
  const advent::Result init = service.init(test_config(dir));
  assert(init.ok);
  advent::SeasonCommitment commitment;
  const advent::Result committed = service.commit_season(advent::sample_season(kNgoWallet), commitment);
  assert(committed.ok);
}

void test_tampered_round_fails_integrity() {
  const auto dir = temp_dir("tamper");
  commit_sample_season(dir);

  const auto round_file = dir / "round-03.json";
  nlohmann::json round;
  {
    std::ifstream in(round_file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    round = nlohmann::json::parse(buffer.str());
  }
  round["gift"]["notes"] = "quietly edited";
  {
    std::ofstream out(round_file, std::ios::trunc);
    out << round.dump(2);
  }

  advent::FileSeasonRepository repository;
  const advent::Result opened = repository.open(dir.string());
  assert(!opened.ok);
  assert(opened.kind == advent::ErrorKind::Integrity);

  advent::AdventService service;
  const advent::Result init = service.init(test_config(dir));
  assert(init.kind == advent::ErrorKind::Integrity);
}

void test_missing_round_fails_integrity() {
  const auto dir = temp_dir("missing-round");
  commit_sample_season(dir);

  std::error_code ec;
  const bool removed = std::filesystem::remove(dir / "round-05.json", ec);
  assert(removed);

  advent::FileSeasonRepository repository;
  const advent::Result opened = repository.open(dir.string());
  assert(!opened.ok);
  assert(opened.kind == advent::ErrorKind::Integrity);
  assert(opened.message.find("5") != std::string::npos);
  assert(!repository.commitment().has_value());
  assert(repository.round_count() == 0U);

  advent::AdventService service;
  const advent::Result init = service.init(test_config(dir));
  assert(init.kind == advent::ErrorKind::Integrity);
}

void test_memory_repository() {
  advent::MemorySeasonRepository repository;
  assert(!repository.commitment().has_value());

  advent::ExecutionResult result;
  result.day = 3;
  const advent::Result recorded = repository.record_execution(result, {});
  assert(recorded.ok);
  assert(repository.has_execution(3));
  const advent::Result again = repository.record_execution(result, {});
  assert(again.kind == advent::ErrorKind::AlreadyExecuted);
  assert(!repository.execution(4).has_value());

  advent::SeasonCommitment partial;
  partial.commitment.root = "root";
  const advent::Result mismatch = repository.save_commitment(partial, advent::sample_season(kNgoWallet));
  assert(!mismatch.ok);
  assert(mismatch.kind == advent::ErrorKind::Integrity);
}

void test_day_inputs_codec() {
  const auto document = nlohmann::json::parse(R"({
    "pool_amount": "25000000000",
    "blockhash": "abc",
    "holders": [{"wallet": "w1", "balance": "1000"}, {"wallet": "w2", "balance": 5, "rank": 2}],
    "transactions": [
      {"signature": "s1", "from_wallet": "pool", "to_wallet": "w1", "amount": "10", "kind": "buy", "block_time": 1764892800},
      {"signature": "s2", "from_wallet": "w2", "to_wallet": "pool", "amount": 3, "kind": "sell", "block_time": 1764892860, "network_fee": "5000"}
    ]
  })");
  advent::DayInputs inputs;
  advent::Result parsed = advent::day_inputs_from_json(document, inputs);
  assert(parsed.ok);
  assert(inputs.pool_amount == advent::Amount{25000000000LL});
  assert(inputs.holders.size() == 2U);
  assert(inputs.holders[1].rank == 2U);
  assert(inputs.transactions.size() == 2U);
  assert(inputs.transactions[1].kind == advent::TransactionKind::Sell);
  assert(inputs.transactions[1].network_fee == 5000);

  auto broken = document;
  broken["transactions"][0]["kind"] = "swap";
  parsed = advent::day_inputs_from_json(broken, inputs);
  assert(!parsed.ok);
  broken = document;
  broken["pool_amount"] = -1;
  parsed = advent::day_inputs_from_json(broken, inputs);
  assert(!parsed.ok);
}

}  // namespace

int main() {
  test_engine_config_parsing();
  test_commit_and_reveal_flow();
  test_allow_future_reveals();
  test_execute_day_once();
  test_tampered_round_fails_integrity();
  test_missing_round_fails_integrity();
  test_memory_repository();
  test_day_inputs_codec();

  std::cout << "advent_service_tests passed\n";
  return 0;
}
