#include "core/service/advent_service.hpp"

#include <map>
#include <utility>

#include "core/commit/commitment_builder.hpp"
#include "core/model/app_meta.hpp"
#include "core/reveal/reveal_gate.hpp"
#include "core/reveal/verifier.hpp"
#include "core/rules/evaluator.hpp"
#include "core/util/canonical.hpp"

namespace advent {

Result AdventService::init(const EngineConfig& config) {
  // Opening the file store re-hashes every round, so libsodium comes first.
  const Result crypto = crypto_.initialize();
  if (!crypto.ok) {
    return crypto;
  }
  auto repository = std::make_unique<FileSeasonRepository>();
  const Result opened = repository->open(config.data_dir);
  if (!opened.ok) {
    return opened;
  }
  return init(config, std::move(repository));
}

Result AdventService::init(const EngineConfig& config, std::unique_ptr<ISeasonRepository> repository) {
  initialized_ = false;
  config_ = config;
  if (config_.salt_bytes < kMinSaltBytes) {
    return Result::failure("salt_bytes must be at least " + std::to_string(kMinSaltBytes) + ".");
  }
  if (!repository) {
    return Result::failure("No season repository supplied.", ErrorKind::Storage);
  }

  const Result crypto = crypto_.initialize();
  if (!crypto.ok) {
    return crypto;
  }

  const auto commitment = repository->commitment();
  if (commitment.has_value() && commitment->season != config_.season) {
    return Result::failure("Stored season '" + commitment->season + "' does not match configured season '" +
                           config_.season + "'.");
  }

  repository_ = std::move(repository);
  initialized_ = true;
  return Result::success("Season service ready for " + config_.season + ".");
}

Result AdventService::require_initialized() const {
  if (!initialized_ || !repository_) {
    return Result::failure("Season service is not initialized.");
  }
  return Result::success();
}

Result AdventService::commit_season(const std::vector<RoundSpec>& specs, SeasonCommitment& out) {
  const Result ready = require_initialized();
  if (!ready.ok) {
    return ready;
  }
  if (repository_->commitment().has_value()) {
    return Result::failure("Season " + config_.season + " is already committed.", ErrorKind::Storage);
  }

  std::map<int, std::string> salts;
  const Result salted = crypto_.season_salts(kRoundCount, config_.salt_bytes, salts);
  if (!salted.ok) {
    return salted;
  }

  const CommitmentBuilder builder(config_.season);
  SeasonCommitment commitment;
  const Result built = builder.build(specs, salts, commitment);
  if (!built.ok) {
    return built;
  }

  const Result saved = repository_->save_commitment(commitment, specs);
  if (!saved.ok) {
    return saved;
  }
  out = std::move(commitment);
  return Result::success("Season " + config_.season + " committed.", out.commitment.root);
}

Result AdventService::disclose(int day, std::chrono::sys_days today, Disclosure& out) const {
  const Result ready = require_initialized();
  if (!ready.ok) {
    return ready;
  }
  const auto commitment = repository_->commitment();
  if (!commitment.has_value()) {
    return Result::failure("Season has not been committed.", ErrorKind::Storage);
  }
  const auto round = repository_->round(day);
  if (!round.has_value()) {
    return Result::failure("No committed round for day " + std::to_string(day) + ".");
  }

  const RevealPhase phase = reveal_phase(day, today, config_.season_start, config_.allow_future_reveals);
  return disclose_round(*round, commitment->root, phase, out);
}

Result AdventService::verify(const Disclosure& disclosure, VerificationReport& report) const {
  const Result ready = require_initialized();
  if (!ready.ok) {
    return ready;
  }
  const auto commitment = repository_->commitment();
  if (!commitment.has_value()) {
    return Result::failure("No published root to verify against.", ErrorKind::Storage);
  }
  return verify_disclosure(disclosure, commitment->root, report);
}

Result AdventService::execute_day(int day, const DayInputs& inputs, ExecutionResult& out, ExecutionLog& log) {
  const Result ready = require_initialized();
  if (!ready.ok) {
    return ready;
  }
  if (repository_->has_execution(day)) {
    return Result::failure("Day " + std::to_string(day) + " has already been executed.",
                           ErrorKind::AlreadyExecuted);
  }
  const auto round = repository_->round(day);
  if (!round.has_value()) {
    return Result::failure("No committed round for day " + std::to_string(day) + ".");
  }

  ExecutionResult result;
  ExecutionLog day_log;
  const Result evaluated =
      evaluate_round(round->spec, round->artifact.salt, inputs, config_.excluded_wallets, result, day_log);
  if (!evaluated.ok) {
    return evaluated;
  }

  const Result recorded = repository_->record_execution(result, day_log);
  if (!recorded.ok) {
    return recorded;
  }

  out = std::move(result);
  log.steps.insert(log.steps.end(), day_log.steps.begin(), day_log.steps.end());
  return Result::success("Day " + std::to_string(day) + " executed: " + evaluated.message);
}

SeasonStatus AdventService::commitment_status() const {
  SeasonStatus status;
  status.season = config_.season;
  status.season_start = util::format_iso_date(config_.season_start);
  status.data_dir = config_.data_dir;
  status.core_phase_status = crypto_.core_phase_status();
  if (!repository_) {
    return status;
  }

  const auto commitment = repository_->commitment();
  if (commitment.has_value()) {
    status.committed = true;
    status.root = commitment->root;
    status.committed_unix = commitment->timestamp_unix;
  }
  status.round_count = repository_->round_count();
  for (int day = 1; day <= kRoundCount; ++day) {
    if (repository_->has_execution(day)) {
      status.executed_days.push_back(day);
    }
  }
  return status;
}

}  // namespace advent
