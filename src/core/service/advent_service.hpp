#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/config/engine_config.hpp"
#include "core/crypto/crypto.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace advent {

struct SeasonStatus {
  bool committed = false;
  std::string season;
  std::string season_start;
  std::string root;
  std::int64_t committed_unix = 0;
  std::size_t round_count = 0;
  std::vector<int> executed_days;
  std::string data_dir;
  std::string core_phase_status;
};

// Orchestrates one season: commits the rounds once, serves disclosures by
// date, verifies them and executes each day at most once.
class AdventService {
public:
  Result init(const EngineConfig& config);
  Result init(const EngineConfig& config, std::unique_ptr<ISeasonRepository> repository);

  Result commit_season(const std::vector<RoundSpec>& specs, SeasonCommitment& out);
  Result disclose(int day, std::chrono::sys_days today, Disclosure& out) const;
  Result verify(const Disclosure& disclosure, VerificationReport& report) const;
  Result execute_day(int day, const DayInputs& inputs, ExecutionResult& out, ExecutionLog& log);

  [[nodiscard]] SeasonStatus commitment_status() const;
  [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
  EngineConfig config_;
  CryptoEngine crypto_;
  std::unique_ptr<ISeasonRepository> repository_;
  bool initialized_ = false;

  Result require_initialized() const;
};

}  // namespace advent
