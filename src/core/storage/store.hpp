#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace advent {

// Persistence for one season: the published commitment, every round with
// its artifact, and at most one execution per day.
class ISeasonRepository {
public:
  virtual ~ISeasonRepository() = default;

  // Fails if a commitment is already stored; a season root never changes.
  virtual Result save_commitment(const SeasonCommitment& commitment, const std::vector<RoundSpec>& specs) = 0;
  [[nodiscard]] virtual std::optional<Commitment> commitment() const = 0;
  [[nodiscard]] virtual std::optional<CommittedRound> round(int day) const = 0;
  [[nodiscard]] virtual std::size_t round_count() const = 0;

  // Fails with AlreadyExecuted when the day already has a record.
  virtual Result record_execution(const ExecutionResult& result, const ExecutionLog& log) = 0;
  [[nodiscard]] virtual bool has_execution(int day) const = 0;
  [[nodiscard]] virtual std::optional<ExecutionResult> execution(int day) const = 0;
};

class MemorySeasonRepository final : public ISeasonRepository {
public:
  Result save_commitment(const SeasonCommitment& commitment, const std::vector<RoundSpec>& specs) override;
  [[nodiscard]] std::optional<Commitment> commitment() const override;
  [[nodiscard]] std::optional<CommittedRound> round(int day) const override;
  [[nodiscard]] std::size_t round_count() const override { return rounds_.size(); }

  Result record_execution(const ExecutionResult& result, const ExecutionLog& log) override;
  [[nodiscard]] bool has_execution(int day) const override { return executions_.contains(day); }
  [[nodiscard]] std::optional<ExecutionResult> execution(int day) const override;

private:
  std::optional<Commitment> commitment_;
  std::map<int, CommittedRound> rounds_;
  std::map<int, ExecutionResult> executions_;
  std::map<int, ExecutionLog> logs_;
};

// JSON files under one directory: commitment.json, round-DD.json and
// execution-DD.json. open() re-verifies every stored round against the root.
class FileSeasonRepository final : public ISeasonRepository {
public:
  Result open(std::string_view data_dir);

  Result save_commitment(const SeasonCommitment& commitment, const std::vector<RoundSpec>& specs) override;
  [[nodiscard]] std::optional<Commitment> commitment() const override;
  [[nodiscard]] std::optional<CommittedRound> round(int day) const override;
  [[nodiscard]] std::size_t round_count() const override { return rounds_.size(); }

  Result record_execution(const ExecutionResult& result, const ExecutionLog& log) override;
  [[nodiscard]] bool has_execution(int day) const override;
  [[nodiscard]] std::optional<ExecutionResult> execution(int day) const override;

  [[nodiscard]] const std::string& data_dir() const { return data_dir_; }

private:
  std::string data_dir_;
  std::optional<Commitment> commitment_;
  std::map<int, CommittedRound> rounds_;
  std::size_t stored_round_count_ = 0;

  Result load_commitment();
  Result load_rounds();
  Result verify_rounds() const;
  [[nodiscard]] std::string round_path(int day) const;
  [[nodiscard]] std::string execution_path(int day) const;
  [[nodiscard]] std::string commitment_path() const;
};

}  // namespace advent
