#include "core/storage/store.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/commit/commitment_builder.hpp"
#include "core/commit/merkle.hpp"
#include "core/model/spec_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace advent {
namespace {

using nlohmann::json;

constexpr std::string_view kCommitmentFile = "commitment.json";
constexpr std::string_view kRoundPrefix = "round-";
constexpr std::string_view kExecutionPrefix = "execution-";

std::string day_file(std::string_view prefix, int day) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.*s%02d.json", static_cast<int>(prefix.size()), prefix.data(), day);
  return buffer;
}

Result read_json_file(const std::string& path, json& out) {
  std::ifstream in(path);
  if (!in) {
    return Result::failure("Failed to open " + path + ".", ErrorKind::Storage);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  try {
    out = json::parse(buffer.str());
  } catch (const json::exception& e) {
    return Result::failure("Failed to parse " + path + ": " + e.what(), ErrorKind::Storage);
  }
  return Result::success();
}

// Writes beside the target and renames, so a crash never leaves half a file.
Result write_json_file(const std::string& path, const json& value) {
  const std::string staging = path + ".tmp";
  {
    std::ofstream out(staging, std::ios::out | std::ios::trunc);
    if (!out) {
      return Result::failure("Failed to write " + staging + ".", ErrorKind::Storage);
    }
    out << value.dump(2) << '\n';
    if (!out.good()) {
      return Result::failure("Failed to flush " + staging + ".", ErrorKind::Storage);
    }
  }

  std::error_code ec;
  std::filesystem::rename(staging, path, ec);
  if (ec) {
    return Result::failure("Failed to move " + staging + " into place: " + ec.message(), ErrorKind::Storage);
  }
  return Result::success();
}

json commitment_to_json(const Commitment& commitment, std::size_t round_count) {
  return {
      {"root", commitment.root},
      {"timestamp", commitment.timestamp_unix},
      {"season", commitment.season},
      {"round_count", round_count},
  };
}

json round_to_json(const CommittedRound& round) {
  return {
      {"day", round.spec.day},
      {"gift", round_spec_to_json(round.spec)},
      {"salt", round.artifact.salt},
      {"leaf", round.artifact.leaf},
      {"proof", round.artifact.proof},
      {"leaf_index", round.artifact.leaf_index},
  };
}

Result round_from_json(const json& value, CommittedRound& out) {
  try {
    CommittedRound round;
    const Result spec = round_spec_from_json(value.at("gift"), round.spec);
    if (!spec.ok) {
      return Result::failure(spec.message, ErrorKind::Storage);
    }
    round.artifact.day = round.spec.day;
    round.artifact.salt = value.at("salt").get<std::string>();
    round.artifact.leaf = value.at("leaf").get<std::string>();
    round.artifact.proof = value.at("proof").get<std::vector<std::string>>();
    round.artifact.leaf_index = value.at("leaf_index").get<std::size_t>();
    if (value.at("day").get<int>() != round.spec.day) {
      return Result::failure("Round file day does not match its gift.", ErrorKind::Integrity);
    }
    out = std::move(round);
    return Result::success();
  } catch (const json::exception& e) {
    return Result::failure(std::string{"Malformed round file: "} + e.what(), ErrorKind::Storage);
  }
}

Result check_commitment_input(const std::optional<Commitment>& existing, const SeasonCommitment& commitment,
                              const std::vector<RoundSpec>& specs) {
  if (existing.has_value()) {
    return Result::failure("Season '" + existing->season + "' is already committed with root " + existing->root + ".",
                           ErrorKind::Storage);
  }
  if (commitment.artifacts.size() != specs.size()) {
    return Result::failure("Commitment artifacts do not cover every round.", ErrorKind::Integrity);
  }
  return Result::success();
}

std::map<int, CommittedRound> pair_rounds(const SeasonCommitment& commitment, const std::vector<RoundSpec>& specs) {
  std::map<int, CommittedRound> rounds;
  for (const auto& spec : specs) {
    rounds[spec.day].spec = spec;
  }
  for (const auto& artifact : commitment.artifacts) {
    rounds[artifact.day].artifact = artifact;
  }
  return rounds;
}

}  // namespace

Result MemorySeasonRepository::save_commitment(const SeasonCommitment& commitment,
                                               const std::vector<RoundSpec>& specs) {
  const Result checked = check_commitment_input(commitment_, commitment, specs);
  if (!checked.ok) {
    return checked;
  }
  commitment_ = commitment.commitment;
  rounds_ = pair_rounds(commitment, specs);
  return Result::success("Commitment stored in memory.");
}

std::optional<Commitment> MemorySeasonRepository::commitment() const {
  return commitment_;
}

std::optional<CommittedRound> MemorySeasonRepository::round(int day) const {
  const auto it = rounds_.find(day);
  if (it == rounds_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result MemorySeasonRepository::record_execution(const ExecutionResult& result, const ExecutionLog& log) {
  if (executions_.contains(result.day)) {
    return Result::failure("Day " + std::to_string(result.day) + " has already been executed.",
                           ErrorKind::AlreadyExecuted);
  }
  executions_[result.day] = result;
  logs_[result.day] = log;
  return Result::success();
}

std::optional<ExecutionResult> MemorySeasonRepository::execution(int day) const {
  const auto it = executions_.find(day);
  if (it == executions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result FileSeasonRepository::open(std::string_view data_dir) {
  data_dir_ = std::string{data_dir};
  commitment_.reset();
  rounds_.clear();
  stored_round_count_ = 0;

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure("Failed to create season directory: " + ec.message(), ErrorKind::Storage);
  }

  const Result loaded = load_commitment();
  if (!loaded.ok) {
    return loaded;
  }
  if (!commitment_.has_value()) {
    return Result::success("Season directory is empty; awaiting commitment.");
  }

  Result rounds = load_rounds();
  if (rounds.ok) {
    rounds = verify_rounds();
  }
  if (!rounds.ok) {
    commitment_.reset();
    rounds_.clear();
    return rounds;
  }
  return Result::success("Loaded " + std::to_string(rounds_.size()) + " committed rounds.", commitment_->root);
}

Result FileSeasonRepository::save_commitment(const SeasonCommitment& commitment, const std::vector<RoundSpec>& specs) {
  if (data_dir_.empty()) {
    return Result::failure("Season repository is not open.", ErrorKind::Storage);
  }
  const Result checked = check_commitment_input(commitment_, commitment, specs);
  if (!checked.ok) {
    return checked;
  }

  const auto rounds = pair_rounds(commitment, specs);
  for (const auto& [day, round] : rounds) {
    const Result written = write_json_file(round_path(day), round_to_json(round));
    if (!written.ok) {
      return written;
    }
  }
  // The commitment file goes last: its presence marks a complete season.
  const Result written = write_json_file(commitment_path(), commitment_to_json(commitment.commitment, rounds.size()));
  if (!written.ok) {
    return written;
  }

  commitment_ = commitment.commitment;
  rounds_ = rounds;
  stored_round_count_ = rounds.size();
  return Result::success("Commitment written to " + data_dir_ + ".", commitment_->root);
}

std::optional<Commitment> FileSeasonRepository::commitment() const {
  return commitment_;
}

std::optional<CommittedRound> FileSeasonRepository::round(int day) const {
  const auto it = rounds_.find(day);
  if (it == rounds_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result FileSeasonRepository::record_execution(const ExecutionResult& result, const ExecutionLog& log) {
  if (data_dir_.empty()) {
    return Result::failure("Season repository is not open.", ErrorKind::Storage);
  }
  if (has_execution(result.day)) {
    return Result::failure("Day " + std::to_string(result.day) + " has already been executed.",
                           ErrorKind::AlreadyExecuted);
  }

  const json record = {
      {"result", execution_result_to_json(result)},
      {"log", execution_log_to_json(log)},
      {"recorded_at", util::unix_timestamp_now()},
  };
  return write_json_file(execution_path(result.day), record);
}

bool FileSeasonRepository::has_execution(int day) const {
  std::error_code ec;
  return !data_dir_.empty() && std::filesystem::exists(execution_path(day), ec) && !ec;
}

std::optional<ExecutionResult> FileSeasonRepository::execution(int day) const {
  if (!has_execution(day)) {
    return std::nullopt;
  }
  json record;
  if (!read_json_file(execution_path(day), record).ok || !record.contains("result")) {
    return std::nullopt;
  }
  ExecutionResult result;
  if (!execution_result_from_json(record.at("result"), result).ok) {
    return std::nullopt;
  }
  return result;
}

Result FileSeasonRepository::load_commitment() {
  std::error_code ec;
  if (!std::filesystem::exists(commitment_path(), ec)) {
    return Result::success();
  }

  json value;
  const Result read = read_json_file(commitment_path(), value);
  if (!read.ok) {
    return read;
  }
  try {
    Commitment commitment;
    commitment.root = value.at("root").get<std::string>();
    commitment.timestamp_unix = value.at("timestamp").get<std::int64_t>();
    commitment.season = value.at("season").get<std::string>();
    const auto round_count = value.at("round_count").get<std::size_t>();
    if (!util::is_digest_hex(commitment.root)) {
      return Result::failure("Stored root is not a SHA-256 hex digest.", ErrorKind::Integrity);
    }
    if (round_count == 0U) {
      return Result::failure("Stored commitment has no rounds.", ErrorKind::Integrity);
    }
    commitment_ = std::move(commitment);
    stored_round_count_ = round_count;
  } catch (const json::exception& e) {
    return Result::failure(std::string{"Malformed commitment file: "} + e.what(), ErrorKind::Storage);
  }
  return Result::success();
}

Result FileSeasonRepository::load_rounds() {
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(data_dir_, ec)) {
    const std::string name = entry.path().filename().string();
    if (!name.starts_with(kRoundPrefix) || !name.ends_with(".json")) {
      continue;
    }
    json value;
    const Result read = read_json_file(entry.path().string(), value);
    if (!read.ok) {
      return read;
    }
    CommittedRound round;
    const Result parsed = round_from_json(value, round);
    if (!parsed.ok) {
      return Result::failure(name + ": " + parsed.message, parsed.kind);
    }
    if (rounds_.contains(round.spec.day)) {
      return Result::failure("Duplicate stored round for day " + std::to_string(round.spec.day) + ".",
                             ErrorKind::Integrity);
    }
    rounds_[round.spec.day] = std::move(round);
  }
  if (ec) {
    return Result::failure("Failed to list season directory: " + ec.message(), ErrorKind::Storage);
  }
  return Result::success();
}

Result FileSeasonRepository::verify_rounds() const {
  for (std::size_t day = 1; day <= stored_round_count_; ++day) {
    if (!rounds_.contains(static_cast<int>(day))) {
      return Result::failure("Stored round " + std::to_string(day) + " is missing.", ErrorKind::Integrity);
    }
  }
  if (rounds_.size() != stored_round_count_) {
    return Result::failure("Season directory holds " + std::to_string(rounds_.size()) + " rounds, commitment lists " +
                               std::to_string(stored_round_count_) + ".",
                           ErrorKind::Integrity);
  }
  for (const auto& [day, round] : rounds_) {
    if (round.artifact.leaf_index != static_cast<std::size_t>(day - 1)) {
      return Result::failure("Stored round " + std::to_string(day) + " has leaf index " +
                                 std::to_string(round.artifact.leaf_index) + ".",
                             ErrorKind::Integrity);
    }
    const std::string leaf = compute_leaf(round.spec, round.artifact.salt);
    if (leaf != round.artifact.leaf) {
      return Result::failure("Stored round " + std::to_string(day) + " no longer hashes to its leaf.",
                             ErrorKind::Integrity);
    }
    if (!verify_proof(round.artifact.leaf, round.artifact.proof, commitment_->root, round.artifact.leaf_index)) {
      return Result::failure("Stored proof for day " + std::to_string(day) + " does not reach the root.",
                             ErrorKind::Integrity);
    }
  }
  return Result::success();
}

std::string FileSeasonRepository::round_path(int day) const {
  return (std::filesystem::path{data_dir_} / day_file(kRoundPrefix, day)).string();
}

std::string FileSeasonRepository::execution_path(int day) const {
  return (std::filesystem::path{data_dir_} / day_file(kExecutionPrefix, day)).string();
}

std::string FileSeasonRepository::commitment_path() const {
  return (std::filesystem::path{data_dir_} / std::string{kCommitmentFile}).string();
}

}  // namespace advent
