#include "core/commit/commitment_builder.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "core/commit/merkle.hpp"
#include "core/model/spec_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace advent {

std::string compute_leaf(const nlohmann::json& gift, std::string_view salt) {
  std::string payload = util::canonicalize(gift);
  payload.append(salt);
  return util::sha256_hex(payload);
}

std::string compute_leaf(const RoundSpec& spec, std::string_view salt) {
  return compute_leaf(round_spec_to_json(spec), salt);
}

Result check_season_layout(const std::vector<RoundSpec>& specs, int round_count) {
  if (round_count < 1 || round_count > kRoundCount) {
    return Result::failure("Season round count must be within 1.." + std::to_string(kRoundCount) + ".");
  }

  std::set<int> seen;
  for (const auto& spec : specs) {
    const Result valid = validate_round_spec(spec);
    if (!valid.ok) {
      return valid;
    }
    if (spec.day > round_count) {
      return Result::failure("Round day " + std::to_string(spec.day) + " exceeds the season length of " +
                             std::to_string(round_count) + ".");
    }
    if (!seen.insert(spec.day).second) {
      return Result::failure("Duplicate round spec for day " + std::to_string(spec.day) + ".");
    }
  }

  for (int day = 1; day <= round_count; ++day) {
    if (!seen.contains(day)) {
      return Result::failure("Missing round spec for day " + std::to_string(day) + ".");
    }
  }
  return Result::success();
}

CommitmentBuilder::CommitmentBuilder(std::string season, int round_count)
    : season_(std::move(season)), round_count_(round_count) {}

Result CommitmentBuilder::build(const std::vector<RoundSpec>& specs, const SaltLookup& salt_of,
                                SeasonCommitment& out) const {
  const Result layout = check_season_layout(specs, round_count_);
  if (!layout.ok) {
    return layout;
  }
  if (!salt_of) {
    return Result::failure("No salt source supplied for the commitment.");
  }

  std::vector<const RoundSpec*> ordered;
  ordered.reserve(specs.size());
  for (const auto& spec : specs) {
    ordered.push_back(&spec);
  }
  std::ranges::sort(ordered, [](const RoundSpec* lhs, const RoundSpec* rhs) { return lhs->day < rhs->day; });

  std::vector<RoundCommitmentArtifact> artifacts;
  std::vector<std::string> leaves;
  artifacts.reserve(ordered.size());
  leaves.reserve(ordered.size());

  for (const RoundSpec* spec : ordered) {
    const std::optional<std::string> salt = salt_of(spec->day);
    if (!salt.has_value() || salt->empty()) {
      return Result::failure("Missing salt for day " + std::to_string(spec->day) + ".");
    }

    RoundCommitmentArtifact artifact;
    artifact.day = spec->day;
    artifact.salt = *salt;
    artifact.leaf_index = static_cast<std::size_t>(spec->day - 1);
    try {
      artifact.leaf = compute_leaf(*spec, artifact.salt);
    } catch (const nlohmann::json::exception& e) {
      return Result::failure("Round spec for day " + std::to_string(spec->day) +
                             " cannot be canonicalized: " + e.what());
    }
    leaves.push_back(artifact.leaf);
    artifacts.push_back(std::move(artifact));
  }

  MerkleTree tree;
  const Result built = MerkleTree::build(leaves, tree);
  if (!built.ok) {
    return built;
  }

  for (auto& artifact : artifacts) {
    auto proof = tree.proof(artifact.leaf_index);
    if (!proof.has_value()) {
      return Result::failure("Proof generation failed for day " + std::to_string(artifact.day) + ".",
                             ErrorKind::Integrity);
    }
    artifact.proof = std::move(*proof);
    if (!verify_proof(artifact.leaf, artifact.proof, tree.root(), artifact.leaf_index)) {
      return Result::failure("Proof for day " + std::to_string(artifact.day) + " does not replay to the root.",
                             ErrorKind::Integrity);
    }
  }

  SeasonCommitment commitment;
  commitment.commitment.root = tree.root();
  commitment.commitment.timestamp_unix = util::unix_timestamp_now();
  commitment.commitment.season = season_;
  commitment.artifacts = std::move(artifacts);
  out = std::move(commitment);
  return Result::success("Committed " + std::to_string(out.artifacts.size()) + " rounds.", out.commitment.root);
}

Result CommitmentBuilder::build(const std::vector<RoundSpec>& specs, const std::map<int, std::string>& salts,
                                SeasonCommitment& out) const {
  return build(
      specs,
      [&salts](int day) -> std::optional<std::string> {
        const auto it = salts.find(day);
        if (it == salts.end()) {
          return std::nullopt;
        }
        return it->second;
      },
      out);
}

}  // namespace advent
