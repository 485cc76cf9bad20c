#include "core/reveal/verifier.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include "core/commit/commitment_builder.hpp"
#include "core/commit/merkle.hpp"
#include "core/model/app_meta.hpp"

namespace advent {
namespace {

std::string missing_fields(const Disclosure& disclosure) {
  std::vector<std::string> missing;
  if (!disclosure.gift.has_value()) {
    missing.emplace_back("gift");
  }
  if (!disclosure.salt.has_value()) {
    missing.emplace_back("salt");
  }
  if (!disclosure.leaf.has_value()) {
    missing.emplace_back("leaf");
  }
  if (!disclosure.proof.has_value()) {
    missing.emplace_back("proof");
  }
  if (!disclosure.root.has_value()) {
    missing.emplace_back("root");
  }

  std::string joined;
  for (const auto& field : missing) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += field;
  }
  return joined;
}

}  // namespace

Result verify_disclosure(const Disclosure& disclosure, std::string_view published_root, VerificationReport& report) {
  if (disclosure.hint_only) {
    return Result::failure("Day " + std::to_string(disclosure.day) + " is a hint-only disclosure.",
                           ErrorKind::Incomplete);
  }
  const std::string missing = missing_fields(disclosure);
  if (!missing.empty()) {
    return Result::failure("Disclosure is missing: " + missing + ".", ErrorKind::Incomplete);
  }
  // A duplicated odd node leaves one index bit unbound, so the day range is checked here.
  if (disclosure.day < 1 || disclosure.day > kRoundCount) {
    return Result::failure("Disclosure day must be between 1 and " + std::to_string(kRoundCount) + ".",
                           ErrorKind::Incomplete);
  }

  VerificationReport next;
  try {
    next.computed_leaf = compute_leaf(*disclosure.gift, *disclosure.salt);
  } catch (const nlohmann::json::exception& e) {
    return Result::failure(std::string{"Disclosed gift cannot be canonicalized: "} + e.what(),
                           ErrorKind::Incomplete);
  }

  const auto index = static_cast<std::size_t>(disclosure.day - 1);
  next.computed_root = recompute_root(*disclosure.leaf, *disclosure.proof, index);
  next.root_matches = *disclosure.root == published_root;
  next.leaf_matches = next.computed_leaf == *disclosure.leaf;
  next.proof_valid = next.computed_root == *disclosure.root;
  const auto gift_day = disclosure.gift->find("day");
  next.day_matches = gift_day != disclosure.gift->end() && gift_day->is_number_integer() &&
                     gift_day->get<std::int64_t>() == disclosure.day;
  next.valid = next.root_matches && next.leaf_matches && next.proof_valid && next.day_matches;

  if (next.valid) {
    next.details = "Day " + std::to_string(disclosure.day) + " matches the published commitment.";
  } else {
    std::string failed;
    const auto note = [&failed](bool passed, std::string_view label) {
      if (passed) {
        return;
      }
      if (!failed.empty()) {
        failed += "; ";
      }
      failed += label;
    };
    note(next.root_matches, "root differs from the published root");
    note(next.leaf_matches, "gift and salt do not hash to the disclosed leaf");
    note(next.proof_valid, "proof does not lead from the leaf to the root");
    note(next.day_matches, "gift is not the round for this day");
    next.details = "Day " + std::to_string(disclosure.day) + " failed: " + failed + ".";
  }

  report = std::move(next);
  return Result::success(report.details);
}

}  // namespace advent
