#include "core/reveal/reveal_gate.hpp"

#include <string>

#include "core/model/spec_codec.hpp"

namespace advent {

std::chrono::sys_days round_date(int day, std::chrono::sys_days season_start) {
  return season_start + std::chrono::days{day - 1};
}

RevealPhase reveal_phase(int day, std::chrono::sys_days today, std::chrono::sys_days season_start,
                         bool force_full) {
  if (force_full) {
    return RevealPhase::FullyRevealed;
  }
  const std::chrono::sys_days scheduled = round_date(day, season_start);
  if (today < scheduled) {
    return RevealPhase::Hidden;
  }
  if (today == scheduled) {
    return RevealPhase::HintOnly;
  }
  return RevealPhase::FullyRevealed;
}

Result disclose_round(const CommittedRound& round, std::string_view root, RevealPhase phase, Disclosure& out) {
  const int day = round.spec.day;
  if (phase == RevealPhase::Hidden) {
    return Result::failure("Day " + std::to_string(day) + " is not revealed yet.", ErrorKind::NotRevealed);
  }

  Disclosure disclosure;
  disclosure.day = day;
  disclosure.hint = round.spec.hint;
  disclosure.sub_hint = round.spec.sub_hint;

  if (phase == RevealPhase::HintOnly) {
    disclosure.hint_only = true;
    out = std::move(disclosure);
    return Result::success("Hint disclosed for day " + std::to_string(day) + ".");
  }

  if (round.artifact.salt.empty() || round.artifact.leaf.empty() || root.empty()) {
    return Result::failure("Day " + std::to_string(day) + " has no commitment artifact.", ErrorKind::Storage);
  }

  disclosure.gift = round_spec_to_json(round.spec);
  disclosure.gift->erase("hash");
  disclosure.salt = round.artifact.salt;
  disclosure.leaf = round.artifact.leaf;
  disclosure.proof = round.artifact.proof;
  disclosure.root = std::string{root};
  out = std::move(disclosure);
  return Result::success("Day " + std::to_string(day) + " fully disclosed.");
}

}  // namespace advent
