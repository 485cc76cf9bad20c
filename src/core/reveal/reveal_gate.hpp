#pragma once

#include <chrono>
#include <string_view>

#include "core/model/types.hpp"

namespace advent {

// Hidden before the round's UTC calendar day, HintOnly on it, FullyRevealed
// after. `force_full` is a non-production override.
[[nodiscard]] RevealPhase reveal_phase(int day, std::chrono::sys_days today, std::chrono::sys_days season_start,
                                       bool force_full = false);

[[nodiscard]] std::chrono::sys_days round_date(int day, std::chrono::sys_days season_start);

// Builds what may be shown for `phase`. Hidden fails with NotRevealed.
Result disclose_round(const CommittedRound& round, std::string_view root, RevealPhase phase, Disclosure& out);

}  // namespace advent
