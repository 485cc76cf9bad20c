#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace advent {

// Checks a full disclosure against the published root. Mismatches are
// reported through `report` with ok=true; only a structurally incomplete
// disclosure fails (ErrorKind::Incomplete).
Result verify_disclosure(const Disclosure& disclosure, std::string_view published_root, VerificationReport& report);

}  // namespace advent
