#pragma once

#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace advent {

// Default 24-round rotation: every 7th day donates to the NGO, every 5th
// rewards top buyers, every 3rd draws random holders, the rest split
// proportionally across holders.
std::vector<RoundSpec> sample_season(std::string_view ngo_wallet);

}  // namespace advent
