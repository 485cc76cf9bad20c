#pragma once

#include <set>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace advent {

// Pure evaluation of one round. Identical arguments always produce an
// identical result; steps are appended to `log`. A round with nobody
// eligible succeeds with zero winners and a skip_reason.
Result evaluate_round(const RoundSpec& spec, std::string_view salt, const DayInputs& inputs,
                      const std::set<std::string>& excluded_wallets, ExecutionResult& out, ExecutionLog& log);

}  // namespace advent
