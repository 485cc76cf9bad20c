#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/types.hpp"

namespace advent {

[[nodiscard]] std::string_view round_type_name(RoundType type);
[[nodiscard]] std::optional<RoundType> round_type_from_name(std::string_view name);
[[nodiscard]] std::string_view transaction_kind_name(TransactionKind kind);
[[nodiscard]] std::string_view reveal_phase_name(RevealPhase phase);

// Schema check of a typed spec: day range, params variant matching the type,
// percent and count bounds, NGO wallet presence, token airdrop amount.
Result validate_round_spec(const RoundSpec& spec);

[[nodiscard]] nlohmann::json round_spec_to_json(const RoundSpec& spec);
Result round_spec_from_json(const nlohmann::json& value, RoundSpec& out);
Result round_specs_from_json(const nlohmann::json& value, std::vector<RoundSpec>& out);

[[nodiscard]] nlohmann::json disclosure_to_json(const Disclosure& disclosure);
Result disclosure_from_json(const nlohmann::json& value, Disclosure& out);

[[nodiscard]] nlohmann::json execution_result_to_json(const ExecutionResult& result);
Result execution_result_from_json(const nlohmann::json& value, ExecutionResult& out);
[[nodiscard]] nlohmann::json execution_log_to_json(const ExecutionLog& log);

[[nodiscard]] nlohmann::json verification_report_to_json(const VerificationReport& report);

Result day_inputs_from_json(const nlohmann::json& value, DayInputs& out);

}  // namespace advent
