#include "core/model/spec_codec.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "core/model/app_meta.hpp"
#include "core/util/amount.hpp"

namespace advent {
namespace {

using json = nlohmann::json;

constexpr std::array<std::pair<RoundType, std::string_view>, 7> kRoundTypeNames = {{
    {RoundType::ProportionalHolders, "proportional_holders"},
    {RoundType::DeterministicRandom, "deterministic_random"},
    {RoundType::TopBuyersAirdrop, "top_buyers_airdrop"},
    {RoundType::FullDonationToNgo, "full_donation_to_ngo"},
    {RoundType::NgoDonation, "ngo_donation"},
    {RoundType::LastSecondHour, "last_second_hour"},
    {RoundType::MostActiveTrader, "most_active_trader"},
}};

std::string day_label(int day) {
  return "Round for day " + std::to_string(day);
}

std::string_view split_name(SplitMode mode) {
  return mode == SplitMode::Equal ? "equal" : "proportional";
}

std::optional<SplitMode> split_from_name(std::string_view name) {
  if (name == "equal") {
    return SplitMode::Equal;
  }
  if (name == "proportional" || name == "volume") {
    return SplitMode::Proportional;
  }
  return std::nullopt;
}

// Reads typed fields out of a params object and remembers which keys were
// consumed so leftovers can be rejected.
class ParamReader {
public:
  ParamReader(const json& params, int day) : params_(params), day_(day) {}

  Result read_u32(std::string_view key, bool required, std::uint32_t& out) {
    const auto it = params_.find(std::string{key});
    if (it == params_.end()) {
      return missing(key, required);
    }
    consumed_.insert(std::string{key});
    if (!it->is_number_integer()) {
      return invalid(key, "must be a non-negative integer");
    }
    if (it->is_number_unsigned()) {
      const auto value = it->get<std::uint64_t>();
      if (value > std::numeric_limits<std::uint32_t>::max()) {
        return invalid(key, "is out of range");
      }
      out = static_cast<std::uint32_t>(value);
      return Result::success();
    }
    const auto value = it->get<std::int64_t>();
    if (value < 0 || value > std::numeric_limits<std::uint32_t>::max()) {
      return invalid(key, "is out of range");
    }
    out = static_cast<std::uint32_t>(value);
    return Result::success();
  }

  Result read_amount(std::string_view key, bool required, Amount& out) {
    const auto it = params_.find(std::string{key});
    if (it == params_.end()) {
      return missing(key, required);
    }
    consumed_.insert(std::string{key});
    if (!util::amount_from_json(*it, out)) {
      return invalid(key, "must be a non-negative integer or decimal string");
    }
    return Result::success();
  }

  Result read_string(std::string_view key, bool required, std::string& out) {
    const auto it = params_.find(std::string{key});
    if (it == params_.end()) {
      return missing(key, required);
    }
    consumed_.insert(std::string{key});
    if (!it->is_string()) {
      return invalid(key, "must be a string");
    }
    out = it->get<std::string>();
    return Result::success();
  }

  Result read_split(SplitMode& out) {
    std::string name;
    const auto it = params_.find("split");
    if (it == params_.end()) {
      return Result::success();
    }
    const Result read = read_string("split", false, name);
    if (!read.ok) {
      return read;
    }
    const auto mode = split_from_name(name);
    if (!mode.has_value()) {
      return invalid("split", "must be \"equal\" or \"proportional\"");
    }
    out = *mode;
    return Result::success();
  }

  Result read_token_airdrop(std::optional<TokenAirdropParams>& out) {
    const auto it = params_.find("token_airdrop");
    if (it == params_.end()) {
      out.reset();
      return Result::success();
    }
    consumed_.insert("token_airdrop");
    if (!it->is_object()) {
      return invalid("token_airdrop", "must be an object");
    }

    TokenAirdropParams airdrop;
    for (const auto& [key, value] : it->items()) {
      if (key == "enabled") {
        if (!value.is_boolean()) {
          return invalid("token_airdrop.enabled", "must be a boolean");
        }
        airdrop.enabled = value.get<bool>();
      } else if (key == "total_amount") {
        if (!util::amount_from_json(value, airdrop.total_amount)) {
          return invalid("token_airdrop.total_amount", "must be a non-negative integer or decimal string");
        }
      } else {
        return Result::failure(day_label(day_) + ": unknown token_airdrop field '" + key + "'.");
      }
    }
    out = airdrop;
    return Result::success();
  }

  Result reject_unknown() const {
    for (const auto& [key, value] : params_.items()) {
      if (!consumed_.contains(key)) {
        return Result::failure(day_label(day_) + ": unknown params field '" + key + "'.");
      }
    }
    return Result::success();
  }

private:
  Result missing(std::string_view key, bool required) const {
    if (required) {
      return Result::failure(day_label(day_) + ": params is missing required field '" + std::string{key} +
                             "'.");
    }
    return Result::success();
  }

  Result invalid(std::string_view key, std::string_view problem) const {
    return Result::failure(day_label(day_) + ": params field '" + std::string{key} + "' " +
                           std::string{problem} + ".");
  }

  const json& params_;
  int day_ = 0;
  std::set<std::string> consumed_;
};

// Returns the first failed read, or success when every read passed.
Result first_failure(std::initializer_list<Result> results) {
  for (const Result& result : results) {
    if (!result.ok) {
      return result;
    }
  }
  return Result::success();
}

Result read_params(RoundType type, int day, const json& params, RoundParams& out,
                   std::optional<TokenAirdropParams>& airdrop) {
  if (!params.is_object()) {
    return Result::failure(day_label(day) + ": params must be an object.");
  }

  ParamReader reader(params, day);
  switch (type) {
    case RoundType::ProportionalHolders: {
      ProportionalHoldersParams p;
      const Result read = first_failure({reader.read_u32("allocation_percent", true, p.allocation_percent),
                                         reader.read_amount("min_balance", false, p.min_balance)});
      if (!read.ok) {
        return read;
      }
      out = p;
      break;
    }
    case RoundType::DeterministicRandom: {
      DeterministicRandomParams p;
      const Result read = first_failure({reader.read_u32("winner_count", true, p.winner_count),
                                         reader.read_u32("allocation_percent", true, p.allocation_percent),
                                         reader.read_amount("min_balance", false, p.min_balance),
                                         reader.read_split(p.split)});
      if (!read.ok) {
        return read;
      }
      out = p;
      break;
    }
    case RoundType::TopBuyersAirdrop: {
      TopBuyersParams p;
      const Result read = first_failure({reader.read_u32("top_n", true, p.top_n),
                                         reader.read_u32("allocation_percent", true, p.allocation_percent),
                                         reader.read_split(p.split)});
      if (!read.ok) {
        return read;
      }
      out = p;
      break;
    }
    case RoundType::FullDonationToNgo:
    case RoundType::NgoDonation: {
      NgoDonationParams p;
      const Result read = first_failure({reader.read_string("ngo_wallet", true, p.ngo_wallet),
                                         reader.read_u32("percent", false, p.percent)});
      if (!read.ok) {
        return read;
      }
      out = p;
      break;
    }
    case RoundType::LastSecondHour: {
      LastSecondHourParams p;
      const Result read = first_failure({reader.read_u32("winner_count", true, p.winner_count),
                                         reader.read_u32("allocation_percent", true, p.allocation_percent),
                                         reader.read_u32("window_minutes", false, p.window_minutes)});
      if (!read.ok) {
        return read;
      }
      out = p;
      break;
    }
    case RoundType::MostActiveTrader: {
      MostActiveTraderParams p;
      const Result read = first_failure({reader.read_u32("allocation_percent", false, p.allocation_percent),
                                         reader.read_u32("min_trades", false, p.min_trades)});
      if (!read.ok) {
        return read;
      }
      out = p;
      break;
    }
  }

  const Result token_airdrop = reader.read_token_airdrop(airdrop);
  if (!token_airdrop.ok) {
    return token_airdrop;
  }
  return reader.reject_unknown();
}

json params_to_json(const RoundSpec& spec) {
  json params = json::object();
  std::visit(
      [&params](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ProportionalHoldersParams>) {
          params["allocation_percent"] = p.allocation_percent;
          params["min_balance"] = util::amount_to_string(p.min_balance);
        } else if constexpr (std::is_same_v<T, DeterministicRandomParams>) {
          params["winner_count"] = p.winner_count;
          params["allocation_percent"] = p.allocation_percent;
          params["min_balance"] = util::amount_to_string(p.min_balance);
          params["split"] = std::string{split_name(p.split)};
        } else if constexpr (std::is_same_v<T, TopBuyersParams>) {
          params["top_n"] = p.top_n;
          params["allocation_percent"] = p.allocation_percent;
          params["split"] = std::string{split_name(p.split)};
        } else if constexpr (std::is_same_v<T, NgoDonationParams>) {
          params["ngo_wallet"] = p.ngo_wallet;
          params["percent"] = p.percent;
        } else if constexpr (std::is_same_v<T, LastSecondHourParams>) {
          params["winner_count"] = p.winner_count;
          params["allocation_percent"] = p.allocation_percent;
          params["window_minutes"] = p.window_minutes;
        } else if constexpr (std::is_same_v<T, MostActiveTraderParams>) {
          params["allocation_percent"] = p.allocation_percent;
          params["min_trades"] = p.min_trades;
        }
      },
      spec.params);

  if (spec.token_airdrop.has_value()) {
    params["token_airdrop"] = {
        {"enabled", spec.token_airdrop->enabled},
        {"total_amount", util::amount_to_string(spec.token_airdrop->total_amount)},
    };
  }
  return params;
}

bool params_match_type(RoundType type, const RoundParams& params) {
  switch (type) {
    case RoundType::ProportionalHolders:
      return std::holds_alternative<ProportionalHoldersParams>(params);
    case RoundType::DeterministicRandom:
      return std::holds_alternative<DeterministicRandomParams>(params);
    case RoundType::TopBuyersAirdrop:
      return std::holds_alternative<TopBuyersParams>(params);
    case RoundType::FullDonationToNgo:
    case RoundType::NgoDonation:
      return std::holds_alternative<NgoDonationParams>(params);
    case RoundType::LastSecondHour:
      return std::holds_alternative<LastSecondHourParams>(params);
    case RoundType::MostActiveTrader:
      return std::holds_alternative<MostActiveTraderParams>(params);
  }
  return false;
}

Result check_percent(int day, std::string_view field, std::uint32_t value) {
  if (value > 100U) {
    return Result::failure(day_label(day) + ": " + std::string{field} + " must be within 0..100.");
  }
  return Result::success();
}

Result check_count(int day, std::string_view field, std::uint32_t value) {
  if (value == 0U) {
    return Result::failure(day_label(day) + ": " + std::string{field} + " must be at least 1.");
  }
  return Result::success();
}

Result read_optional_string(const json& value, std::string_view key, std::string& out) {
  const auto it = value.find(std::string{key});
  if (it == value.end() || it->is_null()) {
    return Result::success();
  }
  if (!it->is_string()) {
    return Result::failure("Field '" + std::string{key} + "' must be a string.");
  }
  out = it->get<std::string>();
  return Result::success();
}

Result read_required_amount(const json& value, std::string_view key, Amount& out) {
  const auto it = value.find(std::string{key});
  if (it == value.end() || !util::amount_from_json(*it, out)) {
    return Result::failure("Field '" + std::string{key} + "' must be a non-negative amount.");
  }
  return Result::success();
}

Result read_optional_amount(const json& value, std::string_view key, Amount& out) {
  const auto it = value.find(std::string{key});
  if (it == value.end() || it->is_null()) {
    return Result::success();
  }
  if (!util::amount_from_json(*it, out)) {
    return Result::failure("Field '" + std::string{key} + "' must be a non-negative amount.");
  }
  return Result::success();
}

std::optional<TransactionKind> transaction_kind_from_name(std::string_view name) {
  if (name == "buy") {
    return TransactionKind::Buy;
  }
  if (name == "sell") {
    return TransactionKind::Sell;
  }
  if (name == "transfer") {
    return TransactionKind::Transfer;
  }
  return std::nullopt;
}

Result day_inputs_from_json_unchecked(const json& value, DayInputs& out) {
  if (!value.is_object()) {
    return Result::failure("Day inputs must be a JSON object.");
  }

  DayInputs inputs;
  const Result header = first_failure({read_required_amount(value, "pool_amount", inputs.pool_amount),
                                       read_optional_string(value, "blockhash", inputs.blockhash)});
  if (!header.ok) {
    return header;
  }
  if (value.contains("window_start_unix")) {
    inputs.window_start_unix = value.at("window_start_unix").get<std::int64_t>();
  }
  if (value.contains("window_end_unix")) {
    inputs.window_end_unix = value.at("window_end_unix").get<std::int64_t>();
  }

  if (value.contains("holders")) {
    for (const auto& entry : value.at("holders")) {
      HolderSnapshot holder;
      const Result read = first_failure({read_optional_string(entry, "wallet", holder.wallet),
                                         read_required_amount(entry, "balance", holder.balance)});
      if (!read.ok) {
        return read;
      }
      if (entry.contains("rank")) {
        holder.rank = entry.at("rank").get<std::uint32_t>();
      }
      if (holder.wallet.empty()) {
        return Result::failure("Holder snapshot entry is missing its wallet.");
      }
      inputs.holders.push_back(std::move(holder));
    }
  }

  if (value.contains("transactions")) {
    for (const auto& entry : value.at("transactions")) {
      TransactionRecord tx;
      std::string kind_name;
      const Result read = first_failure({read_optional_string(entry, "signature", tx.signature),
                                         read_optional_string(entry, "from_wallet", tx.from_wallet),
                                         read_optional_string(entry, "to_wallet", tx.to_wallet),
                                         read_required_amount(entry, "amount", tx.amount),
                                         read_optional_amount(entry, "network_fee", tx.network_fee),
                                         read_optional_amount(entry, "creator_fee", tx.creator_fee),
                                         read_optional_string(entry, "kind", kind_name)});
      if (!read.ok) {
        return read;
      }
      const auto kind = transaction_kind_from_name(kind_name);
      if (!kind.has_value()) {
        return Result::failure("Transaction '" + tx.signature + "' has unknown kind '" + kind_name + "'.");
      }
      tx.kind = *kind;
      tx.block_time_unix = entry.at("block_time").get<std::int64_t>();
      inputs.transactions.push_back(std::move(tx));
    }
  }

  out = std::move(inputs);
  return Result::success();
}

}  // namespace

std::string_view round_type_name(RoundType type) {
  for (const auto& [candidate, name] : kRoundTypeNames) {
    if (candidate == type) {
      return name;
    }
  }
  return "unknown";
}

std::optional<RoundType> round_type_from_name(std::string_view name) {
  for (const auto& [candidate, candidate_name] : kRoundTypeNames) {
    if (candidate_name == name) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::string_view transaction_kind_name(TransactionKind kind) {
  switch (kind) {
    case TransactionKind::Buy:
      return "buy";
    case TransactionKind::Sell:
      return "sell";
    case TransactionKind::Transfer:
      return "transfer";
  }
  return "transfer";
}

std::string_view reveal_phase_name(RevealPhase phase) {
  switch (phase) {
    case RevealPhase::Hidden:
      return "hidden";
    case RevealPhase::HintOnly:
      return "hint_only";
    case RevealPhase::FullyRevealed:
      return "fully_revealed";
  }
  return "hidden";
}

Result validate_round_spec(const RoundSpec& spec) {
  if (spec.day < 1 || spec.day > kRoundCount) {
    return Result::failure("Round day " + std::to_string(spec.day) + " is outside 1.." +
                           std::to_string(kRoundCount) + ".");
  }
  if (!params_match_type(spec.type, spec.params)) {
    return Result::failure(day_label(spec.day) + ": params do not match type '" +
                           std::string{round_type_name(spec.type)} + "'.");
  }

  const int day = spec.day;
  const Result checked = std::visit(
      [day](const auto& p) -> Result {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ProportionalHoldersParams>) {
          return check_percent(day, "allocation_percent", p.allocation_percent);
        } else if constexpr (std::is_same_v<T, DeterministicRandomParams>) {
          const Result count = check_count(day, "winner_count", p.winner_count);
          if (!count.ok) {
            return count;
          }
          return check_percent(day, "allocation_percent", p.allocation_percent);
        } else if constexpr (std::is_same_v<T, TopBuyersParams>) {
          const Result count = check_count(day, "top_n", p.top_n);
          if (!count.ok) {
            return count;
          }
          return check_percent(day, "allocation_percent", p.allocation_percent);
        } else if constexpr (std::is_same_v<T, NgoDonationParams>) {
          if (p.ngo_wallet.empty()) {
            return Result::failure(day_label(day) + ": ngo_wallet must not be empty.");
          }
          return check_percent(day, "percent", p.percent);
        } else if constexpr (std::is_same_v<T, LastSecondHourParams>) {
          const Result count = check_count(day, "winner_count", p.winner_count);
          if (!count.ok) {
            return count;
          }
          if (p.window_minutes == 0U || p.window_minutes > 60U) {
            return Result::failure(day_label(day) + ": window_minutes must be within 1..60.");
          }
          return check_percent(day, "allocation_percent", p.allocation_percent);
        } else {
          const Result count = check_count(day, "min_trades", p.min_trades);
          if (!count.ok) {
            return count;
          }
          return check_percent(day, "allocation_percent", p.allocation_percent);
        }
      },
      spec.params);
  if (!checked.ok) {
    return checked;
  }

  if (spec.token_airdrop.has_value() && spec.token_airdrop->enabled && spec.token_airdrop->total_amount == 0) {
    return Result::failure(day_label(day) + ": enabled token_airdrop needs a positive total_amount.");
  }
  return Result::success();
}

nlohmann::json round_spec_to_json(const RoundSpec& spec) {
  return {
      {"day", spec.day},
      {"type", std::string{round_type_name(spec.type)}},
      {"hint", spec.hint},
      {"sub_hint", spec.sub_hint},
      {"params", params_to_json(spec)},
      {"distribution_source", spec.distribution_source},
      {"notes", spec.notes},
  };
}

Result round_spec_from_json(const nlohmann::json& value, RoundSpec& out) {
  try {
    if (!value.is_object()) {
      return Result::failure("Round spec must be a JSON object.");
    }
    const auto day_it = value.find("day");
    if (day_it == value.end() || !day_it->is_number_integer()) {
      return Result::failure("Round spec is missing an integer 'day'.");
    }

    RoundSpec spec;
    spec.day = day_it->get<int>();

    const auto type_it = value.find("type");
    if (type_it == value.end() || !type_it->is_string()) {
      return Result::failure(day_label(spec.day) + " is missing its type.");
    }
    const auto type = round_type_from_name(type_it->get<std::string>());
    if (!type.has_value()) {
      return Result::failure(day_label(spec.day) + " has unknown type '" + type_it->get<std::string>() + "'.");
    }
    spec.type = *type;

    const auto params_it = value.find("params");
    if (params_it == value.end()) {
      return Result::failure(day_label(spec.day) + " is missing params.");
    }
    const Result params = read_params(spec.type, spec.day, *params_it, spec.params, spec.token_airdrop);
    if (!params.ok) {
      return params;
    }

    spec.distribution_source = std::string{kDefaultDistributionSource};
    const Result text = first_failure({read_optional_string(value, "hint", spec.hint),
                                       read_optional_string(value, "sub_hint", spec.sub_hint),
                                       read_optional_string(value, "notes", spec.notes),
                                       read_optional_string(value, "distribution_source", spec.distribution_source)});
    if (!text.ok) {
      return text;
    }

    const Result valid = validate_round_spec(spec);
    if (!valid.ok) {
      return valid;
    }
    out = std::move(spec);
    return Result::success();
  } catch (const nlohmann::json::exception& e) {
    return Result::failure(std::string{"Round spec is malformed: "} + e.what());
  }
}

Result round_specs_from_json(const nlohmann::json& value, std::vector<RoundSpec>& out) {
  const json* list = &value;
  if (value.is_object() && value.contains("gifts")) {
    list = &value.at("gifts");
  }
  if (!list->is_array()) {
    return Result::failure("Round spec list must be a JSON array (or an object with 'gifts').");
  }

  std::vector<RoundSpec> specs;
  specs.reserve(list->size());
  for (const auto& entry : *list) {
    RoundSpec spec;
    const Result parsed = round_spec_from_json(entry, spec);
    if (!parsed.ok) {
      return parsed;
    }
    specs.push_back(std::move(spec));
  }
  out = std::move(specs);
  return Result::success("Parsed " + std::to_string(out.size()) + " round specs.");
}

nlohmann::json disclosure_to_json(const Disclosure& disclosure) {
  json out = {
      {"day", disclosure.day},
      {"hint_only", disclosure.hint_only},
      {"hint", disclosure.hint},
      {"sub_hint", disclosure.sub_hint},
  };
  if (disclosure.gift.has_value()) {
    out["gift"] = *disclosure.gift;
  }
  if (disclosure.salt.has_value()) {
    out["salt"] = *disclosure.salt;
  }
  if (disclosure.leaf.has_value()) {
    out["leaf"] = *disclosure.leaf;
  }
  if (disclosure.proof.has_value()) {
    out["proof"] = *disclosure.proof;
  }
  if (disclosure.root.has_value()) {
    out["root"] = *disclosure.root;
  }
  return out;
}

Result disclosure_from_json(const nlohmann::json& value, Disclosure& out) {
  try {
    if (!value.is_object()) {
      return Result::failure("Disclosure must be a JSON object.", ErrorKind::Incomplete);
    }
    Disclosure disclosure;
    const auto day_it = value.find("day");
    if (day_it == value.end() || !day_it->is_number_integer()) {
      return Result::failure("Disclosure is missing an integer 'day'.", ErrorKind::Incomplete);
    }
    disclosure.day = day_it->get<int>();
    disclosure.hint_only = value.value("hint_only", false);
    disclosure.hint = value.value("hint", std::string{});
    disclosure.sub_hint = value.value("sub_hint", std::string{});

    if (value.contains("gift") && !value.at("gift").is_null()) {
      disclosure.gift = value.at("gift");
    }
    if (value.contains("salt") && value.at("salt").is_string()) {
      disclosure.salt = value.at("salt").get<std::string>();
    }
    if (value.contains("leaf") && value.at("leaf").is_string()) {
      disclosure.leaf = value.at("leaf").get<std::string>();
    }
    if (value.contains("root") && value.at("root").is_string()) {
      disclosure.root = value.at("root").get<std::string>();
    }
    if (value.contains("proof") && value.at("proof").is_array()) {
      disclosure.proof = value.at("proof").get<std::vector<std::string>>();
    }
    out = std::move(disclosure);
    return Result::success();
  } catch (const nlohmann::json::exception& e) {
    return Result::failure(std::string{"Disclosure is malformed: "} + e.what(), ErrorKind::Incomplete);
  }
}

nlohmann::json execution_result_to_json(const ExecutionResult& result) {
  json winners = json::array();
  for (const auto& winner : result.winners) {
    json entry = {
        {"wallet", winner.wallet},
        {"amount", util::amount_to_string(winner.amount)},
        {"reason", winner.reason},
    };
    if (winner.balance.has_value()) {
      entry["balance"] = util::amount_to_string(*winner.balance);
    }
    winners.push_back(std::move(entry));
  }

  json airdrops = json::array();
  for (const auto& airdrop : result.token_airdrops) {
    airdrops.push_back({
        {"wallet", airdrop.wallet},
        {"amount", util::amount_to_string(airdrop.amount)},
        {"hour", airdrop.hour},
    });
  }

  return {
      {"day", result.day},
      {"type", std::string{round_type_name(result.type)}},
      {"winners", std::move(winners)},
      {"total_distributed", util::amount_to_string(result.total_distributed)},
      {"distribution_pool", util::amount_to_string(result.distribution_pool)},
      {"remainder", util::amount_to_string(result.remainder)},
      {"token_airdrops", std::move(airdrops)},
      {"token_distributed", util::amount_to_string(result.token_distributed)},
      {"token_remainder", util::amount_to_string(result.token_remainder)},
      {"eligible_count", result.eligible_count},
      {"seed", result.seed},
      {"skip_reason", result.skip_reason},
  };
}

Result execution_result_from_json(const nlohmann::json& value, ExecutionResult& out) {
  try {
    ExecutionResult result;
    result.day = value.at("day").get<int>();
    const auto type = round_type_from_name(value.at("type").get<std::string>());
    if (!type.has_value()) {
      return Result::failure("Execution record has unknown type.", ErrorKind::Storage);
    }
    result.type = *type;

    for (const auto& entry : value.at("winners")) {
      Winner winner;
      winner.wallet = entry.at("wallet").get<std::string>();
      winner.reason = entry.value("reason", std::string{});
      if (!util::amount_from_json(entry.at("amount"), winner.amount)) {
        return Result::failure("Execution record has a malformed winner amount.", ErrorKind::Storage);
      }
      if (entry.contains("balance")) {
        Amount balance = 0;
        if (!util::amount_from_json(entry.at("balance"), balance)) {
          return Result::failure("Execution record has a malformed winner balance.", ErrorKind::Storage);
        }
        winner.balance = balance;
      }
      result.winners.push_back(std::move(winner));
    }

    for (const auto& entry : value.at("token_airdrops")) {
      TokenAirdrop airdrop;
      airdrop.wallet = entry.at("wallet").get<std::string>();
      airdrop.hour = entry.at("hour").get<int>();
      if (!util::amount_from_json(entry.at("amount"), airdrop.amount)) {
        return Result::failure("Execution record has a malformed airdrop amount.", ErrorKind::Storage);
      }
      result.token_airdrops.push_back(std::move(airdrop));
    }

    const std::array<std::pair<const char*, Amount*>, 5> amounts = {{
        {"total_distributed", &result.total_distributed},
        {"distribution_pool", &result.distribution_pool},
        {"remainder", &result.remainder},
        {"token_distributed", &result.token_distributed},
        {"token_remainder", &result.token_remainder},
    }};
    for (const auto& [key, target] : amounts) {
      if (!util::amount_from_json(value.at(key), *target)) {
        return Result::failure(std::string{"Execution record field '"} + key + "' is malformed.",
                               ErrorKind::Storage);
      }
    }
    result.eligible_count = value.at("eligible_count").get<std::size_t>();
    result.seed = value.value("seed", std::string{});
    result.skip_reason = value.value("skip_reason", std::string{});
    out = std::move(result);
    return Result::success();
  } catch (const nlohmann::json::exception& e) {
    return Result::failure(std::string{"Execution record is malformed: "} + e.what(), ErrorKind::Storage);
  }
}

nlohmann::json execution_log_to_json(const ExecutionLog& log) {
  json steps = json::array();
  for (const auto& step : log.steps) {
    json fields = json::object();
    for (const auto& [key, value] : step.fields) {
      fields[key] = value;
    }
    steps.push_back({
        {"day", step.day},
        {"rule", step.rule},
        {"step", step.step},
        {"message", step.message},
        {"fields", std::move(fields)},
    });
  }
  return steps;
}

nlohmann::json verification_report_to_json(const VerificationReport& report) {
  return {
      {"valid", report.valid},
      {"rootMatches", report.root_matches},
      {"leafMatches", report.leaf_matches},
      {"proofValid", report.proof_valid},
      {"dayMatches", report.day_matches},
      {"computedLeaf", report.computed_leaf},
      {"computedRoot", report.computed_root},
      {"details", report.details},
  };
}

Result day_inputs_from_json(const nlohmann::json& value, DayInputs& out) {
  try {
    return day_inputs_from_json_unchecked(value, out);
  } catch (const nlohmann::json::exception& e) {
    return Result::failure(std::string{"Day inputs are malformed: "} + e.what());
  }
}

}  // namespace advent
