#pragma once

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <string_view>

#include "core/model/app_meta.hpp"
#include "core/model/types.hpp"

namespace advent {

struct EngineConfig {
  std::string season = std::string{kDefaultSeason};
  std::chrono::sys_days season_start{};
  std::string data_dir = "advent-data";
  std::set<std::string> excluded_wallets;
  bool allow_future_reveals = false;
  std::size_t salt_bytes = kDefaultSaltBytes;
  std::string ngo_wallet;
};

// Defaults with season_start set to kDefaultSeasonStart.
[[nodiscard]] EngineConfig default_engine_config();

// key=value lines; '#' comments and blank lines are skipped, unknown keys ignored.
Result load_engine_config(std::string_view path, EngineConfig& out);
Result parse_engine_config(std::string_view text, EngineConfig& out);

}  // namespace advent
