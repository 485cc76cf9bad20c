#pragma once

#include <cstdint>
#include <string_view>

#ifndef ADVENT_APP_VERSION
#define ADVENT_APP_VERSION "0.3.0"
#endif

#ifndef ADVENT_BUILD_RELEASE
#define ADVENT_BUILD_RELEASE "Commit-Reveal Engine"
#endif

namespace advent {

inline constexpr std::string_view kAppDisplayName = "advent-commit";
inline constexpr std::string_view kDefaultSeason = "2025-season-1";
inline constexpr std::string_view kDefaultSeasonStart = "2025-12-01";
inline constexpr std::string_view kDefaultDistributionSource = "treasury_daily_fees";
inline constexpr int kRoundCount = 24;
inline constexpr int kHoursPerDay = 24;
inline constexpr std::size_t kMinSaltBytes = 16;
inline constexpr std::size_t kDefaultSaltBytes = 32;
inline constexpr std::int64_t kLamportsPerSol = 1000000000LL;
inline constexpr std::string_view kAppVersion = ADVENT_APP_VERSION;
inline constexpr std::string_view kBuildRelease = ADVENT_BUILD_RELEASE;

}  // namespace advent
