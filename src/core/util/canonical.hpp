#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace advent::util {

std::int64_t unix_timestamp_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);
std::vector<std::string> split_list(std::string_view value, char separator);

// Serializes a record with keys sorted at every level, no whitespace, and the
// top-level "hash" field removed. Equal records always produce equal bytes.
std::string canonicalize(const nlohmann::json& record);

std::optional<std::chrono::sys_days> parse_iso_date(std::string_view text);
std::string format_iso_date(std::chrono::sys_days date);
std::chrono::sys_days utc_day_of(std::int64_t unix_seconds);
int utc_hour_of(std::int64_t unix_seconds);
int utc_minute_of(std::int64_t unix_seconds);

}  // namespace advent::util
