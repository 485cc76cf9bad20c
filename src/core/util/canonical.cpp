#include "core/util/canonical.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <ranges>

namespace advent::util {
namespace {

bool parse_fixed_int(std::string_view text, int& out) {
  if (text.empty()) {
    return false;
  }
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc{} && ptr == end;
}

}  // namespace

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::vector<std::string> split_list(std::string_view value, char separator) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    const std::size_t split = value.find(separator, start);
    const std::size_t stop = split == std::string_view::npos ? value.size() : split;
    std::string item = trim_copy(value.substr(start, stop - start));
    if (!item.empty()) {
      out.push_back(std::move(item));
    }
    if (split == std::string_view::npos) {
      break;
    }
    start = split + 1U;
  }
  return out;
}

std::string canonicalize(const nlohmann::json& record) {
  // nlohmann::json stores objects in a std::map, so nested keys come out
  // sorted byte-wise regardless of the order they were inserted or parsed in.
  if (!record.is_object() || !record.contains("hash")) {
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
  }

  nlohmann::json stripped = record;
  stripped.erase("hash");
  return stripped.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

std::optional<std::chrono::sys_days> parse_iso_date(std::string_view text) {
  const std::string trimmed = trim_copy(text);
  if (trimmed.size() != 10U || trimmed[4] != '-' || trimmed[7] != '-') {
    return std::nullopt;
  }

  int year = 0;
  int month = 0;
  int day = 0;
  const std::string_view view{trimmed};
  if (!parse_fixed_int(view.substr(0, 4), year) || !parse_fixed_int(view.substr(5, 2), month) ||
      !parse_fixed_int(view.substr(8, 2), day)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return std::chrono::sys_days{ymd};
}

std::string format_iso_date(std::chrono::sys_days date) {
  const std::chrono::year_month_day ymd{date};
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return buffer;
}

std::chrono::sys_days utc_day_of(std::int64_t unix_seconds) {
  const std::chrono::sys_seconds instant{std::chrono::seconds{unix_seconds}};
  return std::chrono::floor<std::chrono::days>(instant);
}

int utc_hour_of(std::int64_t unix_seconds) {
  const std::chrono::sys_seconds instant{std::chrono::seconds{unix_seconds}};
  const std::chrono::hh_mm_ss tod{instant - std::chrono::floor<std::chrono::days>(instant)};
  return static_cast<int>(tod.hours().count());
}

int utc_minute_of(std::int64_t unix_seconds) {
  const std::chrono::sys_seconds instant{std::chrono::seconds{unix_seconds}};
  const std::chrono::hh_mm_ss tod{instant - std::chrono::floor<std::chrono::days>(instant)};
  return static_cast<int>(tod.minutes().count());
}

}  // namespace advent::util
