#include "core/config/engine_config.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/util/canonical.hpp"

namespace advent {
namespace {

bool parse_bool(std::string_view value, bool& out) {
  const std::string lowered = util::lowercase_copy(value);
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    out = true;
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    out = false;
    return true;
  }
  return false;
}

bool parse_size(std::string_view value, std::size_t& out) {
  if (value.empty()) {
    return false;
  }
  std::size_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return false;
  }
  out = parsed;
  return true;
}

Result apply_field(const std::string& key, const std::string& value, std::size_t line_no, EngineConfig& config) {
  const auto bad_value = [&](std::string_view expected) {
    return Result::failure("Config line " + std::to_string(line_no) + ": '" + key + "' expects " +
                           std::string{expected} + ", got '" + value + "'.");
  };

  if (key == "season") {
    if (value.empty()) {
      return bad_value("a season tag");
    }
    config.season = value;
  } else if (key == "season_start") {
    const auto date = util::parse_iso_date(value);
    if (!date.has_value()) {
      return bad_value("a YYYY-MM-DD date");
    }
    config.season_start = *date;
  } else if (key == "data_dir") {
    if (value.empty()) {
      return bad_value("a directory");
    }
    config.data_dir = value;
  } else if (key == "excluded_wallets") {
    const auto wallets = util::split_list(value, ',');
    config.excluded_wallets = std::set<std::string>(wallets.begin(), wallets.end());
  } else if (key == "allow_future_reveals") {
    if (!parse_bool(value, config.allow_future_reveals)) {
      return bad_value("a boolean");
    }
  } else if (key == "salt_bytes") {
    std::size_t bytes = 0;
    if (!parse_size(value, bytes) || bytes < kMinSaltBytes) {
      return bad_value("an integer of at least " + std::to_string(kMinSaltBytes));
    }
    config.salt_bytes = bytes;
  } else if (key == "ngo_wallet") {
    config.ngo_wallet = value;
  }
  return Result::success();
}

}  // namespace

EngineConfig default_engine_config() {
  EngineConfig config;
  config.season_start = *util::parse_iso_date(kDefaultSeasonStart);
  return config;
}

Result parse_engine_config(std::string_view text, EngineConfig& out) {
  EngineConfig config = out;
  std::istringstream in{std::string{text}};
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      return Result::failure("Config line " + std::to_string(line_no) + " is not key=value.");
    }

    const std::string key = util::trim_copy(trimmed.substr(0, split));
    const std::string value = util::trim_copy(trimmed.substr(split + 1));
    const Result applied = apply_field(key, value, line_no, config);
    if (!applied.ok) {
      return applied;
    }
  }

  out = std::move(config);
  return Result::success();
}

Result load_engine_config(std::string_view path, EngineConfig& out) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure("Cannot open config file: " + std::string{path});
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  const Result parsed = parse_engine_config(buffer.str(), out);
  if (!parsed.ok) {
    return parsed;
  }
  return Result::success("Loaded config from " + std::string{path} + ".");
}

}  // namespace advent
