#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/model/types.hpp"

namespace advent::util {

// Accepts an unsigned decimal string ("0", "10000000000"). No sign, no exponent.
bool parse_amount(std::string_view text, Amount& out);

// Accepts a decimal string or a non-negative JSON integer.
bool amount_from_json(const nlohmann::json& value, Amount& out);

std::string amount_to_string(const Amount& value);

// floor(value * percent / 100)
Amount percent_of(const Amount& value, std::uint32_t percent);

}  // namespace advent::util
