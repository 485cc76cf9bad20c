#include "core/util/amount.hpp"

namespace advent::util {

bool parse_amount(std::string_view text, Amount& out) {
  if (text.empty()) {
    return false;
  }

  Amount value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    value *= 10;
    value += static_cast<unsigned>(c - '0');
  }
  out = value;
  return true;
}

bool amount_from_json(const nlohmann::json& value, Amount& out) {
  if (value.is_string()) {
    return parse_amount(value.get_ref<const std::string&>(), out);
  }
  if (value.is_number_unsigned()) {
    out = Amount{value.get<std::uint64_t>()};
    return true;
  }
  if (value.is_number_integer()) {
    const auto signed_value = value.get<std::int64_t>();
    if (signed_value < 0) {
      return false;
    }
    out = Amount{signed_value};
    return true;
  }
  return false;
}

std::string amount_to_string(const Amount& value) {
  return value.str();
}

Amount percent_of(const Amount& value, std::uint32_t percent) {
  return (value * percent) / 100;
}

}  // namespace advent::util
