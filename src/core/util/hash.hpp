#pragma once

#include <string>
#include <string_view>

namespace advent::util {

// Lowercase hex SHA-256 of the payload bytes (64 characters).
std::string sha256_hex(std::string_view payload);

// Lowercase hex HMAC-SHA-256. Used for randomness seeds, never for commitments.
std::string hmac_sha256_hex(std::string_view message, std::string_view key);

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);
bool is_digest_hex(std::string_view value);

}  // namespace advent::util
