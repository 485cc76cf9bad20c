#include "core/crypto/crypto.hpp"

#include <string_view>
#include <vector>

#include <sodium.h>

#include "core/model/app_meta.hpp"
#include "core/util/hash.hpp"

namespace advent {

Result CryptoEngine::initialize() {
  if (sodium_init() < 0) {
    ready_ = false;
    return Result::failure("libsodium initialization failed.", ErrorKind::Configuration);
  }
  ready_ = true;
  return Result::success("libsodium ready.");
}

Result CryptoEngine::random_salt(std::size_t bytes, std::string& out) const {
  if (!ready_) {
    return Result::failure("Crypto engine is not initialized.");
  }
  if (bytes < kMinSaltBytes) {
    return Result::failure("Salt must carry at least " + std::to_string(kMinSaltBytes) +
                           " bytes of entropy.");
  }

  std::vector<unsigned char> raw(bytes);
  randombytes_buf(raw.data(), raw.size());
  out = util::to_hex(std::string_view{reinterpret_cast<const char*>(raw.data()), raw.size()});
  sodium_memzero(raw.data(), raw.size());
  return Result::success();
}

Result CryptoEngine::season_salts(int round_count, std::size_t bytes,
                                  std::map<int, std::string>& out) const {
  std::map<int, std::string> salts;
  for (int day = 1; day <= round_count; ++day) {
    std::string salt;
    const Result generated = random_salt(bytes, salt);
    if (!generated.ok) {
      return generated;
    }
    salts.emplace(day, std::move(salt));
  }
  out = std::move(salts);
  return Result::success("Generated " + std::to_string(round_count) + " salts.");
}

std::string CryptoEngine::core_phase_status() const {
  if (!ready_) {
    return "Crypto engine idle: libsodium not initialized.";
  }
  return "Crypto engine active: SHA-256 / HMAC-SHA-256 / randombytes via libsodium " +
         std::string{sodium_version_string()} + ".";
}

}  // namespace advent
