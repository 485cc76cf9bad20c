#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "core/model/types.hpp"

namespace advent {

// Owns libsodium initialization and the entropy used for per-round salts.
class CryptoEngine {
public:
  Result initialize();

  [[nodiscard]] bool ready() const { return ready_; }

  Result random_salt(std::size_t bytes, std::string& out) const;
  Result season_salts(int round_count, std::size_t bytes, std::map<int, std::string>& out) const;

  [[nodiscard]] std::string core_phase_status() const;

private:
  bool ready_ = false;
};

}  // namespace advent
