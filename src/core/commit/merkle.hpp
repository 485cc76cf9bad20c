#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace advent {

// Parent node: sha256 over the concatenated hex strings of both children.
std::string hash_pair(std::string_view left, std::string_view right);

// Binary SHA-256 tree over hex leaves. A level with an odd count pairs its
// last node with itself, so every proof carries exactly one sibling per level.
class MerkleTree {
public:
  static Result build(std::vector<std::string> leaves, MerkleTree& out);

  [[nodiscard]] const std::string& root() const { return levels_.back().front(); }
  [[nodiscard]] std::size_t leaf_count() const { return levels_.empty() ? 0 : levels_.front().size(); }
  [[nodiscard]] std::size_t depth() const { return levels_.empty() ? 0 : levels_.size() - 1U; }
  [[nodiscard]] const std::vector<std::vector<std::string>>& levels() const { return levels_; }

  // Sibling hashes from the leaf up to (not including) the root.
  [[nodiscard]] std::optional<std::vector<std::string>> proof(std::size_t leaf_index) const;

private:
  std::vector<std::vector<std::string>> levels_;
};

// Replays a proof: an even index is the left operand at that level, an odd
// index the right operand.
std::string recompute_root(std::string_view leaf, const std::vector<std::string>& proof,
                           std::size_t leaf_index);

bool verify_proof(std::string_view leaf, const std::vector<std::string>& proof, std::string_view root,
                  std::size_t leaf_index);

}  // namespace advent
