#include "core/commit/merkle.hpp"

#include <utility>

#include "core/util/hash.hpp"

namespace advent {

std::string hash_pair(std::string_view left, std::string_view right) {
  std::string joined;
  joined.reserve(left.size() + right.size());
  joined.append(left);
  joined.append(right);
  return util::sha256_hex(joined);
}

Result MerkleTree::build(std::vector<std::string> leaves, MerkleTree& out) {
  if (leaves.empty()) {
    return Result::failure("Cannot build a Merkle tree without leaves.");
  }

  std::vector<std::vector<std::string>> levels;
  levels.push_back(std::move(leaves));

  while (levels.back().size() > 1U) {
    const auto& current = levels.back();
    std::vector<std::string> next;
    next.reserve((current.size() + 1U) / 2U);
    for (std::size_t i = 0; i < current.size(); i += 2U) {
      const std::string& left = current[i];
      const std::string& right = (i + 1U < current.size()) ? current[i + 1U] : current[i];
      next.push_back(hash_pair(left, right));
    }
    levels.push_back(std::move(next));
  }

  out.levels_ = std::move(levels);
  return Result::success("Merkle tree built.", out.root());
}

std::optional<std::vector<std::string>> MerkleTree::proof(std::size_t leaf_index) const {
  if (levels_.empty() || leaf_index >= levels_.front().size()) {
    return std::nullopt;
  }

  std::vector<std::string> siblings;
  siblings.reserve(depth());
  std::size_t index = leaf_index;
  for (std::size_t level = 0; level + 1U < levels_.size(); ++level) {
    const auto& nodes = levels_[level];
    const bool right_node = (index % 2U) == 1U;
    const std::size_t sibling = right_node ? index - 1U : index + 1U;
    siblings.push_back(sibling < nodes.size() ? nodes[sibling] : nodes[index]);
    index /= 2U;
  }
  return siblings;
}

std::string recompute_root(std::string_view leaf, const std::vector<std::string>& proof,
                           std::size_t leaf_index) {
  std::string acc{leaf};
  std::size_t index = leaf_index;
  for (const auto& sibling : proof) {
    if ((index % 2U) == 1U) {
      acc = hash_pair(sibling, acc);
    } else {
      acc = hash_pair(acc, sibling);
    }
    index /= 2U;
  }
  return acc;
}

bool verify_proof(std::string_view leaf, const std::vector<std::string>& proof, std::string_view root,
                  std::size_t leaf_index) {
  return recompute_root(leaf, proof, leaf_index) == root;
}

}  // namespace advent
