#pragma once

#include <cstddef>
#include <vector>

#include "merkletree/hash.hpp"

namespace merkletree {

using Level = std::vector<Hash>;

/// One digest per record, in record order.
Level hash_leaves(const Hasher& hasher, const std::vector<Bytes>& records);

/// Pairs (0,1), (2,3), ... into H(left || right). An unpaired last node is
/// hashed with itself. Output has ceil(n/2) entries.
Level build_parent_level(const Hasher& hasher, const Level& level);

/// Index of the node that pairs with `index`; a lone last node pairs with itself.
inline std::size_t sibling_index(std::size_t index, std::size_t level_size) {
    const std::size_t sib = index ^ 1U;
    return sib < level_size ? sib : index;
}

} // namespace merkletree
