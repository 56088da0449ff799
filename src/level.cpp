#include "merkletree/level.hpp"

#include <stdexcept>

namespace merkletree {

Level hash_leaves(const Hasher& hasher, const std::vector<Bytes>& records) {
    Level leaves;
    leaves.reserve(records.size());
    for (const auto& record : records) {
        leaves.push_back(hasher.digest(record));
    }
    return leaves;
}

Level build_parent_level(const Hasher& hasher, const Level& level) {
    if (level.empty()) {
        throw std::invalid_argument("cannot build a parent of an empty level");
    }
    Level next;
    next.reserve((level.size() + 1) / 2);
    for (std::size_t i = 0; i < level.size(); i += 2) {
        const Hash& left = level[i];
        const Hash& right = level[sibling_index(i, level.size())];
        next.push_back(hasher.concat(left, right));
    }
    return next;
}

} // namespace merkletree
