#include "merkletree/tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "merkletree/errors.hpp"
#include "merkletree/verify.hpp"

namespace merkletree {

MerkleTree::MerkleTree(TreeConfig cfg) : hasher_(cfg.algorithm) {}

MerkleTree::MerkleTree(std::vector<Bytes> records, TreeConfig cfg)
    : hasher_(cfg.algorithm), records_(std::move(records)) {
    rebuild();
}

void MerkleTree::add(Bytes record) {
    records_.push_back(std::move(record));
    rebuild();
}

void MerkleTree::rebuild() {
    levels_.clear();
    if (records_.empty()) {
        return;
    }
    levels_.push_back(hash_leaves(hasher_, records_));
    while (levels_.back().size() > 1) {
        Level next = build_parent_level(hasher_, levels_.back());
        levels_.push_back(std::move(next));
    }
}

const Hash& MerkleTree::root() const {
    if (levels_.empty()) {
        throw EmptyTreeError("root of an empty tree is undefined");
    }
    return levels_.back().front();
}

std::optional<std::size_t> MerkleTree::find(const Bytes& record) const {
    auto it = std::find(records_.begin(), records_.end(), record);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - records_.begin());
}

Proof MerkleTree::generate_proof(const Bytes& record) const {
    if (empty()) {
        throw EmptyTreeError("cannot generate a proof from an empty tree");
    }
    const auto index = find(record);
    if (!index) {
        throw NotFoundError("record is not present in the tree");
    }
    return generate_proof_at(*index);
}

Proof MerkleTree::generate_proof_at(std::size_t index) const {
    if (empty()) {
        throw EmptyTreeError("cannot generate a proof from an empty tree");
    }
    if (index >= size()) {
        throw std::out_of_range("leaf index " + std::to_string(index) + " out of range for "
                                + std::to_string(size()) + " leaves");
    }

    Proof proof;
    proof.leaf_index = index;
    proof.steps.reserve(levels_.size() - 1);
    std::size_t pos = index;
    for (std::size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
        const Level& level = levels_[depth];
        ProofStep step;
        step.sibling = level[sibling_index(pos, level.size())];
        step.side = ((pos & 1U) == 0U) ? Side::RIGHT : Side::LEFT;
        proof.steps.push_back(step);
        pos >>= 1U;
    }
    return proof;
}

bool MerkleTree::verify(const Proof& proof, const Hash& candidate) const {
    if (empty()) {
        return false;
    }
    return verify_proof(hasher_, proof, candidate, root());
}

} // namespace merkletree
