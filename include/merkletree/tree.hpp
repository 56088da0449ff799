#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "merkletree/hash.hpp"
#include "merkletree/level.hpp"
#include "merkletree/proof.hpp"

namespace merkletree {

struct TreeConfig {
    HashAlgorithm algorithm = HashAlgorithm::SHA3_256;
};

/// Binary hash tree over an ordered list of records.
///
/// Every level is kept as a flat digest vector, levels_[0] being the leaves and
/// levels_.back() the single root. Any structural change rebuilds all levels.
/// Not synchronized: callers serialize access to a shared instance.
class MerkleTree {
public:
    explicit MerkleTree(TreeConfig cfg = {});
    explicit MerkleTree(std::vector<Bytes> records, TreeConfig cfg = {});

    /// Appends a record and rebuilds the tree. Earlier proofs become stale.
    void add(Bytes record);

    bool empty() const { return records_.empty(); }
    std::size_t size() const { return records_.size(); }
    std::size_t height() const { return levels_.size(); }

    const Hasher& hasher() const { return hasher_; }
    const std::vector<Bytes>& records() const { return records_; }
    const std::vector<Level>& levels() const { return levels_; }

    /// Throws EmptyTreeError when the tree holds no records.
    const Hash& root() const;

    /// Position of the first record byte-equal to `record`.
    std::optional<std::size_t> find(const Bytes& record) const;

    /// Throws EmptyTreeError on an empty tree and NotFoundError if `record` is absent.
    Proof generate_proof(const Bytes& record) const;

    /// Throws EmptyTreeError on an empty tree and std::out_of_range on a bad index.
    Proof generate_proof_at(std::size_t index) const;

    /// Checks a proof against the current root. False on an empty tree.
    bool verify(const Proof& proof, const Hash& candidate) const;

private:
    void rebuild();

    Hasher hasher_;
    std::vector<Bytes> records_;
    std::vector<Level> levels_;
};

} // namespace merkletree
