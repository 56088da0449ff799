#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "merkletree/hash.hpp"

namespace merkletree {

/// Where the sibling digest sits relative to the node being hashed.
enum class Side : std::uint8_t {
    LEFT  = 0,
    RIGHT = 1,
};

struct ProofStep {
    Hash sibling{};
    Side side = Side::RIGHT;
};

/// Inclusion proof, leaf level first. Detached from the tree that produced it.
struct Proof {
    std::size_t leaf_index = 0;     // informational, not used by verification
    std::vector<ProofStep> steps;

    std::size_t size() const { return steps.size(); }
    bool empty() const { return steps.empty(); }
};

} // namespace merkletree
