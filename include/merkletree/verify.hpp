#pragma once

#include <optional>

#include "merkletree/hash.hpp"
#include "merkletree/proof.hpp"

namespace merkletree {

/// Replays the proof from `candidate`. Returns nullopt if a step carries a side
/// tag outside LEFT/RIGHT.
std::optional<Hash> compute_root(const Hasher& hasher, const Proof& proof, const Hash& candidate);

/// True iff replaying `proof` from `candidate` reproduces `root`. Never throws
/// on mismatched or tampered input.
bool verify_proof(const Hasher& hasher, const Proof& proof, const Hash& candidate, const Hash& root);

/// Same as verify_proof, hashing the raw record into its leaf digest first.
bool verify_record(const Hasher& hasher, const Proof& proof, const Bytes& record, const Hash& root);

} // namespace merkletree
