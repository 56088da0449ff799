#include "merkletree/verify.hpp"

namespace merkletree {

std::optional<Hash> compute_root(const Hasher& hasher, const Proof& proof, const Hash& candidate) {
    Hash acc = candidate;
    for (const auto& step : proof.steps) {
        switch (step.side) {
        case Side::RIGHT:
            acc = hasher.concat(acc, step.sibling);
            break;
        case Side::LEFT:
            acc = hasher.concat(step.sibling, acc);
            break;
        default:
            return std::nullopt;
        }
    }
    return acc;
}

bool verify_proof(const Hasher& hasher, const Proof& proof, const Hash& candidate, const Hash& root) {
    const auto computed = compute_root(hasher, proof, candidate);
    return computed && *computed == root;
}

bool verify_record(const Hasher& hasher, const Proof& proof, const Bytes& record, const Hash& root) {
    return verify_proof(hasher, proof, hasher.digest(record), root);
}

} // namespace merkletree
