#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace merkletree {

/// Raw record bytes as supplied by the caller.
using Bytes = std::vector<std::uint8_t>;

/// 32-byte digest produced by every supported algorithm.
struct Hash {
    std::array<std::uint8_t, 32> bytes{};

    bool operator==(const Hash& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const Hash& other) const noexcept { return !(*this == other); }
    bool operator<(const Hash& other) const noexcept { return bytes < other.bytes; }
};

enum class HashAlgorithm : std::uint8_t {
    SHA3_256 = 0,
    SHA256   = 1,
};

const char* algorithm_name(HashAlgorithm algo);

/// Accepts "sha3-256"/"sha3" and "sha256"/"sha2-256". Throws std::invalid_argument otherwise.
HashAlgorithm parse_algorithm(const std::string& name);

/// Digest function bound to one algorithm. Stateless, so a single instance may
/// be shared between threads.
class Hasher {
public:
    /// Throws std::invalid_argument for a value outside HashAlgorithm.
    explicit Hasher(HashAlgorithm algo = HashAlgorithm::SHA3_256);

    HashAlgorithm algorithm() const { return algo_; }

    Hash digest(const std::uint8_t* data, std::size_t len) const;
    Hash digest(const Bytes& data) const { return digest(data.data(), data.size()); }
    Hash digest(const std::string& data) const;

    /// H(left || right). Argument order matters.
    Hash concat(const Hash& left, const Hash& right) const;

private:
    HashAlgorithm algo_;
};

} // namespace merkletree
