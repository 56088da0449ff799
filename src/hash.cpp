#include "merkletree/hash.hpp"

#include <openssl/evp.h>

#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>

namespace merkletree {
namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

/// One digest computation through OpenSSL's EVP interface.
class EvpDigest {
public:
    explicit EvpDigest(const EVP_MD* md) : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    void update(const std::uint8_t* data, std::size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    Hash finalize() {
        Hash out;
        unsigned int written = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.bytes.data(), &written) != 1 || written != out.bytes.size()) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

private:
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx_;
};

struct Chunk {
    const std::uint8_t* data;
    std::size_t len;
};

const EVP_MD* evp_md(HashAlgorithm algo) {
    switch (algo) {
    case HashAlgorithm::SHA3_256:
        return EVP_sha3_256();
    case HashAlgorithm::SHA256:
        return EVP_sha256();
    }
    return nullptr;
}

Hash run(HashAlgorithm algo, std::initializer_list<Chunk> chunks) {
    EvpDigest engine(evp_md(algo));
    for (const auto& c : chunks) {
        engine.update(c.data, c.len);
    }
    return engine.finalize();
}

} // namespace

const char* algorithm_name(HashAlgorithm algo) {
    switch (algo) {
    case HashAlgorithm::SHA3_256:
        return "sha3-256";
    case HashAlgorithm::SHA256:
        return "sha256";
    }
    return "unknown";
}

Hasher::Hasher(HashAlgorithm algo) : algo_(algo) {
    if (evp_md(algo) == nullptr) {
        throw std::invalid_argument("unknown hash algorithm " + std::to_string(static_cast<int>(algo)));
    }
}

HashAlgorithm parse_algorithm(const std::string& name) {
    if (name == "sha3-256" || name == "sha3") {
        return HashAlgorithm::SHA3_256;
    }
    if (name == "sha256" || name == "sha2-256") {
        return HashAlgorithm::SHA256;
    }
    throw std::invalid_argument("unsupported hash algorithm: " + name);
}

Hash Hasher::digest(const std::uint8_t* data, std::size_t len) const {
    return run(algo_, {{data, len}});
}

Hash Hasher::digest(const std::string& data) const {
    return digest(static_cast<const std::uint8_t*>(static_cast<const void*>(data.data())), data.size());
}

Hash Hasher::concat(const Hash& left, const Hash& right) const {
    return run(algo_, {{left.bytes.data(), left.bytes.size()}, {right.bytes.data(), right.bytes.size()}});
}

} // namespace merkletree
