#include "merkletree/hex.hpp"

#include <stdexcept>

namespace merkletree {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string to_hex(const Hash& h) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(h.bytes.size() * 2);
    for (std::uint8_t b : h.bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

Hash parse_hash(std::string_view hex) {
    Hash h;
    if (hex.size() != h.bytes.size() * 2) {
        throw std::runtime_error("expected 64 hex chars for hash");
    }
    for (std::size_t i = 0; i < h.bytes.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) throw std::runtime_error("invalid hex digit");
        h.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return h;
}

} // namespace merkletree
