#pragma once

#include <string>
#include <string_view>

#include "merkletree/hash.hpp"

namespace merkletree {

std::string to_hex(const Hash& h);

/// Parses exactly 64 hex characters (either case).
Hash parse_hash(std::string_view hex);

} // namespace merkletree
