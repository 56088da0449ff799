#pragma once

#include <stdexcept>
#include <string>

namespace merkletree {

/// Raised when a proof is requested for a record the tree does not hold.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

/// Raised when the root or a proof is requested from a tree with no records.
class EmptyTreeError : public std::runtime_error {
public:
    explicit EmptyTreeError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace merkletree
