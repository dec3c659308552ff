#pragma once

#include "common/errors.hpp"
#include <cstddef>
#include <ostream>
#include <stdexcept>

namespace authtree {

/**
 * NodeIndex - position of a node in the flat, breadth-first array of a
 * complete k-ary tree.
 *
 * Root is stored at 0; its k children at 1..k. The children of node i are
 * stored at i*k + 1 .. i*k + k and the parent of node i is (i-1)/k:
 *
 *                              0
 *    1             2                3               4
 * 5 6 7 8      9 10 11 12      13 14 15 16     17 18 19 20
 */
class NodeIndex {
public:
    constexpr NodeIndex() : value_(0) {}
    constexpr explicit NodeIndex(size_t value) : value_(value) {}

    static constexpr NodeIndex root() { return NodeIndex(0); }

    constexpr size_t value() const { return value_; }
    constexpr bool is_root() const { return value_ == 0; }

    // Position of this node relative to its parent, in [0, arity)
    constexpr size_t child_offset(size_t arity) const {
        return is_root() ? 0 : (value_ - 1) % arity;
    }

    NodeIndex parent(size_t arity) const {
        AUTHTREE_INVARIANT(!is_root(), "the root has no parent");
        return NodeIndex((value_ - 1) / arity);
    }

    // Index of the i-th child, i in [0, arity)
    NodeIndex child(size_t arity, size_t i) const {
        if (i >= arity) {
            throw std::out_of_range("Child offset out of range");
        }
        return NodeIndex(value_ * arity + i + 1);
    }

    bool is_sibling_of(size_t arity, const NodeIndex& other) const {
        return !is_root() && !other.is_root() && parent(arity) == other.parent(arity);
    }

    constexpr bool operator==(const NodeIndex& rhs) const { return value_ == rhs.value_; }
    constexpr bool operator!=(const NodeIndex& rhs) const { return value_ != rhs.value_; }
    constexpr bool operator<(const NodeIndex& rhs) const { return value_ < rhs.value_; }

    friend std::ostream& operator<<(std::ostream& os, const NodeIndex& idx) {
        return os << idx.value_;
    }

private:
    size_t value_;
};

} // namespace authtree
