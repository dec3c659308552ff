#pragma once

#include "tree/node_index.hpp"
#include <cstddef>
#include <string>

namespace authtree {

// Number of leaves of a perfect arity-k tree of height h, i.e. k^h
size_t max_leaves(size_t arity, size_t height);

/**
 * TreeLayout - shape of a flat k-ary tree holding an arbitrary number of leaves
 *
 * When num_leaves is not a power of the arity, leaves occupy the two deepest
 * levels: the last R nodes of level h are leaves and the remaining ones are
 * internal nodes whose children live on level h+1. Exactly one of those
 * internal nodes (the last one) may have fewer than `arity` children.
 *
 * Leaf positions are numbered deepest level first: positions [0, num_last)
 * live on the deepest level, positions [num_last, num_leaves) on the level
 * above it. A sorted batch therefore always lists its deepest-level leaves
 * before its second-to-last-level ones.
 */
class TreeLayout {
public:
    /**
     * @throws std::invalid_argument if arity < 2 or num_leaves == 0
     */
    TreeLayout(size_t arity, size_t num_leaves);

    size_t arity() const { return arity_; }
    size_t num_leaves() const { return num_leaves_; }

    // Height of the deepest fully internal level; leaves live on height (and height+1)
    size_t height() const { return height_; }

    size_t num_internal_nodes() const { return num_internal_nodes_; }
    size_t num_nodes() const { return num_internal_nodes_ + num_leaves_; }

    size_t num_last_level_leaves() const { return num_last_; }
    size_t num_second_to_last_level_leaves() const { return num_second_to_last_; }

    NodeIndex first_last_level_leaf() const { return first_last_level_leaf_; }

    bool has_leaves_on_two_levels() const { return num_second_to_last_ > 0; }

    bool is_leaf(const NodeIndex& node) const {
        return node.value() >= num_internal_nodes_ && node.value() < num_nodes();
    }

    bool is_last_level_leaf(const NodeIndex& node) const {
        return node.value() >= first_last_level_leaf_.value() && node.value() < num_nodes();
    }

    // Maps a leaf position in [0, num_leaves) to its NodeIndex
    NodeIndex leaf_index(size_t leaf_pos) const;

    // Inverse of leaf_index()
    size_t leaf_position(const NodeIndex& leaf) const;

    // Distance from the root (root has depth 0)
    size_t depth(const NodeIndex& node) const;

    std::string to_string() const;

private:
    size_t arity_;
    size_t num_leaves_;
    size_t height_;
    size_t num_internal_nodes_;
    size_t num_second_to_last_;
    size_t num_last_;
    NodeIndex first_last_level_leaf_;
};

} // namespace authtree
