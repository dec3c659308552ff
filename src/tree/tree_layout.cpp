#include "tree/tree_layout.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace authtree {

size_t max_leaves(size_t arity, size_t height) {
    if (arity < 2) {
        throw std::invalid_argument("Tree arity must be at least 2");
    }
    size_t n = 1;
    for (size_t i = 0; i < height; ++i) {
        if (n > std::numeric_limits<size_t>::max() / arity) {
            throw std::overflow_error("arity^height does not fit in size_t");
        }
        n *= arity;
    }
    return n;
}

TreeLayout::TreeLayout(size_t arity, size_t num_leaves)
    : arity_(arity), num_leaves_(num_leaves), height_(0),
      num_internal_nodes_(0), num_second_to_last_(0), num_last_(num_leaves) {
    if (arity < 2) {
        throw std::invalid_argument("Tree arity must be at least 2");
    }
    if (num_leaves == 0) {
        throw std::invalid_argument("Tree must have at least one leaf");
    }

    size_t n = num_leaves;
    while (n / arity > 0) {
        ++height_;
        n /= arity;
    }

    // e.g., arity 3 and 10 leaves gives height 2: 1 root, 3 children, 9
    // grandchildren, and the 10 leaves get split between the last two levels
    const size_t max = max_leaves(arity, height_);
    num_internal_nodes_ = (max - 1) / (arity - 1);

    if (num_leaves > max) {
        const size_t last_level_max_size = max * arity;

        if (last_level_max_size - num_leaves >= arity) {
            // Find epsilon in [1, arity], the number of leaf children of the
            // last internal node on level `height`, so that the remaining
            // level-h slots hold a whole number of leaves
            size_t epsilon = arity;
            auto r_num = [&](size_t e) {
                return last_level_max_size - num_leaves - (arity - e);
            };
            const size_t r_denom = arity - 1;

            while (r_num(epsilon) % r_denom != 0) {
                --epsilon;
                AUTHTREE_INVARIANT(epsilon != 0, "epsilon left [1, arity] while splitting leaves");
            }

            num_second_to_last_ = r_num(epsilon) / r_denom;
            num_last_ = (max - num_second_to_last_ - 1) * arity + epsilon;
        } else {
            num_second_to_last_ = 0;
            num_last_ = num_leaves;
        }

        AUTHTREE_INVARIANT(num_second_to_last_ + num_last_ == num_leaves,
                           "leaf split does not add up to num_leaves");

        // the last num_second_to_last_ nodes on level h are leaves
        num_internal_nodes_ += max - num_second_to_last_;
    }

    first_last_level_leaf_ = NodeIndex(num_internal_nodes_ + num_second_to_last_);
}

NodeIndex TreeLayout::leaf_index(size_t leaf_pos) const {
    if (leaf_pos >= num_leaves_) {
        throw std::out_of_range("Leaf position out of range");
    }
    if (leaf_pos < num_last_) {
        return NodeIndex(first_last_level_leaf_.value() + leaf_pos);
    }
    return NodeIndex(num_internal_nodes_ + (leaf_pos - num_last_));
}

size_t TreeLayout::leaf_position(const NodeIndex& leaf) const {
    if (!is_leaf(leaf)) {
        throw std::out_of_range("Node is not a leaf");
    }
    if (is_last_level_leaf(leaf)) {
        return leaf.value() - first_last_level_leaf_.value();
    }
    return num_last_ + (leaf.value() - num_internal_nodes_);
}

size_t TreeLayout::depth(const NodeIndex& node) const {
    size_t d = 0;
    NodeIndex curr = node;
    while (!curr.is_root()) {
        curr = curr.parent(arity_);
        ++d;
    }
    return d;
}

std::string TreeLayout::to_string() const {
    std::ostringstream oss;
    oss << "arity " << arity_ << ", height " << height_ << ", # leaves " << num_leaves_
        << " (" << num_last_ << " last level, " << num_second_to_last_ << " second-to-last)"
        << ", internal nodes " << num_internal_nodes_ << ", total nodes " << num_nodes()
        << ", first last-level leaf " << first_last_level_leaf_;
    return oss.str();
}

} // namespace authtree
