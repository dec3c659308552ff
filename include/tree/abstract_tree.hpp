#pragma once

#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "tree/hashing_policy.hpp"
#include "tree/node_index.hpp"
#include "tree/tree_layout.hpp"
#include <chrono>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace authtree {

// Wall-clock split of the last update_leaves() call
struct UpdateTimings {
    std::chrono::nanoseconds preprocess{0};
    std::chrono::nanoseconds propagate{0};
};

/**
 * AbstractTree - flat, array-backed k-ary authenticated tree
 *
 * Stores one Digest per node in breadth-first order (see NodeIndex) and
 * recomputes the root after a batch of leaf updates by visiting each affected
 * ancestor exactly once. How leaves are hashed and how a parent digest is
 * derived from its children is left to the Policy.
 *
 * Not thread-safe: one writer per tree.
 */
template <typename LeafData, typename Digest, typename Policy>
class AbstractTree {
    static_assert(std::is_base_of<HashingPolicy<LeafData, Digest>, Policy>::value,
                  "Policy must implement HashingPolicy<LeafData, Digest>");

public:
    using leaf_type = LeafData;
    using digest_type = Digest;
    using policy_type = Policy;
    using UpdateQueue = std::deque<std::pair<NodeIndex, Digest>>;

    // Hashed leaves, already resolved to a single tree level, ready to propagate
    struct PreprocessedUpdates {
        UpdateQueue queue;
        std::chrono::nanoseconds elapsed{0};
    };

    /**
     * Perfect tree with arity^height leaves.
     * @throws std::invalid_argument if arity < 2
     */
    AbstractTree(size_t arity, size_t height, Policy policy)
        : AbstractTree(TreeLayout(arity, max_leaves(arity, height)), std::move(policy)) {}

    /**
     * Tree with exactly num_leaves leaves, split over the last two levels if needed.
     * @throws std::invalid_argument if arity < 2 or num_leaves == 0
     */
    static AbstractTree with_num_leaves(size_t arity, size_t num_leaves, Policy policy) {
        return AbstractTree(TreeLayout(arity, num_leaves), std::move(policy));
    }

    size_t arity() const { return layout_.arity(); }
    size_t num_leaves() const { return layout_.num_leaves(); }
    size_t num_internal_nodes() const { return layout_.num_internal_nodes(); }
    size_t num_nodes() const { return nodes_.size(); }
    bool has_leaves_on_two_levels() const { return layout_.has_leaves_on_two_levels(); }
    const TreeLayout& layout() const { return layout_; }

    Policy& policy() { return policy_; }
    const Policy& policy() const { return policy_; }

    const Digest& root() const { return nodes_[0]; }

    const Digest& digest_at(const NodeIndex& node) const {
        if (node.value() >= nodes_.size()) {
            throw std::out_of_range("Node index out of range");
        }
        return nodes_[node.value()];
    }

    NodeIndex leaf_index(size_t leaf_pos) const { return layout_.leaf_index(leaf_pos); }

    const Digest& leaf_digest(size_t leaf_pos) const {
        return nodes_[layout_.leaf_index(leaf_pos).value()];
    }

    const UpdateTimings& last_timings() const { return timings_; }

    /**
     * Sets each leaf to its new data and recomputes every affected ancestor,
     * up to and including the root.
     *
     * @param updates (leaf position, leaf data), strictly ascending by position
     * @throws std::invalid_argument on unsorted, duplicate or out-of-range positions
     */
    void update_leaves(const LeafUpdates<LeafData>& updates) {
        if (updates.empty()) {
            return;
        }

        PreprocessedUpdates pre = preprocess_leaves(updates);
        timings_.preprocess = pre.elapsed;

        auto start = std::chrono::high_resolution_clock::now();
        process_update_queue(pre.queue, nullptr);
        timings_.propagate = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::high_resolution_clock::now() - start);

        AUTHTREE_IF_PROFILE {
            double preprocess_ms = std::chrono::duration<double, std::milli>(timings_.preprocess).count();
            double propagate_ms = std::chrono::duration<double, std::milli>(timings_.propagate).count();
            std::cout << "[" << policy_.name() << "] updated " << updates.size()
                      << " leaves: preprocess " << preprocess_ms << " ms, propagate " << propagate_ms
                      << " ms, " << policy_.computations_performed() << " computations so far" << std::endl;
        }
    }

    /**
     * Hashes the leaves and, when leaves live on two levels, propagates the
     * deepest-level ones into their parents so that the returned queue holds
     * nodes of a single level only, in ascending index order.
     *
     * Deepest-level leaves and their parents' children slots are written to
     * the tree; finish with update_preprocessed_leaves().
     */
    PreprocessedUpdates preprocess_leaves(const LeafUpdates<LeafData>& updates) {
        validate_updates(updates);
        hashed_nodes_.clear();

        auto start = std::chrono::high_resolution_clock::now();
        PreprocessedUpdates pre;

        if (layout_.has_leaves_on_two_levels()) {
            // positions below num_last_level_leaves() are on the deepest level
            size_t split = 0;
            while (split < updates.size() &&
                   updates[split].first < layout_.num_last_level_leaves()) {
                ++split;
            }

            UpdateQueue deepest = queuefy(updates, 0, split);
            process_update_queue(deepest, &pre.queue);

            UpdateQueue second_to_last = queuefy(updates, split, updates.size());
            for (auto& entry : second_to_last) {
                pre.queue.push_back(std::move(entry));
            }
        } else {
            pre.queue = queuefy(updates, 0, updates.size());
        }

        pre.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::high_resolution_clock::now() - start);
        return pre;
    }

    void update_preprocessed_leaves(PreprocessedUpdates pre) {
        process_update_queue(pre.queue, nullptr);
    }

private:
    AbstractTree(TreeLayout layout, Policy policy)
        : layout_(std::move(layout)),
          nodes_(layout_.num_nodes(), Digest()),
          policy_(std::move(policy)) {
        AUTHTREE_DEBUG_COUT("[" << policy_.name() << "] " << layout_.to_string() << std::endl);
    }

    void validate_updates(const LeafUpdates<LeafData>& updates) const {
        for (size_t i = 0; i < updates.size(); ++i) {
            if (updates[i].first >= layout_.num_leaves()) {
                throw std::invalid_argument("Leaf position " + std::to_string(updates[i].first) +
                                            " out of range for a tree with " +
                                            std::to_string(layout_.num_leaves()) + " leaves");
            }
            if (i > 0 && updates[i].first <= updates[i - 1].first) {
                throw std::invalid_argument("Leaf updates must be sorted by strictly increasing position "
                                            "(position " + std::to_string(updates[i].first) +
                                            " follows " + std::to_string(updates[i - 1].first) + ")");
            }
        }
    }

    void mark_hashed(const NodeIndex& node) {
        AUTHTREE_INVARIANT(hashed_nodes_.insert(node.value()).second,
                           "node " + std::to_string(node.value()) + " hashed twice in one batch");
    }

    UpdateQueue queuefy(const LeafUpdates<LeafData>& updates, size_t begin, size_t end) {
        UpdateQueue queue;
        for (size_t i = begin; i < end; ++i) {
            NodeIndex leaf = layout_.leaf_index(updates[i].first);
            mark_hashed(leaf);
            queue.emplace_back(leaf, policy_.hash_leaf(leaf.child_offset(arity()), updates[i].second));
        }
        return queue;
    }

    /**
     * Core propagation loop. Pops runs of siblings off the front of `dequeue`,
     * recombines their parent and pushes the parent to the back of `enqueue`
     * (or of `dequeue` itself when enqueue is null, which walks all the way to
     * the root). Relies on the queue holding nodes by non-increasing depth and
     * ascending index, so siblings are always adjacent.
     */
    void process_update_queue(UpdateQueue& dequeue, UpdateQueue* enqueue) {
        const size_t k = arity();
        ChildUpdates<Digest> new_siblings;
        std::vector<Digest> old_children;
        new_siblings.reserve(k);
        old_children.reserve(k);

        while (!dequeue.empty()) {
            new_siblings.clear();
            old_children.clear();

            std::pair<NodeIndex, Digest> first = std::move(dequeue.front());
            dequeue.pop_front();

            if (first.first.is_root()) {
                AUTHTREE_INVARIANT(dequeue.empty(), "root dequeued before all updates were processed");
                nodes_[0] = std::move(first.second);
                continue;
            }

            const NodeIndex parent = first.first.parent(k);
            new_siblings.emplace_back(first.first.child_offset(k), std::move(first.second));

            while (!dequeue.empty() && !dequeue.front().first.is_root() &&
                   dequeue.front().first.parent(k) == parent) {
                std::pair<NodeIndex, Digest> sib = std::move(dequeue.front());
                dequeue.pop_front();

                size_t offset = sib.first.child_offset(k);
                AUTHTREE_INVARIANT(offset > new_siblings.back().first,
                                   "siblings of node " + std::to_string(parent.value()) +
                                   " dequeued out of order");
                new_siblings.emplace_back(offset, std::move(sib.second));
            }

            // Old digests of every existing child. A missing child i means the
            // parent sits on the irregular leaf boundary and has no children >= i.
            for (size_t i = 0; i < k; ++i) {
                NodeIndex child = parent.child(k, i);
                if (child.value() >= nodes_.size()) {
                    break;
                }
                old_children.push_back(nodes_[child.value()]);
            }
            AUTHTREE_INVARIANT(new_siblings.back().first < old_children.size(),
                               "updated child beyond the last child of node " +
                               std::to_string(parent.value()));

            mark_hashed(parent);
            Digest parent_digest = policy_.combine_children(nodes_[parent.value()],
                                                            old_children, new_siblings);

            for (auto& sib : new_siblings) {
                nodes_[parent.child(k, sib.first).value()] = std::move(sib.second);
            }

            UpdateQueue& out = enqueue ? *enqueue : dequeue;
            out.emplace_back(parent, std::move(parent_digest));
        }
    }

    TreeLayout layout_;
    std::vector<Digest> nodes_;
    Policy policy_;

    std::unordered_set<size_t> hashed_nodes_;
    UpdateTimings timings_;
};

} // namespace authtree
