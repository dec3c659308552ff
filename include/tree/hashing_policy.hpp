#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace authtree {

// (child offset, new digest) pairs in ascending offset order
template <typename Digest>
using ChildUpdates = std::vector<std::pair<size_t, Digest>>;

// (leaf position, leaf data) pairs in strictly ascending position order
template <typename LeafData>
using LeafUpdates = std::vector<std::pair<size_t, LeafData>>;

/**
 * Counters kept by every policy for benchmarking. Not used for correctness.
 */
struct PolicyStats {
    size_t leaf_hashes = 0;
    size_t combines = 0;
    size_t computations = 0;        // policy-specific unit of work (see each policy)
    size_t full_recomputes = 0;     // incremental: combines that recomputed from scratch
    size_t serial_updates = 0;      // vector commitment: combines using serial exponentiations
    size_t multiscalar_updates = 0; // vector commitment: combines using one multi-scalar mul

    void reset() { *this = PolicyStats(); }
};

/**
 * HashingPolicy - how a tree turns leaf data into digests and children
 * digests into a parent digest.
 *
 * The tree engine is written once against this interface; CRHF, additive
 * (Merkle++) and vector-commitment (Verkle) trees differ only in the policy
 * they are instantiated with.
 */
template <typename LeafData, typename Digest>
class HashingPolicy {
public:
    using leaf_type = LeafData;
    using digest_type = Digest;

    virtual ~HashingPolicy() = default;

    virtual std::string name() const = 0;

    /**
     * True if combine_children() only needs the old digests of the changed
     * children (plus the old parent digest), not every sibling.
     */
    virtual bool is_incremental() const = 0;

    /**
     * Digest of a leaf.
     * @param offset the leaf's position relative to its parent, in [0, arity)
     */
    virtual Digest hash_leaf(size_t offset, const LeafData& data) = 0;

    /**
     * New digest of a parent some of whose children changed.
     *
     * @param old_parent   the parent's digest before this batch
     * @param old_children the committed digest of every existing child, in
     *                     offset order; shorter than the arity for the one
     *                     parent on the irregular leaf boundary. This is the
     *                     engine's scratch buffer: the policy may overwrite it.
     * @param changed      (offset, new digest) for each changed child, by
     *                     ascending offset; every offset < old_children.size()
     */
    virtual Digest combine_children(const Digest& old_parent,
                                    std::vector<Digest>& old_children,
                                    const ChildUpdates<Digest>& changed) = 0;

    size_t computations_performed() const { return stats_.computations; }

    const PolicyStats& stats() const { return stats_; }
    void reset_stats() { stats_.reset(); }

protected:
    PolicyStats stats_;
};

} // namespace authtree
