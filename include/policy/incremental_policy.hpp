#pragma once

#include "curve/curve.hpp"
#include "hash/hash_function.hpp"
#include "tree/hashing_policy.hpp"
#include "types/hash_value.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace authtree {

/**
 * IncrementalDigest - node digest of a Merkle++ tree
 *
 * Leaves carry a plain hash; internal nodes carry an additive accumulator
 * (a compressed group element). A node that was never written is an
 * Internal holding the identity.
 */
class IncrementalDigest {
public:
    enum class Kind { Leaf, Internal };

    IncrementalDigest() : value_(CompressedPoint::identity()) {}

    static IncrementalDigest leaf(const HashValue& h) { return IncrementalDigest(h); }
    static IncrementalDigest internal(const CompressedPoint& acc) { return IncrementalDigest(acc); }

    Kind kind() const { return value_.index() == 0 ? Kind::Leaf : Kind::Internal; }
    bool is_leaf() const { return kind() == Kind::Leaf; }
    bool is_internal() const { return kind() == Kind::Internal; }

    // @throws InvariantViolation if the digest has the other kind
    const HashValue& leaf_hash() const;
    const CompressedPoint& accumulator() const;

    bool operator==(const IncrementalDigest& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const IncrementalDigest& rhs) const { return !(*this == rhs); }

    std::string to_hex() const;
    friend std::ostream& operator<<(std::ostream& os, const IncrementalDigest& d);

private:
    explicit IncrementalDigest(const HashValue& h) : value_(h) {}
    explicit IncrementalDigest(const CompressedPoint& acc) : value_(acc) {}

    std::variant<HashValue, CompressedPoint> value_;
};

/**
 * IncrementalPolicy - Merkle++ hashing
 *
 * A parent is the group sum of contribution(i, child_i) over its children,
 * where contribution maps (digest bytes || le64(i)) to the group. Updating c
 * children then only needs 2c contributions (remove old, add new), unless
 * c > arity/2 in which case the parent is recomputed from all children at a
 * cost of `arity` contributions.
 */
class IncrementalPolicy : public HashingPolicy<std::string, IncrementalDigest> {
public:
    /**
     * @throws std::invalid_argument if arity < 2 or curve is null
     */
    IncrementalPolicy(size_t arity, std::shared_ptr<const Curve> curve);

    std::string name() const override { return "merkle++"; }
    bool is_incremental() const override { return true; }

    size_t arity() const { return arity_; }
    const Curve& curve() const { return *curve_; }

    // SHA3-256("leaf:" || data); not counted as a computation
    IncrementalDigest hash_leaf(size_t offset, const std::string& data) override;

    IncrementalDigest combine_children(const IncrementalDigest& old_parent,
                                       std::vector<IncrementalDigest>& old_children,
                                       const ChildUpdates<IncrementalDigest>& changed) override;

    // Group element contributed by `child` at `offset`; identity for an unwritten node
    Point contribution(size_t offset, const IncrementalDigest& child);

    // Accumulator of a parent over `children`, without touching the counters
    IncrementalDigest recompute(const std::vector<IncrementalDigest>& children);

private:
    size_t arity_;
    std::shared_ptr<const Curve> curve_;
    Hasher hasher_;
    BnCtxPtr ctx_;
};

} // namespace authtree
