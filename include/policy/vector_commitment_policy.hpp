#pragma once

#include "curve/basepoints.hpp"
#include "curve/curve.hpp"
#include "tree/hashing_policy.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace authtree {

/**
 * VerkleDigest - node digest of a vector-commitment tree
 *
 *   Empty            node never written
 *   Leaf(scalar)     leaf value mapped into the scalar field
 *   Internal(point)  commitment sum_i scalar(child_i) * G_i, compressed
 */
class VerkleDigest {
public:
    enum class Kind { Empty, Leaf, Internal };

    VerkleDigest() = default;

    static VerkleDigest empty() { return VerkleDigest(); }
    static VerkleDigest leaf(const Scalar& s) { return VerkleDigest(s); }
    static VerkleDigest internal(const CompressedPoint& c) { return VerkleDigest(c); }

    Kind kind() const { return static_cast<Kind>(value_.index()); }
    bool is_empty() const { return kind() == Kind::Empty; }
    bool is_leaf() const { return kind() == Kind::Leaf; }
    bool is_internal() const { return kind() == Kind::Internal; }

    // @throws InvariantViolation if the digest has another kind
    const Scalar& scalar() const;
    const CompressedPoint& commitment() const;

    bool operator==(const VerkleDigest& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const VerkleDigest& rhs) const { return !(*this == rhs); }

    // Empty digests print as an empty string
    std::string to_hex() const;
    friend std::ostream& operator<<(std::ostream& os, const VerkleDigest& d);

private:
    explicit VerkleDigest(const Scalar& s) : value_(s) {}
    explicit VerkleDigest(const CompressedPoint& c) : value_(c) {}

    std::variant<std::monostate, Scalar, CompressedPoint> value_;
};

const char* to_string(VerkleDigest::Kind kind);

/**
 * VectorCommitmentPolicy - Verkle hashing
 *
 * A parent commits to its children with per-offset generators G_i taken from
 * a shared Basepoints instance. Changing child i from a to b adds
 * (scalar(b) - scalar(a)) * G_i to the parent. Legal transitions:
 *
 *   Empty -> Leaf, Empty -> Internal, Leaf -> Leaf, Internal -> Internal
 *
 * Anything else is an InvariantViolation. Up to serial_cutoff deltas are
 * applied with one fixed-base multiplication each; larger batches go
 * through a single multi-scalar multiplication.
 */
class VectorCommitmentPolicy : public HashingPolicy<std::string, VerkleDigest> {
public:
    static constexpr size_t DEFAULT_SERIAL_CUTOFF = 5;

    /**
     * @throws std::invalid_argument if arity < 2, basepoints is null or has
     *         fewer than `arity` generators
     */
    VectorCommitmentPolicy(size_t arity,
                           std::shared_ptr<const Basepoints> basepoints,
                           size_t serial_cutoff = DEFAULT_SERIAL_CUTOFF);

    std::string name() const override { return "verkle"; }
    bool is_incremental() const override { return true; }

    size_t arity() const { return arity_; }
    size_t serial_cutoff() const { return serial_cutoff_; }
    const Basepoints& basepoints() const { return *basepoints_; }

    // BLAKE2b-512("leaf:" || data) mod the group order; not counted
    VerkleDigest hash_leaf(size_t offset, const std::string& data) override;

    VerkleDigest combine_children(const VerkleDigest& old_parent,
                                  std::vector<VerkleDigest>& old_children,
                                  const ChildUpdates<VerkleDigest>& changed) override;

    // Scalar a child is committed with: 0, the leaf scalar, or H(commitment)
    Scalar child_scalar(const VerkleDigest& child);

    // scalar(next) - scalar(prev)
    // @throws InvariantViolation on an illegal kind transition
    Scalar delta(const VerkleDigest& prev, const VerkleDigest& next);

    // sum_i child_scalar(children[i]) * G_i computed directly
    VerkleDigest commit_from_scratch(const std::vector<VerkleDigest>& children);

private:
    Point apply_deltas(const std::vector<std::pair<size_t, Scalar>>& deltas);

    size_t arity_;
    std::shared_ptr<const Basepoints> basepoints_;
    size_t serial_cutoff_;
    BnCtxPtr ctx_;
};

} // namespace authtree
