#include "policy/vector_commitment_policy.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace authtree {

const Scalar& VerkleDigest::scalar() const {
    AUTHTREE_INVARIANT(is_leaf(), std::string("expected a leaf digest, got ") + to_string(kind()));
    return std::get<Scalar>(value_);
}

const CompressedPoint& VerkleDigest::commitment() const {
    AUTHTREE_INVARIANT(is_internal(), std::string("expected an internal digest, got ") + to_string(kind()));
    return std::get<CompressedPoint>(value_);
}

std::string VerkleDigest::to_hex() const {
    switch (kind()) {
        case Kind::Leaf: return scalar().to_hex();
        case Kind::Internal: return commitment().to_hex();
        case Kind::Empty: break;
    }
    return std::string();
}

std::ostream& operator<<(std::ostream& os, const VerkleDigest& d) {
    os << to_string(d.kind());
    if (!d.is_empty()) {
        os << "(" << d.to_hex() << ")";
    }
    return os;
}

const char* to_string(VerkleDigest::Kind kind) {
    switch (kind) {
        case VerkleDigest::Kind::Empty: return "Empty";
        case VerkleDigest::Kind::Leaf: return "Leaf";
        case VerkleDigest::Kind::Internal: return "Internal";
    }
    return "?";
}

VectorCommitmentPolicy::VectorCommitmentPolicy(size_t arity,
                                               std::shared_ptr<const Basepoints> basepoints,
                                               size_t serial_cutoff)
    : arity_(arity),
      basepoints_(std::move(basepoints)),
      serial_cutoff_(serial_cutoff),
      ctx_(make_bn_ctx()) {
    if (arity < 2) {
        throw std::invalid_argument("Vector commitment policy arity must be at least 2");
    }
    if (!basepoints_) {
        throw std::invalid_argument("Vector commitment policy requires basepoints");
    }
    if (basepoints_->size() < arity) {
        throw std::invalid_argument("Vector commitment policy needs " + std::to_string(arity) +
                                    " basepoints, got " + std::to_string(basepoints_->size()));
    }
}

VerkleDigest VectorCommitmentPolicy::hash_leaf(size_t /*offset*/, const std::string& data) {
    stats_.leaf_hashes++;
    return VerkleDigest::leaf(basepoints_->curve().hash_to_scalar("leaf:", data, ctx_.get()));
}

Scalar VectorCommitmentPolicy::child_scalar(const VerkleDigest& child) {
    switch (child.kind()) {
        case VerkleDigest::Kind::Leaf:
            return child.scalar();
        case VerkleDigest::Kind::Internal:
            return basepoints_->curve().hash_to_scalar(child.commitment().data(),
                                                       CompressedPoint::LEN, ctx_.get());
        case VerkleDigest::Kind::Empty:
            break;
    }
    return Scalar::zero();
}

Scalar VectorCommitmentPolicy::delta(const VerkleDigest& prev, const VerkleDigest& next) {
    const Curve& curve = basepoints_->curve();
    bool legal = (prev.is_empty() && !next.is_empty()) || (!prev.is_empty() && prev.kind() == next.kind());
    AUTHTREE_INVARIANT(legal, std::string("illegal child transition ") + to_string(prev.kind()) +
                              " -> " + to_string(next.kind()));

    if (prev.is_empty()) {
        return child_scalar(next);
    }
    return curve.sub(child_scalar(next), child_scalar(prev), ctx_.get());
}

Point VectorCommitmentPolicy::apply_deltas(const std::vector<std::pair<size_t, Scalar>>& deltas) {
    const Curve& curve = basepoints_->curve();

    if (deltas.size() <= serial_cutoff_) {
        stats_.serial_updates++;
        Point acc = curve.identity();
        for (const auto& d : deltas) {
            acc.add(basepoints_->table(d.first).mul(curve, d.second, ctx_.get()), ctx_.get());
        }
        return acc;
    }

    stats_.multiscalar_updates++;
    AUTHTREE_DEBUG_COUT("[verkle] " << deltas.size() << " deltas, multi-scalar path" << std::endl);
    return basepoints_->multiscalar().multiply(curve, deltas, ctx_.get());
}

VerkleDigest VectorCommitmentPolicy::combine_children(const VerkleDigest& old_parent,
                                                      std::vector<VerkleDigest>& old_children,
                                                      const ChildUpdates<VerkleDigest>& changed) {
    AUTHTREE_INVARIANT(!old_parent.is_leaf(), "vector commitment parent holds a leaf digest");

    std::vector<std::pair<size_t, Scalar>> deltas;
    deltas.reserve(changed.size());
    for (const auto& c : changed) {
        AUTHTREE_INVARIANT(c.first < old_children.size(), "changed offset beyond the last child");
        deltas.emplace_back(c.first, delta(old_children[c.first], c.second));
    }

    Point acc = apply_deltas(deltas);
    if (old_parent.is_internal()) {
        Point parent = basepoints_->curve().decompress(old_parent.commitment(), ctx_.get());
        acc.add(parent, ctx_.get());
    }

    stats_.combines++;
    stats_.computations += deltas.size();
    return VerkleDigest::internal(acc.compress(ctx_.get()));
}

VerkleDigest VectorCommitmentPolicy::commit_from_scratch(const std::vector<VerkleDigest>& children) {
    if (children.size() > arity_) {
        throw std::invalid_argument("More children than the policy arity");
    }
    const Curve& curve = basepoints_->curve();
    Point acc = curve.identity();
    for (size_t i = 0; i < children.size(); ++i) {
        Scalar s = child_scalar(children[i]);
        if (!s.is_zero()) {
            acc.add(curve.mul(basepoints_->generator(i), s, ctx_.get()), ctx_.get());
        }
    }
    return VerkleDigest::internal(acc.compress(ctx_.get()));
}

} // namespace authtree
