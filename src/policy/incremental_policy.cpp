#include "policy/incremental_policy.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace authtree {

const HashValue& IncrementalDigest::leaf_hash() const {
    AUTHTREE_INVARIANT(is_leaf(), "expected a leaf digest");
    return std::get<HashValue>(value_);
}

const CompressedPoint& IncrementalDigest::accumulator() const {
    AUTHTREE_INVARIANT(is_internal(), "expected an internal digest");
    return std::get<CompressedPoint>(value_);
}

std::string IncrementalDigest::to_hex() const {
    return is_leaf() ? leaf_hash().to_hex() : accumulator().to_hex();
}

std::ostream& operator<<(std::ostream& os, const IncrementalDigest& d) {
    return os << (d.is_leaf() ? "Leaf(" : "Internal(") << d.to_hex() << ")";
}

IncrementalPolicy::IncrementalPolicy(size_t arity, std::shared_ptr<const Curve> curve)
    : arity_(arity),
      curve_(std::move(curve)),
      hasher_(HashFunction::Sha3_256),
      ctx_(make_bn_ctx()) {
    if (arity < 2) {
        throw std::invalid_argument("Incremental policy arity must be at least 2");
    }
    if (!curve_) {
        throw std::invalid_argument("Incremental policy requires a curve");
    }
}

IncrementalDigest IncrementalPolicy::hash_leaf(size_t /*offset*/, const std::string& data) {
    hasher_.update("leaf:");
    hasher_.update(data);
    stats_.leaf_hashes++;
    return IncrementalDigest::leaf(hasher_.finalize());
}

Point IncrementalPolicy::contribution(size_t offset, const IncrementalDigest& child) {
    uint8_t buf[CompressedPoint::LEN + 8];
    size_t len = 0;

    if (child.is_leaf()) {
        const HashValue& h = child.leaf_hash();
        std::copy(h.data(), h.data() + HashValue::LEN, buf);
        len = HashValue::LEN;
    } else {
        const CompressedPoint& acc = child.accumulator();
        if (acc.is_identity()) {
            return curve_->identity();
        }
        std::copy(acc.data(), acc.data() + CompressedPoint::LEN, buf);
        len = CompressedPoint::LEN;
    }

    uint64_t off = static_cast<uint64_t>(offset);
    for (size_t b = 0; b < 8; ++b) {
        buf[len++] = static_cast<uint8_t>(off >> (8 * b));
    }
    return curve_->hash_to_point(buf, len, ctx_.get());
}

IncrementalDigest IncrementalPolicy::recompute(const std::vector<IncrementalDigest>& children) {
    Point acc = curve_->identity();
    for (size_t i = 0; i < children.size(); ++i) {
        acc.add(contribution(i, children[i]), ctx_.get());
    }
    return IncrementalDigest::internal(acc.compress(ctx_.get()));
}

IncrementalDigest IncrementalPolicy::combine_children(const IncrementalDigest& old_parent,
                                                      std::vector<IncrementalDigest>& old_children,
                                                      const ChildUpdates<IncrementalDigest>& changed) {
    AUTHTREE_INVARIANT(old_parent.is_internal(), "incremental parent holds a leaf digest");
    stats_.combines++;

    if (changed.size() > arity_ / 2) {
        for (const auto& c : changed) {
            AUTHTREE_INVARIANT(c.first < old_children.size(), "changed offset beyond the last child");
            old_children[c.first] = c.second;
        }
        stats_.computations += arity_;
        stats_.full_recomputes++;
        AUTHTREE_DEBUG_COUT("[merkle++] " << changed.size() << "/" << arity_
                            << " children changed, recomputing" << std::endl);
        return recompute(old_children);
    }

    Point acc = curve_->decompress(old_parent.accumulator(), ctx_.get());
    for (const auto& c : changed) {
        AUTHTREE_INVARIANT(c.first < old_children.size(), "changed offset beyond the last child");
        acc.sub(contribution(c.first, old_children[c.first]), ctx_.get());
        acc.add(contribution(c.first, c.second), ctx_.get());
    }
    stats_.computations += 2 * changed.size();
    return IncrementalDigest::internal(acc.compress(ctx_.get()));
}

} // namespace authtree
