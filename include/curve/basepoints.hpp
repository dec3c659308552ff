#pragma once

#include "curve/curve.hpp"
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace authtree {

/**
 * FixedBaseTable - precomputed multiples of one basepoint B for fast k * B
 *
 * Stores d * 16^w * B for every 4-bit window w in [0, 64) and digit d in
 * [1, 16), so a multiplication is at most 64 point additions and no doublings.
 */
class FixedBaseTable {
public:
    static constexpr size_t WINDOW_BITS = 4;
    static constexpr size_t NUM_WINDOWS = 64;
    static constexpr size_t DIGITS = (1u << WINDOW_BITS) - 1;

    FixedBaseTable(const Point& base, BN_CTX* ctx);

    const Point& basepoint() const { return table_[0]; }

    Point mul(const Curve& curve, const Scalar& k, BN_CTX* ctx) const;

private:
    const Point& entry(size_t window, size_t digit) const {
        return table_[window * DIGITS + (digit - 1)];
    }

    std::vector<Point> table_;
};

/**
 * MultiscalarPrecomputation - interleaved (Straus) multi-scalar multiplication
 * over a fixed set of basepoints.
 *
 * Holds the 255 small multiples [1..255] * B_i of every basepoint, built once.
 * A product sum_j k_j * B_{i_j} then costs 248 shared doublings plus at most
 * 32 additions per term, which beats serial fixed-base multiplication once
 * enough terms are batched together.
 */
class MultiscalarPrecomputation {
public:
    static constexpr size_t WINDOW_BITS = 8;
    static constexpr size_t NUM_WINDOWS = 32;
    static constexpr size_t MULTIPLES = (1u << WINDOW_BITS) - 1;

    explicit MultiscalarPrecomputation(const std::vector<Point>& bases);

    size_t size() const { return multiples_.size(); }

    // sum of k * B_i over all (i, k) in terms; terms may name any subset of bases
    Point multiply(const Curve& curve,
                   const std::vector<std::pair<size_t, Scalar>>& terms,
                   BN_CTX* ctx) const;

private:
    std::vector<std::vector<Point>> multiples_;
};

/**
 * Basepoints - the per-offset generators G_0 .. G_{n-1} of a vector commitment
 * together with their precomputed tables.
 *
 * Built once and passed explicitly to every VectorCommitmentPolicy that
 * commits with these generators. Construction is parallelized with OpenMP.
 */
class Basepoints {
public:
    Basepoints(std::shared_ptr<const Curve> curve, size_t count);

    size_t size() const { return generators_.size(); }

    const Curve& curve() const { return *curve_; }

    const Point& generator(size_t i) const { return generators_.at(i); }
    const FixedBaseTable& table(size_t i) const { return tables_.at(i); }
    const MultiscalarPrecomputation& multiscalar() const { return *multiscalar_; }

private:
    std::shared_ptr<const Curve> curve_;
    std::vector<Point> generators_;
    std::vector<FixedBaseTable> tables_;
    std::unique_ptr<MultiscalarPrecomputation> multiscalar_;
};

} // namespace authtree
