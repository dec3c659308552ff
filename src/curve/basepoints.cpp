#include "curve/basepoints.hpp"
#include "common/debug_control.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace authtree {

namespace {

// Runs body(i) for i in [0, n) on the OpenMP pool. Each iteration gets its own
// BN_CTX. The first exception thrown by any iteration is rethrown afterwards.
template <typename Body>
void parallel_for_with_ctx(size_t n, Body body) {
    std::exception_ptr error;

    #pragma omp parallel for schedule(dynamic)
    for (long i = 0; i < static_cast<long>(n); ++i) {
        try {
            BnCtxPtr ctx = make_bn_ctx();
            body(static_cast<size_t>(i), ctx.get());
        } catch (...) {
            #pragma omp critical(authtree_basepoints_error)
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

} // namespace

// ============================================================================
// FixedBaseTable
// ============================================================================

FixedBaseTable::FixedBaseTable(const Point& base, BN_CTX* ctx) {
    table_.reserve(NUM_WINDOWS * DIGITS);

    // p = 16^w * B at the start of window w
    Point p = base;
    for (size_t w = 0; w < NUM_WINDOWS; ++w) {
        table_.push_back(p);
        for (size_t d = 2; d <= DIGITS; ++d) {
            Point next = table_.back();
            next.add(p, ctx);
            table_.push_back(std::move(next));
        }
        // 16 * (16^w * B) = 15 * (16^w * B) + 16^w * B
        Point next_window = table_.back();
        next_window.add(p, ctx);
        p = std::move(next_window);
    }
}

Point FixedBaseTable::mul(const Curve& curve, const Scalar& k, BN_CTX* ctx) const {
    Point acc = curve.identity();
    for (size_t w = 0; w < NUM_WINDOWS; ++w) {
        uint8_t digit = k.nibble(w);
        if (digit != 0) {
            acc.add(entry(w, digit), ctx);
        }
    }
    return acc;
}

// ============================================================================
// MultiscalarPrecomputation
// ============================================================================

MultiscalarPrecomputation::MultiscalarPrecomputation(const std::vector<Point>& bases) {
    multiples_.resize(bases.size());

    parallel_for_with_ctx(bases.size(), [&](size_t i, BN_CTX* ctx) {
        std::vector<Point>& m = multiples_[i];
        m.reserve(MULTIPLES);
        m.push_back(bases[i]);
        for (size_t d = 2; d <= MULTIPLES; ++d) {
            Point next = m.back();
            next.add(bases[i], ctx);
            m.push_back(std::move(next));
        }
    });
}

Point MultiscalarPrecomputation::multiply(const Curve& curve,
                                          const std::vector<std::pair<size_t, Scalar>>& terms,
                                          BN_CTX* ctx) const {
    for (const auto& term : terms) {
        if (term.first >= multiples_.size()) {
            throw std::out_of_range("Multi-scalar term refers to unknown basepoint " +
                                    std::to_string(term.first));
        }
    }

    Point acc = curve.identity();
    // most significant window first; acc is multiplied by 2^8 between windows
    for (size_t w = NUM_WINDOWS; w-- > 0;) {
        if (w != NUM_WINDOWS - 1 && !acc.is_identity()) {
            for (size_t b = 0; b < WINDOW_BITS; ++b) {
                acc.dbl(ctx);
            }
        }
        for (const auto& term : terms) {
            uint8_t digit = term.second.byte(w);
            if (digit != 0) {
                acc.add(multiples_[term.first][digit - 1], ctx);
            }
        }
    }
    return acc;
}

// ============================================================================
// Basepoints
// ============================================================================

Basepoints::Basepoints(std::shared_ptr<const Curve> curve, size_t count)
    : curve_(std::move(curve)) {
    if (!curve_) {
        throw std::invalid_argument("Basepoints require a curve");
    }
    if (count == 0) {
        throw std::invalid_argument("Basepoints require at least one generator");
    }

    auto start = std::chrono::high_resolution_clock::now();

    // Nothing-up-my-sleeve generators: G_i = hash_to_point("basepoint" || le64(i))
    std::vector<std::unique_ptr<Point>> generators(count);
    parallel_for_with_ctx(count, [&](size_t i, BN_CTX* ctx) {
        uint8_t seed[17] = {'b', 'a', 's', 'e', 'p', 'o', 'i', 'n', 't'};
        for (size_t b = 0; b < 8; ++b) {
            seed[9 + b] = static_cast<uint8_t>(static_cast<uint64_t>(i) >> (8 * b));
        }
        generators[i] = std::make_unique<Point>(curve_->hash_to_point(seed, sizeof(seed), ctx));
    });

    generators_.reserve(count);
    for (auto& g : generators) {
        generators_.push_back(std::move(*g));
    }

    std::vector<std::unique_ptr<FixedBaseTable>> tables(count);
    parallel_for_with_ctx(count, [&](size_t i, BN_CTX* ctx) {
        tables[i] = std::make_unique<FixedBaseTable>(generators_[i], ctx);
    });

    tables_.reserve(count);
    for (auto& t : tables) {
        tables_.push_back(std::move(*t));
    }

    multiscalar_ = std::make_unique<MultiscalarPrecomputation>(generators_);

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    AUTHTREE_PROFILE_COUT("[Basepoints] built " << count << " generators and tables in "
                          << elapsed << " ms" << std::endl);
}

} // namespace authtree
