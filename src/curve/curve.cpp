#include "curve/curve.hpp"
#include "hash/hash_function.hpp"
#include "types/hash_value.hpp"
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <vector>

namespace authtree {

namespace {

// Bound on try-and-increment attempts; each succeeds with probability ~1/2
constexpr uint32_t MAX_HASH_TO_POINT_TRIES = 256;

} // namespace

BnCtxPtr make_bn_ctx() {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        throw_crypto_error("BN_CTX_new failed");
    }
    return ctx;
}

BignumPtr make_bignum() {
    BignumPtr bn(BN_new());
    if (!bn) {
        throw_crypto_error("BN_new failed");
    }
    return bn;
}

// ============================================================================
// Scalar
// ============================================================================

Scalar Scalar::from_u64(uint64_t v) {
    std::array<uint8_t, LEN> bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[LEN - 1 - i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return Scalar(bytes);
}

Scalar Scalar::from_bignum(const BIGNUM* bn) {
    std::array<uint8_t, LEN> bytes{};
    if (BN_bn2binpad(bn, bytes.data(), static_cast<int>(LEN)) != static_cast<int>(LEN)) {
        throw_crypto_error("BN_bn2binpad: scalar does not fit in 32 bytes");
    }
    return Scalar(bytes);
}

BignumPtr Scalar::to_bignum() const {
    BignumPtr bn(BN_bin2bn(bytes_.data(), static_cast<int>(LEN), nullptr));
    if (!bn) {
        throw_crypto_error("BN_bin2bn failed");
    }
    return bn;
}

bool Scalar::is_zero() const {
    for (uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

std::string Scalar::to_hex() const {
    return bytes_to_hex(bytes_.data(), LEN);
}

std::ostream& operator<<(std::ostream& os, const Scalar& s) {
    return os << s.to_hex();
}

// ============================================================================
// CompressedPoint
// ============================================================================

bool CompressedPoint::is_identity() const {
    for (uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

std::string CompressedPoint::to_hex() const {
    return bytes_to_hex(bytes_.data(), LEN);
}

std::ostream& operator<<(std::ostream& os, const CompressedPoint& p) {
    return os << p.to_hex();
}

// ============================================================================
// Point
// ============================================================================

Point::Point(const Curve& curve)
    : group_(curve.group()), point_(EC_POINT_new(curve.group())) {
    if (!point_) {
        throw_crypto_error("EC_POINT_new failed");
    }
    if (EC_POINT_set_to_infinity(group_, point_.get()) != 1) {
        throw_crypto_error("EC_POINT_set_to_infinity failed");
    }
}

Point::Point(const Point& other)
    : group_(other.group_), point_(EC_POINT_dup(other.point_.get(), other.group_)) {
    if (!point_) {
        throw_crypto_error("EC_POINT_dup failed");
    }
}

Point& Point::operator=(const Point& other) {
    if (this != &other) {
        if (!point_ || group_ != other.group_) {
            EcPointPtr copy(EC_POINT_dup(other.point_.get(), other.group_));
            if (!copy) {
                throw_crypto_error("EC_POINT_dup failed");
            }
            point_ = std::move(copy);
            group_ = other.group_;
        } else if (EC_POINT_copy(point_.get(), other.point_.get()) != 1) {
            throw_crypto_error("EC_POINT_copy failed");
        }
    }
    return *this;
}

bool Point::is_identity() const {
    return EC_POINT_is_at_infinity(group_, point_.get()) == 1;
}

void Point::add(const Point& other, BN_CTX* ctx) {
    if (EC_POINT_add(group_, point_.get(), point_.get(), other.point_.get(), ctx) != 1) {
        throw_crypto_error("EC_POINT_add failed");
    }
}

void Point::sub(const Point& other, BN_CTX* ctx) {
    Point neg(other);
    if (EC_POINT_invert(group_, neg.get(), ctx) != 1) {
        throw_crypto_error("EC_POINT_invert failed");
    }
    add(neg, ctx);
}

void Point::dbl(BN_CTX* ctx) {
    if (EC_POINT_dbl(group_, point_.get(), point_.get(), ctx) != 1) {
        throw_crypto_error("EC_POINT_dbl failed");
    }
}

bool Point::equals(const Point& other, BN_CTX* ctx) const {
    int r = EC_POINT_cmp(group_, point_.get(), other.point_.get(), ctx);
    if (r < 0) {
        throw_crypto_error("EC_POINT_cmp failed");
    }
    return r == 0;
}

CompressedPoint Point::compress(BN_CTX* ctx) const {
    if (is_identity()) {
        return CompressedPoint::identity();
    }
    std::array<uint8_t, CompressedPoint::LEN> bytes{};
    size_t len = EC_POINT_point2oct(group_, point_.get(), POINT_CONVERSION_COMPRESSED,
                                    bytes.data(), bytes.size(), ctx);
    if (len != CompressedPoint::LEN) {
        throw_crypto_error("EC_POINT_point2oct failed");
    }
    return CompressedPoint(bytes);
}

// ============================================================================
// Curve
// ============================================================================

Curve::Curve()
    : group_(EC_GROUP_new_by_curve_name(NID_secp256k1)),
      order_(make_bignum()),
      prime_(make_bignum()) {
    if (!group_) {
        throw_crypto_error("EC_GROUP_new_by_curve_name(secp256k1) failed");
    }
    BnCtxPtr ctx = make_bn_ctx();
    if (EC_GROUP_get_order(group_.get(), order_.get(), ctx.get()) != 1) {
        throw_crypto_error("EC_GROUP_get_order failed");
    }
    if (EC_GROUP_get_curve(group_.get(), prime_.get(), nullptr, nullptr, ctx.get()) != 1) {
        throw_crypto_error("EC_GROUP_get_curve failed");
    }
}

Scalar Curve::reduce(const uint8_t* bytes, size_t len, BN_CTX* ctx) const {
    BignumPtr x(BN_bin2bn(bytes, static_cast<int>(len), nullptr));
    if (!x) {
        throw_crypto_error("BN_bin2bn failed");
    }
    BignumPtr r = make_bignum();
    if (BN_nnmod(r.get(), x.get(), order_.get(), ctx) != 1) {
        throw_crypto_error("BN_nnmod failed");
    }
    return Scalar::from_bignum(r.get());
}

Scalar Curve::hash_to_scalar(const uint8_t* data, size_t len, BN_CTX* ctx) const {
    Hasher h(HashFunction::Blake2b512);
    h.update(data, len);
    std::vector<uint8_t> wide = h.finalize_bytes();
    return reduce(wide.data(), wide.size(), ctx);
}

Scalar Curve::hash_to_scalar(const std::string& prefix, const std::string& data, BN_CTX* ctx) const {
    Hasher h(HashFunction::Blake2b512);
    h.update(prefix);
    h.update(data);
    std::vector<uint8_t> wide = h.finalize_bytes();
    return reduce(wide.data(), wide.size(), ctx);
}

Scalar Curve::add(const Scalar& a, const Scalar& b, BN_CTX* ctx) const {
    BignumPtr x = a.to_bignum();
    BignumPtr y = b.to_bignum();
    BignumPtr r = make_bignum();
    if (BN_mod_add(r.get(), x.get(), y.get(), order_.get(), ctx) != 1) {
        throw_crypto_error("BN_mod_add failed");
    }
    return Scalar::from_bignum(r.get());
}

Scalar Curve::sub(const Scalar& a, const Scalar& b, BN_CTX* ctx) const {
    BignumPtr x = a.to_bignum();
    BignumPtr y = b.to_bignum();
    BignumPtr r = make_bignum();
    if (BN_mod_sub(r.get(), x.get(), y.get(), order_.get(), ctx) != 1) {
        throw_crypto_error("BN_mod_sub failed");
    }
    return Scalar::from_bignum(r.get());
}

Point Curve::hash_to_point(const uint8_t* data, size_t len, BN_CTX* ctx) const {
    Point p(*this);
    BignumPtr x = make_bignum();
    Hasher h(HashFunction::Sha256);

    for (uint32_t ctr = 0; ctr < MAX_HASH_TO_POINT_TRIES; ++ctr) {
        h.update(std::string("authtree-hash-to-point:"));
        h.update(data, len);
        uint8_t ctr_bytes[4] = {
            static_cast<uint8_t>(ctr), static_cast<uint8_t>(ctr >> 8),
            static_cast<uint8_t>(ctr >> 16), static_cast<uint8_t>(ctr >> 24)
        };
        h.update(ctr_bytes, sizeof(ctr_bytes));
        HashValue candidate = h.finalize();

        if (BN_bin2bn(candidate.data(), static_cast<int>(HashValue::LEN), x.get()) == nullptr) {
            throw_crypto_error("BN_bin2bn failed");
        }
        if (BN_cmp(x.get(), prime_.get()) >= 0) {
            continue;
        }
        if (EC_POINT_set_compressed_coordinates(group_.get(), p.get(), x.get(), 0, ctx) == 1) {
            return p;
        }
        // x is not the abscissa of a curve point; drop the error OpenSSL queued
        ERR_clear_error();
    }

    throw InvariantViolation("hash_to_point exhausted its attempts");
}

Point Curve::mul(const Point& p, const Scalar& k, BN_CTX* ctx) const {
    Point r(*this);
    BignumPtr kb = k.to_bignum();
    if (EC_POINT_mul(group_.get(), r.get(), nullptr, p.get(), kb.get(), ctx) != 1) {
        throw_crypto_error("EC_POINT_mul failed");
    }
    return r;
}

Point Curve::decompress(const CompressedPoint& c, BN_CTX* ctx) const {
    Point p(*this);
    if (c.is_identity()) {
        return p;
    }
    if (EC_POINT_oct2point(group_.get(), p.get(), c.data(), CompressedPoint::LEN, ctx) != 1) {
        throw_crypto_error("EC_POINT_oct2point: invalid compressed point " + c.to_hex());
    }
    return p;
}

} // namespace authtree
