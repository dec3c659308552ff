#pragma once

#include "common/errors.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace authtree {

// RAII owners for OpenSSL objects
struct BignumDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BnCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct EcPointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct EcGroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };

using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;

BnCtxPtr make_bn_ctx();
BignumPtr make_bignum();

/**
 * Scalar - element of the group's scalar field, stored as 32 big-endian bytes
 * in canonical form (strictly below the group order).
 */
class Scalar {
public:
    static constexpr size_t LEN = 32;

    Scalar() : bytes_{} {}
    explicit Scalar(const std::array<uint8_t, LEN>& bytes) : bytes_(bytes) {}

    static Scalar zero() { return Scalar(); }
    static Scalar from_u64(uint64_t v);
    // `bn` must already be reduced
    static Scalar from_bignum(const BIGNUM* bn);

    BignumPtr to_bignum() const;

    const std::array<uint8_t, LEN>& bytes() const { return bytes_; }
    bool is_zero() const;

    // 4-bit digit i, counted from the least significant end (i < 64)
    uint8_t nibble(size_t i) const {
        uint8_t b = bytes_[LEN - 1 - i / 2];
        return (i % 2 == 0) ? (b & 0x0F) : (b >> 4);
    }

    // Byte i, counted from the least significant end (i < 32)
    uint8_t byte(size_t i) const { return bytes_[LEN - 1 - i]; }

    bool operator==(const Scalar& rhs) const { return bytes_ == rhs.bytes_; }
    bool operator!=(const Scalar& rhs) const { return bytes_ != rhs.bytes_; }

    std::string to_hex() const;
    friend std::ostream& operator<<(std::ostream& os, const Scalar& s);

private:
    std::array<uint8_t, LEN> bytes_;
};

/**
 * CompressedPoint - SEC1 compressed encoding of a group element (33 bytes).
 * The all-zero encoding denotes the identity (point at infinity).
 */
class CompressedPoint {
public:
    static constexpr size_t LEN = 33;

    CompressedPoint() : bytes_{} {}
    explicit CompressedPoint(const std::array<uint8_t, LEN>& bytes) : bytes_(bytes) {}

    static CompressedPoint identity() { return CompressedPoint(); }

    const std::array<uint8_t, LEN>& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }
    bool is_identity() const;

    bool operator==(const CompressedPoint& rhs) const { return bytes_ == rhs.bytes_; }
    bool operator!=(const CompressedPoint& rhs) const { return bytes_ != rhs.bytes_; }

    std::string to_hex() const;
    friend std::ostream& operator<<(std::ostream& os, const CompressedPoint& p);

private:
    std::array<uint8_t, LEN> bytes_;
};

class Curve;

/**
 * Point - group element in OpenSSL's internal (projective) representation.
 * Cheap to add, expensive to (de)compress.
 */
class Point {
public:
    // The identity
    explicit Point(const Curve& curve);

    Point(const Point& other);
    Point& operator=(const Point& other);
    Point(Point&& other) noexcept = default;
    Point& operator=(Point&& other) noexcept = default;

    EC_POINT* get() { return point_.get(); }
    const EC_POINT* get() const { return point_.get(); }

    bool is_identity() const;

    // this += other
    void add(const Point& other, BN_CTX* ctx);
    // this -= other
    void sub(const Point& other, BN_CTX* ctx);
    // this = 2 * this
    void dbl(BN_CTX* ctx);

    bool equals(const Point& other, BN_CTX* ctx) const;

    CompressedPoint compress(BN_CTX* ctx) const;

private:
    const EC_GROUP* group_;
    EcPointPtr point_;
};

/**
 * Curve - the prime-order group used by the additive and vector-commitment
 * policies (secp256k1, cofactor 1).
 *
 * A Curve is immutable once built; policies share it through
 * std::shared_ptr<const Curve>. Scratch BN_CTX objects are supplied by the
 * caller since they are not thread-safe.
 */
class Curve {
public:
    Curve();

    const EC_GROUP* group() const { return group_.get(); }
    const BIGNUM* order() const { return order_.get(); }
    const BIGNUM* prime() const { return prime_.get(); }

    Point identity() const { return Point(*this); }

    // BLAKE2b-512(data) reduced modulo the group order
    Scalar hash_to_scalar(const uint8_t* data, size_t len, BN_CTX* ctx) const;
    Scalar hash_to_scalar(const std::string& prefix, const std::string& data, BN_CTX* ctx) const;

    // Big-endian bytes reduced modulo the group order
    Scalar reduce(const uint8_t* bytes, size_t len, BN_CTX* ctx) const;

    Scalar add(const Scalar& a, const Scalar& b, BN_CTX* ctx) const;
    Scalar sub(const Scalar& a, const Scalar& b, BN_CTX* ctx) const;

    // Deterministic map to a group element (try-and-increment), so nobody knows
    // the discrete log of the result
    Point hash_to_point(const uint8_t* data, size_t len, BN_CTX* ctx) const;

    // Variable-base scalar multiplication k * p
    Point mul(const Point& p, const Scalar& k, BN_CTX* ctx) const;

    // @throws CryptoError if `c` is not a valid encoding
    Point decompress(const CompressedPoint& c, BN_CTX* ctx) const;

private:
    EcGroupPtr group_;
    BignumPtr order_;
    BignumPtr prime_;
};

} // namespace authtree
