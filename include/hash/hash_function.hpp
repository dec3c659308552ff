#pragma once

#include "types/hash_value.hpp"
#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace authtree {

struct EvpMdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

/**
 * Hash functions available to the tree policies, all backed by OpenSSL EVP.
 */
enum class HashFunction {
    Sha3_256,     // default CRHF
    Sha256,
    Blake2s256,
    Blake2b512    // 64-byte output, used for wide reduction into scalars
};

HashFunction hash_function_from_string(const std::string& s);
std::string to_string(HashFunction f);

// Output length in bytes
size_t digest_size(HashFunction f);

/**
 * Hasher - incremental (streaming) hashing context
 *
 * Usage:
 *   Hasher h(HashFunction::Sha3_256);
 *   h.update("leaf:");
 *   h.update(data);
 *   HashValue v = h.finalize();
 */
class Hasher {
public:
    explicit Hasher(HashFunction f);

    Hasher(Hasher&&) noexcept = default;
    Hasher& operator=(Hasher&&) noexcept = default;

    HashFunction function() const { return function_; }

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    void update(const HashValue& v) { update(v.data(), HashValue::LEN); }

    // Writes digest_size(function()) bytes; the context is reset afterwards
    void finalize_into(uint8_t* out);

    // Requires a 32-byte hash function
    HashValue finalize();

    std::vector<uint8_t> finalize_bytes();

private:
    void reset();

    HashFunction function_;
    EvpMdCtxPtr ctx_;
};

// One-shot H(prefix || data)
HashValue hash_with_prefix(HashFunction f, const std::string& prefix, const std::string& data);

} // namespace authtree
