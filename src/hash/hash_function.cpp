#include "hash/hash_function.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace authtree {

namespace {

const EVP_MD* evp_md(HashFunction f) {
    switch (f) {
        case HashFunction::Sha3_256:   return EVP_sha3_256();
        case HashFunction::Sha256:     return EVP_sha256();
        case HashFunction::Blake2s256: return EVP_blake2s256();
        case HashFunction::Blake2b512: return EVP_blake2b512();
    }
    throw std::invalid_argument("Unknown hash function");
}

} // namespace

HashFunction hash_function_from_string(const std::string& s) {
    if (s == "sha3-256" || s == "sha3_256" || s == "sha3") {
        return HashFunction::Sha3_256;
    }
    if (s == "sha256" || s == "sha2-256") {
        return HashFunction::Sha256;
    }
    if (s == "blake2s-256" || s == "blake2s") {
        return HashFunction::Blake2s256;
    }
    if (s == "blake2b-512" || s == "blake2b") {
        return HashFunction::Blake2b512;
    }
    throw std::invalid_argument("Unknown hash function: " + s);
}

std::string to_string(HashFunction f) {
    switch (f) {
        case HashFunction::Sha3_256:   return "sha3-256";
        case HashFunction::Sha256:     return "sha256";
        case HashFunction::Blake2s256: return "blake2s-256";
        case HashFunction::Blake2b512: return "blake2b-512";
    }
    return "unknown";
}

size_t digest_size(HashFunction f) {
    return f == HashFunction::Blake2b512 ? 64 : 32;
}

Hasher::Hasher(HashFunction f) : function_(f), ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw_crypto_error("EVP_MD_CTX_new failed");
    }
    reset();
}

void Hasher::reset() {
    if (EVP_DigestInit_ex(ctx_.get(), evp_md(function_), nullptr) != 1) {
        throw_crypto_error("EVP_DigestInit_ex failed for " + to_string(function_));
    }
}

void Hasher::update(const uint8_t* data, size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw_crypto_error("EVP_DigestUpdate failed");
    }
}

void Hasher::finalize_into(uint8_t* out) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &len) != 1) {
        throw_crypto_error("EVP_DigestFinal_ex failed");
    }
    AUTHTREE_INVARIANT(len == digest_size(function_), "unexpected digest length");
    reset();
}

HashValue Hasher::finalize() {
    if (digest_size(function_) != HashValue::LEN) {
        throw std::logic_error(to_string(function_) + " does not produce a 32-byte digest");
    }
    HashValue out;
    finalize_into(out.data());
    return out;
}

std::vector<uint8_t> Hasher::finalize_bytes() {
    std::vector<uint8_t> out(digest_size(function_));
    finalize_into(out.data());
    return out;
}

HashValue hash_with_prefix(HashFunction f, const std::string& prefix, const std::string& data) {
    Hasher h(f);
    h.update(prefix);
    h.update(data);
    return h.finalize();
}

} // namespace authtree
