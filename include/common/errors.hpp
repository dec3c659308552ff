#pragma once

#include <stdexcept>
#include <string>

namespace authtree {

/**
 * InvariantViolation - internal state corruption
 *
 * Raised when the engine or a policy detects a broken internal invariant
 * (a node hashed twice in one batch, an illegal digest-kind transition, ...).
 * Nothing in the library catches it: it signals a bug, not bad input.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error("invariant violation: " + what) {}
};

/**
 * CryptoError - an OpenSSL primitive reported failure
 */
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what)
        : std::runtime_error(what) {}
};

// Throws CryptoError with the OpenSSL error queue appended to `context`
[[noreturn]] void throw_crypto_error(const std::string& context);

} // namespace authtree

#define AUTHTREE_INVARIANT(cond, msg) \
    do { \
        if (!(cond)) { \
            throw authtree::InvariantViolation(msg); \
        } \
    } while(0)
