#pragma once

#include "hash/hash_function.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace authtree {

enum class Scheme {
    Merkle,          // CRHF policy
    MerklePlusPlus,  // additive incremental policy
    Verkle           // vector-commitment policy
};

// Accepts "merkle", "merkle++" and "verkle"
Scheme scheme_from_string(const std::string& s);
std::string to_string(Scheme scheme);

/**
 * TreeConfig - what make_tree() should build
 *
 * JSON form:
 *   {
 *     "scheme": "verkle",
 *     "arity": 16,
 *     "num_leaves": 1000,      // or "height": 3 for a perfect tree
 *     "hash": "sha3-256",      // merkle only
 *     "serial_cutoff": 5       // verkle only
 *   }
 */
struct TreeConfig {
    static constexpr size_t DEFAULT_SERIAL_CUTOFF = 5;

    Scheme scheme = Scheme::Merkle;
    size_t arity = 2;
    size_t num_leaves = 1;
    // Set when the tree was described by its height; num_leaves = arity^height
    std::optional<size_t> height;
    HashFunction hash = HashFunction::Sha3_256;
    size_t serial_cutoff = DEFAULT_SERIAL_CUTOFF;

    /**
     * @throws std::invalid_argument on missing, mistyped or inconsistent fields
     */
    static TreeConfig from_json(const nlohmann::json& j);

    /**
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument on invalid content
     */
    static TreeConfig load(const std::string& path);

    nlohmann::json to_json() const;

    // @throws std::invalid_argument
    void validate() const;
};

} // namespace authtree
