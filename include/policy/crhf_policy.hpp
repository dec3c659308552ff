#pragma once

#include "hash/hash_function.hpp"
#include "tree/hashing_policy.hpp"
#include "types/hash_value.hpp"
#include <string>
#include <vector>

namespace authtree {

/**
 * CrhfPolicy - classic Merkle hashing with a collision-resistant hash
 *
 *   leaf     = H("leaf:" || data)
 *   internal = H("internal:" || child_0 || ... || child_{n-1})
 *
 * Every combine rehashes all children of the parent, whatever the number of
 * changed ones. One computation is counted per leaf hash and per combine.
 */
class CrhfPolicy : public HashingPolicy<std::string, HashValue> {
public:
    /**
     * @throws std::invalid_argument if arity < 2 or `hash` has a 64-byte output
     */
    explicit CrhfPolicy(size_t arity, HashFunction hash = HashFunction::Sha3_256);

    std::string name() const override;
    bool is_incremental() const override { return false; }

    size_t arity() const { return arity_; }
    HashFunction hash_function() const { return hasher_.function(); }

    HashValue hash_leaf(size_t offset, const std::string& data) override;

    HashValue combine_children(const HashValue& old_parent,
                               std::vector<HashValue>& old_children,
                               const ChildUpdates<HashValue>& changed) override;

private:
    size_t arity_;
    Hasher hasher_;
};

} // namespace authtree
