#include "policy/crhf_policy.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace authtree {

CrhfPolicy::CrhfPolicy(size_t arity, HashFunction hash)
    : arity_(arity), hasher_(hash) {
    if (arity < 2) {
        throw std::invalid_argument("CRHF policy arity must be at least 2");
    }
    if (digest_size(hash) != HashValue::LEN) {
        throw std::invalid_argument("CRHF policy needs a 32-byte hash function, got " + to_string(hash));
    }
}

std::string CrhfPolicy::name() const {
    return "merkle/" + to_string(hasher_.function());
}

HashValue CrhfPolicy::hash_leaf(size_t /*offset*/, const std::string& data) {
    hasher_.update("leaf:");
    hasher_.update(data);
    stats_.leaf_hashes++;
    stats_.computations++;
    return hasher_.finalize();
}

HashValue CrhfPolicy::combine_children(const HashValue& /*old_parent*/,
                                       std::vector<HashValue>& old_children,
                                       const ChildUpdates<HashValue>& changed) {
    for (const auto& c : changed) {
        AUTHTREE_INVARIANT(c.first < old_children.size(), "changed offset beyond the last child");
        old_children[c.first] = c.second;
    }

    hasher_.update("internal:");
    for (const auto& child : old_children) {
        hasher_.update(child);
    }
    stats_.combines++;
    stats_.computations++;
    return hasher_.finalize();
}

} // namespace authtree
