#pragma once

#include "config/tree_config.hpp"
#include "tree/abstract_tree.hpp"
#include "tree/hashing_policy.hpp"
#include <memory>
#include <string>

namespace authtree {

/**
 * AuthenticatedTree - runtime-selected tree over string leaves
 *
 * Wraps one AbstractTree instantiation so callers can pick the scheme from a
 * TreeConfig. Roots are exposed as hex.
 */
class AuthenticatedTree {
public:
    virtual ~AuthenticatedTree() = default;

    virtual Scheme scheme() const = 0;
    virtual size_t arity() const = 0;
    virtual size_t num_leaves() const = 0;

    virtual void update_leaves(const LeafUpdates<std::string>& updates) = 0;

    virtual std::string root_hex() const = 0;
    virtual size_t computations_performed() const = 0;
    virtual const PolicyStats& stats() const = 0;
    virtual const UpdateTimings& last_timings() const = 0;
};

/**
 * Builds the tree described by `config`. Verkle trees get a fresh set of
 * `arity` basepoints.
 *
 * @throws std::invalid_argument if the config is invalid
 */
std::unique_ptr<AuthenticatedTree> make_tree(const TreeConfig& config);

} // namespace authtree
