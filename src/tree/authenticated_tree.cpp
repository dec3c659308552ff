#include "tree/authenticated_tree.hpp"
#include "curve/basepoints.hpp"
#include "curve/curve.hpp"
#include "policy/crhf_policy.hpp"
#include "policy/incremental_policy.hpp"
#include "policy/vector_commitment_policy.hpp"
#include <memory>
#include <stdexcept>
#include <utility>

namespace authtree {

namespace {

template <typename Digest, typename Policy>
class TreeAdapter : public AuthenticatedTree {
public:
    using Tree = AbstractTree<std::string, Digest, Policy>;

    TreeAdapter(Scheme scheme, Tree tree)
        : scheme_(scheme), tree_(std::move(tree)) {}

    Scheme scheme() const override { return scheme_; }
    size_t arity() const override { return tree_.arity(); }
    size_t num_leaves() const override { return tree_.num_leaves(); }

    void update_leaves(const LeafUpdates<std::string>& updates) override {
        tree_.update_leaves(updates);
    }

    std::string root_hex() const override { return tree_.root().to_hex(); }
    size_t computations_performed() const override { return tree_.policy().computations_performed(); }
    const PolicyStats& stats() const override { return tree_.policy().stats(); }
    const UpdateTimings& last_timings() const override { return tree_.last_timings(); }

private:
    Scheme scheme_;
    Tree tree_;
};

template <typename Digest, typename Policy>
std::unique_ptr<AuthenticatedTree> wrap(const TreeConfig& config, Policy policy) {
    using Adapter = TreeAdapter<Digest, Policy>;
    return std::make_unique<Adapter>(
        config.scheme,
        Adapter::Tree::with_num_leaves(config.arity, config.num_leaves, std::move(policy)));
}

} // namespace

std::unique_ptr<AuthenticatedTree> make_tree(const TreeConfig& config) {
    config.validate();

    switch (config.scheme) {
        case Scheme::Merkle:
            return wrap<HashValue>(config, CrhfPolicy(config.arity, config.hash));

        case Scheme::MerklePlusPlus:
            return wrap<IncrementalDigest>(
                config, IncrementalPolicy(config.arity, std::make_shared<const Curve>()));

        case Scheme::Verkle: {
            auto basepoints = std::make_shared<const Basepoints>(std::make_shared<const Curve>(),
                                                                 config.arity);
            return wrap<VerkleDigest>(
                config, VectorCommitmentPolicy(config.arity, std::move(basepoints), config.serial_cutoff));
        }
    }
    throw std::invalid_argument("Unknown tree scheme");
}

} // namespace authtree
