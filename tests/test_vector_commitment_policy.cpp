#include <gtest/gtest.h>
#include "policy/vector_commitment_policy.hpp"
#include "tree/abstract_tree.hpp"
#include <memory>

using namespace authtree;

namespace {

using VerkleTree = AbstractTree<std::string, VerkleDigest, VectorCommitmentPolicy>;

} // namespace

class VectorCommitmentPolicyTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        basepoints_ = std::make_shared<const Basepoints>(std::make_shared<const Curve>(), 16);
    }

    static void TearDownTestSuite() {
        basepoints_.reset();
    }

    VectorCommitmentPolicy make_policy(size_t arity, size_t cutoff = VectorCommitmentPolicy::DEFAULT_SERIAL_CUTOFF) {
        return VectorCommitmentPolicy(arity, basepoints_, cutoff);
    }

    VerkleTree make_tree(size_t arity, size_t num_leaves,
                         size_t cutoff = VectorCommitmentPolicy::DEFAULT_SERIAL_CUTOFF) {
        return VerkleTree::with_num_leaves(arity, num_leaves, make_policy(arity, cutoff));
    }

    // Children of `node` as currently stored in the tree
    static std::vector<VerkleDigest> children_of(const VerkleTree& tree, const NodeIndex& node) {
        std::vector<VerkleDigest> children;
        for (size_t i = 0; i < tree.arity(); ++i) {
            NodeIndex child = node.child(tree.arity(), i);
            if (child.value() >= tree.num_nodes()) {
                break;
            }
            children.push_back(tree.digest_at(child));
        }
        return children;
    }

    static std::shared_ptr<const Basepoints> basepoints_;
};

std::shared_ptr<const Basepoints> VectorCommitmentPolicyTest::basepoints_;

TEST_F(VectorCommitmentPolicyTest, DigestKinds) {
    VerkleDigest empty;
    EXPECT_TRUE(empty.is_empty());
    EXPECT_EQ(empty.to_hex(), "");
    EXPECT_THROW(empty.scalar(), InvariantViolation);
    EXPECT_THROW(empty.commitment(), InvariantViolation);

    VerkleDigest leaf = VerkleDigest::leaf(Scalar::from_u64(9));
    EXPECT_EQ(leaf.kind(), VerkleDigest::Kind::Leaf);
    EXPECT_EQ(leaf.scalar(), Scalar::from_u64(9));
    EXPECT_NE(leaf, empty);
}

TEST_F(VectorCommitmentPolicyTest, LeafHashIsScalar) {
    VectorCommitmentPolicy policy = make_policy(4);
    BnCtxPtr ctx = make_bn_ctx();
    VerkleDigest d = policy.hash_leaf(1, "data");
    ASSERT_TRUE(d.is_leaf());
    EXPECT_EQ(d.scalar(), basepoints_->curve().hash_to_scalar("leaf:", "data", ctx.get()));
    EXPECT_EQ(policy.computations_performed(), 0u);
}

TEST_F(VectorCommitmentPolicyTest, IllegalTransitionsThrow) {
    VectorCommitmentPolicy policy = make_policy(4);
    VerkleDigest empty;
    VerkleDigest leaf = policy.hash_leaf(0, "x");
    VerkleDigest internal = policy.commit_from_scratch({leaf});

    EXPECT_THROW(policy.delta(empty, empty), InvariantViolation);
    EXPECT_THROW(policy.delta(leaf, empty), InvariantViolation);
    EXPECT_THROW(policy.delta(internal, empty), InvariantViolation);
    EXPECT_THROW(policy.delta(leaf, internal), InvariantViolation);
    EXPECT_THROW(policy.delta(internal, leaf), InvariantViolation);

    EXPECT_NO_THROW(policy.delta(empty, leaf));
    EXPECT_NO_THROW(policy.delta(empty, internal));
    EXPECT_NO_THROW(policy.delta(leaf, leaf));
    EXPECT_NO_THROW(policy.delta(internal, internal));

    std::vector<VerkleDigest> children(4);
    EXPECT_THROW(policy.combine_children(leaf, children, {{0, leaf}}), InvariantViolation);
}

// Empty -> Leaf, then Leaf -> Leaf on the same child
TEST_F(VectorCommitmentPolicyTest, EmptyToLeafThenLeafToLeaf) {
    VerkleTree tree = make_tree(4, 4);

    ASSERT_NO_THROW(tree.update_leaves({{2, "first"}}));
    EXPECT_EQ(tree.root(), tree.policy().commit_from_scratch(children_of(tree, NodeIndex::root())));

    ASSERT_NO_THROW(tree.update_leaves({{2, "second"}}));
    std::vector<VerkleDigest> children = children_of(tree, NodeIndex::root());
    EXPECT_TRUE(children[0].is_empty());
    EXPECT_TRUE(children[2].is_leaf());
    EXPECT_EQ(tree.root(), tree.policy().commit_from_scratch(children));
    EXPECT_EQ(tree.policy().computations_performed(), 2u);
}

// Second batch starts from Internal parents, so the old commitment is
// decompressed and the delta added to it
TEST_F(VectorCommitmentPolicyTest, InternalParentAccumulates) {
    VerkleTree tree = make_tree(4, 16);
    tree.update_leaves({{0, "a"}, {5, "b"}, {15, "c"}});
    ASSERT_TRUE(tree.root().is_internal());

    tree.update_leaves({{1, "d"}, {5, "e"}});

    for (size_t v = 0; v < tree.num_internal_nodes(); ++v) {
        NodeIndex node(v);
        std::vector<VerkleDigest> children = children_of(tree, node);
        bool any_written = false;
        for (const auto& c : children) {
            any_written = any_written || !c.is_empty();
        }
        if (any_written) {
            EXPECT_EQ(tree.digest_at(node), tree.policy().commit_from_scratch(children)) << "node " << v;
        } else {
            EXPECT_TRUE(tree.digest_at(node).is_empty()) << "node " << v;
        }
    }
}

TEST_F(VectorCommitmentPolicyTest, SerialAndMultiscalarAgree) {
    LeafUpdates<std::string> first, second;
    for (size_t i = 0; i < 16; ++i) {
        first.emplace_back(i, "first " + std::to_string(i));
        if (i % 2 == 0) {
            second.emplace_back(i, "second " + std::to_string(i));
        }
    }

    VerkleTree serial = make_tree(16, 16, 100);
    VerkleTree multiscalar = make_tree(16, 16, 0);
    for (VerkleTree* tree : {&serial, &multiscalar}) {
        tree->update_leaves(first);
        tree->update_leaves(second);
    }

    EXPECT_EQ(serial.root(), multiscalar.root());
    EXPECT_EQ(serial.policy().stats().multiscalar_updates, 0u);
    EXPECT_EQ(multiscalar.policy().stats().serial_updates, 0u);
    EXPECT_EQ(serial.root(), serial.policy().commit_from_scratch(children_of(serial, NodeIndex::root())));
}

TEST_F(VectorCommitmentPolicyTest, CutoffSelectsPath) {
    VerkleTree tree = make_tree(16, 16, 5);
    LeafUpdates<std::string> five, six;
    for (size_t i = 0; i < 5; ++i) five.emplace_back(i, "x");
    for (size_t i = 5; i < 11; ++i) six.emplace_back(i, "y");

    tree.update_leaves(five);
    EXPECT_EQ(tree.policy().stats().serial_updates, 1u);
    tree.update_leaves(six);
    EXPECT_EQ(tree.policy().stats().multiscalar_updates, 1u);
    EXPECT_EQ(tree.policy().computations_performed(), 11u);
}

TEST_F(VectorCommitmentPolicyTest, DeltaOrderDoesNotMatter) {
    VectorCommitmentPolicy policy = make_policy(8);
    VerkleDigest a = policy.hash_leaf(1, "a");
    VerkleDigest b = policy.hash_leaf(4, "b");

    std::vector<VerkleDigest> children(8);
    std::vector<VerkleDigest> scratch = children;
    VerkleDigest p1 = policy.combine_children(VerkleDigest(), scratch, {{1, a}});
    scratch = children;
    scratch[1] = a;
    p1 = policy.combine_children(p1, scratch, {{4, b}});

    scratch = children;
    VerkleDigest p2 = policy.combine_children(VerkleDigest(), scratch, {{4, b}});
    scratch = children;
    scratch[4] = b;
    p2 = policy.combine_children(p2, scratch, {{1, a}});

    EXPECT_EQ(p1, p2);

    scratch = children;
    VerkleDigest p3 = policy.combine_children(VerkleDigest(), scratch, {{1, a}, {4, b}});
    EXPECT_EQ(p1, p3);
}

TEST_F(VectorCommitmentPolicyTest, IrregularTreeMatchesScratch) {
    VerkleTree tree = make_tree(3, 10);
    LeafUpdates<std::string> batch;
    for (size_t i = 0; i < 10; ++i) {
        batch.emplace_back(i, "leaf " + std::to_string(i));
    }
    tree.update_leaves(batch);
    tree.update_leaves({{0, "changed"}, {9, "changed"}});

    for (size_t v = 0; v < tree.num_internal_nodes(); ++v) {
        NodeIndex node(v);
        EXPECT_EQ(tree.digest_at(node), tree.policy().commit_from_scratch(children_of(tree, node)))
            << "node " << v;
    }
}

TEST_F(VectorCommitmentPolicyTest, InvalidConstruction) {
    EXPECT_THROW(VectorCommitmentPolicy(1, basepoints_), std::invalid_argument);
    EXPECT_THROW(VectorCommitmentPolicy(32, basepoints_), std::invalid_argument);
    EXPECT_THROW(VectorCommitmentPolicy(4, nullptr), std::invalid_argument);
}
