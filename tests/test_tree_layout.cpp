#include <gtest/gtest.h>
#include "tree/tree_layout.hpp"
#include <set>

using namespace authtree;

TEST(TreeLayoutTest, MaxLeaves) {
    EXPECT_EQ(max_leaves(2, 0), 1u);
    EXPECT_EQ(max_leaves(2, 10), 1024u);
    EXPECT_EQ(max_leaves(16, 3), 4096u);
    EXPECT_THROW(max_leaves(2, 64), std::overflow_error);
    EXPECT_THROW(max_leaves(1, 3), std::invalid_argument);
}

TEST(TreeLayoutTest, InvalidArguments) {
    EXPECT_THROW(TreeLayout(1, 10), std::invalid_argument);
    EXPECT_THROW(TreeLayout(0, 10), std::invalid_argument);
    EXPECT_THROW(TreeLayout(2, 0), std::invalid_argument);
}

TEST(TreeLayoutTest, PerfectTree) {
    TreeLayout layout(4, 64);
    EXPECT_EQ(layout.height(), 3u);
    EXPECT_EQ(layout.num_internal_nodes(), 21u);
    EXPECT_EQ(layout.num_nodes(), 85u);
    EXPECT_FALSE(layout.has_leaves_on_two_levels());
    EXPECT_EQ(layout.first_last_level_leaf(), NodeIndex(21));
    EXPECT_EQ(layout.leaf_index(0), NodeIndex(21));
    EXPECT_EQ(layout.leaf_index(63), NodeIndex(84));
}

TEST(TreeLayoutTest, SingleLeafIsTheRoot) {
    TreeLayout layout(3, 1);
    EXPECT_EQ(layout.height(), 0u);
    EXPECT_EQ(layout.num_internal_nodes(), 0u);
    EXPECT_EQ(layout.num_nodes(), 1u);
    EXPECT_EQ(layout.leaf_index(0), NodeIndex::root());
}

// 1 root, 3 children and 9 grandchildren; one grandchild holds the two
// deepest leaves, the other eight grandchildren are leaves themselves
TEST(TreeLayoutTest, ArityThreeTenLeaves) {
    TreeLayout layout(3, 10);
    EXPECT_EQ(layout.height(), 2u);
    EXPECT_TRUE(layout.has_leaves_on_two_levels());
    EXPECT_EQ(layout.num_second_to_last_level_leaves(), 8u);
    EXPECT_EQ(layout.num_last_level_leaves(), 2u);
    EXPECT_EQ(layout.num_internal_nodes(), 5u);
    EXPECT_EQ(layout.first_last_level_leaf(), NodeIndex(13));
    EXPECT_EQ(layout.num_nodes(), 15u);

    EXPECT_EQ(layout.leaf_index(0), NodeIndex(13));
    EXPECT_EQ(layout.leaf_index(1), NodeIndex(14));
    EXPECT_EQ(layout.leaf_index(2), NodeIndex(5));
    EXPECT_EQ(layout.leaf_index(9), NodeIndex(12));
    EXPECT_THROW(layout.leaf_index(10), std::out_of_range);

    EXPECT_EQ(layout.depth(NodeIndex(13)), 3u);
    EXPECT_EQ(layout.depth(NodeIndex(5)), 2u);
}

TEST(TreeLayoutTest, LeavesOnOneDeeperLevel) {
    // 3 leaves in a binary tree: all of them below the two level-1 nodes
    TreeLayout layout(2, 3);
    EXPECT_FALSE(layout.has_leaves_on_two_levels());
    EXPECT_EQ(layout.num_internal_nodes(), 3u);
    EXPECT_EQ(layout.num_nodes(), 6u);
    EXPECT_EQ(layout.leaf_index(0), NodeIndex(3));
    EXPECT_EQ(layout.leaf_index(2), NodeIndex(5));
}

// Every leaf maps to a distinct leaf slot, no internal node has more than
// `arity` children and every internal node has at least one
TEST(TreeLayoutTest, LeafMappingIsConsistent) {
    for (size_t arity : {2u, 3u, 4u, 7u, 16u}) {
        for (size_t n = 1; n <= 300; ++n) {
            TreeLayout layout(arity, n);
            ASSERT_EQ(layout.num_last_level_leaves() + layout.num_second_to_last_level_leaves(), n);

            std::set<size_t> seen;
            for (size_t pos = 0; pos < n; ++pos) {
                NodeIndex leaf = layout.leaf_index(pos);
                ASSERT_TRUE(layout.is_leaf(leaf)) << "arity " << arity << " n " << n << " pos " << pos;
                ASSERT_TRUE(seen.insert(leaf.value()).second);
                ASSERT_EQ(layout.leaf_position(leaf), pos);
            }

            for (size_t v = 0; v < layout.num_internal_nodes(); ++v) {
                NodeIndex first_child = NodeIndex(v).child(arity, 0);
                ASSERT_LT(first_child.value(), layout.num_nodes())
                    << "internal node " << v << " has no children (arity " << arity << ", n " << n << ")";
            }
        }
    }
}
