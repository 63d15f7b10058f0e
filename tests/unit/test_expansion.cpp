#include <gtest/gtest.h>
#include "builder/expansion.hpp"
#include "test_helpers.hpp"

using namespace lexnet;
using namespace lexnet::test_support;

// Chain S - A - B - C plus a fan S - F1..F3 of definition links
class ExpansionTest : public ::testing::Test {
protected:
    AdjacencyIndex index;
    std::vector<EdgeType> all_types = all_edge_types();

    void SetUp() override {
        index.build({
            make_link("S", "A", EdgeType::Reference),
            make_link("A", "B", EdgeType::Reference),
            make_link("B", "C", EdgeType::Hierarchy),
            make_link("S", "F1", EdgeType::Definition),
            make_link("F2", "S", EdgeType::Definition),
            make_link("S", "F3", EdgeType::Definition)
        });
    }
};

TEST_F(ExpansionTest, DepthZeroReturnsSeeds) {
    auto expanded = expand_from_seeds(index, {"S"}, 0, 0, all_types);
    EXPECT_EQ(expanded, (NodeIdSet{"S"}));
}

TEST_F(ExpansionTest, OneHop) {
    auto expanded = expand_from_seeds(index, {"S"}, 1, 0, all_types);
    EXPECT_EQ(expanded, (NodeIdSet{"S", "A", "F1", "F2", "F3"}));
}

TEST_F(ExpansionTest, DepthIsMonotonic) {
    NodeIdSet previous = {"S"};
    for (int depth = 0; depth <= 4; ++depth) {
        auto expanded = expand_from_seeds(index, {"S"}, depth, 0, all_types);
        for (const auto& id : previous) {
            EXPECT_EQ(expanded.count(id), 1) << "depth " << depth << " lost " << id;
        }
        previous = expanded;
    }
    EXPECT_EQ(previous.size(), 7);
}

TEST_F(ExpansionTest, StopsEarlyWhenNothingNew) {
    auto deep = expand_from_seeds(index, {"S"}, 100, 0, all_types);
    auto exact = expand_from_seeds(index, {"S"}, 3, 0, all_types);
    EXPECT_EQ(deep, exact);
}

TEST_F(ExpansionTest, EdgeTypeAllowList) {
    auto expanded = expand_from_seeds(index, {"S"}, 3, 0, {EdgeType::Reference});
    EXPECT_EQ(expanded, (NodeIdSet{"S", "A", "B"}));
}

TEST_F(ExpansionTest, EmptyAllowListFollowsNothing) {
    auto expanded = expand_from_seeds(index, {"S"}, 3, 0, {});
    EXPECT_EQ(expanded, (NodeIdSet{"S"}));
}

TEST_F(ExpansionTest, NeighborCapKeepsAdjacencyOrder) {
    // S lists A, F1, F2, F3 in link order
    auto expanded = expand_from_seeds(index, {"S"}, 1, 2, all_types);
    EXPECT_EQ(expanded, (NodeIdSet{"S", "A", "F1"}));
}

TEST_F(ExpansionTest, NeighborCapAppliesAfterTypeFilter) {
    auto expanded = expand_from_seeds(index, {"S"}, 1, 2, {EdgeType::Definition});
    EXPECT_EQ(expanded, (NodeIdSet{"S", "F1", "F2"}));
}

TEST_F(ExpansionTest, UnknownSeedIsKept) {
    auto expanded = expand_from_seeds(index, {"Z"}, 2, 0, all_types);
    EXPECT_EQ(expanded, (NodeIdSet{"Z"}));
}

TEST_F(ExpansionTest, NegativeArgumentsThrow) {
    EXPECT_THROW(expand_from_seeds(index, {"S"}, -1, 0, all_types), std::invalid_argument);
    EXPECT_THROW(expand_from_seeds(index, {"S"}, 1, -1, all_types), std::invalid_argument);
}
