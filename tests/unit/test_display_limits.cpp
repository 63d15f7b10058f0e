#include <gtest/gtest.h>
#include "builder/display_limits.hpp"
#include "test_helpers.hpp"

using namespace lexnet;
using namespace lexnet::test_support;

// Hub H with three spokes plus a separate X - Y pair
class CapLinksTest : public ::testing::Test {
protected:
    FilteredGraph graph;

    void SetUp() override {
        graph.nodes = {
            RankedNode{make_node("H", NodeType::Section), 3},
            RankedNode{make_node("a", NodeType::Entity), 1},
            RankedNode{make_node("b", NodeType::Entity), 1},
            RankedNode{make_node("c", NodeType::Concept), 1},
            RankedNode{make_node("X", NodeType::Section), 1},
            RankedNode{make_node("Y", NodeType::Section), 1}
        };
        graph.links = {
            make_link("X", "Y", EdgeType::Reference),
            make_link("H", "a", EdgeType::Definition),
            make_link("H", "b", EdgeType::Definition),
            make_link("H", "c", EdgeType::Definition)
        };
        graph.matched_count = 6;
    }
};

TEST_F(CapLinksTest, WithinLimitIsUnchanged) {
    FilteredGraph capped = cap_links(graph, 4);
    EXPECT_FALSE(capped.truncated);
    EXPECT_EQ(capped.links.size(), 4);
    EXPECT_EQ(capped.nodes.size(), 6);
}

TEST_F(CapLinksTest, KeepsLinksWithBusiestEndpoints) {
    FilteredGraph capped = cap_links(graph, 2);

    ASSERT_EQ(capped.links.size(), 2);
    EXPECT_EQ(capped.links[0].target, "a");
    EXPECT_EQ(capped.links[1].target, "b");
    EXPECT_TRUE(capped.truncated);
    EXPECT_EQ(capped.matched_count, 6);
}

TEST_F(CapLinksTest, DropsNodesLeftWithoutLinks) {
    FilteredGraph capped = cap_links(graph, 2);

    EXPECT_EQ(capped.node_ids(), (std::vector<std::string>{"H", "a", "b"}));
    EXPECT_EQ(capped.find_node("H")->degree, 2);
    EXPECT_EQ(capped.find_node("a")->degree, 1);
    EXPECT_EQ(capped.find_node("X"), nullptr);
}

TEST_F(CapLinksTest, TiesKeepResultOrder) {
    graph.links = {
        make_link("X", "Y", EdgeType::Reference),
        make_link("a", "b", EdgeType::Definition)
    };
    FilteredGraph capped = cap_links(graph, 1);

    ASSERT_EQ(capped.links.size(), 1);
    EXPECT_EQ(capped.links[0].source, "X");
}

TEST_F(CapLinksTest, LinklessNodesDroppedWithinLimit) {
    graph.nodes.push_back(RankedNode{make_node("lone", NodeType::Index), 0});
    graph.truncated = true;

    FilteredGraph capped = cap_links(graph, 10);
    EXPECT_EQ(capped.find_node("lone"), nullptr);
    EXPECT_EQ(capped.nodes.size(), 6);
    EXPECT_EQ(capped.links.size(), 4);
    EXPECT_TRUE(capped.truncated);
    EXPECT_EQ(capped.matched_count, 6);
}

TEST_F(CapLinksTest, DroppingNodesAloneDoesNotMarkTruncated) {
    graph.nodes.push_back(RankedNode{make_node("lone", NodeType::Index), 0});

    FilteredGraph capped = cap_links(graph, 10);
    EXPECT_EQ(capped.find_node("lone"), nullptr);
    EXPECT_FALSE(capped.truncated);
}

TEST_F(CapLinksTest, ZeroLimitThrows) {
    EXPECT_THROW(cap_links(graph, 0), std::invalid_argument);
}

TEST(CapLinksDefaultTest, DefaultLimit) {
    EXPECT_EQ(kDefaultLinkLimit, 4000);

    FilteredGraph empty;
    FilteredGraph capped = cap_links(empty);
    EXPECT_TRUE(capped.empty());
    EXPECT_FALSE(capped.truncated);
}
