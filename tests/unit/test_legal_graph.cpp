#include <gtest/gtest.h>
#include "graph/legal_graph.hpp"
#include "test_helpers.hpp"

using namespace lexnet;
using namespace lexnet::test_support;

// ==========================================
// Type Vocabulary Tests
// ==========================================

TEST(NodeTypeTest, ParseKnownNames) {
    EXPECT_EQ(parse_node_type("section"), NodeType::Section);
    EXPECT_EQ(parse_node_type("entity"), NodeType::Entity);
    EXPECT_EQ(parse_node_type("concept"), NodeType::Concept);
    EXPECT_EQ(parse_node_type("index"), NodeType::Index);
    EXPECT_EQ(to_string(NodeType::Concept), "concept");
}

TEST(NodeTypeTest, UnknownNameThrows) {
    EXPECT_THROW(parse_node_type("tag"), std::invalid_argument);
    EXPECT_THROW(parse_edge_type("cites"), std::invalid_argument);
}

TEST(NodeTypeTest, HierarchyAndTermNodes) {
    EXPECT_TRUE(is_hierarchy_node(NodeType::Section));
    EXPECT_TRUE(is_hierarchy_node(NodeType::Index));
    EXPECT_FALSE(is_hierarchy_node(NodeType::Entity));
    EXPECT_TRUE(is_term_node(NodeType::Concept));
    EXPECT_FALSE(is_term_node(NodeType::Index));
}

TEST(NodeKeyTest, OrderingAndFormat) {
    NodeKey a{"2015", "s1"};
    NodeKey b{"2024", "s1"};
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_EQ(a.to_string(), "2015:s1");
    EXPECT_EQ(make_node("s1", NodeType::Section).key(), (NodeKey{"2024", "s1"}));
}

// ==========================================
// JSON Codec Tests
// ==========================================

TEST(GraphNodeTest, FromJsonKeepsExtraAttributes) {
    auto j = nlohmann::json::parse(R"({
        "id": "26 USC 61",
        "name": "Gross income defined",
        "node_type": "section",
        "time": 2024,
        "display_label": "§ 61",
        "section_text": "Gross income means all income",
        "usc_title": 26,
        "x": 1.5,
        "properties": {"full_name": "Section 61", "page": 3}
    })");

    GraphNode node = GraphNode::from_json(j);
    EXPECT_EQ(node.id, "26 USC 61");
    EXPECT_EQ(node.node_type, NodeType::Section);
    EXPECT_EQ(node.time, "2024");
    ASSERT_TRUE(node.display_label.has_value());
    EXPECT_EQ(*node.display_label, "§ 61");
    EXPECT_EQ(node.attribute("section_text").value_or(""), "Gross income means all income");
    EXPECT_EQ(node.attribute("usc_title").value_or(""), "26");
    EXPECT_EQ(node.properties["page"], 3);
    EXPECT_EQ(node.attributes.count("properties"), 0);
}

TEST(GraphNodeTest, AttributeResolvesStructuralFields) {
    GraphNode node = make_node("e1", NodeType::Entity, "Taxpayer");
    EXPECT_EQ(node.attribute("name").value_or(""), "Taxpayer");
    EXPECT_EQ(node.attribute("node_type").value_or(""), "entity");
    EXPECT_EQ(node.attribute("time").value_or(""), "2024");
    EXPECT_FALSE(node.attribute("display_label").has_value());
    EXPECT_FALSE(node.attribute("chapter").has_value());
}

TEST(GraphLinkTest, EmbeddedEndpointsAreNormalized) {
    auto j = nlohmann::json::parse(R"json({
        "source": {"id": "a", "name": "A"},
        "target": "b",
        "edge_type": "reference",
        "action": "refers to",
        "weight": 2,
        "location": "(a)(1)"
    })json");

    GraphLink link = GraphLink::from_json(j);
    EXPECT_EQ(link.source, "a");
    EXPECT_EQ(link.target, "b");
    EXPECT_EQ(link.edge_type, EdgeType::Reference);
    ASSERT_TRUE(link.weight.has_value());
    EXPECT_DOUBLE_EQ(*link.weight, 2.0);
    EXPECT_EQ(link.attributes.at("location"), "(a)(1)");

    auto out = link.to_json();
    EXPECT_EQ(out["source"], "a");
    EXPECT_EQ(out["edge_type"], "reference");
}

TEST(GraphSnapshotJsonTest, AcceptsEdgesKey) {
    auto j = nlohmann::json::parse(R"({
        "title": "26",
        "time_scope": "2024",
        "nodes": [
            {"id": "a", "name": "A", "node_type": "section"},
            {"id": "b", "name": "B", "node_type": "entity"}
        ],
        "edges": [{"source": "a", "target": "b", "edge_type": "definition", "action": "defines"}]
    })");

    GraphSnapshot snapshot = GraphSnapshot::from_json(j);
    EXPECT_EQ(snapshot.title, "26");
    EXPECT_EQ(snapshot.num_nodes(), 2);
    EXPECT_EQ(snapshot.num_links(), 1);
}

TEST(GraphSnapshotJsonTest, NullTextFieldsReadAsEmpty) {
    auto j = nlohmann::json::parse(R"({
        "title": null,
        "time_scope": "2024",
        "nodes": [
            {"id": "a", "name": null, "node_type": "section", "time": null},
            {"id": "b", "name": "B", "node_type": "entity"}
        ],
        "links": [{"source": "a", "target": "b", "edge_type": "reference", "action": null}]
    })");

    GraphSnapshot snapshot = GraphSnapshot::from_json(j);
    EXPECT_EQ(snapshot.title, "");
    ASSERT_EQ(snapshot.num_nodes(), 2);
    EXPECT_EQ(snapshot.nodes[0].name, "");
    EXPECT_EQ(snapshot.nodes[0].time, "");
    EXPECT_EQ(snapshot.nodes[1].name, "B");
    ASSERT_EQ(snapshot.num_links(), 1);
    EXPECT_EQ(snapshot.links[0].action, "");
}

TEST(GraphSnapshotJsonTest, LoadMissingFileThrows) {
    EXPECT_THROW(GraphSnapshot::load_from_json("/nonexistent/snapshot.json"), std::runtime_error);
}

// ==========================================
// Snapshot Operations Tests
// ==========================================

class GraphSnapshotTest : public ::testing::Test {
protected:
    GraphSnapshot snapshot;

    void SetUp() override {
        snapshot.title = "26";
        snapshot.nodes = {
            make_node("A", NodeType::Section),
            make_node("B", NodeType::Entity),
            make_node("C", NodeType::Concept),
            make_node("D", NodeType::Index)
        };
        snapshot.links = {
            make_link("A", "B", EdgeType::Reference),
            make_link("B", "C", EdgeType::Definition)
        };
    }
};

TEST_F(GraphSnapshotTest, ValidSnapshot) {
    std::string error;
    EXPECT_TRUE(snapshot.validate(error)) << error;
}

TEST_F(GraphSnapshotTest, DanglingLinkIsInvalid) {
    snapshot.links.push_back(make_link("A", "Z", EdgeType::Reference));
    std::string error;
    EXPECT_FALSE(snapshot.validate(error));
    EXPECT_NE(error.find("Z"), std::string::npos);
}

TEST_F(GraphSnapshotTest, DuplicateIdIsInvalid) {
    snapshot.nodes.push_back(make_node("A", NodeType::Entity));
    std::string error;
    EXPECT_FALSE(snapshot.validate(error));
}

TEST_F(GraphSnapshotTest, Statistics) {
    auto stats = snapshot.compute_statistics();
    EXPECT_EQ(stats.num_nodes, 4);
    EXPECT_EQ(stats.num_links, 2);
    EXPECT_EQ(stats.nodes_by_type["section"], 1);
    EXPECT_EQ(stats.links_by_type["definition"], 1);
    EXPECT_EQ(stats.isolated_nodes, 1);  // D
    EXPECT_EQ(stats.max_degree, 2);      // B
    EXPECT_DOUBLE_EQ(stats.avg_degree, 1.0);
}

TEST_F(GraphSnapshotTest, ScopedToKeepsOnlyMatchingTimeScope) {
    GraphNode old_node = make_node("E", NodeType::Entity);
    old_node.time = "2015";
    snapshot.nodes.push_back(old_node);

    GraphLink old_link = make_link("A", "E", EdgeType::Reference);
    old_link.time = "2015";
    snapshot.links.push_back(old_link);

    // Tagged with the scope but pointing at a node outside it
    GraphLink cross_link = make_link("B", "E", EdgeType::Reference);
    snapshot.links.push_back(cross_link);

    GraphSnapshot scoped = snapshot.scoped_to("2024");
    EXPECT_EQ(scoped.time_scope, "2024");
    EXPECT_EQ(scoped.title, "26");
    EXPECT_EQ(scoped.num_nodes(), 4);
    EXPECT_EQ(scoped.num_links(), 2);

    GraphSnapshot old = snapshot.scoped_to("2015");
    EXPECT_EQ(old.num_nodes(), 1);
    EXPECT_EQ(old.num_links(), 0);
}
