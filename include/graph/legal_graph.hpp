#ifndef LEXNET_LEGAL_GRAPH_HPP
#define LEXNET_LEGAL_GRAPH_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace lexnet {

/// Ordered set of node identifiers (seed sets, expansion results)
using NodeIdSet = std::set<std::string>;

// ==========================================
// Closed type vocabularies
// ==========================================

/**
 * @brief Kind of node in a legal-code graph
 *
 * Section and Index nodes form the statutory hierarchy; Entity and
 * Concept nodes are terms extracted from the statutory text.
 */
enum class NodeType {
    Section,
    Entity,
    Concept,
    Index
};

/**
 * @brief Kind of relation between two nodes
 */
enum class EdgeType {
    Definition,
    Reference,
    Hierarchy
};

std::string to_string(NodeType type);
std::string to_string(EdgeType type);

/**
 * @brief Parse a node type name ("section", "entity", "concept", "index")
 * @throws std::invalid_argument for any other name
 */
NodeType parse_node_type(const std::string& name);

/**
 * @brief Parse an edge type name ("definition", "reference", "hierarchy")
 * @throws std::invalid_argument for any other name
 */
EdgeType parse_edge_type(const std::string& name);

std::vector<NodeType> all_node_types();
std::vector<EdgeType> all_edge_types();

bool is_hierarchy_node(NodeType type);
bool is_term_node(NodeType type);

/**
 * @brief Join key used by enrichment lookups (display labels, full text,
 * neighbor counts). A node id is only unique within one time scope.
 */
struct NodeKey {
    std::string time_scope;
    std::string node_id;

    std::string to_string() const { return time_scope + ":" + node_id; }

    bool operator==(const NodeKey& other) const {
        return time_scope == other.time_scope && node_id == other.node_id;
    }
    bool operator<(const NodeKey& other) const {
        if (time_scope != other.time_scope) return time_scope < other.time_scope;
        return node_id < other.node_id;
    }
};

// ==========================================
// Nodes and links
// ==========================================

/**
 * @brief A statutory section, index heading, entity or concept
 *
 * The property bag is kept as raw JSON because the datasets carry
 * arbitrary extra fields, not all of them strings. Every other top-level
 * scalar attribute of the source record (text, full_name, section_text,
 * index_heading, usc_title, chapter, ...) is kept stringified in
 * `attributes`.
 */
struct GraphNode {
    std::string id;                                    // Unique within a snapshot
    std::string name;                                  // Raw name
    NodeType node_type = NodeType::Section;
    std::string time;                                  // Time-scope tag
    std::optional<std::string> display_label;          // Label distinct from the raw name
    nlohmann::json properties = nlohmann::json::object();
    std::map<std::string, std::string> attributes;     // Remaining top-level attributes

    /**
     * @brief Direct attribute lookup by name
     *
     * Resolves the structural fields (id, name, node_type, time,
     * display_label) first, then the attribute map.
     */
    std::optional<std::string> attribute(const std::string& field) const;

    NodeKey key() const { return NodeKey{time, id}; }

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief A typed relation between two nodes
 *
 * Endpoints are bare identifiers. The relation is undirected for
 * traversal purposes; source/target only record the original orientation.
 */
struct GraphLink {
    std::string source;
    std::string target;
    EdgeType edge_type = EdgeType::Reference;
    std::string action;                                // Human-readable label
    std::string time;                                  // Time-scope tag
    std::optional<double> weight;
    std::map<std::string, std::string> attributes;     // usc_title, definition, location, timestamp, ...

    bool touches(const std::string& node_id) const {
        return source == node_id || target == node_id;
    }

    nlohmann::json to_json() const;

    /**
     * @brief Create link from JSON
     *
     * Endpoints may be given as bare ids or as embedded node objects
     * carrying an "id" field; both are normalized to the id.
     */
    static GraphLink from_json(const nlohmann::json& j);
};

// ==========================================
// Snapshot
// ==========================================

/**
 * @brief Structural summary of a snapshot
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_links = 0;
    std::map<std::string, size_t> nodes_by_type;
    std::map<std::string, size_t> links_by_type;
    size_t isolated_nodes = 0;
    size_t max_degree = 0;
    double avg_degree = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief All nodes and links of one (title, time scope) pair
 *
 * A snapshot is treated as immutable once handed to a NetworkBuilder.
 * Switching title or time scope means building a new snapshot.
 */
struct GraphSnapshot {
    std::string title;
    std::string time_scope;
    std::vector<GraphNode> nodes;
    std::vector<GraphLink> links;

    size_t num_nodes() const { return nodes.size(); }
    size_t num_links() const { return links.size(); }
    bool empty() const { return nodes.empty() && links.empty(); }

    /**
     * @brief Restrict a multi-scope graph to a single time scope
     *
     * Keeps nodes tagged with `scope`, and links tagged with `scope`
     * whose endpoints are both kept.
     */
    GraphSnapshot scoped_to(const std::string& scope) const;

    /**
     * @brief Check identifier uniqueness and link endpoint integrity
     */
    bool validate(std::string& error_message) const;

    GraphStatistics compute_statistics() const;

    nlohmann::json to_json() const;
    static GraphSnapshot from_json(const nlohmann::json& j);
    static GraphSnapshot load_from_json(const std::string& filename);
};

} // namespace lexnet

#endif // LEXNET_LEGAL_GRAPH_HPP
