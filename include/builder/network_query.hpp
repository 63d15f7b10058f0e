#pragma once

#include "graph/legal_graph.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lexnet {

// ============================================================================
// Network Query
// ============================================================================

/**
 * @brief A declarative network-builder request
 *
 * Built per user action and never mutated; each query yields a fresh
 * FilteredGraph.
 */
struct NetworkQuery {
    std::vector<std::string> search_terms;          ///< Free-text terms
    std::vector<std::string> search_fields = {      ///< Fields the terms are matched against
        "text", "full_name", "entity", "concept"
    };
    std::vector<NodeType> allowed_node_types = all_node_types();  ///< Empty = every type
    std::vector<EdgeType> allowed_edge_types = all_edge_types();  ///< Empty = no edge
    int expansion_depth = 1;                        ///< Hops from the seeds
    int max_neighbors_per_node = 100;               ///< Per-node cap per hop, 0 = unlimited
    int max_total_nodes = 500;                      ///< Hard cap on returned nodes

    /**
     * @brief True when both terms and fields are given
     *
     * Without either, every node of the snapshot is a candidate.
     */
    bool uses_search() const { return !search_terms.empty() && !search_fields.empty(); }

    bool allows_node_type(NodeType type) const;
    bool allows_edge_type(EdgeType type) const;

    /**
     * @brief Reject caps and depths the engine has no defined behavior for
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Load from JSON
     *
     * Accepts snake_case keys as well as the camelCase keys of the
     * browser client (searchTerms, maxNodesPerExpansion, ...).
     */
    static NetworkQuery from_json(const nlohmann::json& j);
    static NetworkQuery from_json_file(const std::string& path);

    nlohmann::json to_json() const;
};

// ============================================================================
// Result
// ============================================================================

/**
 * @brief A surviving node and its degree within the returned links
 */
struct RankedNode {
    GraphNode node;
    size_t degree = 0;
};

/**
 * @brief Connected, self-consistent subgraph produced for one query
 */
struct FilteredGraph {
    std::vector<RankedNode> nodes;
    std::vector<GraphLink> links;
    bool truncated = false;          ///< Node cap was applied
    size_t matched_count = 0;        ///< Connected, type-filtered count before the cap

    bool empty() const { return nodes.empty() && links.empty(); }

    std::vector<std::string> node_ids() const;
    const RankedNode* find_node(const std::string& node_id) const;

    /**
     * @brief Export for presentation-layer consumers
     *
     * Node objects gain "degree" (exact, may be 0 after truncation) and
     * "val" (the degree floored at 1, used for node sizing).
     */
    nlohmann::json to_json() const;
};

} // namespace lexnet
