#pragma once

#include "builder/network_query.hpp"
#include "builder/ranking.hpp"
#include "builder/search.hpp"
#include "graph/adjacency_index.hpp"
#include "graph/legal_graph.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lexnet {

/**
 * @brief Query engine over one immutable graph snapshot
 *
 * The adjacency index is built once at construction. Every query method
 * is const and keeps no state between calls, so one builder may serve
 * concurrent queries. Loading another title or time scope means building
 * another builder.
 *
 * Pipeline of build_network():
 *   search -> (no seeds: empty) -> expansion -> type/edge filter
 *   -> truncation by degree ranking -> assembly
 */
class NetworkBuilder {
public:
    NetworkBuilder(std::vector<GraphNode> nodes, std::vector<GraphLink> links);
    explicit NetworkBuilder(GraphSnapshot snapshot);

    // ==========================================
    // Query stages
    // ==========================================

    /**
     * @brief Seed nodes matching the terms in the given fields
     */
    NodeIdSet search(
        const std::vector<std::string>& terms,
        const std::vector<std::string>& fields,
        SearchLogic logic = SearchLogic::Or
    ) const;

    /**
     * @brief Bounded expansion over the adjacency index
     * @see lexnet::expand_from_seeds
     */
    NodeIdSet expand_from_seeds(
        const NodeIdSet& seeds,
        int depth,
        int max_neighbors_per_node,
        const std::vector<EdgeType>& allowed_edge_types
    ) const;

    /**
     * @brief Run the whole pipeline for one query
     * @throws std::invalid_argument if the query fails validation
     *
     * Degenerate inputs (no seeds, every seed filtered out by type) give an
     * empty result with matched_count 0 rather than an error.
     */
    FilteredGraph build_network(
        const NetworkQuery& query,
        SearchLogic logic = SearchLogic::Or,
        RankingMode ranking = RankingMode::Global
    ) const;

    // ==========================================
    // Accessors
    // ==========================================

    const GraphSnapshot& snapshot() const { return snapshot_; }
    const AdjacencyIndex& adjacency() const { return adjacency_; }

    const GraphNode* find_node(const std::string& node_id) const;

    /**
     * @brief Snapshot-wide degree of a node
     */
    size_t global_degree(const std::string& node_id) const { return adjacency_.degree(node_id); }

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

private:
    // Output of the filter stage; node ids in snapshot order
    struct CandidateSubgraph {
        std::vector<std::string> node_ids;
        std::vector<GraphLink> links;
    };

    GraphSnapshot snapshot_;
    AdjacencyIndex adjacency_;
    std::unordered_map<std::string, size_t> node_positions_;  // node id -> index in snapshot_.nodes
    bool verbose_ = false;

    void index_nodes();

    /**
     * @brief Candidate ids before filtering; nullopt short-circuits to an
     * empty result
     */
    std::optional<NodeIdSet> select_candidates(const NetworkQuery& query, SearchLogic logic) const;

    /**
     * @brief Keep allowed links between candidates and the typed candidates
     * they connect
     */
    CandidateSubgraph apply_filters(const NodeIdSet& candidates, const NetworkQuery& query) const;

    std::vector<std::string> select_top_nodes(
        const CandidateSubgraph& subgraph,
        size_t max_nodes,
        RankingMode ranking
    ) const;

    FilteredGraph assemble(
        const CandidateSubgraph& subgraph,
        const std::vector<std::string>& final_ids,
        bool truncated
    ) const;
};

} // namespace lexnet
