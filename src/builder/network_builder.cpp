#include "builder/network_builder.hpp"
#include "builder/expansion.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace lexnet {

NetworkBuilder::NetworkBuilder(std::vector<GraphNode> nodes, std::vector<GraphLink> links) {
    snapshot_.nodes = std::move(nodes);
    snapshot_.links = std::move(links);
    index_nodes();
}

NetworkBuilder::NetworkBuilder(GraphSnapshot snapshot)
    : snapshot_(std::move(snapshot)) {
    index_nodes();
}

void NetworkBuilder::index_nodes() {
    adjacency_.build(snapshot_.links);

    node_positions_.reserve(snapshot_.nodes.size());
    for (size_t i = 0; i < snapshot_.nodes.size(); ++i) {
        // First occurrence wins if an id is repeated
        node_positions_.emplace(snapshot_.nodes[i].id, i);
    }
}

const GraphNode* NetworkBuilder::find_node(const std::string& node_id) const {
    auto it = node_positions_.find(node_id);
    if (it == node_positions_.end()) {
        return nullptr;
    }
    return &snapshot_.nodes[it->second];
}

// ==========================================
// Query stages
// ==========================================

NodeIdSet NetworkBuilder::search(
    const std::vector<std::string>& terms,
    const std::vector<std::string>& fields,
    SearchLogic logic
) const {
    return search_nodes(snapshot_.nodes, terms, fields, logic);
}

NodeIdSet NetworkBuilder::expand_from_seeds(
    const NodeIdSet& seeds,
    int depth,
    int max_neighbors_per_node,
    const std::vector<EdgeType>& allowed_edge_types
) const {
    return lexnet::expand_from_seeds(adjacency_, seeds, depth, max_neighbors_per_node, allowed_edge_types);
}

std::optional<NodeIdSet> NetworkBuilder::select_candidates(
    const NetworkQuery& query,
    SearchLogic logic
) const {
    if (!query.uses_search()) {
        NodeIdSet all_ids;
        for (const auto& node : snapshot_.nodes) {
            all_ids.insert(node.id);
        }
        return all_ids;
    }

    NodeIdSet seeds = search(query.search_terms, query.search_fields, logic);
    if (verbose_) {
        std::cout << "[network] " << seeds.size() << " seed(s) matched\n";
    }
    if (seeds.empty()) {
        return std::nullopt;
    }

    // Expanded nodes must be typed; seeds are re-filtered on their own below
    NodeIdSet expanded;
    if (query.expansion_depth > 0) {
        NodeIdSet reached = expand_from_seeds(
            seeds,
            query.expansion_depth,
            query.max_neighbors_per_node,
            query.allowed_edge_types
        );
        for (const auto& node_id : reached) {
            if (seeds.count(node_id)) continue;
            const GraphNode* node = find_node(node_id);
            if (node && query.allows_node_type(node->node_type)) {
                expanded.insert(node_id);
            }
        }
        if (verbose_) {
            std::cout << "[network] expansion reached " << expanded.size()
                      << " typed node(s) in " << query.expansion_depth << " hop(s)\n";
        }
    }

    NodeIdSet candidates;
    for (const auto& seed_id : seeds) {
        const GraphNode* node = find_node(seed_id);
        if (node && query.allows_node_type(node->node_type)) {
            candidates.insert(seed_id);
        }
    }

    // A search needs at least one in-type seed to mean anything
    if (candidates.empty()) {
        if (verbose_) {
            std::cout << "[network] every seed was removed by the node-type filter\n";
        }
        return std::nullopt;
    }

    candidates.insert(expanded.begin(), expanded.end());
    return candidates;
}

NetworkBuilder::CandidateSubgraph NetworkBuilder::apply_filters(
    const NodeIdSet& candidates,
    const NetworkQuery& query
) const {
    std::unordered_set<std::string> typed;
    typed.reserve(candidates.size());
    for (const auto& node_id : candidates) {
        const GraphNode* node = find_node(node_id);
        if (node && query.allows_node_type(node->node_type)) {
            typed.insert(node_id);
        }
    }

    CandidateSubgraph subgraph;
    std::unordered_set<std::string> connected;
    for (const auto& link : snapshot_.links) {
        if (!query.allows_edge_type(link.edge_type)) continue;
        if (!typed.count(link.source) || !typed.count(link.target)) continue;

        subgraph.links.push_back(link);
        connected.insert(link.source);
        connected.insert(link.target);
    }

    // Snapshot order; isolated candidates are dropped. Erasing keeps a
    // repeated id from being emitted twice.
    for (const auto& node : snapshot_.nodes) {
        if (connected.erase(node.id)) {
            subgraph.node_ids.push_back(node.id);
        }
    }

    return subgraph;
}

std::vector<std::string> NetworkBuilder::select_top_nodes(
    const CandidateSubgraph& subgraph,
    size_t max_nodes,
    RankingMode ranking
) const {
    switch (ranking) {
        case RankingMode::Subgraph:
            return rank_by_subgraph_degree(subgraph.node_ids, subgraph.links, max_nodes);
        case RankingMode::Global:
            break;
    }
    return rank_by_global_degree(subgraph.node_ids, adjacency_, max_nodes);
}

FilteredGraph NetworkBuilder::assemble(
    const CandidateSubgraph& subgraph,
    const std::vector<std::string>& final_ids,
    bool truncated
) const {
    std::unordered_set<std::string> selected(final_ids.begin(), final_ids.end());

    FilteredGraph result;
    result.truncated = truncated;
    result.matched_count = subgraph.node_ids.size();

    std::unordered_map<std::string, size_t> degrees;
    for (const auto& link : subgraph.links) {
        if (!selected.count(link.source) || !selected.count(link.target)) continue;
        result.links.push_back(link);
        degrees[link.source]++;
        degrees[link.target]++;
    }

    result.nodes.reserve(selected.size());
    for (const auto& node_id : subgraph.node_ids) {
        if (!selected.count(node_id)) continue;
        RankedNode ranked;
        ranked.node = *find_node(node_id);
        auto it = degrees.find(node_id);
        ranked.degree = (it != degrees.end()) ? it->second : 0;
        result.nodes.push_back(std::move(ranked));
    }

    return result;
}

FilteredGraph NetworkBuilder::build_network(
    const NetworkQuery& query,
    SearchLogic logic,
    RankingMode ranking
) const {
    std::string error;
    if (!query.validate(error)) {
        throw std::invalid_argument("Invalid network query: " + error);
    }

    auto candidates = select_candidates(query, logic);
    if (!candidates) {
        return FilteredGraph{};
    }

    CandidateSubgraph subgraph = apply_filters(*candidates, query);

    const size_t max_nodes = static_cast<size_t>(query.max_total_nodes);
    const bool truncated = subgraph.node_ids.size() > max_nodes;

    std::vector<std::string> final_ids = truncated
        ? select_top_nodes(subgraph, max_nodes, ranking)
        : subgraph.node_ids;

    if (verbose_) {
        std::cout << "[network] " << subgraph.node_ids.size() << " connected node(s), "
                  << subgraph.links.size() << " link(s)";
        if (truncated) {
            std::cout << ", truncated to " << final_ids.size()
                      << " by " << to_string(ranking) << " degree";
        }
        std::cout << "\n";
    }

    return assemble(subgraph, final_ids, truncated);
}

} // namespace lexnet
