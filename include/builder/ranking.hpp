#pragma once

#include "graph/adjacency_index.hpp"
#include "graph/legal_graph.hpp"
#include <string>
#include <utility>
#include <vector>

namespace lexnet {

/**
 * @brief Degree policy used to pick the survivors of an over-budget result
 *
 * Global ranks by snapshot-wide degree taken from the adjacency index.
 * Subgraph ranks by degree within the filtered candidate links.
 */
enum class RankingMode {
    Global,
    Subgraph
};

std::string to_string(RankingMode mode);

/**
 * @brief Parse "global" / "subgraph" (case-insensitive)
 * @throws std::invalid_argument for any other value
 */
RankingMode parse_ranking_mode(const std::string& name);

/**
 * @brief Top `max_nodes` candidates by snapshot-wide degree
 *
 * Sorted by descending degree; ties keep candidate order.
 */
std::vector<std::string> rank_by_global_degree(
    const std::vector<std::string>& candidates,
    const AdjacencyIndex& index,
    size_t max_nodes
);

/**
 * @brief Top `max_nodes` candidates by degree within `links`
 *
 * Candidates touched by none of the links are excluded before ranking.
 * Ties keep candidate order.
 */
std::vector<std::string> rank_by_subgraph_degree(
    const std::vector<std::string>& candidates,
    const std::vector<GraphLink>& links,
    size_t max_nodes
);

/**
 * @brief (id, degree) pairs sorted by descending degree, stable
 */
std::vector<std::pair<std::string, size_t>> sort_by_degree(
    std::vector<std::pair<std::string, size_t>> degrees
);

} // namespace lexnet
