#pragma once

#include "graph/adjacency_index.hpp"
#include "graph/legal_graph.hpp"
#include <vector>

namespace lexnet {

/**
 * @brief Bounded breadth-first expansion from a seed set
 * @param index Adjacency index of the snapshot
 * @param seeds Starting node ids (always part of the result)
 * @param depth Number of hops
 * @param max_neighbors_per_node Per-node cap on followed adjacency entries,
 *        taken in adjacency order; 0 means unlimited
 * @param allowed_edge_types Edge types that may be followed; an empty list
 *        follows nothing
 * @return Seeds plus every node reached within `depth` hops
 *
 * The frontier only grows. Stops early when a hop adds no new node.
 *
 * @throws std::invalid_argument for a negative depth or cap
 */
NodeIdSet expand_from_seeds(
    const AdjacencyIndex& index,
    const NodeIdSet& seeds,
    int depth,
    int max_neighbors_per_node,
    const std::vector<EdgeType>& allowed_edge_types
);

} // namespace lexnet
