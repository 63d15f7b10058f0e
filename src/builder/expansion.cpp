#include "builder/expansion.hpp"
#include <algorithm>
#include <stdexcept>

namespace lexnet {

NodeIdSet expand_from_seeds(
    const AdjacencyIndex& index,
    const NodeIdSet& seeds,
    int depth,
    int max_neighbors_per_node,
    const std::vector<EdgeType>& allowed_edge_types
) {
    if (depth < 0) {
        throw std::invalid_argument("Expansion depth must be non-negative");
    }
    if (max_neighbors_per_node < 0) {
        throw std::invalid_argument("Max neighbors per node must be non-negative");
    }

    NodeIdSet expanded = seeds;
    std::vector<std::string> current_layer(seeds.begin(), seeds.end());

    for (int hop = 0; hop < depth; ++hop) {
        std::vector<std::string> next_layer;

        for (const auto& node_id : current_layer) {
            size_t followed = 0;

            for (const auto& neighbor : index.neighbors(node_id)) {
                bool allowed = std::find(allowed_edge_types.begin(), allowed_edge_types.end(),
                                         neighbor.edge_type) != allowed_edge_types.end();
                if (!allowed) continue;

                // The cap counts allowed entries, visited or not
                if (max_neighbors_per_node > 0 &&
                    followed >= static_cast<size_t>(max_neighbors_per_node)) {
                    break;
                }
                ++followed;

                if (expanded.insert(neighbor.neighbor_id).second) {
                    next_layer.push_back(neighbor.neighbor_id);
                }
            }
        }

        if (next_layer.empty()) {
            break;
        }
        current_layer = std::move(next_layer);
    }

    return expanded;
}

} // namespace lexnet
