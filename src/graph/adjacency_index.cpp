#include "graph/adjacency_index.hpp"

namespace lexnet {

void AdjacencyIndex::build(const std::vector<GraphLink>& links) {
    adjacency_.clear();
    adjacency_.reserve(links.size());
    num_entries_ = 0;

    for (const auto& link : links) {
        adjacency_[link.source].push_back(Neighbor{link.target, link.edge_type});
        adjacency_[link.target].push_back(Neighbor{link.source, link.edge_type});
        num_entries_ += 2;
    }
}

const std::vector<Neighbor>& AdjacencyIndex::neighbors(const std::string& node_id) const {
    static const std::vector<Neighbor> kNoNeighbors;

    auto it = adjacency_.find(node_id);
    if (it == adjacency_.end()) {
        return kNoNeighbors;
    }
    return it->second;
}

size_t AdjacencyIndex::degree(const std::string& node_id) const {
    return neighbors(node_id).size();
}

} // namespace lexnet
