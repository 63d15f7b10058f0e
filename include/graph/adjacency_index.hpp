#pragma once

#include "graph/legal_graph.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace lexnet {

/**
 * @brief One entry of a node's adjacency list
 */
struct Neighbor {
    std::string neighbor_id;
    EdgeType edge_type;
};

/**
 * @brief Node id -> incident (neighbor, edge type) pairs
 *
 * Every link is inserted once per direction, so a node's list covers all
 * links touching it regardless of which endpoint it occupied. Lists keep
 * link order, which makes neighbor capping deterministic.
 */
class AdjacencyIndex {
public:
    AdjacencyIndex() = default;
    explicit AdjacencyIndex(const std::vector<GraphLink>& links) { build(links); }

    /**
     * @brief Rebuild from a link list (linear in the number of links)
     */
    void build(const std::vector<GraphLink>& links);

    /**
     * @brief Adjacency list of a node; empty for unknown ids
     */
    const std::vector<Neighbor>& neighbors(const std::string& node_id) const;

    /**
     * @brief Snapshot-wide degree (number of incident links)
     */
    size_t degree(const std::string& node_id) const;

    bool contains(const std::string& node_id) const {
        return adjacency_.find(node_id) != adjacency_.end();
    }

    size_t num_nodes() const { return adjacency_.size(); }
    size_t num_entries() const { return num_entries_; }
    bool empty() const { return adjacency_.empty(); }

private:
    std::unordered_map<std::string, std::vector<Neighbor>> adjacency_;
    size_t num_entries_ = 0;
};

} // namespace lexnet
