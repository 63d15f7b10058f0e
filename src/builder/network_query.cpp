#include "builder/network_query.hpp"
#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace lexnet {

namespace {

// First of several accepted spellings of a key
const json* find_key(const json& j, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = j.find(name);
        if (it != j.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

// Integer field within int range; floats and out-of-range values are rejected
int integer_value(const json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("Query field ") + key + " must be an integer");
    }
    if (value.is_number_unsigned()) {
        auto parsed = value.get<unsigned long long>();
        if (parsed > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw std::invalid_argument(std::string("Query field ") + key + " is out of range");
        }
        return static_cast<int>(parsed);
    }
    auto parsed = value.get<long long>();
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string("Query field ") + key + " is out of range");
    }
    return static_cast<int>(parsed);
}

} // namespace

// ============================================================================
// NetworkQuery
// ============================================================================

bool NetworkQuery::allows_node_type(NodeType type) const {
    if (allowed_node_types.empty()) return true;
    return std::find(allowed_node_types.begin(), allowed_node_types.end(), type)
        != allowed_node_types.end();
}

bool NetworkQuery::allows_edge_type(EdgeType type) const {
    return std::find(allowed_edge_types.begin(), allowed_edge_types.end(), type)
        != allowed_edge_types.end();
}

bool NetworkQuery::validate(std::string& error_message) const {
    if (max_total_nodes <= 0) {
        error_message = "Max total nodes must be positive";
        return false;
    }

    if (max_neighbors_per_node < 0) {
        error_message = "Max neighbors per node must be non-negative";
        return false;
    }

    if (expansion_depth < 0) {
        error_message = "Expansion depth must be non-negative";
        return false;
    }

    return true;
}

NetworkQuery NetworkQuery::from_json(const json& j) {
    NetworkQuery query;

    if (auto* v = find_key(j, {"search_terms", "searchTerms"})) {
        query.search_terms = v->get<std::vector<std::string>>();
    }
    if (auto* v = find_key(j, {"search_fields", "searchFields"})) {
        query.search_fields = v->get<std::vector<std::string>>();
    }
    if (auto* v = find_key(j, {"allowed_node_types", "allowedNodeTypes"})) {
        query.allowed_node_types.clear();
        for (const auto& name : v->get<std::vector<std::string>>()) {
            query.allowed_node_types.push_back(parse_node_type(name));
        }
    }
    if (auto* v = find_key(j, {"allowed_edge_types", "allowedEdgeTypes"})) {
        query.allowed_edge_types.clear();
        for (const auto& name : v->get<std::vector<std::string>>()) {
            query.allowed_edge_types.push_back(parse_edge_type(name));
        }
    }
    if (auto* v = find_key(j, {"expansion_depth", "expansionDepth"})) {
        query.expansion_depth = integer_value(*v, "expansion_depth");
    }
    if (auto* v = find_key(j, {"max_neighbors_per_node", "maxNodesPerExpansion"})) {
        query.max_neighbors_per_node = integer_value(*v, "max_neighbors_per_node");
    }
    if (auto* v = find_key(j, {"max_total_nodes", "maxTotalNodes"})) {
        query.max_total_nodes = integer_value(*v, "max_total_nodes");
    }

    return query;
}

NetworkQuery NetworkQuery::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open query file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

json NetworkQuery::to_json() const {
    json j;
    j["search_terms"] = search_terms;
    j["search_fields"] = search_fields;

    json node_types = json::array();
    for (auto type : allowed_node_types) {
        node_types.push_back(lexnet::to_string(type));
    }
    j["allowed_node_types"] = node_types;

    json edge_types = json::array();
    for (auto type : allowed_edge_types) {
        edge_types.push_back(lexnet::to_string(type));
    }
    j["allowed_edge_types"] = edge_types;

    j["expansion_depth"] = expansion_depth;
    j["max_neighbors_per_node"] = max_neighbors_per_node;
    j["max_total_nodes"] = max_total_nodes;
    return j;
}

// ============================================================================
// FilteredGraph
// ============================================================================

std::vector<std::string> FilteredGraph::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes.size());
    for (const auto& ranked : nodes) {
        ids.push_back(ranked.node.id);
    }
    return ids;
}

const RankedNode* FilteredGraph::find_node(const std::string& node_id) const {
    for (const auto& ranked : nodes) {
        if (ranked.node.id == node_id) return &ranked;
    }
    return nullptr;
}

json FilteredGraph::to_json() const {
    json j;

    json nodes_json = json::array();
    for (const auto& ranked : nodes) {
        json node_json = ranked.node.to_json();
        // Renderers size nodes by val; a node kept by truncation alone still gets 1
        node_json["val"] = std::max<size_t>(ranked.degree, 1);
        node_json["degree"] = ranked.degree;
        nodes_json.push_back(node_json);
    }
    j["nodes"] = nodes_json;

    json links_json = json::array();
    for (const auto& link : links) {
        links_json.push_back(link.to_json());
    }
    j["links"] = links_json;

    j["truncated"] = truncated;
    j["matched_count"] = matched_count;
    return j;
}

} // namespace lexnet
