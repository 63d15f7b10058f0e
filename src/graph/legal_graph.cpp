#include "graph/legal_graph.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace lexnet {

namespace {

// Top-level node keys with a dedicated member in GraphNode
const std::set<std::string> kReservedNodeKeys = {
    "id", "name", "node_type", "time", "display_label", "properties"
};

const std::set<std::string> kReservedLinkKeys = {
    "source", "target", "edge_type", "action", "time", "weight"
};

// Scalar JSON value as text; nullopt for null, arrays and objects
std::optional<std::string> scalar_to_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? std::string("true") : std::string("false");
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    if (value.is_number_unsigned()) return std::to_string(value.get<unsigned long long>());
    if (value.is_number_float()) return value.dump();
    return std::nullopt;
}

// Optional text field; absent, null or non-scalar values read as ""
std::string text_or_empty(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return "";
    return scalar_to_string(*it).value_or("");
}

std::string endpoint_id(const nlohmann::json& endpoint) {
    if (endpoint.is_object()) {
        return endpoint.at("id").get<std::string>();
    }
    auto id = scalar_to_string(endpoint);
    if (!id) {
        throw std::invalid_argument("Link endpoint must be an id or an object with an id");
    }
    return *id;
}

} // namespace

// ==========================================
// Type vocabularies
// ==========================================

std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::Section: return "section";
        case NodeType::Entity:  return "entity";
        case NodeType::Concept: return "concept";
        case NodeType::Index:   return "index";
    }
    return "section";
}

std::string to_string(EdgeType type) {
    switch (type) {
        case EdgeType::Definition: return "definition";
        case EdgeType::Reference:  return "reference";
        case EdgeType::Hierarchy:  return "hierarchy";
    }
    return "reference";
}

NodeType parse_node_type(const std::string& name) {
    if (name == "section") return NodeType::Section;
    if (name == "entity") return NodeType::Entity;
    if (name == "concept") return NodeType::Concept;
    if (name == "index") return NodeType::Index;
    throw std::invalid_argument("Unknown node type: " + name);
}

EdgeType parse_edge_type(const std::string& name) {
    if (name == "definition") return EdgeType::Definition;
    if (name == "reference") return EdgeType::Reference;
    if (name == "hierarchy") return EdgeType::Hierarchy;
    throw std::invalid_argument("Unknown edge type: " + name);
}

std::vector<NodeType> all_node_types() {
    return {NodeType::Section, NodeType::Entity, NodeType::Concept, NodeType::Index};
}

std::vector<EdgeType> all_edge_types() {
    return {EdgeType::Definition, EdgeType::Reference, EdgeType::Hierarchy};
}

bool is_hierarchy_node(NodeType type) {
    return type == NodeType::Section || type == NodeType::Index;
}

bool is_term_node(NodeType type) {
    return type == NodeType::Entity || type == NodeType::Concept;
}

// ==========================================
// GraphNode Implementation
// ==========================================

std::optional<std::string> GraphNode::attribute(const std::string& field) const {
    if (field == "id") return id;
    if (field == "name") return name;
    if (field == "node_type") return lexnet::to_string(node_type);
    if (field == "time") {
        if (time.empty()) return std::nullopt;
        return time;
    }
    if (field == "display_label") return display_label;

    auto it = attributes.find(field);
    if (it != attributes.end()) {
        return it->second;
    }
    return std::nullopt;
}

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    for (const auto& [key, value] : attributes) {
        j[key] = value;
    }
    j["id"] = id;
    j["name"] = name;
    j["node_type"] = lexnet::to_string(node_type);
    if (!time.empty()) {
        j["time"] = time;
    }
    if (display_label.has_value()) {
        j["display_label"] = display_label.value();
    }
    j["properties"] = properties;
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = endpoint_id(j.at("id"));
    node.name = text_or_empty(j, "name");
    node.node_type = parse_node_type(j.at("node_type").get<std::string>());

    node.time = text_or_empty(j, "time");
    if (j.contains("display_label") && !j["display_label"].is_null()) {
        node.display_label = scalar_to_string(j["display_label"]);
    }
    if (j.contains("properties") && j["properties"].is_object()) {
        node.properties = j["properties"];
    }

    for (const auto& [key, value] : j.items()) {
        if (kReservedNodeKeys.count(key)) continue;
        auto text = scalar_to_string(value);
        if (text) {
            node.attributes[key] = *text;
        }
    }

    return node;
}

// ==========================================
// GraphLink Implementation
// ==========================================

nlohmann::json GraphLink::to_json() const {
    nlohmann::json j;
    for (const auto& [key, value] : attributes) {
        j[key] = value;
    }
    j["source"] = source;
    j["target"] = target;
    j["edge_type"] = lexnet::to_string(edge_type);
    j["action"] = action;
    if (!time.empty()) {
        j["time"] = time;
    }
    if (weight.has_value()) {
        j["weight"] = weight.value();
    }
    return j;
}

GraphLink GraphLink::from_json(const nlohmann::json& j) {
    GraphLink link;
    link.source = endpoint_id(j.at("source"));
    link.target = endpoint_id(j.at("target"));
    link.edge_type = parse_edge_type(j.at("edge_type").get<std::string>());
    link.action = text_or_empty(j, "action");

    link.time = text_or_empty(j, "time");
    if (j.contains("weight") && j["weight"].is_number()) {
        link.weight = j["weight"].get<double>();
    }

    for (const auto& [key, value] : j.items()) {
        if (kReservedLinkKeys.count(key)) continue;
        auto text = scalar_to_string(value);
        if (text) {
            link.attributes[key] = *text;
        }
    }

    return link;
}

// ==========================================
// GraphStatistics Implementation
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_links"] = num_links;
    j["nodes_by_type"] = nodes_by_type;
    j["links_by_type"] = links_by_type;
    j["isolated_nodes"] = isolated_nodes;
    j["max_degree"] = max_degree;
    j["avg_degree"] = avg_degree;
    return j;
}

// ==========================================
// GraphSnapshot Implementation
// ==========================================

GraphSnapshot GraphSnapshot::scoped_to(const std::string& scope) const {
    GraphSnapshot scoped;
    scoped.title = title;
    scoped.time_scope = scope;

    std::unordered_set<std::string> kept_ids;
    for (const auto& node : nodes) {
        if (node.time == scope) {
            scoped.nodes.push_back(node);
            kept_ids.insert(node.id);
        }
    }

    for (const auto& link : links) {
        if (link.time == scope && kept_ids.count(link.source) && kept_ids.count(link.target)) {
            scoped.links.push_back(link);
        }
    }

    return scoped;
}

bool GraphSnapshot::validate(std::string& error_message) const {
    std::unordered_set<std::string> ids;
    ids.reserve(nodes.size());

    for (const auto& node : nodes) {
        if (node.id.empty()) {
            error_message = "Node with empty id";
            return false;
        }
        if (!ids.insert(node.id).second) {
            error_message = "Duplicate node id: " + node.id;
            return false;
        }
    }

    for (const auto& link : links) {
        if (!ids.count(link.source)) {
            error_message = "Link source not in snapshot: " + link.source;
            return false;
        }
        if (!ids.count(link.target)) {
            error_message = "Link target not in snapshot: " + link.target;
            return false;
        }
    }

    return true;
}

GraphStatistics GraphSnapshot::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = nodes.size();
    stats.num_links = links.size();

    std::unordered_map<std::string, size_t> degrees;
    for (const auto& link : links) {
        stats.links_by_type[lexnet::to_string(link.edge_type)]++;
        degrees[link.source]++;
        degrees[link.target]++;
    }

    size_t degree_sum = 0;
    for (const auto& node : nodes) {
        stats.nodes_by_type[lexnet::to_string(node.node_type)]++;

        auto it = degrees.find(node.id);
        size_t degree = (it != degrees.end()) ? it->second : 0;
        if (degree == 0) {
            stats.isolated_nodes++;
        }
        stats.max_degree = std::max(stats.max_degree, degree);
        degree_sum += degree;
    }

    if (!nodes.empty()) {
        stats.avg_degree = static_cast<double>(degree_sum) / nodes.size();
    }

    return stats;
}

nlohmann::json GraphSnapshot::to_json() const {
    nlohmann::json j;
    j["title"] = title;
    j["time_scope"] = time_scope;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json links_json = nlohmann::json::array();
    for (const auto& link : links) {
        links_json.push_back(link.to_json());
    }
    j["links"] = links_json;

    return j;
}

GraphSnapshot GraphSnapshot::from_json(const nlohmann::json& j) {
    GraphSnapshot snapshot;
    snapshot.title = text_or_empty(j, "title");
    snapshot.time_scope = text_or_empty(j, "time_scope");

    if (j.contains("nodes")) {
        snapshot.nodes.reserve(j["nodes"].size());
        for (const auto& node_json : j["nodes"]) {
            snapshot.nodes.push_back(GraphNode::from_json(node_json));
        }
    }

    // "links" in the exported datasets, "edges" in hand-written fixtures
    const char* links_key = j.contains("links") ? "links" : "edges";
    if (j.contains(links_key)) {
        snapshot.links.reserve(j[links_key].size());
        for (const auto& link_json : j[links_key]) {
            snapshot.links.push_back(GraphLink::from_json(link_json));
        }
    }

    return snapshot;
}

GraphSnapshot GraphSnapshot::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    file.close();

    return from_json(j);
}

} // namespace lexnet
