#include "builder/ranking.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace lexnet {

namespace {

std::vector<std::string> take_ids(
    const std::vector<std::pair<std::string, size_t>>& ranked,
    size_t max_nodes
) {
    std::vector<std::string> result;
    size_t count = std::min(max_nodes, ranked.size());
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(ranked[i].first);
    }
    return result;
}

} // namespace

std::string to_string(RankingMode mode) {
    return mode == RankingMode::Subgraph ? "subgraph" : "global";
}

RankingMode parse_ranking_mode(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "global") return RankingMode::Global;
    if (lower == "subgraph") return RankingMode::Subgraph;
    throw std::invalid_argument("Unknown ranking mode: " + name);
}

std::vector<std::pair<std::string, size_t>> sort_by_degree(
    std::vector<std::pair<std::string, size_t>> degrees
) {
    std::stable_sort(degrees.begin(), degrees.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    return degrees;
}

std::vector<std::string> rank_by_global_degree(
    const std::vector<std::string>& candidates,
    const AdjacencyIndex& index,
    size_t max_nodes
) {
    std::vector<std::pair<std::string, size_t>> degrees;
    degrees.reserve(candidates.size());
    for (const auto& node_id : candidates) {
        degrees.emplace_back(node_id, index.degree(node_id));
    }

    return take_ids(sort_by_degree(std::move(degrees)), max_nodes);
}

std::vector<std::string> rank_by_subgraph_degree(
    const std::vector<std::string>& candidates,
    const std::vector<GraphLink>& links,
    size_t max_nodes
) {
    std::unordered_map<std::string, size_t> local_degree;
    for (const auto& link : links) {
        local_degree[link.source]++;
        local_degree[link.target]++;
    }

    std::vector<std::pair<std::string, size_t>> degrees;
    degrees.reserve(candidates.size());
    for (const auto& node_id : candidates) {
        auto it = local_degree.find(node_id);
        if (it == local_degree.end()) continue;
        degrees.emplace_back(node_id, it->second);
    }

    return take_ids(sort_by_degree(std::move(degrees)), max_nodes);
}

} // namespace lexnet
