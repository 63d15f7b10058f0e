#include "builder/display_limits.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

namespace lexnet {

FilteredGraph cap_links(const FilteredGraph& graph, size_t limit) {
    if (limit == 0) {
        throw std::invalid_argument("Link limit must be positive");
    }

    std::vector<size_t> order(graph.links.size());
    std::iota(order.begin(), order.end(), 0);

    const bool links_cut = graph.links.size() > limit;
    if (links_cut) {
        std::unordered_map<std::string, size_t> degrees;
        for (const auto& link : graph.links) {
            degrees[link.source]++;
            degrees[link.target]++;
        }

        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const auto& la = graph.links[a];
            const auto& lb = graph.links[b];
            return degrees[la.source] + degrees[la.target] > degrees[lb.source] + degrees[lb.target];
        });
        order.resize(limit);
    }

    FilteredGraph capped;
    capped.truncated = graph.truncated || links_cut;
    capped.matched_count = graph.matched_count;

    std::unordered_map<std::string, size_t> kept_degrees;
    capped.links.reserve(order.size());
    for (size_t i : order) {
        const auto& link = graph.links[i];
        capped.links.push_back(link);
        kept_degrees[link.source]++;
        kept_degrees[link.target]++;
    }

    // Only nodes drawn by a kept link are shown
    for (const auto& ranked : graph.nodes) {
        auto it = kept_degrees.find(ranked.node.id);
        if (it == kept_degrees.end()) continue;
        RankedNode kept = ranked;
        kept.degree = it->second;
        capped.nodes.push_back(std::move(kept));
    }

    return capped;
}

} // namespace lexnet
