#pragma once

#include "builder/network_query.hpp"
#include <cstddef>

namespace lexnet {

/// Link budget the graph view renders by default
inline constexpr size_t kDefaultLinkLimit = 4000;

/**
 * @brief Prepare a result for rendering with at most `limit` links
 *
 * When there are more than `limit` links, they are ranked by the summed
 * degree of their endpoints (counted over the uncapped link list), ties
 * keeping result order, and the first `limit` are kept. In every case
 * only nodes touched by a kept link remain, with degrees recounted from
 * the kept links. `truncated` stays set if it was, and is set when links
 * were cut; `matched_count` is left alone.
 *
 * @throws std::invalid_argument if limit is 0
 */
FilteredGraph cap_links(const FilteredGraph& graph, size_t limit = kDefaultLinkLimit);

} // namespace lexnet
