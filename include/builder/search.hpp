#pragma once

#include "graph/legal_graph.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lexnet {

/**
 * @brief How multiple search terms combine
 *
 * Or: any term in any collected field value.
 * And: every term in at least one (possibly different) field value.
 */
enum class SearchLogic {
    Or,
    And
};

std::string to_string(SearchLogic logic);

/**
 * @brief Parse "OR" / "AND" (case-insensitive)
 * @throws std::invalid_argument for any other value
 */
SearchLogic parse_search_logic(const std::string& name);

// Field names with a dedicated extraction rule
namespace field_names {
inline constexpr const char* kText = "text";
inline constexpr const char* kFullName = "full_name";
inline constexpr const char* kDisplayLabel = "display_label";
inline constexpr const char* kDefinition = "definition";
inline constexpr const char* kEntity = "entity";
inline constexpr const char* kConcept = "concept";
inline constexpr const char* kProperties = "properties";
} // namespace field_names

/**
 * @brief Split a comma-separated keyword box into trimmed, non-empty terms
 */
std::vector<std::string> parse_search_terms(const std::string& keywords, char delim = ',');

/**
 * @brief Lower-case and trim a term for comparison
 */
std::string normalize_term(const std::string& term);

/**
 * @brief Value of one searchable field of a node, with its fallback chain
 *
 *   text          properties.text, text, section_text, index_heading
 *                 (first non-empty wins)
 *   full_name     properties.full_name, full_name (first non-empty wins)
 *   display_label the node's display label
 *   definition    properties.definition
 *   entity        the name, only for entity nodes
 *   concept       the name, only for concept nodes
 *   anything else direct attribute lookup (GraphNode::attribute)
 *
 * "properties" is multi-valued and yields nullopt here; see
 * searchable_values().
 */
std::optional<std::string> extract_field(const GraphNode& node, const std::string& field);

/**
 * @brief All lower-cased values the given fields produce for a node
 *
 * "properties" contributes every string-valued property-bag entry.
 */
std::vector<std::string> searchable_values(const GraphNode& node, const std::vector<std::string>& fields);

/**
 * @brief Match already-normalized terms against collected values
 */
bool matches_terms(
    const std::vector<std::string>& values,
    const std::vector<std::string>& normalized_terms,
    SearchLogic logic
);

/**
 * @brief Ids of nodes whose selected fields contain the terms
 *
 * Matching is case-insensitive substring containment.
 */
NodeIdSet search_nodes(
    const std::vector<GraphNode>& nodes,
    const std::vector<std::string>& terms,
    const std::vector<std::string>& fields,
    SearchLogic logic = SearchLogic::Or
);

} // namespace lexnet
