#include "builder/search.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

namespace lexnet {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

std::string json_to_text(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

bool is_truthy(const nlohmann::json& value) {
    if (value.is_null()) return false;
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    return true;
}

// Property-bag entry if present and not null
std::optional<std::string> property(const GraphNode& node, const char* key) {
    if (!node.properties.is_object()) return std::nullopt;
    auto it = node.properties.find(key);
    if (it == node.properties.end() || it->is_null()) return std::nullopt;
    return json_to_text(*it);
}

// Property-bag entry only when it would not fall through to the next source
std::optional<std::string> truthy_property(const GraphNode& node, const char* key) {
    if (!node.properties.is_object()) return std::nullopt;
    auto it = node.properties.find(key);
    if (it == node.properties.end() || !is_truthy(*it)) return std::nullopt;
    return json_to_text(*it);
}

std::optional<std::string> non_empty_attribute(const GraphNode& node, const char* key) {
    auto it = node.attributes.find(key);
    if (it == node.attributes.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

// First source yielding a value wins; the last source is taken as-is
std::optional<std::string> first_of(
    std::initializer_list<std::optional<std::string>> chain,
    const std::optional<std::string>& last
) {
    for (const auto& candidate : chain) {
        if (candidate) return candidate;
    }
    return last;
}

std::optional<std::string> raw_attribute(const GraphNode& node, const char* key) {
    auto it = node.attributes.find(key);
    if (it == node.attributes.end()) return std::nullopt;
    return it->second;
}

} // namespace

std::string to_string(SearchLogic logic) {
    return logic == SearchLogic::And ? "AND" : "OR";
}

SearchLogic parse_search_logic(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "OR") return SearchLogic::Or;
    if (upper == "AND") return SearchLogic::And;
    throw std::invalid_argument("Unknown search logic: " + name);
}

std::vector<std::string> parse_search_terms(const std::string& keywords, char delim) {
    std::vector<std::string> terms;
    std::stringstream ss(keywords);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) terms.push_back(item);
    }
    return terms;
}

std::string normalize_term(const std::string& term) {
    return to_lower(trim(term));
}

std::optional<std::string> extract_field(const GraphNode& node, const std::string& field) {
    if (field == field_names::kText) {
        return first_of({
            truthy_property(node, "text"),
            non_empty_attribute(node, "text"),
            non_empty_attribute(node, "section_text"),
        }, raw_attribute(node, "index_heading"));
    }
    if (field == field_names::kFullName) {
        return first_of({truthy_property(node, "full_name")}, raw_attribute(node, "full_name"));
    }
    if (field == field_names::kDisplayLabel) {
        return node.display_label;
    }
    if (field == field_names::kDefinition) {
        return property(node, "definition");
    }
    if (field == field_names::kEntity) {
        if (node.node_type != NodeType::Entity) return std::nullopt;
        return node.name;
    }
    if (field == field_names::kConcept) {
        if (node.node_type != NodeType::Concept) return std::nullopt;
        return node.name;
    }
    if (field == field_names::kProperties) {
        return std::nullopt;
    }
    return node.attribute(field);
}

std::vector<std::string> searchable_values(const GraphNode& node, const std::vector<std::string>& fields) {
    std::vector<std::string> values;

    for (const auto& field : fields) {
        if (field == field_names::kProperties) {
            if (!node.properties.is_object()) continue;
            for (const auto& item : node.properties.items()) {
                if (item.value().is_string()) {
                    values.push_back(to_lower(item.value().get<std::string>()));
                }
            }
            continue;
        }

        auto value = extract_field(node, field);
        if (value) {
            values.push_back(to_lower(*value));
        }
    }

    return values;
}

bool matches_terms(
    const std::vector<std::string>& values,
    const std::vector<std::string>& normalized_terms,
    SearchLogic logic
) {
    auto term_found = [&values](const std::string& term) {
        return std::any_of(values.begin(), values.end(), [&term](const std::string& value) {
            return value.find(term) != std::string::npos;
        });
    };

    if (logic == SearchLogic::Or) {
        return std::any_of(normalized_terms.begin(), normalized_terms.end(), term_found);
    }
    return std::all_of(normalized_terms.begin(), normalized_terms.end(), term_found);
}

NodeIdSet search_nodes(
    const std::vector<GraphNode>& nodes,
    const std::vector<std::string>& terms,
    const std::vector<std::string>& fields,
    SearchLogic logic
) {
    std::vector<std::string> normalized_terms;
    normalized_terms.reserve(terms.size());
    for (const auto& term : terms) {
        normalized_terms.push_back(normalize_term(term));
    }

    NodeIdSet matched;
    for (const auto& node : nodes) {
        auto values = searchable_values(node, fields);
        if (matches_terms(values, normalized_terms, logic)) {
            matched.insert(node.id);
        }
    }
    return matched;
}

} // namespace lexnet
