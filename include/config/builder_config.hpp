#pragma once

#include "builder/display_limits.hpp"
#include "builder/ranking.hpp"
#include "builder/search.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace lexnet {

/**
 * @brief Session-wide defaults for running network queries
 */
struct BuilderConfig {
    SearchLogic search_logic = SearchLogic::Or;         ///< How multiple terms combine
    RankingMode ranking_mode = RankingMode::Global;     ///< Truncation policy
    size_t link_limit = kDefaultLinkLimit;              ///< Render-side link cap
    bool verbose = false;                               ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     */
    static BuilderConfig from_json_file(const std::string& path);

    static BuilderConfig from_json(const nlohmann::json& j);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Load from environment variables
     *
     * LEXNET_SEARCH_LOGIC, LEXNET_RANKING_MODE, LEXNET_LINK_LIMIT,
     * LEXNET_VERBOSE. Unset variables keep the defaults.
     */
    static BuilderConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

} // namespace lexnet
