#include "config/builder_config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace lexnet {

namespace {

bool parse_flag(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes" || value == "on";
}

} // namespace

BuilderConfig BuilderConfig::from_json(const json& j) {
    BuilderConfig config;

    if (j.contains("search_logic")) {
        config.search_logic = parse_search_logic(j["search_logic"].get<std::string>());
    }
    if (j.contains("ranking_mode")) {
        config.ranking_mode = parse_ranking_mode(j["ranking_mode"].get<std::string>());
    }
    if (j.contains("link_limit")) {
        const auto& limit = j["link_limit"];
        bool positive = limit.is_number_unsigned()
            ? limit.get<unsigned long long>() > 0
            : limit.is_number_integer() && limit.get<long long>() > 0;
        if (!positive) {
            throw std::invalid_argument("link_limit must be a positive integer");
        }
        config.link_limit = limit.get<size_t>();
    }
    if (j.contains("verbose")) {
        config.verbose = j["verbose"].get<bool>();
    }

    return config;
}

BuilderConfig BuilderConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

json BuilderConfig::to_json() const {
    json j;
    j["search_logic"] = to_string(search_logic);
    j["ranking_mode"] = to_string(ranking_mode);
    j["link_limit"] = link_limit;
    j["verbose"] = verbose;
    return j;
}

void BuilderConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2);
}

BuilderConfig BuilderConfig::from_environment() {
    BuilderConfig config;

    const char* logic = std::getenv("LEXNET_SEARCH_LOGIC");
    if (logic) config.search_logic = parse_search_logic(logic);

    const char* ranking = std::getenv("LEXNET_RANKING_MODE");
    if (ranking) config.ranking_mode = parse_ranking_mode(ranking);

    const char* link_limit = std::getenv("LEXNET_LINK_LIMIT");
    if (link_limit) {
        long long value = std::stoll(link_limit);
        if (value <= 0) {
            throw std::invalid_argument("LEXNET_LINK_LIMIT must be positive");
        }
        config.link_limit = static_cast<size_t>(value);
    }

    const char* verbose = std::getenv("LEXNET_VERBOSE");
    if (verbose) config.verbose = parse_flag(verbose);

    return config;
}

bool BuilderConfig::validate(std::string& error_message) const {
    if (link_limit == 0) {
        error_message = "Link limit must be positive";
        return false;
    }
    return true;
}

} // namespace lexnet
