#include "session/graph_session.hpp"
#include <iostream>
#include <stdexcept>

namespace lexnet {

GraphSession::GraphSession(BuilderConfig config)
    : config_(std::move(config)) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

void GraphSession::load(GraphSnapshot snapshot) {
    std::string error;
    if (!snapshot.validate(error)) {
        throw std::invalid_argument("Invalid snapshot: " + error);
    }

    if (config_.verbose) {
        std::cout << "Loading snapshot " << snapshot.title << " [" << snapshot.time_scope << "]: "
                  << snapshot.num_nodes() << " nodes, " << snapshot.num_links() << " links\n";
    }

    auto builder = std::make_shared<NetworkBuilder>(std::move(snapshot));
    builder->set_verbose(config_.verbose);

    std::lock_guard<std::mutex> lock(mutex_);
    builder_ = std::move(builder);
}

std::shared_ptr<const NetworkBuilder> GraphSession::builder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builder_;
}

uint64_t GraphSession::begin_query() {
    return ++generation_;
}

SessionResult GraphSession::run(const NetworkQuery& query) {
    return run(query, config_.search_logic, config_.ranking_mode);
}

SessionResult GraphSession::run(const NetworkQuery& query, SearchLogic logic, RankingMode ranking) {
    auto current = builder();
    if (!current) {
        throw std::runtime_error("No snapshot loaded");
    }

    SessionResult result;
    result.generation = begin_query();
    result.graph = cap_links(current->build_network(query, logic, ranking), config_.link_limit);
    return result;
}

} // namespace lexnet
