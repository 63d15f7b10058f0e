#pragma once

#include "builder/network_builder.hpp"
#include "config/builder_config.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace lexnet {

/**
 * @brief Result of GraphSession::run tagged with its generation ticket
 */
struct SessionResult {
    uint64_t generation = 0;
    FilteredGraph graph;
};

/**
 * @brief Holds the snapshot currently being explored
 *
 * load() builds a new NetworkBuilder and swaps it in; the previous one is
 * never mutated and stays alive for queries still holding it. Generation
 * tickets let asynchronous callers drop results of superseded queries.
 */
class GraphSession {
public:
    explicit GraphSession(BuilderConfig config = BuilderConfig{});

    /**
     * @brief Replace the current snapshot
     * @throws std::invalid_argument if the snapshot fails validation
     */
    void load(GraphSnapshot snapshot);

    /**
     * @brief Current builder, or nullptr before the first load
     */
    std::shared_ptr<const NetworkBuilder> builder() const;

    bool loaded() const { return builder() != nullptr; }

    /**
     * @brief Start a query; earlier tickets stop being current
     */
    uint64_t begin_query();

    bool is_current(uint64_t generation) const { return generation == generation_.load(); }

    /**
     * @brief Build and link-cap a network with the session defaults
     * @throws std::runtime_error if nothing is loaded
     */
    SessionResult run(const NetworkQuery& query);

    SessionResult run(const NetworkQuery& query, SearchLogic logic, RankingMode ranking);

    const BuilderConfig& config() const { return config_; }

private:
    BuilderConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<const NetworkBuilder> builder_;
    std::atomic<uint64_t> generation_{0};
};

} // namespace lexnet
