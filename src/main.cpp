#include "cli/cli.hpp"
#include "builder/network_builder.hpp"
#include "config/builder_config.hpp"
#include "graph/legal_graph.hpp"
#include "session/graph_session.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using namespace lexnet;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(d).count();
    std::stringstream ss;
    if (us >= 1000) {
        ss << std::fixed << std::setprecision(2) << (us / 1000.0) << "ms";
    } else {
        ss << us << "us";
    }
    return ss.str();
}

// Load the --input snapshot, narrowed to --scope when given
GraphSnapshot load_snapshot(const Args& args) {
    std::string input_path = args.require("input");
    GraphSnapshot snapshot = GraphSnapshot::load_from_json(input_path);

    std::string scope = args.get("scope").value;
    if (!scope.empty()) {
        snapshot = snapshot.scoped_to(scope);
    }
    return snapshot;
}

void print_ids(const NodeIdSet& ids) {
    for (const auto& id : ids) {
        std::cout << "  " << id << "\n";
    }
}

// ============== lexnet stats ==============
int cmd_stats(const Args& args) {
    GraphSnapshot snapshot = load_snapshot(args);

    std::string error;
    if (!snapshot.validate(error)) {
        std::cerr << "Warning: " << error << "\n";
    }

    auto stats = snapshot.compute_statistics();
    std::cout << "Snapshot: " << (snapshot.title.empty() ? "(untitled)" : snapshot.title);
    if (!snapshot.time_scope.empty()) {
        std::cout << " [" << snapshot.time_scope << "]";
    }
    std::cout << "\n";
    std::cout << stats.to_json().dump(2) << "\n";
    return 0;
}

// ============== lexnet search ==============
int cmd_search(const Args& args) {
    NetworkBuilder builder(load_snapshot(args));

    auto terms = parse_search_terms(args.require("terms"));
    auto fields = args.get("fields", "text,full_name,entity,concept").as_list();
    SearchLogic logic = parse_search_logic(args.get("logic", "OR").value);

    auto start = std::chrono::steady_clock::now();
    NodeIdSet seeds = builder.search(terms, fields, logic);
    auto elapsed = std::chrono::steady_clock::now() - start;

    std::cout << seeds.size() << " node(s) matched (" << format_duration(elapsed) << ")\n";
    print_ids(seeds);
    return 0;
}

// ============== lexnet expand ==============
int cmd_expand(const Args& args) {
    NetworkBuilder builder(load_snapshot(args));

    auto seed_list = args.get("seeds").as_list();
    NodeIdSet seeds(seed_list.begin(), seed_list.end());
    int depth = args.get("depth", "1").as_int();
    int max_neighbors = args.get("max-neighbors", "0").as_int();
    auto edge_types = args.get("edge-types", "definition,reference,hierarchy").as_edge_types();

    NodeIdSet expanded = builder.expand_from_seeds(seeds, depth, max_neighbors, edge_types);

    std::cout << expanded.size() << " node(s) within " << depth << " hop(s)\n";
    print_ids(expanded);
    return 0;
}

// ============== lexnet query ==============
int cmd_query(const Args& args) {
    BuilderConfig config = args.has("config")
        ? BuilderConfig::from_json_file(args.require("config"))
        : BuilderConfig::from_environment();

    if (args.has("logic")) config.search_logic = parse_search_logic(args.require("logic"));
    if (args.has("ranking")) config.ranking_mode = parse_ranking_mode(args.require("ranking"));
    if (args.has("link-limit")) config.link_limit = args.get("link-limit").as_count();
    if (args.has("verbose")) config.verbose = true;

    NetworkQuery query = args.has("query")
        ? NetworkQuery::from_json_file(args.require("query"))
        : NetworkQuery{};

    if (args.has("terms")) query.search_terms = parse_search_terms(args.require("terms"));
    if (args.has("fields")) query.search_fields = args.get("fields").as_list();
    if (args.has("node-types")) query.allowed_node_types = args.get("node-types").as_node_types();
    if (args.has("edge-types")) query.allowed_edge_types = args.get("edge-types").as_edge_types();
    if (args.has("depth")) query.expansion_depth = args.get("depth").as_int();
    if (args.has("max-neighbors")) query.max_neighbors_per_node = args.get("max-neighbors").as_int();
    if (args.has("max-nodes")) query.max_total_nodes = static_cast<int>(args.get("max-nodes").as_count());

    GraphSession session(config);
    session.load(load_snapshot(args));

    auto start = std::chrono::steady_clock::now();
    SessionResult result = session.run(query);
    auto elapsed = std::chrono::steady_clock::now() - start;

    const FilteredGraph& graph = result.graph;
    std::cout << "Nodes:     " << graph.nodes.size() << "\n";
    std::cout << "Links:     " << graph.links.size() << "\n";
    std::cout << "Matched:   " << graph.matched_count << "\n";
    std::cout << "Truncated: " << (graph.truncated ? "yes" : "no") << "\n";
    std::cout << "Time:      " << format_duration(elapsed) << "\n";

    std::string output_path = args.get("output").value;
    if (output_path.empty()) {
        std::cout << graph.to_json().dump(2) << "\n";
        return 0;
    }

    fs::path out_path(output_path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + output_path);
    }
    file << graph.to_json().dump(2);
    std::cout << "Saved network to: " << output_path << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("lexnet", "1.0.0");

    // lexnet stats
    cli.register_command({
        "stats",
        "Print statistics about a graph snapshot",
        {
            {"input", "i", "Snapshot JSON file", "", true, false},
            {"scope", "s", "Time scope to keep (for multi-scope files)", "", false, false}
        },
        cmd_stats
    });

    // lexnet search
    cli.register_command({
        "search",
        "List the seed nodes matching search terms",
        {
            {"input", "i", "Snapshot JSON file", "", true, false},
            {"scope", "s", "Time scope to keep (for multi-scope files)", "", false, false},
            {"terms", "t", "Comma-separated search terms", "", true, false},
            {"fields", "f", "Fields: text,full_name,display_label,definition,entity,concept,properties or any attribute", "text,full_name,entity,concept", false, false},
            {"logic", "l", "Term logic: OR or AND", "OR", false, false}
        },
        cmd_search
    });

    // lexnet expand
    cli.register_command({
        "expand",
        "Expand a seed set over the adjacency index",
        {
            {"input", "i", "Snapshot JSON file", "", true, false},
            {"scope", "s", "Time scope to keep (for multi-scope files)", "", false, false},
            {"seeds", "e", "Comma-separated seed node ids", "", true, false},
            {"depth", "d", "Number of hops", "1", false, false},
            {"max-neighbors", "m", "Neighbors followed per node and hop (0 = unlimited)", "0", false, false},
            {"edge-types", "y", "Edge types to follow", "definition,reference,hierarchy", false, false}
        },
        cmd_expand
    });

    // lexnet query
    cli.register_command({
        "query",
        "Build a filtered network and export it as JSON",
        {
            {"input", "i", "Snapshot JSON file", "", true, false},
            {"scope", "s", "Time scope to keep (for multi-scope files)", "", false, false},
            {"query", "q", "Query JSON file (flags below override it)", "", false, false},
            {"config", "c", "Builder config JSON file (default: LEXNET_* environment)", "", false, false},
            {"terms", "t", "Comma-separated search terms", "", false, false},
            {"fields", "f", "Search fields", "", false, false},
            {"node-types", "n", "Allowed node types", "", false, false},
            {"edge-types", "y", "Allowed edge types", "", false, false},
            {"depth", "d", "Expansion depth", "", false, false},
            {"max-neighbors", "m", "Neighbors followed per node and hop (0 = unlimited)", "", false, false},
            {"max-nodes", "x", "Maximum number of returned nodes", "", false, false},
            {"logic", "l", "Term logic: OR or AND", "", false, false},
            {"ranking", "r", "Truncation ranking: global or subgraph", "", false, false},
            {"link-limit", "k", "Maximum number of returned links", "", false, false},
            {"output", "o", "Output JSON path (default: stdout)", "", false, false},
            {"verbose", "v", "Verbose logging", "", false, true}
        },
        cmd_query
    });

    return cli.run(argc, argv);
}
