#pragma once

#include "graph/legal_graph.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lexnet {

/**
 * @brief Bad command line (unknown option, missing value, bad number)
 *
 * CLI::run prints the command help after these; other exceptions from a
 * handler are reported without it.
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// One option as seen on the command line (or its default)
struct ArgValue {
    std::string name;
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;
        size_t consumed = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(value, &consumed);
        } catch (const std::exception&) {
            throw UsageError("--" + name + " expects an integer, got '" + value + "'");
        }
        if (consumed != value.size()) {
            throw UsageError("--" + name + " expects an integer, got '" + value + "'");
        }
        return parsed;
    }

    // Strictly positive count, for limits where 0 has no meaning
    size_t as_count() const {
        int parsed = as_int(0);
        if (parsed <= 0) {
            throw UsageError("--" + name + " must be a positive number");
        }
        return static_cast<size_t>(parsed);
    }

    // Comma-separated list, items trimmed, empties dropped
    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> result;
        if (!is_set) return result;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, delim)) {
            auto first = item.find_first_not_of(" \t");
            if (first == std::string::npos) continue;
            auto last = item.find_last_not_of(" \t");
            result.push_back(item.substr(first, last - first + 1));
        }
        return result;
    }

    // "section,entity" -> node types; an unknown name is a usage error
    std::vector<NodeType> as_node_types() const {
        std::vector<NodeType> types;
        for (const auto& item : as_list()) {
            try {
                types.push_back(parse_node_type(item));
            } catch (const std::invalid_argument& e) {
                throw UsageError("--" + name + ": " + e.what());
            }
        }
        return types;
    }

    std::vector<EdgeType> as_edge_types() const {
        std::vector<EdgeType> types;
        for (const auto& item : as_list()) {
            try {
                types.push_back(parse_edge_type(item));
            } catch (const std::invalid_argument& e) {
                throw UsageError("--" + name + ": " + e.what());
            }
        }
        return types;
    }
};

// Options of one parsed command line
class Args {
public:
    std::map<std::string, ArgValue> named;

    ArgValue get(const std::string& name, const std::string& default_val = "") const {
        auto it = named.find(name);
        if (it != named.end()) return it->second;
        return ArgValue{name, default_val, !default_val.empty()};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        auto it = named.find(name);
        if (it == named.end() || !it->second.is_set) {
            throw UsageError("Missing required argument: --" + name);
        }
        return it->second.value;
    }
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;  // Presence means true
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    const ArgDef* find_arg(const std::string& token) const {
        for (const auto& arg : args) {
            if (token == "--" + arg.name) return &arg;
            if (!arg.short_name.empty() && token == "-" + arg.short_name) return &arg;
        }
        return nullptr;
    }

    void print_help(const std::string& program_name) const {
        std::cout << "\nUsage: " << program_name << " " << name;
        for (const auto& arg : args) {
            if (arg.required) {
                std::cout << " --" << arg.name << " <value>";
            }
        }
        std::cout << " [options]\n\n";
        std::cout << description << "\n\n";
        std::cout << "Options:\n";
        for (const auto& arg : args) {
            std::cout << "  --" << arg.name;
            if (!arg.short_name.empty()) {
                std::cout << ", -" << arg.short_name;
            }
            if (!arg.is_flag) {
                std::cout << " <value>";
            }
            std::cout << "\n      " << arg.description;
            if (!arg.default_value.empty()) {
                std::cout << " (default: " << arg.default_value << ")";
            }
            if (arg.required) {
                std::cout << " [required]";
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

/**
 * @brief Subcommand dispatcher for the lexnet tool
 *
 * Commands are listed in registration order, which follows the query
 * pipeline (inspect, search, expand, build).
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        auto existing = find_command(cmd.name);
        if (existing) {
            *existing = std::move(cmd);
            return;
        }
        commands_.push_back(std::move(cmd));
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string cmd_name = argv[1];

        if (cmd_name == "--help" || cmd_name == "-h") {
            print_help();
            return 0;
        }

        if (cmd_name == "--version" || cmd_name == "-V") {
            std::cout << program_name_ << " version " << version_ << "\n";
            return 0;
        }

        const Command* cmd = find_command(cmd_name);
        if (!cmd) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd->print_help(program_name_);
                return 0;
            }
        }

        try {
            Args args = parse_args(argc - 2, argv + 2, *cmd);
            return cmd->handler(args);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd->print_help(program_name_);
            return 2;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " - legal-code network builder\n\n";
        std::cout << "Usage: " << program_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& cmd : commands_) {
            std::cout << "  " << cmd.name;
            for (size_t i = cmd.name.length(); i < 10; ++i) std::cout << " ";
            std::cout << cmd.description << "\n";
        }
        std::cout << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
        std::cout << "Query defaults may also come from LEXNET_SEARCH_LOGIC, LEXNET_RANKING_MODE,\n"
                  << "LEXNET_LINK_LIMIT and LEXNET_VERBOSE.\n";
    }

private:
    Command* find_command(const std::string& name) {
        auto it = std::find_if(commands_.begin(), commands_.end(),
            [&name](const Command& cmd) { return cmd.name == name; });
        return it == commands_.end() ? nullptr : &(*it);
    }

    const Command* find_command(const std::string& name) const {
        auto it = std::find_if(commands_.begin(), commands_.end(),
            [&name](const Command& cmd) { return cmd.name == name; });
        return it == commands_.end() ? nullptr : &(*it);
    }

    // --name value, --name=value, -n value, or a bare flag
    static Args parse_args(int argc, char** argv, const Command& cmd) {
        Args result;

        for (int i = 0; i < argc; ++i) {
            std::string token = argv[i];
            std::string inline_value;
            bool has_inline_value = false;

            auto eq_pos = token.find('=');
            if (token.rfind("--", 0) == 0 && eq_pos != std::string::npos) {
                inline_value = token.substr(eq_pos + 1);
                token = token.substr(0, eq_pos);
                has_inline_value = true;
            }

            const ArgDef* def = cmd.find_arg(token);
            if (!def) {
                throw UsageError("Unknown argument: " + std::string(argv[i]));
            }

            if (def->is_flag) {
                if (has_inline_value) {
                    throw UsageError("Flag " + token + " takes no value");
                }
                result.named[def->name] = ArgValue{def->name, "true", true};
            } else if (has_inline_value) {
                result.named[def->name] = ArgValue{def->name, inline_value, true};
            } else {
                if (i + 1 >= argc) {
                    throw UsageError("Argument " + token + " requires a value");
                }
                result.named[def->name] = ArgValue{def->name, argv[++i], true};
            }
        }

        for (const auto& arg : cmd.args) {
            if (result.named.count(arg.name)) continue;
            if (arg.required) {
                throw UsageError("Missing required argument: --" + arg.name);
            }
            if (!arg.default_value.empty()) {
                result.named[arg.name] = ArgValue{arg.name, arg.default_value, true};
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::vector<Command> commands_;
};

} // namespace lexnet
