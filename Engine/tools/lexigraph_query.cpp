/**
 * @file lexigraph_query.cpp
 * @brief CLI: path and neighborhood queries against Postgres or a JSON graph
 *
 * Usage:
 *   lexigraph_query [--graph FILE] [--detailed] paths SRC DST
 *                   [--max-paths N] [--min-length N] [--max-length N]
 *   lexigraph_query [--graph FILE] neighborhood WORD
 *                   [--max-level N] [--max-nodes N] [--max-edges N]
 *
 * SRC, DST and WORD are word ids or word text. Without --graph the database
 * is reached through LEXIGRAPH_DB_URL / PG* variables.
 */

#include <database/postgres_connection.hpp>
#include <storage/postgres_graph_store.hpp>
#include <storage/graph_document.hpp>
#include <query/graph_query.hpp>
#include <query/result_json.hpp>
#include <config/engine_config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cctype>
#include <algorithm>
#include <stdexcept>

using namespace Lexigraph;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRequest = 2;
constexpr int kExitStore = 3;
constexpr int kExitInternal = 4;

void print_usage() {
    std::cerr
        << "Usage:\n"
        << "  lexigraph_query [--graph FILE] [--detailed] paths SRC DST\n"
        << "                  [--max-paths N] [--min-length N] [--max-length N]\n"
        << "  lexigraph_query [--graph FILE] neighborhood WORD\n"
        << "                  [--max-level N] [--max-nodes N] [--max-edges N]\n";
}

struct Options {
    std::optional<std::string> graph_file;
    bool detailed = false;
    std::string command;
    std::vector<std::string> words;
    std::vector<std::pair<std::string, std::string>> bounds;
};

Options parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--graph") {
            if (i + 1 >= argc) throw InvalidArgumentError("--graph needs a file");
            opts.graph_file = argv[++i];
        } else if (arg == "--detailed") {
            opts.detailed = true;
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) throw InvalidArgumentError(arg + " needs a value");
            opts.bounds.emplace_back(arg, argv[++i]);
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.words.push_back(arg);
        }
    }
    return opts;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

WordId word_ref(GraphQueryService& service, const std::string& ref) {
    if (!is_number(ref)) return service.resolve(ref);
    try {
        return std::stoll(ref);
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError("Word id out of range: " + ref);
    }
}

int run(const Options& opts) {
    std::unique_ptr<PostgresConnection> db;
    std::unique_ptr<GraphStore> store;

    Timer timer;
    if (opts.graph_file) {
        Logger::step("Loading graph document " + *opts.graph_file);
        store = GraphDocument::load_file(*opts.graph_file);
    } else {
        Logger::step("Connecting to database");
        try {
            db = std::make_unique<PostgresConnection>();
        } catch (const DatabaseError& e) {
            throw StoreUnavailableError(e.what());
        }
        store = std::make_unique<PostgresGraphStore>(*db);
    }

    GraphQueryService service(*store, TraversalConfig::from_env());
    nlohmann::json out;

    if (opts.command == "paths") {
        if (opts.words.size() != 2) throw InvalidArgumentError("paths needs SRC and DST");

        PathQuery query = service.default_path_query();
        for (const auto& [flag, value] : opts.bounds) {
            if (flag == "--max-paths") query.max_paths = parse_int(value, flag);
            else if (flag == "--min-length") query.min_length = parse_int(value, flag);
            else if (flag == "--max-length") query.max_length = parse_int(value, flag);
            else throw InvalidArgumentError("Unknown option for paths: " + flag);
        }

        auto paths = service.find_paths(word_ref(service, opts.words[0]),
                                        word_ref(service, opts.words[1]), query);
        if (opts.detailed) {
            out = service.describe_paths(paths);
        } else {
            out = paths;
        }
        Logger::success("Found " + std::to_string(paths.size()) + " path(s) in " +
                        std::to_string(timer.elapsed_ms()) + " ms");
    } else if (opts.command == "neighborhood") {
        if (opts.words.size() != 1) throw InvalidArgumentError("neighborhood needs WORD");

        NeighborhoodQuery query = service.default_neighborhood_query();
        for (const auto& [flag, value] : opts.bounds) {
            if (flag == "--max-level") query.max_level = parse_int(value, flag);
            else if (flag == "--max-nodes") query.max_nodes = parse_int(value, flag);
            else if (flag == "--max-edges") query.max_edges_per_node = parse_int(value, flag);
            else throw InvalidArgumentError("Unknown option for neighborhood: " + flag);
        }

        auto graph = service.get_neighborhood(word_ref(service, opts.words[0]), query);
        out = graph;
        Logger::success("Projected " + std::to_string(graph.node_ids.size()) + " node(s), " +
                        std::to_string(graph.edges.size()) + " edge(s) in " +
                        std::to_string(timer.elapsed_ms()) + " ms");
    } else {
        throw InvalidArgumentError("Unknown command: " + opts.command);
    }

    std::cout << out.dump(2) << std::endl;
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const InvalidArgumentError& e) {
        Logger::error(e.what());
        print_usage();
        return kExitUsage;
    }

    if (opts.command.empty()) {
        print_usage();
        return kExitUsage;
    }

    try {
        return run(opts);
    } catch (const NotFoundError& e) {
        Logger::error(e.what());
        return kExitRequest;
    } catch (const InvalidArgumentError& e) {
        Logger::error(e.what());
        return kExitRequest;
    } catch (const StoreUnavailableError& e) {
        Logger::error(e.what());
        return kExitStore;
    } catch (const std::exception& e) {
        Logger::error(std::string("Internal error: ") + e.what());
        return kExitInternal;
    }
}
