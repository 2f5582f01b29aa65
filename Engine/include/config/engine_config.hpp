/**
 * @file engine_config.hpp
 * @brief Environment-driven database and traversal configuration
 */

#pragma once

#include <export.hpp>
#include <string>
#include <optional>

namespace Lexigraph {

/**
 * @brief libpq connection parameters
 *
 * LEXIGRAPH_DB_URL wins when set; otherwise the standard PG* variables are
 * read with defaults localhost / 5432 / lexigraph / postgres.
 */
struct LEXIGRAPH_API DatabaseConfig {
    std::optional<std::string> url;
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "lexigraph";
    std::string user = "postgres";
    std::optional<std::string> password;

    static DatabaseConfig from_env();

    /**
     * @brief Connection string for PQconnectdb
     */
    std::string conninfo() const;
};

/**
 * @brief Defaults and hard limits for traversal requests
 */
struct LEXIGRAPH_API TraversalConfig {
    // Path finder
    int max_paths = 10;
    int min_length = 1;
    int max_length = 10;
    int max_paths_limit = 50;       // <= 0: no limit
    int max_length_limit = 10;      // <= 0: no limit

    // Neighborhood projector
    int max_level = 3;
    int max_nodes = 100;
    int max_edges_per_node = 0;     // 0 = unbounded
    int max_level_limit = 5;
    int max_nodes_limit = 200;

    /**
     * @brief Defaults overridden by LEXIGRAPH_MAX_PATHS, LEXIGRAPH_MAX_LENGTH,
     * LEXIGRAPH_MAX_LEVEL, LEXIGRAPH_MAX_NODES and LEXIGRAPH_MAX_EDGES; path
     * limits by LEXIGRAPH_MAX_PATHS_LIMIT and LEXIGRAPH_MAX_LENGTH_LIMIT.
     *
     * @throws InvalidArgumentError on a non-integer value
     */
    static TraversalConfig from_env();
};

/**
 * @brief Parse a base-10 integer, rejecting trailing garbage.
 * @throws InvalidArgumentError naming `what` on failure
 */
LEXIGRAPH_API int parse_int(const std::string& text, const std::string& what);

} // namespace Lexigraph
