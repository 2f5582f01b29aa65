#pragma once

#if defined(_WIN32)
    #if defined(LEXIGRAPH_EXPORT)
        #define LEXIGRAPH_API __declspec(dllexport)
    #else
        #define LEXIGRAPH_API __declspec(dllimport)
    #endif
#else
    #define LEXIGRAPH_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

typedef enum {
    L_OK = 0,
    L_NOT_FOUND = 1,
    L_INVALID_ARGUMENT = 2,
    L_STORE_UNAVAILABLE = 3,
    L_INTERNAL = 4
} L_ERROR_CODE;

// Thread-local error storage, set by the last failing call on this thread
LEXIGRAPH_API const char* lexigraph_get_last_error();
LEXIGRAPH_API L_ERROR_CODE lexigraph_get_last_error_code();
LEXIGRAPH_API const char* lexigraph_get_version();

// =============================================================================
//  Opaque Handles
// =============================================================================

typedef void* l_db_connection_t;
typedef void* l_graph_t;

// =============================================================================
//  Database Connection
// =============================================================================

// NULL connection_string: configuration from LEXIGRAPH_DB_URL / PG* variables
LEXIGRAPH_API l_db_connection_t lexigraph_db_create(const char* connection_string);
LEXIGRAPH_API void lexigraph_db_destroy(l_db_connection_t handle);
LEXIGRAPH_API bool lexigraph_db_is_connected(l_db_connection_t handle);

// =============================================================================
//  Graph Handles
// =============================================================================

// Graph over the database tables. The connection must outlive the graph and
// must not be used from two threads at once.
LEXIGRAPH_API l_graph_t lexigraph_graph_open_db(l_db_connection_t db_handle);

// Graph over an in-memory copy of a JSON graph document. Safe to query from
// several threads.
LEXIGRAPH_API l_graph_t lexigraph_graph_load_json(const char* document);
LEXIGRAPH_API l_graph_t lexigraph_graph_load_file(const char* path);

LEXIGRAPH_API void lexigraph_graph_destroy(l_graph_t handle);

// =============================================================================
//  Traversal
// =============================================================================

typedef struct LPathQuery {
    int max_paths;
    int min_length;
    int max_length;
} LPathQuery;

typedef struct LNeighborhoodQuery {
    int max_level;
    int max_nodes;
    int max_edges_per_node;   // <= 0: unbounded
} LNeighborhoodQuery;

LEXIGRAPH_API void lexigraph_path_query_defaults(LPathQuery* out_query);
LEXIGRAPH_API void lexigraph_neighborhood_query_defaults(LNeighborhoodQuery* out_query);

// Results are JSON strings owned by the caller; release with
// lexigraph_free_string(). NULL on failure (see lexigraph_get_last_error).
// With `detailed`, each path node carries its word text.
LEXIGRAPH_API char* lexigraph_find_paths_json(l_graph_t handle, int64_t source_id, int64_t target_id,
                                              const LPathQuery* query, bool detailed);
LEXIGRAPH_API char* lexigraph_neighborhood_json(l_graph_t handle, int64_t word_id,
                                                const LNeighborhoodQuery* query);

// Word id by display or normalized text; false if absent or on error
LEXIGRAPH_API bool lexigraph_resolve_word(l_graph_t handle, const char* text, int64_t* out_id);

LEXIGRAPH_API void lexigraph_free_string(char* str);

#ifdef __cplusplus
}
#endif
