#include <interop_api.h>
#include <database/postgres_connection.hpp>
#include <storage/postgres_graph_store.hpp>
#include <storage/graph_document.hpp>
#include <query/graph_query.hpp>
#include <query/result_json.hpp>
#include <core/errors.hpp>
#include <config/engine_config.hpp>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <string>

// Thread-local error storage
thread_local std::string g_last_error;
thread_local L_ERROR_CODE g_last_error_code = L_OK;

const char* lexigraph_get_last_error() {
    return g_last_error.c_str();
}

L_ERROR_CODE lexigraph_get_last_error_code() {
    return g_last_error_code;
}

const char* lexigraph_get_version() {
    return "0.1.0";
}

using namespace Lexigraph;

namespace {

struct GraphHandle {
    std::unique_ptr<GraphStore> store;
    std::unique_ptr<GraphQueryService> service;
};

void set_error(L_ERROR_CODE code, const std::exception& e) {
    g_last_error_code = code;
    g_last_error = e.what();
}

void clear_error() {
    g_last_error_code = L_OK;
    g_last_error.clear();
}

char* strdup_safe(const std::string& str) {
    char* out = static_cast<char*>(std::malloc(str.size() + 1));
    if (!out) throw std::bad_alloc();
    std::memcpy(out, str.c_str(), str.size() + 1);
    return out;
}

GraphHandle* make_handle(std::unique_ptr<GraphStore> store) {
    auto handle = std::make_unique<GraphHandle>();
    handle->service = std::make_unique<GraphQueryService>(*store, TraversalConfig::from_env());
    handle->store = std::move(store);
    return handle.release();
}

GraphHandle* as_graph(l_graph_t handle) {
    if (!handle) throw InvalidArgumentError("Invalid graph handle");
    return static_cast<GraphHandle*>(handle);
}

} // namespace

// Maps the engine's exception hierarchy onto L_ERROR_CODE
#define INTEROP_TRY_CATCH(fail_value, ...) \
    try { \
        clear_error(); \
        __VA_ARGS__ \
    } catch (const Lexigraph::NotFoundError& e) { \
        set_error(L_NOT_FOUND, e); \
        return fail_value; \
    } catch (const Lexigraph::InvalidArgumentError& e) { \
        set_error(L_INVALID_ARGUMENT, e); \
        return fail_value; \
    } catch (const Lexigraph::StoreUnavailableError& e) { \
        set_error(L_STORE_UNAVAILABLE, e); \
        return fail_value; \
    } catch (const Lexigraph::DatabaseError& e) { \
        set_error(L_STORE_UNAVAILABLE, e); \
        return fail_value; \
    } catch (const std::exception& e) { \
        set_error(L_INTERNAL, e); \
        return fail_value; \
    }

// =============================================================================
//  Database Connection
// =============================================================================

l_db_connection_t lexigraph_db_create(const char* connection_string) {
    INTEROP_TRY_CATCH(nullptr, {
        auto* db = connection_string
            ? new Lexigraph::PostgresConnection(connection_string)
            : new Lexigraph::PostgresConnection();
        return static_cast<l_db_connection_t>(db);
    })
}

void lexigraph_db_destroy(l_db_connection_t handle) {
    if (handle) {
        delete static_cast<Lexigraph::PostgresConnection*>(handle);
    }
}

bool lexigraph_db_is_connected(l_db_connection_t handle) {
    if (!handle) return false;
    auto* db = static_cast<Lexigraph::PostgresConnection*>(handle);
    return db->is_connected();
}

// =============================================================================
//  Graph Handles
// =============================================================================

l_graph_t lexigraph_graph_open_db(l_db_connection_t db_handle) {
    INTEROP_TRY_CATCH(nullptr, {
        if (!db_handle) throw InvalidArgumentError("Invalid database handle");
        auto* db = static_cast<Lexigraph::PostgresConnection*>(db_handle);
        return static_cast<l_graph_t>(make_handle(std::make_unique<PostgresGraphStore>(*db)));
    })
}

l_graph_t lexigraph_graph_load_json(const char* document) {
    INTEROP_TRY_CATCH(nullptr, {
        if (!document) throw InvalidArgumentError("Graph document is NULL");
        return static_cast<l_graph_t>(make_handle(GraphDocument::parse(document)));
    })
}

l_graph_t lexigraph_graph_load_file(const char* path) {
    INTEROP_TRY_CATCH(nullptr, {
        if (!path) throw InvalidArgumentError("Graph file path is NULL");
        return static_cast<l_graph_t>(make_handle(GraphDocument::load_file(path)));
    })
}

void lexigraph_graph_destroy(l_graph_t handle) {
    if (handle) {
        delete static_cast<GraphHandle*>(handle);
    }
}

// =============================================================================
//  Traversal
// =============================================================================

void lexigraph_path_query_defaults(LPathQuery* out_query) {
    if (!out_query) return;
    Lexigraph::PathQuery defaults;
    out_query->max_paths = defaults.max_paths;
    out_query->min_length = defaults.min_length;
    out_query->max_length = defaults.max_length;
}

void lexigraph_neighborhood_query_defaults(LNeighborhoodQuery* out_query) {
    if (!out_query) return;
    Lexigraph::NeighborhoodQuery defaults;
    out_query->max_level = defaults.max_level;
    out_query->max_nodes = defaults.max_nodes;
    out_query->max_edges_per_node = defaults.max_edges_per_node;
}

char* lexigraph_find_paths_json(l_graph_t handle, int64_t source_id, int64_t target_id,
                                const LPathQuery* query, bool detailed) {
    INTEROP_TRY_CATCH(nullptr, {
        auto* graph = as_graph(handle);

        Lexigraph::PathQuery q = graph->service->default_path_query();
        if (query) {
            q.max_paths = query->max_paths;
            q.min_length = query->min_length;
            q.max_length = query->max_length;
        }

        auto paths = graph->service->find_paths(source_id, target_id, q);

        nlohmann::json out;
        if (detailed) {
            out = graph->service->describe_paths(paths);
        } else {
            out = paths;
        }
        return strdup_safe(out.dump());
    })
}

char* lexigraph_neighborhood_json(l_graph_t handle, int64_t word_id, const LNeighborhoodQuery* query) {
    INTEROP_TRY_CATCH(nullptr, {
        auto* graph = as_graph(handle);

        Lexigraph::NeighborhoodQuery q = graph->service->default_neighborhood_query();
        if (query) {
            q.max_level = query->max_level;
            q.max_nodes = query->max_nodes;
            q.max_edges_per_node = query->max_edges_per_node;
        }

        nlohmann::json out = graph->service->get_neighborhood(word_id, q);
        return strdup_safe(out.dump());
    })
}

bool lexigraph_resolve_word(l_graph_t handle, const char* text, int64_t* out_id) {
    INTEROP_TRY_CATCH(false, {
        if (!text || !out_id) throw InvalidArgumentError("NULL argument");
        *out_id = as_graph(handle)->service->resolve(text);
        return true;
    })
}

void lexigraph_free_string(char* str) {
    std::free(str);
}
