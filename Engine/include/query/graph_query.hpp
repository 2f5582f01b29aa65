/**
 * @file graph_query.hpp
 * @brief Caller-facing entry point for path and neighborhood queries
 */

#pragma once

#include <graph/graph_accessor.hpp>
#include <graph/path_finder.hpp>
#include <graph/neighborhood_projector.hpp>
#include <config/engine_config.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace Lexigraph {

/**
 * @brief Graph query service
 *
 * Resolves words by id or text, runs the traversals and hydrates results
 * with word text. Holds no per-request state beyond the injected store;
 * create one per connection / thread when the store is a PostgresGraphStore.
 */
class LEXIGRAPH_API GraphQueryService {
public:
    explicit GraphQueryService(GraphStore& store, TraversalConfig config = {});

    /**
     * @brief Paths with the configured defaults (max_paths, min/max_length)
     */
    std::vector<GraphPath> find_paths(WordId source_id, WordId target_id);
    std::vector<GraphPath> find_paths(WordId source_id, WordId target_id, const PathQuery& query);

    /**
     * @brief Paths between two words given as text (exact, then lowercase match)
     * @throws NotFoundError naming the text that did not resolve
     */
    std::vector<GraphPath> find_paths_by_text(const std::string& source, const std::string& target,
                                              const PathQuery& query);

    /**
     * @brief Hydrate a path's nodes with word text and each hop's relation record
     * @throws NotFoundError if a node or relation was deleted since the path was found
     */
    PathDetail describe_path(const GraphPath& path);
    std::vector<PathDetail> describe_paths(const std::vector<GraphPath>& paths);

    Subgraph get_neighborhood(WordId word_id);
    Subgraph get_neighborhood(WordId word_id, const NeighborhoodQuery& query);
    Subgraph get_neighborhood_by_text(const std::string& text, const NeighborhoodQuery& query);

    /**
     * @brief Word id for a display or normalized text
     * @throws NotFoundError
     */
    WordId resolve(const std::string& text);

    PathQuery default_path_query() const { return PathQuery::defaults(config_); }
    NeighborhoodQuery default_neighborhood_query() const { return NeighborhoodQuery::defaults(config_); }
    const TraversalConfig& config() const { return config_; }

private:
    Relation relation_of(WordId word_id, RelationId relation_id);

    GraphStore& store_;
    TraversalConfig config_;
    GraphAccessor accessor_;
};

} // namespace Lexigraph
