/**
 * @file neighborhood_projector.hpp
 * @brief Level-bounded, node-bounded subgraph around a center word
 */

#pragma once

#include <graph/graph_accessor.hpp>
#include <config/engine_config.hpp>
#include <export.hpp>

namespace Lexigraph {

struct NeighborhoodQuery {
    int max_level = 3;
    int max_nodes = 100;
    int max_edges_per_node = 0;     // <= 0: unbounded

    static NeighborhoodQuery defaults(const TraversalConfig& config) {
        return {config.max_level, config.max_nodes, config.max_edges_per_node};
    }
};

/**
 * @brief Level-synchronous BFS projection for graph display
 *
 * Edges are reported in traversal direction (source = the node being
 * expanded). An edge whose (source, target) or (target, source) key was
 * already recorded is suppressed, so two distinct relations between the same
 * pair collapse into the first one seen.
 *
 * Expansion stops as soon as the node set reaches max_nodes; the subgraph is
 * then flagged truncated if anything was left unexplored. Edges only ever
 * connect recorded nodes.
 */
class LEXIGRAPH_API NeighborhoodProjector {
public:
    explicit NeighborhoodProjector(GraphAccessor& accessor, TraversalConfig config = {});

    /**
     * @throws NotFoundError if the center word does not exist
     * @throws StoreUnavailableError if the store fails mid-expansion (no partial result)
     */
    Subgraph project(WordId center_id, const NeighborhoodQuery& query = {});

    /**
     * @brief Apply defaults to non-positive bounds and clamp to the configured limits
     */
    NeighborhoodQuery normalize(const NeighborhoodQuery& query) const;

private:
    GraphAccessor& accessor_;
    TraversalConfig config_;
};

} // namespace Lexigraph
