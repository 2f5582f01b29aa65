#include <graph/neighborhood_projector.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace Lexigraph {

namespace {

struct EdgeKeyHasher {
    size_t operator()(const std::pair<WordId, WordId>& k) const {
        size_t h = std::hash<WordId>{}(k.first);
        h ^= std::hash<WordId>{}(k.second) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace

NeighborhoodProjector::NeighborhoodProjector(GraphAccessor& accessor, TraversalConfig config)
    : accessor_(accessor), config_(config) {}

NeighborhoodQuery NeighborhoodProjector::normalize(const NeighborhoodQuery& query) const {
    NeighborhoodQuery out = query;

    if (out.max_level <= 0) out.max_level = config_.max_level > 0 ? config_.max_level : 3;
    if (out.max_nodes <= 0) out.max_nodes = config_.max_nodes > 0 ? config_.max_nodes : 100;
    if (config_.max_level_limit > 0) out.max_level = std::min(out.max_level, config_.max_level_limit);
    if (config_.max_nodes_limit > 0) out.max_nodes = std::min(out.max_nodes, config_.max_nodes_limit);
    if (out.max_edges_per_node < 0) out.max_edges_per_node = 0;

    return out;
}

Subgraph NeighborhoodProjector::project(WordId center_id, const NeighborhoodQuery& request) {
    if (!accessor_.word_exists(center_id)) {
        throw NotFoundError("Word " + std::to_string(center_id) + " not found");
    }

    const NeighborhoodQuery query = normalize(request);
    const size_t max_nodes = static_cast<size_t>(query.max_nodes);
    const size_t edge_cap = static_cast<size_t>(query.max_edges_per_node);

    Subgraph graph;
    std::unordered_map<WordId, int> levels;     // Recorded nodes -> discovery level
    std::unordered_set<std::pair<WordId, WordId>, EdgeKeyHasher> seen_edges;
    std::unordered_set<WordId> visited;
    std::deque<std::pair<WordId, int>> queue;

    auto record_node = [&](WordId id, int level) {
        levels.emplace(id, level);
        graph.node_ids.push_back(id);
        graph.nodes.push_back({id, level});
    };

    record_node(center_id, 0);
    visited.insert(center_id);
    queue.emplace_back(center_id, 0);

    bool full = graph.node_ids.size() >= max_nodes;
    bool refused = false;

    while (!queue.empty() && !full) {
        auto [current, level] = queue.front();
        queue.pop_front();

        if (level >= query.max_level) continue;

        auto edges = accessor_.adjacency(current);
        if (edge_cap > 0 && edges.size() > edge_cap) {
            edges.resize(edge_cap);
        }

        for (const auto& edge : edges) {
            const WordId neighbor = edge.neighbor_id;

            // Stale relation: the neighbor word was deleted
            if (!accessor_.word_exists(neighbor)) continue;

            auto known = levels.find(neighbor);
            if (known == levels.end()) {
                if (graph.node_ids.size() >= max_nodes) {
                    refused = true;
                    continue;
                }
                record_node(neighbor, level + 1);
                known = levels.find(neighbor);
            }

            std::pair<WordId, WordId> key{current, neighbor};
            std::pair<WordId, WordId> reverse{neighbor, current};
            if (!seen_edges.count(key) && !seen_edges.count(reverse)) {
                seen_edges.insert(key);
                graph.edges.push_back({edge.relation_id, current, neighbor, known->second,
                                       edge.strength, edge.relation_type});
            }

            if (visited.insert(neighbor).second) {
                queue.emplace_back(neighbor, level + 1);
            }
        }

        full = graph.node_ids.size() >= max_nodes;
    }

    if (full) {
        bool unexplored = std::any_of(queue.begin(), queue.end(), [&](const auto& entry) {
            return entry.second < query.max_level;
        });
        graph.truncated = refused || unexplored;
    }

    Logger::debug("neighborhood of " + std::to_string(center_id) + ": " +
                  std::to_string(graph.node_ids.size()) + " node(s), " +
                  std::to_string(graph.edges.size()) + " edge(s)" +
                  (graph.truncated ? " (truncated)" : ""));

    return graph;
}

} // namespace Lexigraph
