/**
 * @file path_finder.cpp
 * @brief FIFO breadth-first path enumeration
 */

#include <graph/path_finder.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <deque>

namespace Lexigraph {

PathFinder::PathFinder(GraphAccessor& accessor, TraversalConfig config)
    : accessor_(accessor), config_(config) {}

void PathFinder::validate(const PathQuery& query) const {
    if (query.max_paths <= 0) {
        throw InvalidArgumentError("max_paths must be positive, got " + std::to_string(query.max_paths));
    }
    if (query.min_length < 0 || query.max_length < 0) {
        throw InvalidArgumentError("path lengths must be non-negative");
    }
    if (query.max_length < query.min_length) {
        throw InvalidArgumentError("max_length (" + std::to_string(query.max_length) +
                                   ") is less than min_length (" + std::to_string(query.min_length) + ")");
    }
    if (config_.max_paths_limit > 0 && query.max_paths > config_.max_paths_limit) {
        throw InvalidArgumentError("max_paths " + std::to_string(query.max_paths) +
                                   " exceeds the limit of " + std::to_string(config_.max_paths_limit));
    }
    if (config_.max_length_limit > 0 && query.max_length > config_.max_length_limit) {
        throw InvalidArgumentError("max_length " + std::to_string(query.max_length) +
                                   " exceeds the limit of " + std::to_string(config_.max_length_limit));
    }
}

bool PathFinder::on_path(const Arena& arena, size_t record, WordId word) {
    for (size_t i = record; i != kNoParent; i = arena[i].parent) {
        if (arena[i].node == word) return true;
    }
    return false;
}

GraphPath PathFinder::materialize(const Arena& arena, size_t record) {
    GraphPath out;
    out.length = arena[record].length;
    out.total_strength = arena[record].strength;

    for (size_t i = record; i != kNoParent; i = arena[i].parent) {
        out.path.push_back(arena[i].node);
        if (arena[i].parent != kNoParent) {
            out.relations.push_back(arena[i].relation_id);
        }
    }
    std::reverse(out.path.begin(), out.path.end());
    std::reverse(out.relations.begin(), out.relations.end());
    return out;
}

std::vector<GraphPath> PathFinder::find_paths(WordId source_id, WordId target_id, const PathQuery& query) {
    validate(query);

    if (!accessor_.word_exists(source_id)) {
        throw NotFoundError("Source word " + std::to_string(source_id) + " not found");
    }
    if (!accessor_.word_exists(target_id)) {
        throw NotFoundError("Target word " + std::to_string(target_id) + " not found");
    }

    stats_ = {};

    std::vector<GraphPath> paths;

    if (source_id == target_id) {
        if (query.min_length <= 0 && 0 <= query.max_length) {
            GraphPath trivial;
            trivial.path = {source_id};
            paths.push_back(std::move(trivial));
        }
        return paths;
    }

    const size_t max_paths = static_cast<size_t>(query.max_paths);

    Arena arena;
    arena.push_back({source_id, kNoParent, 0, 1.0, 0});
    std::deque<size_t> queue{0};

    while (!queue.empty() && paths.size() < max_paths) {
        size_t current = queue.front();
        queue.pop_front();

        // Copy: arena may reallocate below
        const PartialPath partial = arena[current];
        if (partial.length >= query.max_length) continue;

        auto edges = accessor_.adjacency(partial.node);
        stats_.expansions++;

        for (const auto& edge : edges) {
            if (on_path(arena, current, edge.neighbor_id)) continue;

            // Stale relation: the neighbor word was deleted
            if (edge.neighbor_id != target_id && !accessor_.word_exists(edge.neighbor_id)) continue;

            arena.push_back({edge.neighbor_id, current, edge.relation_id,
                             partial.strength * edge.strength, partial.length + 1});
            size_t extended = arena.size() - 1;

            if (edge.neighbor_id == target_id) {
                int length = partial.length + 1;
                if (length >= query.min_length && length <= query.max_length) {
                    paths.push_back(materialize(arena, extended));
                    if (paths.size() >= max_paths) break;
                }
            } else {
                queue.push_back(extended);
            }
        }
    }

    stats_.partial_paths = arena.size();

    Logger::debug("find_paths " + std::to_string(source_id) + " -> " + std::to_string(target_id) +
                  ": " + std::to_string(paths.size()) + " path(s), " +
                  std::to_string(stats_.expansions) + " expansion(s), " +
                  std::to_string(stats_.partial_paths) + " partial path(s)");

    return paths;
}

} // namespace Lexigraph
