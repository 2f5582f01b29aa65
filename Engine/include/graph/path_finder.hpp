/**
 * @file path_finder.hpp
 * @brief Bounded enumeration of simple paths between two words
 *
 * Breadth-first over a FIFO queue of partial paths, so shorter paths are
 * found first. Partial paths live in an arena of parent-linked records; a
 * path's node sequence is rebuilt only when it reaches the target.
 *
 * Relations are walked in either direction. Parallel relations between the
 * same pair are distinct hops and may yield paths that share a node sequence
 * but differ in relation ids and strength.
 */

#pragma once

#include <graph/graph_accessor.hpp>
#include <config/engine_config.hpp>
#include <export.hpp>
#include <vector>

namespace Lexigraph {

struct PathQuery {
    int max_paths = 10;
    int min_length = 1;
    int max_length = 10;

    static PathQuery defaults(const TraversalConfig& config) {
        return {config.max_paths, config.min_length, config.max_length};
    }
};

struct PathSearchStats {
    size_t partial_paths = 0;   // Records created in the arena
    size_t expansions = 0;      // Adjacency fetches
};

/**
 * @brief Path enumeration over one accessor
 *
 * Search state is local to each find_paths() call; only last_stats() is kept.
 * Use one PathFinder per thread. Requests above the configured
 * max_paths_limit / max_length_limit are rejected.
 */
class LEXIGRAPH_API PathFinder {
public:
    explicit PathFinder(GraphAccessor& accessor, TraversalConfig config = {});

    /**
     * @brief Up to max_paths simple paths with min_length <= hops <= max_length
     *
     * source == target yields the single zero-length path when
     * min_length <= 0 <= max_length, otherwise nothing.
     *
     * Neighbors whose word no longer exists (stale relations) are skipped.
     *
     * @throws InvalidArgumentError if max_paths <= 0, a length is negative,
     *         max_length < min_length or a bound exceeds its configured limit
     * @throws NotFoundError if either word does not exist
     * @throws StoreUnavailableError if the store fails mid-search (no partial result)
     */
    std::vector<GraphPath> find_paths(WordId source_id, WordId target_id, const PathQuery& query = {});

    const PathSearchStats& last_stats() const { return stats_; }

private:
    static constexpr size_t kNoParent = static_cast<size_t>(-1);

    struct PartialPath {
        WordId node;
        size_t parent;              // Arena index, kNoParent for the root
        RelationId relation_id;     // Relation from parent to node
        double strength;            // Product of hop strengths so far
        int length;
    };

    using Arena = std::vector<PartialPath>;

    void validate(const PathQuery& query) const;
    static bool on_path(const Arena& arena, size_t record, WordId word);
    static GraphPath materialize(const Arena& arena, size_t record);

    GraphAccessor& accessor_;
    TraversalConfig config_;
    PathSearchStats stats_;
};

} // namespace Lexigraph
