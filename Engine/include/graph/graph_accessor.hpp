/**
 * @file graph_accessor.hpp
 * @brief Store records -> directed adjacency tuples
 */

#pragma once

#include <storage/graph_store.hpp>
#include <export.hpp>
#include <vector>

namespace Lexigraph {

/**
 * @brief Thin read-only adapter between a GraphStore and the traversals
 *
 * A relation where the queried word is the source yields an Outgoing edge to
 * its target; where it is the target, an Incoming edge to its source. A
 * self-loop yields both. Adjacency is sorted by (relation id, direction) so
 * capped traversals are reproducible for a given store state.
 */
class LEXIGRAPH_API GraphAccessor {
public:
    explicit GraphAccessor(GraphStore& store);

    /**
     * @throws NotFoundError if the word does not exist
     * @throws StoreUnavailableError if the store's I/O fails
     */
    std::vector<AdjacentEdge> adjacency(WordId word_id);

    bool word_exists(WordId word_id);

    /**
     * @throws NotFoundError if the word does not exist
     */
    Word word(WordId word_id);

    GraphStore& store() { return store_; }

private:
    GraphStore& store_;
};

} // namespace Lexigraph
