#include <graph/graph_accessor.hpp>
#include <core/errors.hpp>
#include <algorithm>

namespace Lexigraph {

GraphAccessor::GraphAccessor(GraphStore& store) : store_(store) {}

std::vector<AdjacentEdge> GraphAccessor::adjacency(WordId word_id) {
    if (!store_.word_exists(word_id)) {
        throw NotFoundError("Word " + std::to_string(word_id) + " not found");
    }

    std::vector<AdjacentEdge> edges;
    for (const auto& rel : store_.relations_of(word_id)) {
        if (rel.source_word_id == word_id) {
            edges.push_back({rel.target_word_id, rel.id, EdgeDirection::Outgoing,
                             rel.strength, rel.relation_type});
        }
        if (rel.target_word_id == word_id) {
            edges.push_back({rel.source_word_id, rel.id, EdgeDirection::Incoming,
                             rel.strength, rel.relation_type});
        }
    }

    std::stable_sort(edges.begin(), edges.end(), [](const AdjacentEdge& a, const AdjacentEdge& b) {
        if (a.relation_id != b.relation_id) return a.relation_id < b.relation_id;
        return a.direction == EdgeDirection::Outgoing && b.direction == EdgeDirection::Incoming;
    });

    return edges;
}

bool GraphAccessor::word_exists(WordId word_id) {
    return store_.word_exists(word_id);
}

Word GraphAccessor::word(WordId word_id) {
    auto word = store_.get_word(word_id);
    if (!word) {
        throw NotFoundError("Word " + std::to_string(word_id) + " not found");
    }
    return *word;
}

} // namespace Lexigraph
