/**
 * @file graph_query.cpp
 * @brief Graph query service implementation
 */

#include <query/graph_query.hpp>
#include <core/errors.hpp>

namespace Lexigraph {

namespace {

WordBrief brief_of(const Word& word) {
    return {word.id, word.text, word.normalized_text, word.length};
}

} // namespace

GraphQueryService::GraphQueryService(GraphStore& store, TraversalConfig config)
    : store_(store), config_(config), accessor_(store) {}

WordId GraphQueryService::resolve(const std::string& text) {
    auto word = store_.find_word_by_text(text);
    if (!word) {
        throw NotFoundError("Word '" + text + "' not found");
    }
    return word->id;
}

std::vector<GraphPath> GraphQueryService::find_paths(WordId source_id, WordId target_id) {
    return find_paths(source_id, target_id, default_path_query());
}

std::vector<GraphPath> GraphQueryService::find_paths(WordId source_id, WordId target_id, const PathQuery& query) {
    PathFinder finder(accessor_, config_);
    return finder.find_paths(source_id, target_id, query);
}

std::vector<GraphPath> GraphQueryService::find_paths_by_text(const std::string& source, const std::string& target,
                                                             const PathQuery& query) {
    WordId source_id = resolve(source);
    WordId target_id = resolve(target);
    return find_paths(source_id, target_id, query);
}

Relation GraphQueryService::relation_of(WordId word_id, RelationId relation_id) {
    for (auto& rel : store_.relations_of(word_id)) {
        if (rel.id == relation_id) return rel;
    }
    throw NotFoundError("Relation " + std::to_string(relation_id) + " not found");
}

PathDetail GraphQueryService::describe_path(const GraphPath& path) {
    PathDetail detail;
    detail.length = path.length;
    detail.total_strength = path.total_strength;
    detail.path.reserve(path.path.size());

    for (size_t i = 0; i < path.path.size(); ++i) {
        Word word = accessor_.word(path.path[i]);

        PathDetail::Node node{word.id, brief_of(word), std::nullopt, std::nullopt};
        if (i < path.relations.size()) {
            node.relation_id = path.relations[i];
            node.relation = relation_of(word.id, path.relations[i]);
        }
        detail.path.push_back(std::move(node));
    }

    return detail;
}

std::vector<PathDetail> GraphQueryService::describe_paths(const std::vector<GraphPath>& paths) {
    std::vector<PathDetail> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(describe_path(p));
    }
    return out;
}

Subgraph GraphQueryService::get_neighborhood(WordId word_id) {
    return get_neighborhood(word_id, default_neighborhood_query());
}

Subgraph GraphQueryService::get_neighborhood(WordId word_id, const NeighborhoodQuery& query) {
    NeighborhoodProjector projector(accessor_, config_);
    return projector.project(word_id, query);
}

Subgraph GraphQueryService::get_neighborhood_by_text(const std::string& text, const NeighborhoodQuery& query) {
    return get_neighborhood(resolve(text), query);
}

} // namespace Lexigraph
