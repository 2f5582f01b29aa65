#include <query/result_json.hpp>

namespace Lexigraph {

void to_json(nlohmann::json& j, const GraphPath& path) {
    j = nlohmann::json{
        {"path", path.path},
        {"relations", path.relations},
        {"length", path.length},
        {"total_strength", path.total_strength}
    };
}

void to_json(nlohmann::json& j, const WordBrief& word) {
    j = nlohmann::json{
        {"id", word.id},
        {"word", word.word},
        {"normalized_word", word.normalized_word},
        {"length", word.length}
    };
}

void to_json(nlohmann::json& j, const Relation& relation) {
    j = nlohmann::json{
        {"id", relation.id},
        {"source_word_id", relation.source_word_id},
        {"target_word_id", relation.target_word_id},
        {"strength", relation.strength},
        {"description", relation.description}
    };
    j["relation_type"] = relation.relation_type
        ? nlohmann::json(std::string(to_string(*relation.relation_type)))
        : nlohmann::json(nullptr);
    j["title"] = relation.title ? nlohmann::json(*relation.title) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const PathDetail& detail) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : detail.path) {
        nlohmann::json entry{{"word_id", node.word_id}, {"word", node.word}};
        entry["relation_id"] = node.relation_id ? nlohmann::json(*node.relation_id) : nlohmann::json(nullptr);
        entry["relation"] = node.relation ? nlohmann::json(*node.relation) : nlohmann::json(nullptr);
        nodes.push_back(std::move(entry));
    }

    j = nlohmann::json{
        {"path", std::move(nodes)},
        {"length", detail.length},
        {"total_strength", detail.total_strength}
    };
}

void to_json(nlohmann::json& j, const Subgraph& graph) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : graph.nodes) {
        nodes.push_back({{"id", node.id}, {"level", node.level}});
    }

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : graph.edges) {
        nlohmann::json entry{
            {"id", edge.relation_id},
            {"source", edge.source},
            {"target", edge.target},
            {"level", edge.level},
            {"strength", edge.strength}
        };
        entry["relation_type"] = edge.relation_type
            ? nlohmann::json(std::string(to_string(*edge.relation_type)))
            : nlohmann::json(nullptr);
        edges.push_back(std::move(entry));
    }

    j = nlohmann::json{
        {"node_ids", graph.node_ids},
        {"nodes", std::move(nodes)},
        {"edges", std::move(edges)},
        {"truncated", graph.truncated}
    };
}

} // namespace Lexigraph
