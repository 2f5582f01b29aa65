/**
 * @file result_json.hpp
 * @brief nlohmann/json serializers for traversal results
 *
 * Found by ADL, so `nlohmann::json j = subgraph;` works directly.
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>

namespace Lexigraph {

/// {"path": [ids], "relations": [ids], "length": k, "total_strength": s}
LEXIGRAPH_API void to_json(nlohmann::json& j, const GraphPath& path);

LEXIGRAPH_API void to_json(nlohmann::json& j, const WordBrief& word);

/// {"id", "source_word_id", "target_word_id", "strength", "relation_type", "title", "description"}
LEXIGRAPH_API void to_json(nlohmann::json& j, const Relation& relation);

/// {"path": [{"word_id", "word": {...}, "relation_id", "relation": {...}}], "length", "total_strength"}
LEXIGRAPH_API void to_json(nlohmann::json& j, const PathDetail& detail);

/// {"node_ids", "nodes": [{"id", "level"}], "edges": [...], "truncated"}
LEXIGRAPH_API void to_json(nlohmann::json& j, const Subgraph& graph);

} // namespace Lexigraph
