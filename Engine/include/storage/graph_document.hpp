/**
 * @file graph_document.hpp
 * @brief Load a MemoryGraphStore from a JSON graph document
 *
 * Format:
 * {
 *   "words":     [{"id": 1, "word": "happy"}, ...],
 *   "relations": [{"id": 10, "source": 1, "target": 2,
 *                  "strength": 0.9, "type": "synonym",
 *                  "title": "...", "description": "..."}, ...]
 * }
 * "strength" defaults to 1.0; "type", "title" and "description" are optional.
 */

#pragma once

#include <storage/memory_graph_store.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace Lexigraph {

class LEXIGRAPH_API GraphDocument {
public:
    /**
     * @throws InvalidArgumentError on malformed JSON or invalid entries
     */
    static std::unique_ptr<MemoryGraphStore> parse(const std::string& text);

    static std::unique_ptr<MemoryGraphStore> from_json(const nlohmann::json& doc);

    /**
     * @throws InvalidArgumentError if the file cannot be read or parsed
     */
    static std::unique_ptr<MemoryGraphStore> load_file(const std::filesystem::path& path);

    /**
     * @brief Append the document's words and relations to an existing store
     */
    static void load_into(const nlohmann::json& doc, MemoryGraphStore& store);
};

} // namespace Lexigraph
