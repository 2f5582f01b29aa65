#include <storage/graph_document.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <fstream>

namespace Lexigraph {

namespace {

const nlohmann::json& require_array(const nlohmann::json& doc, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    if (!doc.contains(key)) return empty;
    const auto& value = doc[key];
    if (!value.is_array()) {
        throw InvalidArgumentError(std::string("Graph document: '") + key + "' must be an array");
    }
    return value;
}

} // namespace

void GraphDocument::load_into(const nlohmann::json& doc, MemoryGraphStore& store) {
    if (!doc.is_object()) {
        throw InvalidArgumentError("Graph document must be a JSON object");
    }

    try {
        for (const auto& entry : require_array(doc, "words")) {
            store.add_word(entry.at("id").get<WordId>(), entry.at("word").get<std::string>());
        }

        for (const auto& entry : require_array(doc, "relations")) {
            Relation rel;
            rel.id = entry.at("id").get<RelationId>();
            rel.source_word_id = entry.at("source").get<WordId>();
            rel.target_word_id = entry.at("target").get<WordId>();
            rel.strength = entry.value("strength", 1.0);
            if (entry.contains("type") && !entry["type"].is_null()) {
                rel.relation_type = relation_type_from_string(entry["type"].get<std::string>());
            }
            if (entry.contains("title") && !entry["title"].is_null()) {
                rel.title = entry["title"].get<std::string>();
            }
            rel.description = entry.value("description", std::string());
            store.add_relation(rel);
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("Graph document: ") + e.what());
    }
}

std::unique_ptr<MemoryGraphStore> GraphDocument::from_json(const nlohmann::json& doc) {
    auto store = std::make_unique<MemoryGraphStore>();
    load_into(doc, *store);
    return store;
}

std::unique_ptr<MemoryGraphStore> GraphDocument::parse(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError(std::string("Graph document is not valid JSON: ") + e.what());
    }
    return from_json(doc);
}

std::unique_ptr<MemoryGraphStore> GraphDocument::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw InvalidArgumentError("Cannot open graph file: " + path.string());
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError("Graph file " + path.string() + " is not valid JSON: " + e.what());
    }

    auto store = from_json(doc);
    Logger::debug("Loaded " + std::to_string(store->word_count()) + " words, " +
                  std::to_string(store->relation_count()) + " relations from " + path.string());
    return store;
}

} // namespace Lexigraph
