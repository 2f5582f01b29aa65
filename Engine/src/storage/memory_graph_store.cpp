#include <storage/memory_graph_store.hpp>
#include <core/errors.hpp>
#include <utils/unicode.hpp>

namespace Lexigraph {

const Word& MemoryGraphStore::add_word(WordId id, const std::string& text) {
    if (text.empty()) {
        throw InvalidArgumentError("Word " + std::to_string(id) + " has empty text");
    }
    if (words_.count(id)) {
        throw InvalidArgumentError("Duplicate word id " + std::to_string(id));
    }

    Word word;
    word.id = id;
    word.text = text;
    word.normalized_text = normalize_word(text);
    word.length = codepoint_length(text);

    // First insertion wins for text lookups, matching the SQL lookup's "first row"
    by_text_.emplace(word.text, id);
    by_normalized_.emplace(word.normalized_text, id);

    return words_.emplace(id, std::move(word)).first->second;
}

const Relation& MemoryGraphStore::add_relation(const Relation& relation) {
    const std::string label = "Relation " + std::to_string(relation.id);

    if (relation_index_.count(relation.id)) {
        throw InvalidArgumentError("Duplicate relation id " + std::to_string(relation.id));
    }
    if (!words_.count(relation.source_word_id)) {
        throw InvalidArgumentError(label + ": unknown source word " + std::to_string(relation.source_word_id));
    }
    if (!words_.count(relation.target_word_id)) {
        throw InvalidArgumentError(label + ": unknown target word " + std::to_string(relation.target_word_id));
    }
    if (!(relation.strength >= 0.0 && relation.strength <= 1.0)) {
        throw InvalidArgumentError(label + ": strength must lie in [0, 1]");
    }

    size_t slot = relations_.size();
    relations_.push_back(relation);
    relation_index_.emplace(relation.id, slot);

    incident_[relation.source_word_id].push_back(slot);
    if (relation.target_word_id != relation.source_word_id) {
        incident_[relation.target_word_id].push_back(slot);
    }

    return relations_.back();
}

const Relation& MemoryGraphStore::add_relation(RelationId id, WordId source, WordId target,
                                               double strength, std::optional<RelationType> type) {
    Relation relation;
    relation.id = id;
    relation.source_word_id = source;
    relation.target_word_id = target;
    relation.strength = strength;
    relation.relation_type = type;
    return add_relation(relation);
}

std::optional<Word> MemoryGraphStore::get_word(WordId id) {
    auto it = words_.find(id);
    if (it == words_.end()) return std::nullopt;
    return it->second;
}

std::optional<Word> MemoryGraphStore::find_word_by_text(const std::string& text) {
    auto it = by_text_.find(text);
    if (it != by_text_.end()) return words_.at(it->second);

    auto nit = by_normalized_.find(normalize_word(text));
    if (nit != by_normalized_.end()) return words_.at(nit->second);

    return std::nullopt;
}

std::vector<Relation> MemoryGraphStore::relations_of(WordId id) {
    std::vector<Relation> out;

    auto it = incident_.find(id);
    if (it == incident_.end()) return out;

    out.reserve(it->second.size());
    for (size_t slot : it->second) {
        out.push_back(relations_[slot]);
    }
    return out;
}

bool MemoryGraphStore::word_exists(WordId id) {
    return words_.count(id) > 0;
}

} // namespace Lexigraph
