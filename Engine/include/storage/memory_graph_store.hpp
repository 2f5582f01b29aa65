/**
 * @file memory_graph_store.hpp
 * @brief In-process word/relation store
 */

#pragma once

#include <storage/graph_store.hpp>
#include <export.hpp>
#include <unordered_map>
#include <string>
#include <vector>

namespace Lexigraph {

/**
 * @brief GraphStore held entirely in memory
 *
 * Loaded once (add_word / add_relation, or GraphDocument), then read-only.
 * Concurrent reads are safe; mutation concurrent with reads is not.
 */
class LEXIGRAPH_API MemoryGraphStore : public GraphStore {
public:
    MemoryGraphStore() = default;

    /**
     * @brief Insert a word; normalized text and length are derived from text.
     * @throws InvalidArgumentError on a duplicate id or empty text
     */
    const Word& add_word(WordId id, const std::string& text);

    /**
     * @throws InvalidArgumentError on a duplicate id, unknown endpoint or
     * strength outside [0, 1]
     */
    const Relation& add_relation(const Relation& relation);

    /**
     * @brief Convenience overload with default strength 1.0
     */
    const Relation& add_relation(RelationId id, WordId source, WordId target,
                                 double strength = 1.0,
                                 std::optional<RelationType> type = std::nullopt);

    std::optional<Word> get_word(WordId id) override;
    std::optional<Word> find_word_by_text(const std::string& text) override;
    std::vector<Relation> relations_of(WordId id) override;
    bool word_exists(WordId id) override;

    size_t word_count() const { return words_.size(); }
    size_t relation_count() const { return relations_.size(); }

private:
    std::unordered_map<WordId, Word> words_;
    std::unordered_map<std::string, WordId> by_text_;
    std::unordered_map<std::string, WordId> by_normalized_;

    std::vector<Relation> relations_;                            // Insertion order
    std::unordered_map<RelationId, size_t> relation_index_;
    std::unordered_map<WordId, std::vector<size_t>> incident_;   // word -> relations_ slots
};

} // namespace Lexigraph
