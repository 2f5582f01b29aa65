/**
 * @file postgres_graph_store.hpp
 * @brief GraphStore over the backend's PostgreSQL tables
 *
 * Reads words(id, word, normalized_word), word_relations(id, source_word_id,
 * target_word_id, strength, title, description) and
 * relation_types(id, relation_id, type_name). Tables resolve through the
 * connection's search_path.
 */

#pragma once

#include <storage/graph_store.hpp>
#include <database/postgres_connection.hpp>
#include <export.hpp>

namespace Lexigraph {

class LEXIGRAPH_API PostgresGraphStore : public GraphStore {
public:
    explicit PostgresGraphStore(PostgresConnection& db);

    std::optional<Word> get_word(WordId id) override;
    std::optional<Word> find_word_by_text(const std::string& text) override;

    /**
     * @brief Incident relations ordered by relation id
     *
     * When a relation carries several relation_types rows, the one with the
     * lowest id supplies the tag.
     */
    std::vector<Relation> relations_of(WordId id) override;

    bool word_exists(WordId id) override;

private:
    Word word_from_row(const std::vector<std::string>& row) const;

    PostgresConnection& db_;
};

} // namespace Lexigraph
