#include <storage/postgres_graph_store.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <stdexcept>

namespace Lexigraph {

namespace {

// Runs a store call, turning driver and row-decoding failures into
// StoreUnavailableError so traversal callers see a single error kind.
template <typename Fn>
auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const DatabaseError& e) {
        Logger::error(std::string(operation) + ": " + e.what());
        throw StoreUnavailableError(std::string(operation) + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        Logger::error(std::string(operation) + ": malformed row: " + e.what());
        throw StoreUnavailableError(std::string(operation) + ": malformed row");
    } catch (const std::out_of_range& e) {
        Logger::error(std::string(operation) + ": malformed row: " + e.what());
        throw StoreUnavailableError(std::string(operation) + ": malformed row");
    }
}

const char* kRelationColumns =
    "r.id, r.source_word_id, r.target_word_id, COALESCE(r.strength, 1.0), "
    "(SELECT rt.type_name FROM relation_types rt "
    "  WHERE rt.relation_id = r.id ORDER BY rt.id LIMIT 1), "
    "r.title, r.description";

} // namespace

PostgresGraphStore::PostgresGraphStore(PostgresConnection& db) : db_(db) {}

Word PostgresGraphStore::word_from_row(const std::vector<std::string>& row) const {
    Word word;
    word.id = std::stoll(row[0]);
    word.text = row[1];
    word.normalized_text = row[2].empty() ? normalize_word(row[1]) : row[2];
    word.length = codepoint_length(word.text);
    return word;
}

std::optional<Word> PostgresGraphStore::get_word(WordId id) {
    return guarded("get_word", [&]() {
        std::optional<Word> word;
        db_.query(
            "SELECT id, word, normalized_word FROM words WHERE id = $1",
            {std::to_string(id)},
            [&](const std::vector<std::string>& row) {
                word = word_from_row(row);
            }
        );
        return word;
    });
}

std::optional<Word> PostgresGraphStore::find_word_by_text(const std::string& text) {
    return guarded("find_word_by_text", [&]() {
        std::optional<Word> word;
        db_.query(
            "SELECT id, word, normalized_word FROM words "
            "WHERE word = $1 OR normalized_word = $2 "
            "ORDER BY (word = $1) DESC, id LIMIT 1",
            {text, normalize_word(text)},
            [&](const std::vector<std::string>& row) {
                word = word_from_row(row);
            }
        );
        return word;
    });
}

std::vector<Relation> PostgresGraphStore::relations_of(WordId id) {
    return guarded("relations_of", [&]() {
        std::vector<Relation> relations;
        db_.query_nullable(
            std::string("SELECT ") + kRelationColumns +
            " FROM word_relations r "
            "WHERE r.source_word_id = $1 OR r.target_word_id = $1 "
            "ORDER BY r.id",
            {std::to_string(id)},
            [&](const std::vector<std::optional<std::string>>& row) {
                if (!row[0] || !row[1] || !row[2]) {
                    throw std::invalid_argument("relation with NULL id or endpoint");
                }
                Relation rel;
                rel.id = std::stoll(*row[0]);
                rel.source_word_id = std::stoll(*row[1]);
                rel.target_word_id = std::stoll(*row[2]);
                rel.strength = std::stod(row[3].value_or("1.0"));
                if (row[4]) rel.relation_type = relation_type_from_string(*row[4]);
                rel.title = row[5];
                rel.description = row[6].value_or("");
                relations.push_back(std::move(rel));
            }
        );
        return relations;
    });
}

bool PostgresGraphStore::word_exists(WordId id) {
    return guarded("word_exists", [&]() {
        auto value = db_.query_single(
            "SELECT EXISTS (SELECT 1 FROM words WHERE id = $1)",
            {std::to_string(id)}
        );
        return value && *value == "t";
    });
}

} // namespace Lexigraph
