/**
 * @file graph_store.hpp
 * @brief Read interface onto the word / relation tables
 */

#pragma once

#include <core/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Lexigraph {

/**
 * @brief Word/relation lookups consumed by the traversal engine
 *
 * Implementations raise StoreUnavailableError when their I/O fails. A missing
 * word is not an error at this level: get_word() returns std::nullopt.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual std::optional<Word> get_word(WordId id) = 0;

    /**
     * @brief Exact display text first, then the normalized (lowercase) text
     */
    virtual std::optional<Word> find_word_by_text(const std::string& text) = 0;

    /**
     * @brief Every relation where `id` is source or target, in store order
     */
    virtual std::vector<Relation> relations_of(WordId id) = 0;

    virtual bool word_exists(WordId id) { return get_word(id).has_value(); }
};

} // namespace Lexigraph
