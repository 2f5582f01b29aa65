/**
 * @file types.hpp
 * @brief Word, relation and traversal result types
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Lexigraph {

using WordId = int64_t;
using RelationId = int64_t;

/**
 * @brief Relation type tags as stored in relation_types.type_name.
 */
enum class RelationType {
    Synonym,
    Antonym,
    Homophone,
    Homonym,
    Derivation,
    Homoglyph,
    Paronym,
    Hypernym,
    Hyponym,
    Holonym,
    Meronym,
    Related,
    Variant,
    Abbreviation,
    Plural,
    PastTense,
    Custom
};

enum class RelationCategory {
    Semantic,
    Formal,
    Morphological,
    Associative
};

LEXIGRAPH_API std::string_view to_string(RelationType type);
LEXIGRAPH_API std::string_view to_string(RelationCategory category);

/**
 * @brief Parse a stored type name. Unknown names map to RelationType::Custom.
 */
LEXIGRAPH_API RelationType relation_type_from_string(std::string_view name);

LEXIGRAPH_API RelationCategory category_of(RelationType type);

struct Word {
    WordId id = 0;
    std::string text;              // Display text
    std::string normalized_text;   // Lowercased lookup key
    size_t length = 0;             // Code points in text
};

struct Relation {
    RelationId id = 0;
    WordId source_word_id = 0;
    WordId target_word_id = 0;
    double strength = 1.0;                      // [0, 1]
    std::optional<RelationType> relation_type;
    std::optional<std::string> title;
    std::string description;
};

enum class EdgeDirection {
    Outgoing,   // Queried word is the relation's source
    Incoming    // Queried word is the relation's target
};

/**
 * @brief One relation seen from one of its endpoints.
 */
struct AdjacentEdge {
    WordId neighbor_id;
    RelationId relation_id;
    EdgeDirection direction;
    double strength;
    std::optional<RelationType> relation_type;
};

struct GraphPath {
    std::vector<WordId> path;           // w0 .. wk
    std::vector<RelationId> relations;  // k entries, empty for a zero-length path
    int length = 0;                     // k
    double total_strength = 1.0;        // Product of hop strengths
};

struct WordBrief {
    WordId id = 0;
    std::string word;
    std::string normalized_word;
    size_t length = 0;
};

/**
 * @brief A GraphPath with every node hydrated from the store.
 */
struct PathDetail {
    struct Node {
        WordId word_id;
        WordBrief word;
        std::optional<RelationId> relation_id;  // Relation to the next node; none on the last
        std::optional<Relation> relation;       // Full record of relation_id
    };

    std::vector<Node> path;
    int length = 0;
    double total_strength = 1.0;
};

struct SubgraphNode {
    WordId id;
    int level;      // Hops from the center at discovery
};

struct SubgraphEdge {
    RelationId relation_id;
    WordId source;
    WordId target;
    int level;      // Level at which target was first discovered
    double strength;
    std::optional<RelationType> relation_type;
};

struct Subgraph {
    std::vector<WordId> node_ids;       // Unique, discovery order
    std::vector<SubgraphNode> nodes;    // Same order as node_ids
    std::vector<SubgraphEdge> edges;
    bool truncated = false;             // Expansion stopped at max_nodes
};

} // namespace Lexigraph
