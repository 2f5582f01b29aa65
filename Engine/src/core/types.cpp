#include <core/types.hpp>
#include <utils/unicode.hpp>
#include <array>
#include <utility>

namespace Lexigraph {

namespace {

constexpr std::array<std::pair<RelationType, std::string_view>, 17> kTypeNames = {{
    {RelationType::Synonym,      "synonym"},
    {RelationType::Antonym,      "antonym"},
    {RelationType::Homophone,    "homophone"},
    {RelationType::Homonym,      "homonym"},
    {RelationType::Derivation,   "derivation"},
    {RelationType::Homoglyph,    "homoglyph"},
    {RelationType::Paronym,      "paronym"},
    {RelationType::Hypernym,     "hypernym"},
    {RelationType::Hyponym,      "hyponym"},
    {RelationType::Holonym,      "holonym"},
    {RelationType::Meronym,      "meronym"},
    {RelationType::Related,      "related"},
    {RelationType::Variant,      "variant"},
    {RelationType::Abbreviation, "abbreviation"},
    {RelationType::Plural,       "plural"},
    {RelationType::PastTense,    "past_tense"},
    {RelationType::Custom,       "custom"},
}};

} // namespace

std::string_view to_string(RelationType type) {
    for (const auto& [t, name] : kTypeNames) {
        if (t == type) return name;
    }
    return "custom";
}

std::string_view to_string(RelationCategory category) {
    switch (category) {
        case RelationCategory::Semantic:      return "semantic";
        case RelationCategory::Formal:        return "formal";
        case RelationCategory::Morphological: return "morphological";
        case RelationCategory::Associative:   return "associative";
    }
    return "associative";
}

RelationType relation_type_from_string(std::string_view name) {
    std::string key = normalize_word(std::string(name));
    for (const auto& [t, n] : kTypeNames) {
        if (n == key) return t;
    }
    return RelationType::Custom;
}

RelationCategory category_of(RelationType type) {
    switch (type) {
        case RelationType::Synonym:
        case RelationType::Antonym:
        case RelationType::Hypernym:
        case RelationType::Hyponym:
        case RelationType::Holonym:
        case RelationType::Meronym:
            return RelationCategory::Semantic;
        case RelationType::Homophone:
        case RelationType::Homonym:
        case RelationType::Homoglyph:
        case RelationType::Paronym:
            return RelationCategory::Formal;
        case RelationType::Derivation:
        case RelationType::Variant:
        case RelationType::Abbreviation:
        case RelationType::Plural:
        case RelationType::PastTense:
            return RelationCategory::Morphological;
        case RelationType::Related:
        case RelationType::Custom:
            return RelationCategory::Associative;
    }
    return RelationCategory::Associative;
}

} // namespace Lexigraph
