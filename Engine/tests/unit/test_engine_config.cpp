/**
 * @file test_engine_config.cpp
 * @brief Configuration parsing, relation type names and word normalization
 */

#include <gtest/gtest.h>
#include <config/engine_config.hpp>
#include <core/types.hpp>
#include <core/errors.hpp>
#include <utils/unicode.hpp>
#include <utils/logger.hpp>
#include <cstdlib>

using namespace Lexigraph;

namespace {

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

// ============================================================================
// parse_int
// ============================================================================

TEST(ConfigTest, ParseIntAcceptsIntegers) {
    EXPECT_EQ(parse_int("42", "n"), 42);
    EXPECT_EQ(parse_int("-3", "n"), -3);
    EXPECT_EQ(parse_int("0", "n"), 0);
}

TEST(ConfigTest, ParseIntRejectsGarbage) {
    EXPECT_THROW(parse_int("", "n"), InvalidArgumentError);
    EXPECT_THROW(parse_int("abc", "n"), InvalidArgumentError);
    EXPECT_THROW(parse_int("12x", "n"), InvalidArgumentError);
    EXPECT_THROW(parse_int("99999999999999999999", "n"), InvalidArgumentError);
}

// ============================================================================
// TraversalConfig / DatabaseConfig
// ============================================================================

TEST(ConfigTest, TraversalDefaults) {
    TraversalConfig config;
    EXPECT_EQ(config.max_paths, 10);
    EXPECT_EQ(config.min_length, 1);
    EXPECT_EQ(config.max_length, 10);
    EXPECT_EQ(config.max_level, 3);
    EXPECT_EQ(config.max_nodes, 100);
    EXPECT_EQ(config.max_level_limit, 5);
    EXPECT_EQ(config.max_nodes_limit, 200);
    EXPECT_EQ(config.max_paths_limit, 50);
    EXPECT_EQ(config.max_length_limit, 10);
}

TEST(ConfigTest, PathLimitsFromEnvironment) {
    ScopedEnv length("LEXIGRAPH_MAX_LENGTH_LIMIT", "20");
    ScopedEnv paths("LEXIGRAPH_MAX_PATHS_LIMIT", "0");

    auto config = TraversalConfig::from_env();
    EXPECT_EQ(config.max_length_limit, 20);
    EXPECT_EQ(config.max_paths_limit, 0);
}

TEST(ConfigTest, TraversalOverridesFromEnvironment) {
    ScopedEnv paths("LEXIGRAPH_MAX_PATHS", "4");
    ScopedEnv nodes("LEXIGRAPH_MAX_NODES", "25");

    auto config = TraversalConfig::from_env();
    EXPECT_EQ(config.max_paths, 4);
    EXPECT_EQ(config.max_nodes, 25);
    EXPECT_EQ(config.max_length, 10);
}

TEST(ConfigTest, TraversalRejectsNonIntegerEnvironment) {
    ScopedEnv level("LEXIGRAPH_MAX_LEVEL", "deep");
    EXPECT_THROW(TraversalConfig::from_env(), InvalidArgumentError);
}

TEST(ConfigTest, ConninfoFromParts) {
    DatabaseConfig config;
    config.host = "db.local";
    config.password = "it's";

    std::string info = config.conninfo();
    EXPECT_NE(info.find("host='db.local'"), std::string::npos);
    EXPECT_NE(info.find("dbname='lexigraph'"), std::string::npos);
    EXPECT_NE(info.find("password='it\\'s'"), std::string::npos);
}

TEST(ConfigTest, UrlWins) {
    ScopedEnv url("LEXIGRAPH_DB_URL", "postgresql://u@h/d");
    ScopedEnv host("PGHOST", "ignored");

    auto config = DatabaseConfig::from_env();
    EXPECT_EQ(config.conninfo(), "postgresql://u@h/d");
    EXPECT_EQ(config.host, "ignored");
}

// ============================================================================
// Relation types
// ============================================================================

TEST(RelationTypeTest, NamesRoundTrip) {
    EXPECT_EQ(to_string(RelationType::PastTense), "past_tense");
    EXPECT_EQ(relation_type_from_string("past_tense"), RelationType::PastTense);
    EXPECT_EQ(relation_type_from_string("Synonym"), RelationType::Synonym);
    EXPECT_EQ(relation_type_from_string("cousin"), RelationType::Custom);
}

TEST(RelationTypeTest, Categories) {
    EXPECT_EQ(category_of(RelationType::Antonym), RelationCategory::Semantic);
    EXPECT_EQ(category_of(RelationType::Homophone), RelationCategory::Formal);
    EXPECT_EQ(category_of(RelationType::Plural), RelationCategory::Morphological);
    EXPECT_EQ(category_of(RelationType::Related), RelationCategory::Associative);
    EXPECT_EQ(to_string(RelationCategory::Morphological), "morphological");
}

// ============================================================================
// Normalization
// ============================================================================

TEST(UnicodeTest, NormalizeLowercasesBeyondAscii) {
    EXPECT_EQ(normalize_word("HeLLo"), "hello");
    EXPECT_EQ(normalize_word("ÉCOLE"), "école");
    EXPECT_EQ(normalize_word("ΣΟΦΙΑ"), "σοφια");
    EXPECT_EQ(normalize_word("МИР"), "мир");
}

TEST(UnicodeTest, NormalizeCoversExtendedScripts) {
    EXPECT_EQ(normalize_word("ԱՐԵՎ"), "արեվ");       // Armenian
    EXPECT_EQ(normalize_word("ᲛᲘᲠᲘ"), "მირი");       // Georgian Mtavruli
    EXPECT_EQ(normalize_word("ႠႡ"), "ⴀⴁ");           // Georgian Asomtavruli
    EXPECT_EQ(normalize_word("ẠẞỸ"), "ạßỹ");         // Latin Extended Additional
    EXPECT_EQ(normalize_word("ǄǅǍ"), "ǆǆǎ");         // Latin Extended-B
    EXPECT_EQ(normalize_word("ҐӘӁӀ"), "ґәӂӏ");       // Cyrillic beyond the basic block
    EXPECT_EQ(normalize_word("ΆΈΌΏ"), "άέόώ");       // Greek with tonos
    EXPECT_EQ(normalize_word("ＡＢＣ"), "ａｂｃ");     // Fullwidth
}

TEST(UnicodeTest, CapitalDottedIExpandsToTwoCodepoints) {
    EXPECT_EQ(normalize_word("İZMİR"), "i\u0307zmi\u0307r");
    EXPECT_EQ(codepoint_length(normalize_word("İ")), 2u);
}

TEST(UnicodeTest, UncasedScriptsAreUnchanged) {
    EXPECT_EQ(normalize_word("日本"), "日本");
    EXPECT_EQ(normalize_word("ß"), "ß");
    EXPECT_EQ(to_lower_codepoint(0x2D00), char32_t{0x2D00});
}

TEST(UnicodeTest, CodepointLength) {
    EXPECT_EQ(codepoint_length(""), 0u);
    EXPECT_EQ(codepoint_length("word"), 4u);
    EXPECT_EQ(codepoint_length("naïve"), 5u);
    EXPECT_EQ(codepoint_length("日本"), 2u);
}

TEST(UnicodeTest, Utf8RoundTrip) {
    std::string text = "grüße 🙂";
    EXPECT_EQ(utf32_to_utf8(utf8_to_utf32(text)), text);
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("DEBUG"), Logger::Level::Debug);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::Warning);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::Error);
    EXPECT_EQ(Logger::parse_level("chatty"), Logger::Level::Info);
}

TEST(LoggerTest, LevelGatesOutput) {
    auto saved = Logger::level();
    Logger::set_level(Logger::Level::Warning);
    EXPECT_FALSE(Logger::enabled(Logger::Level::Info));
    EXPECT_TRUE(Logger::enabled(Logger::Level::Error));
    Logger::set_level(saved);
}
