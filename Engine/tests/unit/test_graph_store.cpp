/**
 * @file test_graph_store.cpp
 * @brief MemoryGraphStore, GraphDocument loading and GraphAccessor adjacency
 */

#include <gtest/gtest.h>
#include <storage/memory_graph_store.hpp>
#include <storage/graph_document.hpp>
#include <graph/graph_accessor.hpp>
#include <core/errors.hpp>
#include "graph_fixtures.hpp"
#include <cstdio>
#include <fstream>
#include <filesystem>

using namespace Lexigraph;
using namespace Lexigraph::testing;

// ============================================================================
// MemoryGraphStore
// ============================================================================

TEST(MemoryGraphStoreTest, WordsCarryNormalizedTextAndLength) {
    MemoryGraphStore store;
    const Word& w = store.add_word(1, "Café");

    EXPECT_EQ(w.text, "Café");
    EXPECT_EQ(w.normalized_text, "café");
    EXPECT_EQ(w.length, 4u);
}

TEST(MemoryGraphStoreTest, FindByTextPrefersExactMatch) {
    MemoryGraphStore store;
    store.add_word(1, "Polish");
    store.add_word(2, "polish");

    EXPECT_EQ(store.find_word_by_text("polish")->id, 2);
    EXPECT_EQ(store.find_word_by_text("Polish")->id, 1);
    EXPECT_EQ(store.find_word_by_text("POLISH")->id, 1);
    EXPECT_FALSE(store.find_word_by_text("varnish").has_value());
}

TEST(MemoryGraphStoreTest, RejectsBadInput) {
    MemoryGraphStore store;
    store.add_word(1, "a");
    store.add_word(2, "b");
    store.add_relation(1, 1, 2);

    EXPECT_THROW(store.add_word(1, "again"), InvalidArgumentError);
    EXPECT_THROW(store.add_word(3, ""), InvalidArgumentError);
    EXPECT_THROW(store.add_relation(1, 2, 1), InvalidArgumentError);
    EXPECT_THROW(store.add_relation(2, 1, 99), InvalidArgumentError);
    EXPECT_THROW(store.add_relation(3, 1, 2, 1.5), InvalidArgumentError);
    EXPECT_THROW(store.add_relation(4, 1, 2, -0.1), InvalidArgumentError);

    EXPECT_EQ(store.word_count(), 2u);
    EXPECT_EQ(store.relation_count(), 1u);
}

TEST(MemoryGraphStoreTest, RelationsOfBothEndpoints) {
    auto store = make_scenario_graph();

    auto of_a = store->relations_of(kA);
    ASSERT_EQ(of_a.size(), 2u);
    EXPECT_EQ(of_a[0].id, 101);
    EXPECT_EQ(of_a[1].id, 103);

    auto of_b = store->relations_of(kB);
    ASSERT_EQ(of_b.size(), 2u);
    EXPECT_EQ(of_b[0].id, 101);
    EXPECT_EQ(of_b[1].id, 102);

    EXPECT_TRUE(store->relations_of(999).empty());
}

TEST(MemoryGraphStoreTest, SelfLoopListedOnce) {
    MemoryGraphStore store;
    store.add_word(1, "echo");
    store.add_relation(9, 1, 1);

    EXPECT_EQ(store.relations_of(1).size(), 1u);
}

// ============================================================================
// GraphAccessor
// ============================================================================

TEST(GraphAccessorTest, DirectionsFollowStoredEndpoints) {
    auto store = make_scenario_graph();
    GraphAccessor accessor(*store);

    auto from_b = accessor.adjacency(kB);
    ASSERT_EQ(from_b.size(), 2u);

    EXPECT_EQ(from_b[0].relation_id, 101);
    EXPECT_EQ(from_b[0].neighbor_id, kA);
    EXPECT_EQ(from_b[0].direction, EdgeDirection::Incoming);
    EXPECT_DOUBLE_EQ(from_b[0].strength, 0.9);
    EXPECT_EQ(from_b[0].relation_type, RelationType::Synonym);

    EXPECT_EQ(from_b[1].relation_id, 102);
    EXPECT_EQ(from_b[1].neighbor_id, kC);
    EXPECT_EQ(from_b[1].direction, EdgeDirection::Outgoing);
}

TEST(GraphAccessorTest, SelfLoopYieldsBothDirections) {
    MemoryGraphStore store;
    store.add_word(1, "echo");
    store.add_relation(9, 1, 1);
    GraphAccessor accessor(store);

    auto edges = accessor.adjacency(1);
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(edges[0].direction, EdgeDirection::Outgoing);
    EXPECT_EQ(edges[1].direction, EdgeDirection::Incoming);
    EXPECT_EQ(edges[0].neighbor_id, 1);
    EXPECT_EQ(edges[1].neighbor_id, 1);
}

TEST(GraphAccessorTest, SortedByRelationIdRegardlessOfStoreOrder) {
    auto base = make_star_graph(5);
    ScriptedStore reversed(*base);
    reversed.reverse_order(true);
    GraphAccessor accessor(reversed);

    auto edges = accessor.adjacency(1);
    ASSERT_EQ(edges.size(), 5u);
    for (size_t i = 1; i < edges.size(); ++i) {
        EXPECT_LT(edges[i - 1].relation_id, edges[i].relation_id);
    }
}

TEST(GraphAccessorTest, IsolatedWordHasEmptyAdjacency) {
    MemoryGraphStore store;
    store.add_word(1, "alone");
    GraphAccessor accessor(store);

    EXPECT_TRUE(accessor.adjacency(1).empty());
}

TEST(GraphAccessorTest, MissingWordIsNotFound) {
    auto store = make_scenario_graph();
    GraphAccessor accessor(*store);

    EXPECT_THROW(accessor.adjacency(404), NotFoundError);
    EXPECT_THROW(accessor.word(404), NotFoundError);
    EXPECT_FALSE(accessor.word_exists(404));
    EXPECT_EQ(accessor.word(kC).text, "C");
}

// ============================================================================
// GraphDocument
// ============================================================================

namespace {

const char* kDocument = R"({
    "words": [
        {"id": 1, "word": "happy"},
        {"id": 2, "word": "glad"},
        {"id": 3, "word": "sad"}
    ],
    "relations": [
        {"id": 10, "source": 1, "target": 2, "strength": 0.8, "type": "Synonym", "title": "near"},
        {"id": 11, "source": 1, "target": 3, "type": "antonym", "description": "opposite"},
        {"id": 12, "source": 2, "target": 3, "type": "something_else"},
        {"id": 13, "source": 3, "target": 2, "type": null}
    ]
})";

} // namespace

TEST(GraphDocumentTest, ParsesWordsAndRelations) {
    auto store = GraphDocument::parse(kDocument);

    EXPECT_EQ(store->word_count(), 3u);
    EXPECT_EQ(store->relation_count(), 4u);

    auto rels = store->relations_of(1);
    ASSERT_EQ(rels.size(), 2u);
    EXPECT_DOUBLE_EQ(rels[0].strength, 0.8);
    EXPECT_EQ(rels[0].relation_type, RelationType::Synonym);
    EXPECT_EQ(rels[0].title, std::optional<std::string>("near"));
    EXPECT_DOUBLE_EQ(rels[1].strength, 1.0);
    EXPECT_EQ(rels[1].relation_type, RelationType::Antonym);
    EXPECT_EQ(rels[1].description, "opposite");
    EXPECT_FALSE(rels[1].title.has_value());

    auto of_three = store->relations_of(3);
    ASSERT_EQ(of_three.size(), 3u);
    EXPECT_EQ(of_three[1].relation_type, RelationType::Custom);
    EXPECT_FALSE(of_three[2].relation_type.has_value());
}

TEST(GraphDocumentTest, EmptyObjectIsEmptyGraph) {
    auto store = GraphDocument::parse("{}");
    EXPECT_EQ(store->word_count(), 0u);
}

TEST(GraphDocumentTest, MalformedDocumentsAreInvalidArguments) {
    EXPECT_THROW(GraphDocument::parse("not json"), InvalidArgumentError);
    EXPECT_THROW(GraphDocument::parse("[1, 2]"), InvalidArgumentError);
    EXPECT_THROW(GraphDocument::parse(R"({"words": 5})"), InvalidArgumentError);
    EXPECT_THROW(GraphDocument::parse(R"({"words": [{"id": 1}]})"), InvalidArgumentError);
    EXPECT_THROW(GraphDocument::parse(R"({"words": [{"id": "x", "word": "a"}]})"), InvalidArgumentError);
    EXPECT_THROW(GraphDocument::parse(
        R"({"words": [{"id": 1, "word": "a"}], "relations": [{"id": 1, "source": 1, "target": 2}]})"),
        InvalidArgumentError);
}

TEST(GraphDocumentTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "lexigraph_test_graph.json";
    {
        std::ofstream out(path);
        out << kDocument;
    }

    auto store = GraphDocument::load_file(path);
    EXPECT_EQ(store->word_count(), 3u);
    std::filesystem::remove(path);

    EXPECT_THROW(GraphDocument::load_file(path), InvalidArgumentError);
}
