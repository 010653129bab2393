#include <gtest/gtest.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "memory_document_store.hpp"

using namespace elastivec;
using json = nlohmann::json;

namespace {

int status_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const TransportError& e) {
        return e.status_code();
    }
    return 0;
}

std::vector<std::string> ids_of(const std::vector<SearchHit>& hits) {
    std::vector<std::string> ids;
    for (const auto& h : hits) {
        ids.push_back(h.id);
    }
    return ids;
}

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.create_index("products", json::parse(R"({"properties": {
            "name": {"type": "text"},
            "category": {"type": "keyword"},
            "price": {"type": "double"},
            "tags": {"type": "keyword"},
            "v": {"type": "dense_vector", "dims": 2, "similarity": "cosine"}
        }})"));
        put("p1", R"({"name": "Red running shoes", "category": "shoes", "price": 80, "tags": ["red", "sport"], "v": [1.0, 0.0]})");
        put("p2", R"({"name": "Blue hat", "category": "hats", "price": 20, "tags": ["blue"], "v": [0.0, 1.0]})");
        put("p3", R"({"name": "Red and blue boots", "category": "shoes", "price": 120, "tags": [], "v": [0.6, 0.8]})");
        put("p4", R"({"name": "Plain scarf", "category": "scarves", "v": [1.0, 0.0, 0.0]})");
    }

    void put(const std::string& id, const char* body) {
        store_.index_document("products", id, json::parse(body));
    }

    std::vector<std::string> query(const char* q) {
        return ids_of(store_.search("products", json::parse(q), {}, {}, 0, 100));
    }

    MemoryDocumentStore store_;
};

} // namespace

//=============================================================================
// Scoring helpers
//=============================================================================

TEST(AnalyzeText, LowercaseAlphanumericTerms) {
    EXPECT_EQ(analyze_text("Red, running-Shoes 42!"), (std::vector<std::string>{"red", "running", "shoes", "42"}));
    EXPECT_TRUE(analyze_text(" ,.- ").empty());
}

TEST(VectorScore, Similarities) {
    EXPECT_DOUBLE_EQ(vector_score("cosine", {1.0f, 0.0f}, {2.0f, 0.0f}), 1.0);
    EXPECT_DOUBLE_EQ(vector_score("cosine", {1.0f, 0.0f}, {-1.0f, 0.0f}), 0.0);
    EXPECT_DOUBLE_EQ(vector_score("cosine", {0.0f, 0.0f}, {1.0f, 0.0f}), 0.5);
    EXPECT_DOUBLE_EQ(vector_score("dot_product", {0.5f, 0.5f}, {1.0f, 0.0f}), 0.75);
    EXPECT_DOUBLE_EQ(vector_score("l2_norm", {0.0f, 0.0f}, {3.0f, 4.0f}), 1.0 / 26.0);
    EXPECT_DOUBLE_EQ(vector_score("max_inner_product", {1.0f, 1.0f}, {2.0f, 0.0f}), 3.0);
    EXPECT_DOUBLE_EQ(vector_score("max_inner_product", {-1.0f, 0.0f}, {1.0f, 0.0f}), 0.5);
    EXPECT_EQ(status_of([] { vector_score("hamming", {1.0f}, {1.0f}); }), 400);
}

//=============================================================================
// Indices and documents
//=============================================================================

TEST(MemoryDocumentStore, IndexLifecycle) {
    MemoryDocumentStore store;
    EXPECT_FALSE(store.index_exists("a"));
    store.create_index("b", json::parse(R"({"properties": {}})"));
    store.create_index("a", json::parse(R"({"properties": {"x": {"type": "long"}}})"));
    EXPECT_TRUE(store.index_exists("a"));
    EXPECT_EQ(store.list_indices(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(store.mappings("a")["properties"]["x"]["type"], "long");

    EXPECT_EQ(status_of([&] { store.create_index("a", json::object()); }), 400);
    store.delete_index("a");
    EXPECT_FALSE(store.index_exists("a"));
    EXPECT_EQ(status_of([&] { store.delete_index("a"); }), 404);
}

TEST(MemoryDocumentStore, MissingIndexIsNotFound) {
    MemoryDocumentStore store;
    EXPECT_EQ(status_of([&] { store.get_document("nope", "1", {}); }), 404);
    EXPECT_EQ(status_of([&] { store.delete_document("nope", "1"); }), 404);
    EXPECT_EQ(status_of([&] { store.search("nope", json{{"match_all", json::object()}}, {}, {}, 0, 10); }), 404);
    EXPECT_EQ(status_of([&] { store.bulk_delete("nope", {"1"}); }), 404);
    try {
        store.get_document("nope", "1", {});
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.is_not_found());
    }
}

TEST(MemoryDocumentStore, WritesCreateTheIndex) {
    MemoryDocumentStore store;
    store.index_document("auto", "1", json{{"a", 1}});
    EXPECT_TRUE(store.index_exists("auto"));
    EXPECT_EQ(store.document_count("auto"), 1u);

    std::vector<StorageDocument> docs{{std::string("x"), json{{"a", 2}}}, {std::string("y"), json{{"a", 3}}}};
    EXPECT_EQ(store.bulk_index("bulk", docs), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(store.document_count("bulk"), 2u);

    std::vector<StorageDocument> no_id{{std::nullopt, json::object()}};
    EXPECT_EQ(status_of([&] { store.bulk_index("bulk", no_id); }), 400);
    EXPECT_EQ(status_of([&] { store.index_document("bulk", "z", json::array()); }), 400);
}

TEST_F(MemoryStoreTest, GetAndReplace) {
    std::optional<json> doc = store_.get_document("products", "p2", {"v"});
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["name"], "Blue hat");
    EXPECT_FALSE(doc->contains("v"));
    EXPECT_TRUE(store_.raw_document("products", "p2")->contains("v"));

    EXPECT_FALSE(store_.get_document("products", "missing", {}).has_value());

    put("p2", R"({"name": "Green hat"})");
    EXPECT_EQ((*store_.get_document("products", "p2", {}))["name"], "Green hat");
    EXPECT_EQ(store_.document_count("products"), 4u);
}

TEST_F(MemoryStoreTest, MultiGetKeepsOrder) {
    auto docs = store_.multi_get("products", {"p3", "missing", "p1"}, {});
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ((*docs[0])["category"], "shoes");
    EXPECT_FALSE(docs[1].has_value());
    EXPECT_EQ((*docs[2])["price"], 80);
}

TEST_F(MemoryStoreTest, Deletes) {
    store_.delete_document("products", "p1");
    EXPECT_FALSE(store_.get_document("products", "p1", {}).has_value());
    EXPECT_EQ(status_of([&] { store_.delete_document("products", "p1"); }), 404);

    store_.bulk_delete("products", {"p2", "p1", "never"});
    EXPECT_EQ(store_.document_count("products"), 2u);
}

//=============================================================================
// Queries
//=============================================================================

TEST_F(MemoryStoreTest, TermQueries) {
    EXPECT_EQ(query(R"({"term": {"category": "shoes"}})"), (std::vector<std::string>{"p1", "p3"}));
    EXPECT_EQ(query(R"({"term": {"tags": "blue"}})"), std::vector<std::string>{"p2"});
    EXPECT_EQ(query(R"({"term": {"price": 80.0}})"), std::vector<std::string>{"p1"});
    EXPECT_EQ(query(R"({"term": {"_id": "p4"}})"), std::vector<std::string>{"p4"});
    EXPECT_EQ(query(R"({"terms": {"tags": ["sport", "blue"]}})"), (std::vector<std::string>{"p1", "p2"}));
    EXPECT_EQ(query(R"({"terms": {"_id": ["p2", "p3"]}})"), (std::vector<std::string>{"p2", "p3"}));
}

TEST_F(MemoryStoreTest, RangeAndExists) {
    EXPECT_EQ(query(R"({"range": {"price": {"gte": 80}}})"), (std::vector<std::string>{"p1", "p3"}));
    EXPECT_EQ(query(R"({"range": {"price": {"gt": 20, "lt": 120}}})"), std::vector<std::string>{"p1"});
    EXPECT_EQ(query(R"({"exists": {"field": "price"}})"), (std::vector<std::string>{"p1", "p2", "p3"}));
    // Empty arrays count as missing.
    EXPECT_EQ(query(R"({"exists": {"field": "tags"}})"), (std::vector<std::string>{"p1", "p2"}));
    EXPECT_EQ(status_of([&] { query(R"({"range": {"price": {"near": 3}}})"); }), 400);
}

TEST_F(MemoryStoreTest, BoolQueries) {
    EXPECT_EQ(query(R"({"bool": {"must": [{"term": {"category": "shoes"}}, {"range": {"price": {"lt": 100}}}]}})"),
              std::vector<std::string>{"p1"});
    EXPECT_EQ(query(R"({"bool": {"must_not": [{"exists": {"field": "price"}}]}})"), std::vector<std::string>{"p4"});
    EXPECT_EQ(query(R"({"bool": {"should": [{"term": {"category": "hats"}}, {"term": {"category": "scarves"}}],
                                 "minimum_should_match": 1}})"),
              (std::vector<std::string>{"p2", "p4"}));
    EXPECT_EQ(query(R"({"bool": {"filter": [{"term": {"category": "shoes"}}],
                                 "must": [{"match": {"name": "blue"}}]}})"),
              std::vector<std::string>{"p3"});
    EXPECT_EQ(query(R"({"bool": {"must_not": [{"match_all": {}}]}})"), std::vector<std::string>{});
}

TEST_F(MemoryStoreTest, MatchScoresDistinctTerms) {
    std::vector<SearchHit> hits = store_.search("products", json::parse(R"({"match": {"name": "red blue red"}})"),
                                                {}, {}, 0, 10);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, "p3");
    EXPECT_DOUBLE_EQ(hits[0].score.value(), 2.0);
    EXPECT_EQ(hits[1].id, "p1");
    EXPECT_DOUBLE_EQ(hits[1].score.value(), 1.0);
    EXPECT_EQ(hits[2].id, "p2");
}

TEST_F(MemoryStoreTest, MalformedQueries) {
    EXPECT_EQ(status_of([&] { query(R"({"wildcard": {"name": "r*"}})"); }), 400);
    EXPECT_EQ(status_of([&] { query(R"({"term": {"a": 1, "b": 2}})"); }), 400);
    EXPECT_EQ(status_of([&] { query(R"({"terms": {"tags": "red"}})"); }), 400);
}

TEST_F(MemoryStoreTest, SortedResultsAreUnscored) {
    std::vector<SearchHit> desc = store_.search("products", json{{"match_all", json::object()}},
                                                {json::parse(R"({"price": {"order": "desc"}})")}, {}, 0, 10);
    EXPECT_EQ(ids_of(desc), (std::vector<std::string>{"p3", "p1", "p2", "p4"}));
    EXPECT_FALSE(desc[0].score.has_value());

    std::vector<SearchHit> asc = store_.search("products", json{{"match_all", json::object()}},
                                               {json::parse(R"({"price": {"order": "asc"}})")}, {}, 1, 2);
    EXPECT_EQ(ids_of(asc), (std::vector<std::string>{"p1", "p3"}));
}

TEST(MemoryStoreSort, MixedKindsOrderByKind) {
    MemoryDocumentStore store;
    store.index_document("mixed", "m1", json{{"code", 5}});
    store.index_document("mixed", "m2", json{{"code", "a"}});
    store.index_document("mixed", "m3", json{{"code", true}});
    store.index_document("mixed", "m4", json{{"code", 2}});
    store.index_document("mixed", "m5", json::object());
    store.index_document("mixed", "m6", json{{"code", "b"}});

    const json all = json{{"match_all", json::object()}};
    std::vector<SearchHit> asc = store.search("mixed", all, {json::parse(R"({"code": {"order": "asc"}})")}, {}, 0, 10);
    EXPECT_EQ(ids_of(asc), (std::vector<std::string>{"m4", "m1", "m2", "m6", "m3", "m5"}));

    std::vector<SearchHit> desc = store.search("mixed", all, {json::parse(R"({"code": {"order": "desc"}})")}, {}, 0, 10);
    EXPECT_EQ(ids_of(desc), (std::vector<std::string>{"m3", "m6", "m2", "m1", "m4", "m5"}));
}

TEST_F(MemoryStoreTest, ExcludesSourceFields) {
    std::vector<SearchHit> hits = store_.search("products", json::parse(R"({"term": {"_id": "p1"}})"), {},
                                                {"v", "tags"}, 0, 10);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_FALSE(hits[0].source.contains("v"));
    EXPECT_FALSE(hits[0].source.contains("tags"));
    EXPECT_TRUE(hits[0].source.contains("name"));
}

//=============================================================================
// kNN
//=============================================================================

TEST_F(MemoryStoreTest, KnnRanksBySimilarity) {
    std::vector<SearchHit> hits = store_.search("products", json::parse(R"({"knn": {
        "field": "v", "query_vector": [1.0, 0.0], "k": 10, "num_candidates": 20
    }})"), {}, {}, 0, 10);
    // p4 has a vector of a different size and is skipped.
    ASSERT_EQ(ids_of(hits), (std::vector<std::string>{"p1", "p3", "p2"}));
    EXPECT_DOUBLE_EQ(hits[0].score.value(), 1.0);
    EXPECT_NEAR(hits[1].score.value(), 0.8, 1e-6);
    EXPECT_DOUBLE_EQ(hits[2].score.value(), 0.5);
}

TEST_F(MemoryStoreTest, KnnHonorsKAndFilter) {
    EXPECT_EQ(query(R"({"knn": {"field": "v", "query_vector": [1.0, 0.0], "k": 1, "num_candidates": 2}})"),
              std::vector<std::string>{"p1"});
    EXPECT_EQ(query(R"({"knn": {"field": "v", "query_vector": [1.0, 0.0], "k": 5, "num_candidates": 10,
                                "filter": [{"term": {"category": "hats"}}]}})"),
              std::vector<std::string>{"p2"});
}

TEST_F(MemoryStoreTest, KnnRejectsBadRequests) {
    EXPECT_EQ(status_of([&] { query(R"({"knn": {"field": "v", "query_vector": [1.0, 0.0], "k": 5, "num_candidates": 2}})"); }),
              400);
    EXPECT_EQ(status_of([&] { query(R"({"knn": {"query_vector": [1.0, 0.0]}})"); }), 400);
    EXPECT_EQ(status_of([&] {
                  query(R"({"bool": {"must": [{"knn": {"field": "v", "query_vector": [1.0, 0.0], "k": 1}}]}})");
              }),
              400);
}

TEST_F(MemoryStoreTest, ReciprocalRankFusion) {
    json retriever = json::parse(R"({"rrf": {
        "retrievers": [
            {"knn": {"field": "v", "query_vector": [0.6, 0.8], "k": 3, "num_candidates": 6}},
            {"standard": {"query": {"match": {"name": "red blue"}}}}
        ],
        "rank_window_size": 10,
        "rank_constant": 60
    }})");
    std::vector<SearchHit> hits = store_.hybrid_search("products", retriever, {}, 0, 10);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, "p3");
    EXPECT_DOUBLE_EQ(hits[0].score.value(), 2.0 / 61.0);

    retriever["rrf"]["rank_window_size"] = 1;
    EXPECT_EQ(ids_of(store_.hybrid_search("products", retriever, {}, 0, 10)), std::vector<std::string>{"p3"});
}

TEST_F(MemoryStoreTest, FusionWithFilteredLegs) {
    json retriever = json::parse(R"({"rrf": {
        "retrievers": [
            {"knn": {"field": "v", "query_vector": [0.0, 1.0], "k": 3, "num_candidates": 6,
                     "filter": [{"term": {"category": "shoes"}}]}},
            {"standard": {"query": {"bool": {"filter": [{"term": {"category": "shoes"}}],
                                             "must": [{"match": {"name": "blue"}}]}}}}
        ],
        "rank_window_size": 10,
        "rank_constant": 60
    }})");
    std::vector<std::string> ids = ids_of(store_.hybrid_search("products", retriever, {}, 0, 10));
    EXPECT_EQ(ids, (std::vector<std::string>{"p3", "p1"}));
}

TEST_F(MemoryStoreTest, RetrieverErrors) {
    EXPECT_EQ(status_of([&] { store_.hybrid_search("products", json::parse(R"({"linear": {}})"), {}, 0, 10); }), 400);
    EXPECT_EQ(status_of([&] {
                  store_.hybrid_search("products",
                                       json::parse(R"({"rrf": {"retrievers": [{"standard": {}}]}})"), {}, 0, 10);
              }),
              400);
}
