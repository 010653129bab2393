#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "collection_model.hpp"
#include "errors.hpp"
#include "search_request.hpp"
#include "test_util.hpp"

using namespace elastivec;
using json = nlohmann::json;

namespace {

CollectionModelPtr hotel_model(EmbeddingGeneratorPtr generator = nullptr) {
    return CollectionModelBuilder().build(fixtures::hotel_type(), std::nullopt, std::move(generator));
}

const std::vector<float> QUERY = {0.5f, 0.25f, 0.0f, 1.0f};

} // namespace

TEST(SearchRequest, TopMustBePositive) {
    EXPECT_THROW(check_top(0), std::invalid_argument);
    EXPECT_NO_THROW(check_top(1));
}

TEST(SearchRequest, KnnQueryShape) {
    CollectionModelPtr model = hotel_model();
    json q = build_knn_query(model->vector_property(0), QUERY, 5, 3, std::nullopt, 2);

    const json& knn = q.at("knn");
    EXPECT_EQ(knn.at("field"), "descriptionEmbedding");
    EXPECT_EQ(knn.at("query_vector"), json::array({0.5, 0.25, 0.0, 1.0}));
    EXPECT_EQ(knn.at("k"), 8);
    EXPECT_EQ(knn.at("num_candidates"), 16);
    EXPECT_FALSE(knn.contains("filter"));
}

TEST(SearchRequest, KnnFilterIsWrappedInAList) {
    CollectionModelPtr model = hotel_model();
    json filter = json::parse(R"({"term": {"rating": 4}})");
    json q = build_knn_query(model->vector_property(0), QUERY, 3, 0, filter, 1);

    EXPECT_EQ(q["knn"]["k"], 3);
    EXPECT_EQ(q["knn"]["num_candidates"], 3);
    EXPECT_EQ(q["knn"]["filter"], json::array({filter}));
}

TEST(SearchRequest, HybridRetrieverShape) {
    CollectionModelPtr model = hotel_model();
    CollectionOptions options;
    json r = build_hybrid_retriever(model->vector_property(0), QUERY, *model->find("Description"),
                                    {"red", "blue"}, 5, 0, std::nullopt, options);

    const json& rrf = r.at("rrf");
    ASSERT_EQ(rrf.at("retrievers").size(), 2u);
    EXPECT_EQ(rrf["retrievers"][0]["knn"]["field"], "descriptionEmbedding");
    EXPECT_EQ(rrf["retrievers"][0]["knn"]["k"], 5);
    EXPECT_EQ(rrf["retrievers"][1], json::parse(R"({"standard": {"query": {"match": {"description": "red blue"}}}})"));
    EXPECT_EQ(rrf.at("rank_window_size"), 10);
    EXPECT_EQ(rrf.at("rank_constant"), 60);
}

TEST(SearchRequest, HybridWindowFollowsPageOrOptions) {
    CollectionModelPtr model = hotel_model();
    const PropertyModel& text = *model->find("Description");

    CollectionOptions defaults;
    json wide = build_hybrid_retriever(model->vector_property(0), QUERY, text, {"x"}, 20, 5, std::nullopt, defaults);
    EXPECT_EQ(wide["rrf"]["rank_window_size"], 25);

    CollectionOptions fixed;
    fixed.rank_window_size = 7;
    fixed.rank_constant = 20;
    json r = build_hybrid_retriever(model->vector_property(0), QUERY, text, {"x"}, 20, 5, std::nullopt, fixed);
    EXPECT_EQ(r["rrf"]["rank_window_size"], 7);
    EXPECT_EQ(r["rrf"]["rank_constant"], 20);
}

TEST(SearchRequest, HybridFilterConstrainsBothLegs) {
    CollectionModelPtr model = hotel_model();
    json filter = json::parse(R"({"term": {"hotelName": "Grand"}})");
    json r = build_hybrid_retriever(model->vector_property(0), QUERY, *model->find("Description"),
                                    {"red"}, 3, 0, filter, CollectionOptions());

    EXPECT_EQ(r["rrf"]["retrievers"][0]["knn"]["filter"], json::array({filter}));
    EXPECT_EQ(r["rrf"]["retrievers"][1]["standard"]["query"], json::parse(R"({
        "bool": {
            "filter": [{"term": {"hotelName": "Grand"}}],
            "must": [{"match": {"description": "red"}}]
        }
    })"));
}

TEST(SearchRequest, JoinKeywords) {
    EXPECT_EQ(join_keywords({"red", "", "blue"}), "red blue");
    EXPECT_EQ(join_keywords({}), "");
}

TEST(SearchRequest, SortEntries) {
    CollectionModelPtr model = hotel_model();
    std::vector<json> sort = build_sort(*model, {{"Rating", false}, {"HotelId", true}});
    ASSERT_EQ(sort.size(), 2u);
    EXPECT_EQ(sort[0], json::parse(R"({"rating": {"order": "desc"}})"));
    EXPECT_EQ(sort[1], json::parse(R"({"_id": {"order": "asc"}})"));

    EXPECT_THROW(build_sort(*model, {{"Stars", true}}), SchemaError);
    EXPECT_THROW(build_sort(*model, {{"DescriptionEmbedding", true}}), SchemaError);
}

TEST(SearchRequest, ExcludedSourceFields) {
    CollectionModelPtr model = hotel_model();
    EXPECT_EQ(excluded_source_fields(*model, false), std::vector<std::string>{"descriptionEmbedding"});
    EXPECT_TRUE(excluded_source_fields(*model, true).empty());
}

TEST(SearchRequest, VectorInputsPassThrough) {
    CollectionModelPtr model = hotel_model();
    const PropertyModel& v = model->vector_property(0);
    EXPECT_EQ(resolve_query_vector(FieldValue(QUERY), v), QUERY);
    EXPECT_EQ(resolve_query_vector(FieldValue(std::vector<double>{1.0, 2.0}), v), (std::vector<float>{1.0f, 2.0f}));
    EXPECT_EQ(resolve_query_vector(FieldValue(Embedding(std::vector<float>{3.0f})), v), std::vector<float>{3.0f});
}

TEST(SearchRequest, TextNeedsAGenerator) {
    CollectionModelPtr model = hotel_model();
    EXPECT_THROW(resolve_query_vector(FieldValue(std::string("sea view")), model->vector_property(0)),
                 NoEmbeddingGeneratorError);
}

TEST(SearchRequest, GeneratorMustAcceptTheInput) {
    CollectionModelPtr model = hotel_model(fixtures::make_text_generator());
    EXPECT_THROW(resolve_query_vector(FieldValue(int64_t{3}), model->vector_property(0)),
                 IncompatibleGeneratorError);
}

TEST(SearchRequest, GeneratesFromText) {
    int calls = 0;
    CollectionModelPtr model = hotel_model(fixtures::make_text_generator(&calls));
    std::vector<float> v = resolve_query_vector(FieldValue(std::string("sea view")), model->vector_property(0));
    EXPECT_EQ(v, fixtures::word_length_embedding("sea view", 4));
    EXPECT_EQ(calls, 1);
}

TEST(SearchRequest, CancelledBeforeGenerating) {
    int calls = 0;
    CollectionModelPtr model = hotel_model(fixtures::make_text_generator(&calls));
    std::stop_source source;
    source.request_stop();
    try {
        resolve_query_vector(FieldValue(std::string("sea")), model->vector_property(0), source.get_token());
        FAIL() << "expected OperationCancelledError";
    } catch (const OperationCancelledError& e) {
        EXPECT_EQ(e.operation_name(), "GenerateEmbedding");
    }
    EXPECT_EQ(calls, 0);
}

TEST(SearchRequest, IncludeVectorsWithGeneration) {
    EXPECT_NO_THROW(check_include_vectors(*hotel_model(), true));
    CollectionModelPtr generated = hotel_model(fixtures::make_text_generator());
    EXPECT_NO_THROW(check_include_vectors(*generated, false));
    EXPECT_THROW(check_include_vectors(*generated, true), UnsupportedCombinationError);
}
