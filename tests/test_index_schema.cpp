#include <gtest/gtest.h>

#include <string>
#include <nlohmann/json.hpp>

#include "collection_model.hpp"
#include "errors.hpp"
#include "index_schema.hpp"
#include "test_util.hpp"

using namespace elastivec;
using json = nlohmann::json;

namespace {

CollectionModelPtr model_with_vector(VectorOptions options, TypeInfo type = TypeInfo(TypeKind::FLOAT_VECTOR)) {
    RecordDefinition def;
    def.add(PropertyDefinition::key("Id", TypeInfo(TypeKind::STRING)));
    def.add(PropertyDefinition::vector("Embedding", std::move(type), options));
    return CollectionModelBuilder().build_dynamic(def, nullptr);
}

} // namespace

TEST(IndexSchema, DenseVectorWithDefaults) {
    VectorOptions options;
    options.dimensions = 3;
    options.distance_function = distance_function::COSINE_SIMILARITY;
    json schema = build_index_schema(*model_with_vector(options));

    const json& field = schema.at("properties").at("embedding");
    EXPECT_EQ(field.at("type"), "dense_vector");
    EXPECT_EQ(field.at("dims"), 3);
    EXPECT_EQ(field.at("index"), true);
    EXPECT_EQ(field.at("similarity"), "cosine");
    EXPECT_EQ(field.at("index_options").at("type"), "int8_hnsw");
}

TEST(IndexSchema, DistanceFunctionsMapToSimilarities) {
    const std::pair<const char*, const char*> cases[] = {
        {distance_function::COSINE_SIMILARITY, "cosine"},
        {distance_function::DOT_PRODUCT_SIMILARITY, "dot_product"},
        {distance_function::EUCLIDEAN_DISTANCE, "l2_norm"},
        {distance_function::MAX_INNER_PRODUCT, "max_inner_product"},
    };
    for (const auto& [df, similarity] : cases) {
        VectorOptions options;
        options.dimensions = 2;
        options.distance_function = df;
        json schema = build_index_schema(*model_with_vector(options));
        EXPECT_EQ(schema["properties"]["embedding"]["similarity"], similarity) << df;
    }
}

TEST(IndexSchema, IndexKindsMapToIndexOptions) {
    const std::pair<const char*, const char*> cases[] = {
        {index_kind::HNSW, "hnsw"},
        {index_kind::INT8_HNSW, "int8_hnsw"},
        {index_kind::INT4_HNSW, "int4_hnsw"},
        {index_kind::BBQ_HNSW, "bbq_hnsw"},
        {index_kind::FLAT, "flat"},
        {index_kind::INT8_FLAT, "int8_flat"},
        {index_kind::INT4_FLAT, "int4_flat"},
        {index_kind::BBQ_FLAT, "bbq_flat"},
    };
    for (const auto& [kind, type] : cases) {
        VectorOptions options;
        options.dimensions = 2;
        options.index_kind = kind;
        json schema = build_index_schema(*model_with_vector(options));
        EXPECT_EQ(schema["properties"]["embedding"]["index_options"]["type"], type) << kind;
    }
}

TEST(IndexSchema, UnsupportedVectorConfiguration) {
    VectorOptions bad_distance;
    bad_distance.dimensions = 2;
    bad_distance.distance_function = "ManhattanDistance";
    EXPECT_THROW(build_index_schema(*model_with_vector(bad_distance)), UnsupportedConfigurationError);

    VectorOptions bad_kind;
    bad_kind.dimensions = 2;
    bad_kind.index_kind = "DiskAnn";
    EXPECT_THROW(build_index_schema(*model_with_vector(bad_kind)), UnsupportedConfigurationError);
}

TEST(IndexSchema, DataPropertyMappings) {
    RecordDefinition def;
    def.add(PropertyDefinition::key("Id", TypeInfo(TypeKind::STRING)));
    def.add(PropertyDefinition::data("Body", TypeInfo(TypeKind::STRING), {.is_full_text_indexed = true}));
    def.add(PropertyDefinition::data("Category", TypeInfo(TypeKind::STRING), {.is_indexed = true}));
    def.add(PropertyDefinition::data("Price", TypeInfo(TypeKind::DOUBLE), {.is_indexed = true}));
    def.add(PropertyDefinition::data("Stock", TypeInfo(TypeKind::INT64), {.is_indexed = true}));
    def.add(PropertyDefinition::data("Small", TypeInfo(TypeKind::INT16), {.is_indexed = true}));
    def.add(PropertyDefinition::data("Big", TypeInfo(TypeKind::UINT64), {.is_indexed = true}));
    def.add(PropertyDefinition::data("Active", TypeInfo(TypeKind::BOOL), {.is_indexed = true}));
    def.add(PropertyDefinition::data("Updated", TypeInfo(TypeKind::TIMESTAMP), {.is_indexed = true}));
    def.add(PropertyDefinition::data("Notes", TypeInfo(TypeKind::STRING)));

    json props = build_index_schema(*CollectionModelBuilder().build_dynamic(def, nullptr))["properties"];

    EXPECT_EQ(props["body"], json::object({{"type", "text"}}));
    EXPECT_EQ(props["category"], json::object({{"type", "keyword"}}));
    EXPECT_EQ(props["price"]["type"], "double");
    EXPECT_EQ(props["stock"]["type"], "long");
    EXPECT_EQ(props["small"]["type"], "short");
    EXPECT_EQ(props["big"]["type"], "unsigned_long");
    EXPECT_EQ(props["active"]["type"], "boolean");
    EXPECT_EQ(props["updated"]["type"], "date");
    EXPECT_EQ(props["notes"], json::object({{"type", "keyword"}, {"index", false}}));
}

TEST(IndexSchema, EveryNonKeyPropertyAppearsOnce) {
    CollectionModelPtr model = CollectionModelBuilder().build(fixtures::hotel_type(), std::nullopt, nullptr);
    json props = build_index_schema(*model)["properties"];

    EXPECT_EQ(props.size(), model->properties().size() - 1);
    for (const auto& p : model->properties()) {
        if (p.is_key()) {
            EXPECT_FALSE(props.contains(p.storage_name));
        } else {
            EXPECT_TRUE(props.contains(p.storage_name)) << p.storage_name;
        }
    }
    EXPECT_EQ(props["tags"]["type"], "keyword");
    EXPECT_EQ(props["description"]["type"], "text");
    EXPECT_EQ(props["descriptionEmbedding"]["dims"], 4);
}
