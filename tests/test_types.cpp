#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <deque>
#include <list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "types.hpp"

using namespace elastivec;
using json = nlohmann::json;

TEST(TypeOf, MapsMemberTypes) {
    EXPECT_EQ(type_of<std::string>().kind, TypeKind::STRING);
    EXPECT_EQ(type_of<int64_t>().kind, TypeKind::INT64);
    EXPECT_EQ(type_of<int32_t>().kind, TypeKind::INT32);
    EXPECT_EQ(type_of<bool>().kind, TypeKind::BOOL);
    EXPECT_EQ(type_of<Uuid>().kind, TypeKind::UUID);
    EXPECT_EQ(type_of<Timestamp>().kind, TypeKind::TIMESTAMP);
    EXPECT_EQ(type_of<std::vector<std::string>>().kind, TypeKind::STRING_ARRAY);
    EXPECT_EQ(type_of<std::vector<float>>().kind, TypeKind::FLOAT_VECTOR);
    EXPECT_EQ((type_of<std::array<float, 3>>().kind), TypeKind::FLOAT_FIXED_ARRAY);
    EXPECT_EQ(type_of<std::deque<float>>().kind, TypeKind::FLOAT_DEQUE);
    EXPECT_EQ(type_of<std::list<float>>().kind, TypeKind::FLOAT_LIST);
    EXPECT_EQ(type_of<Embedding>().kind, TypeKind::EMBEDDING);

    TypeInfo opt = type_of<std::optional<double>>();
    EXPECT_EQ(opt.kind, TypeKind::DOUBLE);
    EXPECT_TRUE(opt.nullable);
    EXPECT_EQ(opt.name, "double");
}

TEST(TypeOf, ParsesDefinitionTypeNames) {
    TypeInfo t = parse_type_name("float[]?");
    EXPECT_EQ(t.kind, TypeKind::FLOAT_VECTOR);
    EXPECT_TRUE(t.nullable);

    EXPECT_EQ(parse_type_name("long").kind, TypeKind::INT64);
    EXPECT_EQ(parse_type_name("string[]").kind, TypeKind::STRING_ARRAY);

    TypeInfo unknown = parse_type_name("geo_point");
    EXPECT_EQ(unknown.kind, TypeKind::OBJECT);
    EXPECT_EQ(unknown.name, "geo_point");
}

TEST(TypeOf, VectorKinds) {
    EXPECT_TRUE(is_native_vector_kind(TypeKind::FLOAT_VECTOR));
    EXPECT_TRUE(is_native_vector_kind(TypeKind::EMBEDDING));
    EXPECT_FALSE(is_native_vector_kind(TypeKind::DOUBLE_ARRAY));
    EXPECT_FALSE(is_native_vector_kind(TypeKind::STRING));
    EXPECT_TRUE(is_numeric_kind(TypeKind::UINT16));
    EXPECT_FALSE(is_integer_kind(TypeKind::DOUBLE));
}

TEST(Timestamps, FormatsIsoUtcWithMilliseconds) {
    Timestamp ts(std::chrono::milliseconds(1714564800123LL));
    EXPECT_EQ(format_timestamp(ts), "2024-05-01T12:00:00.123Z");
    EXPECT_EQ(parse_timestamp("2024-05-01T12:00:00.123Z"), ts);
}

TEST(Timestamps, ParsesWithoutFraction) {
    Timestamp ts(std::chrono::milliseconds(1714564800000LL));
    EXPECT_EQ(parse_timestamp("2024-05-01T12:00:00Z"), ts);
    EXPECT_EQ(parse_timestamp("2024-05-01T12:00:00"), ts);
    EXPECT_EQ(parse_timestamp("2024-05-01T12:00:00.5Z"), ts + std::chrono::milliseconds(500));
}

TEST(Timestamps, RejectsMalformedText) {
    EXPECT_THROW(parse_timestamp("yesterday"), std::invalid_argument);
    EXPECT_THROW(parse_timestamp("2024-05-01T12:00:00+02:00"), std::invalid_argument);
}

TEST(Uuids, CanonicalText) {
    Uuid id = parse_uuid("123E4567-E89B-12D3-A456-426614174000");
    EXPECT_EQ(uuid_to_string(id), "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_THROW(parse_uuid("123"), std::invalid_argument);
}

TEST(FieldValues, ToJson) {
    EXPECT_TRUE(field_value_to_json(FieldValue{}).is_null());
    EXPECT_EQ(field_value_to_json(FieldValue(int64_t{3})), json(3));
    EXPECT_EQ(field_value_to_json(FieldValue(std::vector<std::string>{"a", "b"})), json::array({"a", "b"}));
    EXPECT_EQ(field_value_to_json(FieldValue(Embedding(std::vector<float>{1.0f, 2.0f}))), json::array({1.0, 2.0}));
    EXPECT_EQ(field_value_to_json(FieldValue(parse_uuid("123e4567-e89b-12d3-a456-426614174000"))),
              json("123e4567-e89b-12d3-a456-426614174000"));
}

TEST(FieldValues, FromJsonFollowsDeclaredType) {
    FieldValue i = field_value_from_json(json(5), TypeInfo(TypeKind::INT32));
    ASSERT_TRUE(std::holds_alternative<int64_t>(i));
    EXPECT_EQ(std::get<int64_t>(i), 5);

    FieldValue d = field_value_from_json(json(5), TypeInfo(TypeKind::DOUBLE));
    ASSERT_TRUE(std::holds_alternative<double>(d));

    FieldValue ts = field_value_from_json(json("2024-05-01T12:00:00.000Z"), TypeInfo(TypeKind::TIMESTAMP));
    ASSERT_TRUE(std::holds_alternative<Timestamp>(ts));

    FieldValue e = field_value_from_json(json::array({0.5, 1.5}), TypeInfo(TypeKind::EMBEDDING));
    ASSERT_TRUE(std::holds_alternative<Embedding>(e));
    EXPECT_EQ(std::get<Embedding>(e).dimensions(), 2u);

    EXPECT_TRUE(is_null(field_value_from_json(json(nullptr), TypeInfo(TypeKind::STRING))));
    EXPECT_THROW(field_value_from_json(json("x"), TypeInfo(TypeKind::INT64)), json::exception);
}

TEST(FieldValues, NumericVector) {
    auto from_doubles = numeric_vector(FieldValue(std::vector<double>{1.0, 2.0}));
    ASSERT_TRUE(from_doubles.has_value());
    EXPECT_EQ(*from_doubles, (std::vector<float>{1.0f, 2.0f}));

    auto from_embedding = numeric_vector(FieldValue(Embedding(std::vector<float>{3.0f})));
    ASSERT_TRUE(from_embedding.has_value());
    EXPECT_EQ(from_embedding->size(), 1u);

    EXPECT_FALSE(numeric_vector(FieldValue(std::string("text"))).has_value());
    EXPECT_FALSE(numeric_vector(FieldValue(std::vector<int64_t>{1})).has_value());
}

TEST(FieldValues, MakeFieldValue) {
    EXPECT_TRUE(is_null(make_field_value(std::optional<int>{})));
    EXPECT_EQ(std::get<int64_t>(make_field_value(int32_t{3})), 3);
    EXPECT_EQ(std::get<uint64_t>(make_field_value(uint32_t{3})), 3u);
    EXPECT_EQ(std::get<std::string>(make_field_value("abc")), "abc");
    EXPECT_EQ(std::get<std::vector<float>>(make_field_value(std::array<float, 2>{1.0f, 2.0f})),
              (std::vector<float>{1.0f, 2.0f}));
    EXPECT_EQ(std::get<std::vector<float>>(make_field_value(std::list<float>{4.0f})),
              (std::vector<float>{4.0f}));
    EXPECT_EQ(type_of_value(make_field_value(2.5f)).kind, TypeKind::DOUBLE);
}

TEST(MemberCodec, EncodesAndDecodesMembers) {
    EXPECT_TRUE(codec::encode(std::optional<std::string>{}).is_null());
    EXPECT_EQ(codec::encode(std::optional<std::string>("x")), json("x"));
    EXPECT_EQ(codec::encode(Embedding(std::vector<float>{1.0f})), json::array({1.0}));

    auto arr = codec::decode<std::array<float, 3>>(json::array({1.0, 2.0, 3.0}));
    EXPECT_EQ(arr[2], 3.0f);
    EXPECT_THROW((codec::decode<std::array<float, 3>>(json::array({1.0, 2.0, 3.0, 4.0}))), std::invalid_argument);
    EXPECT_THROW((codec::decode<std::array<float, 3>>(json::array({1.0, 2.0}))), std::invalid_argument);
    EXPECT_THROW((codec::decode<std::array<float, 3>>(json(1.0))), std::invalid_argument);

    EXPECT_EQ(codec::decode<int64_t>(json(nullptr)), 0);
    EXPECT_FALSE(codec::decode<std::optional<std::string>>(json(nullptr)).has_value());
    EXPECT_EQ(codec::decode<std::optional<std::string>>(json("v")).value(), "v");
    EXPECT_EQ(codec::decode<std::vector<std::string>>(json::array({"a"})).size(), 1u);
}
