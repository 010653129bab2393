/**
 * @file types.hpp
 * @brief Value and type vocabulary shared by every Elastivec component
 *
 * - TypeKind / TypeInfo describe the declared type of a record property
 * - FieldValue is the variant used for dynamic records, filter constants and
 *   embedding generator inputs
 * - Embedding is the explicit embedding wrapper type
 * - codec::encode / codec::decode convert typed members to and from JSON
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <nlohmann/json.hpp>

namespace elastivec {

using Uuid = boost::uuids::uuid;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

//=============================================================================
// Embedding
//=============================================================================

/**
 * Explicit embedding wrapper. Stored in documents as a flat numeric array,
 * never as a structured object.
 */
class Embedding {
public:
    Embedding() = default;
    explicit Embedding(std::vector<float> vector) : vector_(std::move(vector)) {}

    const std::vector<float>& vector() const { return vector_; }
    size_t dimensions() const { return vector_.size(); }
    bool empty() const { return vector_.empty(); }

    bool operator==(const Embedding& other) const = default;

private:
    std::vector<float> vector_;
};

//=============================================================================
// Type Descriptors
//=============================================================================

/**
 * Semantic property types.
 */
enum class TypeKind : uint8_t {
    STRING = 0,
    BOOL = 1,
    INT8 = 2,
    UINT8 = 3,
    INT16 = 4,
    UINT16 = 5,
    INT32 = 6,
    UINT32 = 7,
    INT64 = 8,
    UINT64 = 9,
    FLOAT = 10,
    DOUBLE = 11,
    TIMESTAMP = 12,
    UUID = 13,
    STRING_ARRAY = 14,      // std::vector<std::string>
    INT_ARRAY = 15,         // std::vector<int64_t>
    DOUBLE_ARRAY = 16,      // std::vector<double>
    FLOAT_VECTOR = 17,      // std::vector<float>
    FLOAT_FIXED_ARRAY = 18, // std::array<float, N>
    FLOAT_DEQUE = 19,       // std::deque<float>
    FLOAT_LIST = 20,        // std::list<float>
    EMBEDDING = 21,         // Embedding
    OBJECT = 22,            // anything else; serialized through nlohmann adl
};

/**
 * Declared type of a property. nullable marks std::optional<...> members
 * (or nullable definition entries).
 */
struct TypeInfo {
    TypeKind kind = TypeKind::OBJECT;
    bool nullable = false;
    std::string name;               // display name used in error messages

    TypeInfo() = default;
    TypeInfo(TypeKind k, bool null = false, std::string n = {});

    bool operator==(const TypeInfo& other) const {
        return kind == other.kind && nullable == other.nullable && name == other.name;
    }
};

/**
 * Canonical short name of a kind ("string", "int64", "float[]", ...).
 */
const char* type_kind_name(TypeKind kind);

/**
 * Parse a canonical type name as written in JSON record definitions.
 * A trailing '?' marks the type nullable.
 */
TypeInfo parse_type_name(const std::string& name);

bool is_integer_kind(TypeKind kind);
bool is_numeric_kind(TypeKind kind);

/**
 * True for the vector shapes that can be stored without an embedding generator.
 */
bool is_native_vector_kind(TypeKind kind);

/**
 * Human-readable list of the supported vector types.
 */
extern const char* const SUPPORTED_VECTOR_TYPES;

//=============================================================================
// Static type mapping
//=============================================================================

namespace detail {

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_float_array : std::false_type {};
template <size_t N> struct is_float_array<std::array<float, N>> : std::true_type {};

} // namespace detail

/**
 * Map a C++ member type to its TypeInfo.
 */
template <typename T>
TypeInfo type_of() {
    using U = std::remove_cv_t<T>;
    if constexpr (detail::is_optional<U>::value) {
        TypeInfo inner = type_of<typename U::value_type>();
        inner.nullable = true;
        return inner;
    } else if constexpr (std::is_same_v<U, std::string>) {
        return TypeInfo(TypeKind::STRING);
    } else if constexpr (std::is_same_v<U, bool>) {
        return TypeInfo(TypeKind::BOOL);
    } else if constexpr (std::is_same_v<U, int8_t>) {
        return TypeInfo(TypeKind::INT8);
    } else if constexpr (std::is_same_v<U, uint8_t>) {
        return TypeInfo(TypeKind::UINT8);
    } else if constexpr (std::is_same_v<U, int16_t>) {
        return TypeInfo(TypeKind::INT16);
    } else if constexpr (std::is_same_v<U, uint16_t>) {
        return TypeInfo(TypeKind::UINT16);
    } else if constexpr (std::is_same_v<U, int32_t>) {
        return TypeInfo(TypeKind::INT32);
    } else if constexpr (std::is_same_v<U, uint32_t>) {
        return TypeInfo(TypeKind::UINT32);
    } else if constexpr (std::is_same_v<U, int64_t>) {
        return TypeInfo(TypeKind::INT64);
    } else if constexpr (std::is_same_v<U, uint64_t>) {
        return TypeInfo(TypeKind::UINT64);
    } else if constexpr (std::is_same_v<U, float>) {
        return TypeInfo(TypeKind::FLOAT);
    } else if constexpr (std::is_same_v<U, double>) {
        return TypeInfo(TypeKind::DOUBLE);
    } else if constexpr (std::is_same_v<U, Timestamp>) {
        return TypeInfo(TypeKind::TIMESTAMP);
    } else if constexpr (std::is_same_v<U, Uuid>) {
        return TypeInfo(TypeKind::UUID);
    } else if constexpr (std::is_same_v<U, std::vector<std::string>>) {
        return TypeInfo(TypeKind::STRING_ARRAY);
    } else if constexpr (std::is_same_v<U, std::vector<int64_t>>) {
        return TypeInfo(TypeKind::INT_ARRAY);
    } else if constexpr (std::is_same_v<U, std::vector<double>>) {
        return TypeInfo(TypeKind::DOUBLE_ARRAY);
    } else if constexpr (std::is_same_v<U, std::vector<float>>) {
        return TypeInfo(TypeKind::FLOAT_VECTOR);
    } else if constexpr (detail::is_float_array<U>::value) {
        return TypeInfo(TypeKind::FLOAT_FIXED_ARRAY);
    } else if constexpr (std::is_same_v<U, std::deque<float>>) {
        return TypeInfo(TypeKind::FLOAT_DEQUE);
    } else if constexpr (std::is_same_v<U, std::list<float>>) {
        return TypeInfo(TypeKind::FLOAT_LIST);
    } else if constexpr (std::is_same_v<U, Embedding>) {
        return TypeInfo(TypeKind::EMBEDDING);
    } else {
        return TypeInfo(TypeKind::OBJECT, false, typeid(U).name());
    }
}

//=============================================================================
// FieldValue
//=============================================================================

/**
 * Variant type for dynamic record values, filter constants and generator input.
 */
using FieldValue = std::variant<
    std::monostate,                    // null
    bool,
    int64_t,
    uint64_t,
    double,
    std::string,
    Uuid,
    Timestamp,
    std::vector<std::string>,          // string[]
    std::vector<int64_t>,              // int[]
    std::vector<double>,               // double[]
    std::vector<float>,                // float vector
    Embedding
>;

/**
 * Dynamic record: field name -> value.
 */
using DynamicRecord = std::map<std::string, FieldValue>;

inline bool is_null(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * Type of the value currently held (null reports OBJECT, nullable).
 */
TypeInfo type_of_value(const FieldValue& value);

/**
 * Short description of a value for error messages.
 */
std::string describe_value(const FieldValue& value);

/**
 * Convert a value to its JSON document form.
 * UUIDs become canonical strings, timestamps ISO-8601 strings and
 * embeddings flat numeric arrays.
 */
nlohmann::json field_value_to_json(const FieldValue& value);

/**
 * Convert a JSON document value to a FieldValue of the declared type.
 * JSON null yields std::monostate.
 */
FieldValue field_value_from_json(const nlohmann::json& j, const TypeInfo& type);

/**
 * Flat float vector from a numeric value (float vector, double array, embedding).
 */
std::optional<std::vector<float>> numeric_vector(const FieldValue& value);

/**
 * Wrap a C++ value into a FieldValue.
 */
template <typename T>
FieldValue make_field_value(const T& value) {
    using U = std::decay_t<T>;
    if constexpr (detail::is_optional<U>::value) {
        if (!value.has_value()) {
            return std::monostate{};
        }
        return make_field_value(*value);
    } else if constexpr (std::is_same_v<U, FieldValue>) {
        return value;
    } else if constexpr (std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::monostate>) {
        return std::monostate{};
    } else if constexpr (std::is_same_v<U, bool>) {
        return value;
    } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
        return static_cast<int64_t>(value);
    } else if constexpr (std::is_integral_v<U>) {
        return static_cast<uint64_t>(value);
    } else if constexpr (std::is_floating_point_v<U>) {
        return static_cast<double>(value);
    } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
        return std::string(value);
    } else if constexpr (std::is_same_v<U, std::string_view>) {
        return std::string(value);
    } else if constexpr (std::is_same_v<U, std::deque<float>> || std::is_same_v<U, std::list<float>> ||
                         detail::is_float_array<U>::value) {
        return std::vector<float>(value.begin(), value.end());
    } else if constexpr (std::is_same_v<U, std::vector<int32_t>>) {
        return std::vector<int64_t>(value.begin(), value.end());
    } else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, Uuid> ||
                         std::is_same_v<U, Timestamp> || std::is_same_v<U, Embedding> ||
                         std::is_same_v<U, std::vector<std::string>> ||
                         std::is_same_v<U, std::vector<int64_t>> ||
                         std::is_same_v<U, std::vector<double>> ||
                         std::is_same_v<U, std::vector<float>>) {
        return FieldValue(value);
    } else {
        // Opaque member types go through their JSON form.
        return field_value_from_json(nlohmann::json(value), TypeInfo(TypeKind::OBJECT));
    }
}

//=============================================================================
// Timestamps and UUIDs
//=============================================================================

/**
 * Format as ISO-8601 UTC with millisecond precision ("2024-05-01T12:00:00.000Z").
 */
std::string format_timestamp(Timestamp ts);

/**
 * Parse an ISO-8601 UTC timestamp. Accepts an optional fractional part and a
 * trailing 'Z'. Throws std::invalid_argument on malformed input.
 */
Timestamp parse_timestamp(const std::string& text);

std::string uuid_to_string(const Uuid& id);

/**
 * Parse canonical UUID text. Throws std::invalid_argument on malformed input.
 */
Uuid parse_uuid(const std::string& text);

//=============================================================================
// Typed member codec
//=============================================================================

namespace codec {

/**
 * Encode a typed member into its document form. Types without special
 * handling go through nlohmann's adl_serializer, so a member type's own
 * to_json customization is honoured.
 */
template <typename T>
nlohmann::json encode(const T& value) {
    using U = std::decay_t<T>;
    if constexpr (detail::is_optional<U>::value) {
        if (!value.has_value()) {
            return nullptr;
        }
        return encode(*value);
    } else if constexpr (std::is_same_v<U, Uuid>) {
        return uuid_to_string(value);
    } else if constexpr (std::is_same_v<U, Timestamp>) {
        return format_timestamp(value);
    } else if constexpr (std::is_same_v<U, Embedding>) {
        return value.vector();
    } else if constexpr (std::is_same_v<U, FieldValue>) {
        return field_value_to_json(value);
    } else {
        return nlohmann::json(value);
    }
}

/**
 * Decode a document value into a typed member. Null decodes to the type's
 * default value.
 */
template <typename T>
T decode(const nlohmann::json& j) {
    using U = std::decay_t<T>;
    if (j.is_null()) {
        return U{};
    }
    if constexpr (detail::is_optional<U>::value) {
        return U(decode<typename U::value_type>(j));
    } else if constexpr (std::is_same_v<U, Uuid>) {
        return parse_uuid(j.get<std::string>());
    } else if constexpr (std::is_same_v<U, Timestamp>) {
        return parse_timestamp(j.get<std::string>());
    } else if constexpr (std::is_same_v<U, Embedding>) {
        return Embedding(j.get<std::vector<float>>());
    } else if constexpr (detail::is_float_array<U>::value) {
        if (!j.is_array() || j.size() != std::tuple_size_v<U>) {
            throw std::invalid_argument("Expected a numeric array of length " +
                                        std::to_string(std::tuple_size_v<U>) + ", got " + j.dump());
        }
        U out{};
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = j[i].get<float>();
        }
        return out;
    } else {
        return j.get<U>();
    }
}

} // namespace codec

} // namespace elastivec
