/**
 * @file record_definition.hpp
 * @brief Explicit record definitions (property lists) for collections
 *
 * A RecordDefinition describes the key, data and vector properties of a
 * record without reference to a C++ type. It is the only schema source for
 * dynamic collections and may overlay a RecordType<T> for typed ones.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "embedding.hpp"
#include "types.hpp"

namespace elastivec {

//=============================================================================
// Vector Configuration Names
//=============================================================================

namespace distance_function {
inline constexpr const char* COSINE_SIMILARITY = "CosineSimilarity";
inline constexpr const char* DOT_PRODUCT_SIMILARITY = "DotProductSimilarity";
inline constexpr const char* EUCLIDEAN_DISTANCE = "EuclideanDistance";
inline constexpr const char* MAX_INNER_PRODUCT = "max_inner_product";
} // namespace distance_function

namespace index_kind {
inline constexpr const char* HNSW = "Hnsw";
inline constexpr const char* INT8_HNSW = "int8_hnsw";
inline constexpr const char* INT4_HNSW = "int4_hnsw";
inline constexpr const char* BBQ_HNSW = "bbq_hnsw";
inline constexpr const char* FLAT = "Flat";
inline constexpr const char* INT8_FLAT = "int8_flat";
inline constexpr const char* INT4_FLAT = "int4_flat";
inline constexpr const char* BBQ_FLAT = "bbq_flat";
} // namespace index_kind

//=============================================================================
// Property Definitions
//=============================================================================

enum class PropertyRole : uint8_t {
    KEY = 0,
    DATA = 1,
    VECTOR = 2,
};

const char* property_role_name(PropertyRole role);

/**
 * Options for data properties.
 */
struct DataOptions {
    std::optional<std::string> storage_name;
    bool is_indexed = false;
    bool is_full_text_indexed = false;
};

/**
 * Options for vector properties. Unset distance function and index kind
 * fall back to cosine similarity and int8_hnsw respectively.
 */
struct VectorOptions {
    uint32_t dimensions = 0;
    std::optional<std::string> distance_function;
    std::optional<std::string> index_kind;
    std::optional<std::string> storage_name;
    EmbeddingGeneratorPtr embedding_generator;
};

/**
 * One property of a record definition.
 */
struct PropertyDefinition {
    PropertyRole role = PropertyRole::DATA;
    std::string name;                           // application-facing (model) name
    TypeInfo type;
    std::optional<std::string> storage_name;    // explicit override

    // Data properties
    bool is_indexed = false;
    bool is_full_text_indexed = false;

    // Vector properties
    uint32_t dimensions = 0;
    std::optional<std::string> distance_function;
    std::optional<std::string> index_kind;
    EmbeddingGeneratorPtr embedding_generator;

    static PropertyDefinition key(const std::string& name, TypeInfo type,
                                  std::optional<std::string> storage_name = std::nullopt);
    static PropertyDefinition data(const std::string& name, TypeInfo type,
                                   const DataOptions& options = {});
    static PropertyDefinition vector(const std::string& name, TypeInfo type,
                                     const VectorOptions& options);
};

/**
 * Ordered list of property definitions with unique names.
 */
class RecordDefinition {
public:
    RecordDefinition() = default;
    RecordDefinition(std::initializer_list<PropertyDefinition> properties);

    /**
     * Append a property. Throws SchemaError if the name is already defined.
     */
    RecordDefinition& add(PropertyDefinition property);

    const std::vector<PropertyDefinition>& properties() const { return properties_; }

    const PropertyDefinition* find(const std::string& name) const;

    bool empty() const { return properties_.empty(); }

    /**
     * Serialize to JSON: {"properties": [{"name", "role", "type", ...}]}.
     * Embedding generators are not serialized.
     */
    nlohmann::json to_json() const;

    /**
     * Load from JSON. Accepts either the object form produced by to_json or
     * a bare array of property objects.
     */
    static RecordDefinition from_json(const nlohmann::json& j);

private:
    std::vector<PropertyDefinition> properties_;
    std::unordered_map<std::string, size_t> name_to_index_;
};

} // namespace elastivec
