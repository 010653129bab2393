/**
 * @file options.hpp
 * @brief Collection and vector store configuration
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "embedding.hpp"
#include "record_definition.hpp"

namespace elastivec {

/**
 * Field naming policy applied to model names that carry no explicit
 * storage name.
 */
enum class NamingPolicy : uint8_t {
    CAMEL_CASE = 0,   // "HotelName" -> "hotelName"
    SNAKE_CASE = 1,   // "HotelName" -> "hotel_name"
    AS_IS = 2,        // unchanged
};

NamingPolicy string_to_naming_policy(const std::string& str);
const char* naming_policy_to_string(NamingPolicy policy);

/**
 * Apply a naming policy to a model name.
 */
std::string apply_naming_policy(NamingPolicy policy, const std::string& name);

/**
 * Custom model name -> storage name function. Takes precedence over the
 * naming policy when set.
 */
using FieldNameInferrer = std::function<std::string(const std::string&)>;

/**
 * Per-collection configuration.
 */
struct CollectionOptions {
    std::optional<RecordDefinition> definition;     // overlay (typed) or schema (dynamic)
    EmbeddingGeneratorPtr embedding_generator;      // collection-level default generator

    NamingPolicy naming_policy = NamingPolicy::CAMEL_CASE;
    FieldNameInferrer field_name_inferrer;

    bool ignore_null_values = false;                // omit nulls instead of writing them

    // kNN
    uint32_t num_candidates_factor = 2;             // num_candidates = k * factor

    // Hybrid search (reciprocal rank fusion)
    std::optional<uint32_t> rank_window_size;       // default max(skip + top, 10)
    uint32_t rank_constant = 60;

    /**
     * Storage name for a model name without override.
     */
    std::string infer_field_name(const std::string& model_name) const;

    /**
     * Load scalar settings and an optional "definition" from JSON.
     * Unknown keys are ignored.
     */
    static CollectionOptions from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

/**
 * Store-wide configuration. collection_defaults seeds the options of every
 * collection obtained from the store.
 */
struct VectorStoreOptions {
    EmbeddingGeneratorPtr embedding_generator;
    CollectionOptions collection_defaults;

    static VectorStoreOptions from_json(const nlohmann::json& j);
};

} // namespace elastivec
