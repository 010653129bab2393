/**
 * @file index_schema.hpp
 * @brief Index mapping generation for a collection model
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "collection_model.hpp"

namespace elastivec {

/**
 * Native similarity name for a distance function
 * ("CosineSimilarity" -> "cosine", ...). Throws UnsupportedConfigurationError.
 */
std::string similarity_for(const PropertyModel& vector_property);

/**
 * Native dense_vector index_options type for an index kind
 * ("Hnsw" -> "hnsw", "int8_hnsw" -> "int8_hnsw", ...).
 * Throws UnsupportedConfigurationError.
 */
std::string index_options_type_for(const PropertyModel& vector_property);

/**
 * Exact-match field type for an indexed data property
 * (boolean/byte/short/integer/long/unsigned_long/double/float/date/keyword).
 */
std::string exact_match_type_for(const TypeInfo& type);

/**
 * Build the index mapping: {"properties": {storage_name: mapping, ...}}.
 *
 * Vector properties come first as dense_vector fields, then data properties
 * as text, typed exact-match or unindexed keyword fields.
 */
nlohmann::json build_index_schema(const CollectionModel& model);

} // namespace elastivec
