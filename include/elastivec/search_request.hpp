/**
 * @file search_request.hpp
 * @brief Read/search options and native request assembly
 *
 * Vector search runs as a kNN query clause:
 *   {"knn": {"field", "query_vector", "k", "num_candidates", "filter": [...]}}
 *
 * Hybrid search combines a kNN retriever and a keyword retriever with
 * reciprocal rank fusion:
 *   {"rrf": {"retrievers": [{"knn": {...}}, {"standard": {"query": ...}}],
 *            "rank_window_size": N, "rank_constant": C}}
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "collection_model.hpp"
#include "filter.hpp"
#include "options.hpp"
#include "types.hpp"

namespace elastivec {

//=============================================================================
// Options
//=============================================================================

struct GetOptions {
    bool include_vectors = false;
};

/**
 * One ordering key of a filtered get, by model name.
 */
struct OrderBy {
    std::string property;
    bool ascending = true;
};

struct FilteredGetOptions {
    size_t skip = 0;
    bool include_vectors = false;
    std::vector<OrderBy> order_by;
};

struct VectorSearchOptions {
    size_t skip = 0;
    bool include_vectors = false;
    std::optional<std::string> vector_property;     // model name; default: the only vector property
    std::optional<FilterExpr> filter;
};

struct HybridSearchOptions {
    size_t skip = 0;
    bool include_vectors = false;
    std::optional<std::string> vector_property;
    std::optional<std::string> additional_property;   // full-text property; default: the only one
    std::optional<FilterExpr> filter;
};

template <typename TRecord>
struct SearchResult {
    TRecord record;
    std::optional<double> score;
};

//=============================================================================
// Validation
//=============================================================================

/**
 * Throws std::invalid_argument when top is zero.
 */
void check_top(size_t top);

/**
 * Throws UnsupportedCombinationError when vectors are requested from a
 * collection with embedding generation.
 */
void check_include_vectors(const CollectionModel& model, bool include_vectors);

//=============================================================================
// Request assembly
//=============================================================================

/**
 * Numeric query vector for a search input. Vectors (float, double,
 * Embedding) are used directly; anything else goes through the property's
 * embedding generator.
 *
 * Throws NoEmbeddingGeneratorError / IncompatibleGeneratorError when the
 * input cannot be embedded, OperationCancelledError when stop is requested.
 */
std::vector<float> resolve_query_vector(const FieldValue& input,
                                        const PropertyModel& vector_property,
                                        std::stop_token stop = {});

/**
 * Space-joined keyword string; empty keywords are skipped.
 */
std::string join_keywords(const std::vector<std::string>& keywords);

/**
 * {"knn": {...}} query clause. k = skip + top,
 * num_candidates = max(k * num_candidates_factor, k).
 */
nlohmann::json build_knn_query(const PropertyModel& vector_property,
                               const std::vector<float>& query_vector,
                               size_t top, size_t skip,
                               const std::optional<nlohmann::json>& filter,
                               uint32_t num_candidates_factor);

/**
 * {"rrf": {...}} retriever over a kNN leg and a match leg. The filter, when
 * present, applies to both legs.
 */
nlohmann::json build_hybrid_retriever(const PropertyModel& vector_property,
                                      const std::vector<float>& query_vector,
                                      const PropertyModel& text_property,
                                      const std::vector<std::string>& keywords,
                                      size_t top, size_t skip,
                                      const std::optional<nlohmann::json>& filter,
                                      const CollectionOptions& options);

/**
 * Sort entries for a filtered get: [{storage_name: {"order": "asc"|"desc"}}].
 * The key property sorts on "_id". Throws SchemaError for unknown or vector
 * properties.
 */
std::vector<nlohmann::json> build_sort(const CollectionModel& model, const std::vector<OrderBy>& order_by);

/**
 * Source fields to leave out of fetched documents.
 */
std::vector<std::string> excluded_source_fields(const CollectionModel& model, bool include_vectors);

} // namespace elastivec
