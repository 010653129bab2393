/**
 * @file search_request.cpp
 * @brief Query vector resolution and kNN / RRF request assembly
 */

#include "search_request.hpp"

#include <algorithm>
#include <stdexcept>

#include "errors.hpp"

namespace elastivec {

using json = nlohmann::json;

void check_top(size_t top) {
    if (top == 0) {
        throw std::invalid_argument("top must be greater than zero");
    }
}

void check_include_vectors(const CollectionModel& model, bool include_vectors) {
    if (include_vectors && model.embedding_generation_required()) {
        throw UnsupportedCombinationError(
            "When an embedding generator is configured, include_vectors cannot be used");
    }
}

std::vector<float> resolve_query_vector(const FieldValue& input,
                                        const PropertyModel& vector_property,
                                        std::stop_token stop) {
    if (auto vector = numeric_vector(input)) {
        return std::move(*vector);
    }

    TypeInfo input_type = type_of_value(input);
    if (!vector_property.embedding_generator) {
        throw NoEmbeddingGeneratorError("A value of type '" + input_type.name +
                                        "' was passed to search on vector property '" +
                                        vector_property.model_name +
                                        "', but no embedding generator is configured");
    }
    if (!vector_property.embedding_generator->accepts(input_type)) {
        throw IncompatibleGeneratorError("The embedding generator configured on vector property '" +
                                         vector_property.model_name + "' does not accept search input of type '" +
                                         input_type.name + "'");
    }
    if (stop.stop_requested()) {
        throw OperationCancelledError("GenerateEmbedding");
    }
    return vector_property.embedding_generator->generate(input, vector_property.dimensions, stop).vector();
}

std::string join_keywords(const std::vector<std::string>& keywords) {
    std::string joined;
    for (const auto& kw : keywords) {
        if (kw.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += kw;
    }
    return joined;
}

namespace {

json knn_body(const PropertyModel& vector_property,
              const std::vector<float>& query_vector,
              size_t top, size_t skip,
              const std::optional<json>& filter,
              uint32_t num_candidates_factor) {
    const size_t k = skip + top;
    const size_t num_candidates = std::max(k * num_candidates_factor, k);

    json body = {
        {"field", vector_property.storage_name},
        {"query_vector", query_vector},
        {"k", k},
        {"num_candidates", num_candidates},
    };
    if (filter) {
        body["filter"] = json::array({*filter});
    }
    return body;
}

} // namespace

json build_knn_query(const PropertyModel& vector_property,
                     const std::vector<float>& query_vector,
                     size_t top, size_t skip,
                     const std::optional<json>& filter,
                     uint32_t num_candidates_factor) {
    return {{"knn", knn_body(vector_property, query_vector, top, skip, filter, num_candidates_factor)}};
}

json build_hybrid_retriever(const PropertyModel& vector_property,
                            const std::vector<float>& query_vector,
                            const PropertyModel& text_property,
                            const std::vector<std::string>& keywords,
                            size_t top, size_t skip,
                            const std::optional<json>& filter,
                            const CollectionOptions& options) {
    json knn = {{"knn", knn_body(vector_property, query_vector, top, skip, filter,
                                 options.num_candidates_factor)}};

    json match = {{"match", {{text_property.storage_name, join_keywords(keywords)}}}};
    json text_query = match;
    if (filter) {
        text_query = {{"bool", {{"filter", json::array({*filter})}, {"must", json::array({match})}}}};
    }
    json standard = {{"standard", {{"query", std::move(text_query)}}}};

    const size_t window = options.rank_window_size
                              ? static_cast<size_t>(*options.rank_window_size)
                              : std::max<size_t>(skip + top, 10);

    return {{"rrf", {
        {"retrievers", json::array({std::move(knn), std::move(standard)})},
        {"rank_window_size", window},
        {"rank_constant", options.rank_constant},
    }}};
}

std::vector<json> build_sort(const CollectionModel& model, const std::vector<OrderBy>& order_by) {
    std::vector<json> sort;
    sort.reserve(order_by.size());
    for (const auto& ob : order_by) {
        const PropertyModel& p = model.get_data_or_key_property(ob.property);
        const std::string field = p.is_key() ? std::string("_id") : p.storage_name;
        sort.push_back({{field, {{"order", ob.ascending ? "asc" : "desc"}}}});
    }
    return sort;
}

std::vector<std::string> excluded_source_fields(const CollectionModel& model, bool include_vectors) {
    if (include_vectors) {
        return {};
    }
    return model.vector_storage_names();
}

} // namespace elastivec
