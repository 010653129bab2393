/**
 * @file index_schema.cpp
 * @brief Index mapping generation
 */

#include "index_schema.hpp"

#include "errors.hpp"

namespace elastivec {

std::string similarity_for(const PropertyModel& vector_property) {
    const std::string& df = vector_property.distance_function;
    if (df.empty() || df == distance_function::COSINE_SIMILARITY) return "cosine";
    if (df == distance_function::DOT_PRODUCT_SIMILARITY) return "dot_product";
    if (df == distance_function::EUCLIDEAN_DISTANCE) return "l2_norm";
    if (df == distance_function::MAX_INNER_PRODUCT) return "max_inner_product";
    throw UnsupportedConfigurationError("Distance function '" + df + "' for '" + vector_property.model_name +
                                        "' is not supported by the vector store");
}

std::string index_options_type_for(const PropertyModel& vector_property) {
    const std::string& kind = vector_property.index_kind;
    if (kind.empty() || kind == index_kind::INT8_HNSW) return "int8_hnsw";
    if (kind == index_kind::HNSW) return "hnsw";
    if (kind == index_kind::INT4_HNSW) return "int4_hnsw";
    if (kind == index_kind::BBQ_HNSW) return "bbq_hnsw";
    if (kind == index_kind::FLAT) return "flat";
    if (kind == index_kind::INT8_FLAT) return "int8_flat";
    if (kind == index_kind::INT4_FLAT) return "int4_flat";
    if (kind == index_kind::BBQ_FLAT) return "bbq_flat";
    throw UnsupportedConfigurationError("Index kind '" + kind + "' for '" + vector_property.model_name +
                                        "' is not supported by the vector store");
}

std::string exact_match_type_for(const TypeInfo& type) {
    switch (type.kind) {
        case TypeKind::STRING: return "keyword";
        case TypeKind::BOOL: return "boolean";
        case TypeKind::INT8:
        case TypeKind::UINT8: return "byte";
        case TypeKind::INT16:
        case TypeKind::UINT16: return "short";
        case TypeKind::INT32:
        case TypeKind::UINT32: return "integer";
        case TypeKind::INT64: return "long";
        case TypeKind::UINT64: return "unsigned_long";
        case TypeKind::DOUBLE: return "double";
        case TypeKind::FLOAT: return "float";
        case TypeKind::TIMESTAMP: return "date";
        default: return "keyword";
    }
}

nlohmann::json build_index_schema(const CollectionModel& model) {
    nlohmann::json properties = nlohmann::json::object();

    for (const PropertyModel* p : model.vector_properties()) {
        properties[p->storage_name] = {
            {"type", "dense_vector"},
            {"dims", p->dimensions},
            {"index", true},
            {"similarity", similarity_for(*p)},
            {"index_options", {{"type", index_options_type_for(*p)}}},
        };
    }

    for (const PropertyModel* p : model.data_properties()) {
        if (p->is_full_text_indexed) {
            properties[p->storage_name] = {{"type", "text"}};
        } else if (p->is_indexed) {
            properties[p->storage_name] = {{"type", exact_match_type_for(p->type)}};
        } else {
            properties[p->storage_name] = {{"type", "keyword"}, {"index", false}};
        }
    }

    return {{"properties", properties}};
}

} // namespace elastivec
