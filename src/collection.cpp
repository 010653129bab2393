/**
 * @file collection.cpp
 * @brief CollectionCore: storage-level collection operations
 */

#include "collection.hpp"

#include "filter_translator.hpp"
#include "index_schema.hpp"

namespace elastivec {

using json = nlohmann::json;

CollectionModelPtr build_dynamic_model(const CollectionOptions& options) {
    if (!options.definition) {
        throw SchemaError("A record definition is required for dynamic collections");
    }
    return CollectionModelBuilder(options).build_dynamic(*options.definition, options.embedding_generator);
}

CollectionCore::CollectionCore(std::shared_ptr<DocumentStore> store, std::string name,
                               CollectionModelPtr model, CollectionOptions options)
    : store_(std::move(store))
    , name_(std::move(name))
    , model_(std::move(model))
    , options_(std::move(options)) {
    if (!store_) {
        throw std::invalid_argument("A document store is required");
    }
    if (name_.empty()) {
        throw std::invalid_argument("Collection name must not be empty");
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

bool CollectionCore::collection_exists(std::stop_token stop) {
    return run("indices.exists", stop, [&] { return store_->index_exists(name_); });
}

void CollectionCore::ensure_collection_exists(std::stop_token stop) {
    if (collection_exists(stop)) {
        return;
    }
    json mappings = build_index_schema(*model_);
    run("indices.create", stop, [&] { store_->create_index(name_, mappings); });
}

void CollectionCore::ensure_collection_deleted(std::stop_token stop) {
    run("indices.delete", stop, [&] {
        try {
            store_->delete_index(name_);
        } catch (const TransportError& e) {
            if (!e.is_not_found()) {
                throw;
            }
            ELASTIVEC_LOG_DEBUG("Collection", "'", name_, "' does not exist; nothing to delete");
        }
    });
}

//=============================================================================
// Documents
//=============================================================================

std::optional<StorageDocument> CollectionCore::get_document(const std::string& id, bool include_vectors,
                                                            std::stop_token stop) {
    check_include_vectors(*model_, include_vectors);
    std::vector<std::string> exclude = excluded_source_fields(*model_, include_vectors);

    std::optional<json> source = run("get", stop, [&] { return store_->get_document(name_, id, exclude); });
    if (!source) {
        return std::nullopt;
    }
    return StorageDocument{id, std::move(*source)};
}

std::vector<StorageDocument> CollectionCore::get_documents(const std::vector<std::string>& ids,
                                                           bool include_vectors, std::stop_token stop) {
    check_include_vectors(*model_, include_vectors);
    if (ids.empty()) {
        return {};
    }
    std::vector<std::string> exclude = excluded_source_fields(*model_, include_vectors);

    std::vector<std::optional<json>> sources = run("mget", stop, [&] { return store_->multi_get(name_, ids, exclude); });

    std::vector<StorageDocument> documents;
    for (size_t i = 0; i < sources.size() && i < ids.size(); ++i) {
        if (sources[i]) {
            documents.push_back(StorageDocument{ids[i], std::move(*sources[i])});
        }
    }
    return documents;
}

void CollectionCore::index_document(const StorageDocument& document, std::stop_token stop) {
    if (!document.id) {
        throw SchemaError("Key can not be null");
    }
    run("index", stop, [&] { store_->index_document(name_, *document.id, document.body); });
}

void CollectionCore::index_documents(const std::vector<StorageDocument>& documents, std::stop_token stop) {
    if (documents.empty()) {
        return;
    }
    run("bulk", stop, [&] { store_->bulk_index(name_, documents); });
}

void CollectionCore::delete_document(const std::string& id, std::stop_token stop) {
    run("delete", stop, [&] {
        try {
            store_->delete_document(name_, id);
        } catch (const TransportError& e) {
            if (!e.is_not_found()) {
                throw;
            }
            ELASTIVEC_LOG_DEBUG("Collection", "'", name_, "': document '", id, "' not found; nothing to delete");
        }
    });
}

void CollectionCore::delete_documents(const std::vector<std::string>& ids, std::stop_token stop) {
    if (ids.empty()) {
        return;
    }
    run("bulk", stop, [&] {
        try {
            store_->bulk_delete(name_, ids);
        } catch (const TransportError& e) {
            if (!e.is_not_found()) {
                throw;
            }
            ELASTIVEC_LOG_DEBUG("Collection", "'", name_, "' does not exist; nothing to delete");
        }
    });
}

GeneratedEmbeddings CollectionCore::generate_embeddings(const std::function<FieldValue(const PropertyModel&)>& value_of,
                                                        std::stop_token stop) const {
    const size_t count = model_->vector_property_count();
    GeneratedEmbeddings generated(count);

    for (size_t i = 0; i < count; ++i) {
        const PropertyModel& p = model_->vector_property(i);
        if (!p.requires_embedding_generation()) {
            continue;
        }
        FieldValue input = value_of(p);
        if (is_null(input)) {
            continue;
        }
        if (stop.stop_requested()) {
            throw OperationCancelledError("GenerateEmbedding");
        }
        Embedding embedding = p.embedding_generator->generate(input, p.dimensions, stop);
        if (embedding.dimensions() != p.dimensions) {
            throw VectorStoreError("The embedding generator returned " + std::to_string(embedding.dimensions()) +
                                   " dimensions for vector property '" + p.model_name + "', which has " +
                                   std::to_string(p.dimensions));
        }
        generated[i] = std::move(embedding);
    }
    return generated;
}

//=============================================================================
// Queries
//=============================================================================

std::vector<SearchHit> CollectionCore::filtered_get(const FilterExpr& filter, size_t top,
                                                    const FilteredGetOptions& options, std::stop_token stop) {
    check_top(top);
    check_include_vectors(*model_, options.include_vectors);

    std::optional<json> translated = translate_filter(filter, *model_);
    json query = translated ? std::move(*translated) : json{{"match_all", json::object()}};
    std::vector<json> sort = build_sort(*model_, options.order_by);
    std::vector<std::string> exclude = excluded_source_fields(*model_, options.include_vectors);

    return run("search", stop, [&] { return store_->search(name_, query, sort, exclude, options.skip, top); });
}

std::vector<SearchHit> CollectionCore::vector_search(const FieldValue& input, size_t top,
                                                     const VectorSearchOptions& options, std::stop_token stop) {
    check_top(top);
    check_include_vectors(*model_, options.include_vectors);

    const PropertyModel& vector_property = model_->get_vector_property_or_single(options.vector_property);
    std::vector<float> query_vector = resolve_query_vector(input, vector_property, stop);
    std::optional<json> filter = translate_filter(options.filter, *model_);

    json query = build_knn_query(vector_property, query_vector, top, options.skip, filter,
                                 options_.num_candidates_factor);
    std::vector<std::string> exclude = excluded_source_fields(*model_, options.include_vectors);

    return run("search", stop, [&] { return store_->search(name_, query, {}, exclude, options.skip, top); });
}

std::vector<SearchHit> CollectionCore::hybrid_search(const FieldValue& input, const std::vector<std::string>& keywords,
                                                     size_t top, const HybridSearchOptions& options,
                                                     std::stop_token stop) {
    check_top(top);
    check_include_vectors(*model_, options.include_vectors);

    const PropertyModel& vector_property = model_->get_vector_property_or_single(options.vector_property);
    const PropertyModel& text_property = model_->get_full_text_data_property_or_single(options.additional_property);
    std::vector<float> query_vector = resolve_query_vector(input, vector_property, stop);
    std::optional<json> filter = translate_filter(options.filter, *model_);

    json retriever = build_hybrid_retriever(vector_property, query_vector, text_property, keywords,
                                            top, options.skip, filter, options_);
    std::vector<std::string> exclude = excluded_source_fields(*model_, options.include_vectors);

    return run("search", stop, [&] { return store_->hybrid_search(name_, retriever, exclude, options.skip, top); });
}

} // namespace elastivec
