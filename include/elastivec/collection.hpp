/**
 * @file collection.hpp
 * @brief Collection facade: CRUD, filtered get, vector and hybrid search
 *
 * A Collection binds a record type to one index of a DocumentStore:
 *
 *   auto store = std::make_shared<MemoryDocumentStore>();
 *   Collection<std::string, Hotel> hotels(store, "hotels", hotel_type);
 *   hotels.ensure_collection_exists();
 *   hotels.upsert(hotel);
 *   auto results = hotels.search(query_vector, 3, {.filter = field("City") == "Paris"});
 *
 * The model is built once at construction and shared read-only by every
 * operation. Backing-store failures surface as StorageOperationError with
 * the TransportError nested.
 */

#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "collection_model.hpp"
#include "document_store.hpp"
#include "errors.hpp"
#include "filter.hpp"
#include "key_codec.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "record_mapper.hpp"
#include "record_type.hpp"
#include "search_request.hpp"
#include "types.hpp"

namespace elastivec {

/**
 * Run one backing-store call. Checks cancellation first and wraps a
 * TransportError into StorageOperationError with the TransportError nested.
 */
template <typename Fn>
auto run_store_operation(const std::string& collection_name, const char* operation,
                         const std::stop_token& stop, Fn&& fn) -> decltype(fn()) {
    if (stop.stop_requested()) {
        throw OperationCancelledError(operation);
    }
    ELASTIVEC_LOG_DEBUG("Collection", "'", collection_name, "': ", operation);
    try {
        return fn();
    } catch (const TransportError& e) {
        ELASTIVEC_LOG_WARN("Collection", "Operation '", operation, "' on collection '", collection_name,
                           "' failed (status ", e.status_code(), "): ", e.what());
        std::throw_with_nested(StorageOperationError(collection_name, operation, e.what(), e.status_code()));
    }
}

//=============================================================================
// Collection Core
//=============================================================================

/**
 * Record-type independent part of a collection: everything that works on
 * storage ids, documents and native requests.
 */
class CollectionCore {
public:
    CollectionCore(std::shared_ptr<DocumentStore> store, std::string name,
                   CollectionModelPtr model, CollectionOptions options);

    const std::string& name() const { return name_; }
    const CollectionModelPtr& model() const { return model_; }
    const CollectionOptions& options() const { return options_; }

    bool collection_exists(std::stop_token stop);
    void ensure_collection_exists(std::stop_token stop);
    void ensure_collection_deleted(std::stop_token stop);

    std::optional<StorageDocument> get_document(const std::string& id, bool include_vectors, std::stop_token stop);

    /**
     * Found documents in request order; missing ids are skipped.
     */
    std::vector<StorageDocument> get_documents(const std::vector<std::string>& ids, bool include_vectors,
                                               std::stop_token stop);

    void index_document(const StorageDocument& document, std::stop_token stop);
    void index_documents(const std::vector<StorageDocument>& documents, std::stop_token stop);

    /**
     * Missing documents are not an error.
     */
    void delete_document(const std::string& id, std::stop_token stop);
    void delete_documents(const std::vector<std::string>& ids, std::stop_token stop);

    std::vector<SearchHit> filtered_get(const FilterExpr& filter, size_t top,
                                        const FilteredGetOptions& options, std::stop_token stop);

    std::vector<SearchHit> vector_search(const FieldValue& input, size_t top,
                                         const VectorSearchOptions& options, std::stop_token stop);

    std::vector<SearchHit> hybrid_search(const FieldValue& input, const std::vector<std::string>& keywords,
                                         size_t top, const HybridSearchOptions& options, std::stop_token stop);

    /**
     * Embeddings for the generator-backed vector properties of one record.
     * value_of returns the record's current value of a property.
     */
    GeneratedEmbeddings generate_embeddings(const std::function<FieldValue(const PropertyModel&)>& value_of,
                                            std::stop_token stop) const;

private:
    template <typename Fn>
    auto run(const char* operation, const std::stop_token& stop, Fn&& fn) -> decltype(fn()) {
        return run_store_operation(name_, operation, stop, std::forward<Fn>(fn));
    }

    std::shared_ptr<DocumentStore> store_;
    std::string name_;
    CollectionModelPtr model_;
    CollectionOptions options_;
};

/**
 * Model for a dynamic collection; options.definition is required.
 */
CollectionModelPtr build_dynamic_model(const CollectionOptions& options);

//=============================================================================
// Collection
//=============================================================================

template <typename TKey, typename TRecord>
class Collection {
public:
    using key_type = TKey;
    using record_type = TRecord;

    /**
     * Typed collection. options.definition, when set, overlays the record type.
     */
    Collection(std::shared_ptr<DocumentStore> store, std::string name,
               const RecordType<TRecord>& type, CollectionOptions options = {})
        : core_(std::move(store), std::move(name),
                CollectionModelBuilder(options).build(type, options.definition, options.embedding_generator),
                options)
        , mapper_(std::make_unique<TypedRecordMapper<TRecord>>(core_.model(), type, options.ignore_null_values)) {
        check_key_type();
    }

    /**
     * Dynamic collection described by options.definition.
     */
    Collection(std::shared_ptr<DocumentStore> store, std::string name, CollectionOptions options)
        : core_(std::move(store), std::move(name), build_dynamic_model(options), options)
        , mapper_(std::make_unique<DynamicRecordMapper>(core_.model(), options.ignore_null_values)) {
        static_assert(std::is_same_v<TRecord, DynamicRecord>, "Only DynamicRecord collections are built from a definition alone");
        check_key_type();
    }

    const std::string& name() const { return core_.name(); }
    const CollectionModel& model() const { return *core_.model(); }

    //-------------------------------------------------------------------------
    // Lifecycle
    //-------------------------------------------------------------------------

    bool collection_exists(std::stop_token stop = {}) { return core_.collection_exists(stop); }

    /**
     * Create the index with the model's mapping unless it already exists.
     */
    void ensure_collection_exists(std::stop_token stop = {}) { core_.ensure_collection_exists(stop); }

    void ensure_collection_deleted(std::stop_token stop = {}) { core_.ensure_collection_deleted(stop); }

    //-------------------------------------------------------------------------
    // Reads
    //-------------------------------------------------------------------------

    std::optional<TRecord> get(const TKey& key, const GetOptions& options = {}, std::stop_token stop = {}) {
        std::optional<StorageDocument> doc = core_.get_document(key_to_storage_id(key), options.include_vectors, stop);
        if (!doc) {
            return std::nullopt;
        }
        return mapper_->from_storage(*doc, options.include_vectors);
    }

    /**
     * Records for the given keys, in key order. Missing keys are skipped.
     */
    std::vector<TRecord> get(const std::vector<TKey>& keys, const GetOptions& options = {}, std::stop_token stop = {}) {
        std::vector<std::string> ids;
        ids.reserve(keys.size());
        for (const auto& key : keys) {
            ids.push_back(key_to_storage_id(key));
        }
        std::vector<TRecord> records;
        for (const auto& doc : core_.get_documents(ids, options.include_vectors, stop)) {
            records.push_back(mapper_->from_storage(doc, options.include_vectors));
        }
        return records;
    }

    /**
     * Up to `top` records matching the filter, after skipping options.skip.
     */
    std::vector<TRecord> get(const FilterExpr& filter, size_t top, const FilteredGetOptions& options = {},
                             std::stop_token stop = {}) {
        std::vector<TRecord> records;
        for (const auto& hit : core_.filtered_get(filter, top, options, stop)) {
            records.push_back(mapper_->from_storage(StorageDocument{hit.id, hit.source}, options.include_vectors));
        }
        return records;
    }

    //-------------------------------------------------------------------------
    // Writes
    //-------------------------------------------------------------------------

    void upsert(const TRecord& record, std::stop_token stop = {}) {
        core_.index_document(to_storage(record, stop), stop);
    }

    void upsert(const std::vector<TRecord>& records, std::stop_token stop = {}) {
        std::vector<StorageDocument> documents;
        documents.reserve(records.size());
        for (const auto& record : records) {
            documents.push_back(to_storage(record, stop));
        }
        core_.index_documents(documents, stop);
    }

    void remove(const TKey& key, std::stop_token stop = {}) {
        core_.delete_document(key_to_storage_id(key), stop);
    }

    void remove(const std::vector<TKey>& keys, std::stop_token stop = {}) {
        std::vector<std::string> ids;
        ids.reserve(keys.size());
        for (const auto& key : keys) {
            ids.push_back(key_to_storage_id(key));
        }
        core_.delete_documents(ids, stop);
    }

    //-------------------------------------------------------------------------
    // Search
    //-------------------------------------------------------------------------

    /**
     * Nearest records to `input`: a vector, or a value the vector property's
     * embedding generator accepts.
     */
    template <typename TInput>
    std::vector<SearchResult<TRecord>> search(const TInput& input, size_t top,
                                              const VectorSearchOptions& options = {},
                                              std::stop_token stop = {}) {
        return to_results(core_.vector_search(make_field_value(input), top, options, stop), options.include_vectors);
    }

    /**
     * Vector search fused with a keyword match on a full-text property.
     */
    template <typename TInput>
    std::vector<SearchResult<TRecord>> hybrid_search(const TInput& input, const std::vector<std::string>& keywords,
                                                     size_t top, const HybridSearchOptions& options = {},
                                                     std::stop_token stop = {}) {
        return to_results(core_.hybrid_search(make_field_value(input), keywords, top, options, stop),
                          options.include_vectors);
    }

private:
    void check_key_type() const {
        if constexpr (!std::is_same_v<TKey, RecordKey>) {
            const PropertyModel& key = core_.model()->key_property();
            TypeInfo declared = type_of<TKey>();
            if (declared.kind != key.type.kind) {
                throw UnsupportedTypeError("The collection key type '" + declared.name +
                                           "' does not match the type '" + key.type.name +
                                           "' of key property '" + key.model_name + "'");
            }
        }
    }

    StorageDocument to_storage(const TRecord& record, std::stop_token stop) {
        GeneratedEmbeddings generated = core_.generate_embeddings(
            [&](const PropertyModel& p) { return mapper_->property_value(record, p); }, stop);
        return mapper_->to_storage(record, &generated);
    }

    std::vector<SearchResult<TRecord>> to_results(const std::vector<SearchHit>& hits, bool include_vectors) const {
        std::vector<SearchResult<TRecord>> results;
        results.reserve(hits.size());
        for (const auto& hit : hits) {
            results.push_back({mapper_->from_storage(StorageDocument{hit.id, hit.source}, include_vectors), hit.score});
        }
        return results;
    }

    CollectionCore core_;
    std::unique_ptr<RecordMapper<TRecord>> mapper_;
};

/**
 * Collection of dynamic records with runtime-typed keys.
 */
using DynamicCollection = Collection<RecordKey, DynamicRecord>;

} // namespace elastivec
