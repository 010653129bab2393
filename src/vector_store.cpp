/**
 * @file vector_store.cpp
 * @brief VectorStore implementation
 */

#include "vector_store.hpp"

#include <stdexcept>

namespace elastivec {

namespace {
constexpr const char* LIST_COLLECTIONS = "ListCollectionNames";
} // namespace

VectorStore::VectorStore(std::shared_ptr<DocumentStore> store, VectorStoreOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
    if (!store_) {
        throw std::invalid_argument("A document store is required");
    }
}

std::vector<std::string> VectorStore::list_collection_names(std::stop_token stop) {
    return run_store_operation("", LIST_COLLECTIONS, stop, [&] { return store_->list_indices(); });
}

bool VectorStore::collection_exists(const std::string& name, std::stop_token stop) {
    return run_store_operation(name, "indices.exists", stop, [&] { return store_->index_exists(name); });
}

void VectorStore::ensure_collection_deleted(const std::string& name, std::stop_token stop) {
    run_store_operation(name, "indices.delete", stop, [&] {
        try {
            store_->delete_index(name);
        } catch (const TransportError& e) {
            if (!e.is_not_found()) {
                throw;
            }
            ELASTIVEC_LOG_DEBUG("VectorStore", "Collection '", name, "' does not exist; nothing to delete");
        }
    });
}

DynamicCollection VectorStore::get_dynamic_collection(const std::string& name,
                                                      const RecordDefinition& definition) const {
    ELASTIVEC_LOG_DEBUG("VectorStore", "Opening dynamic collection '", name, "'");
    return DynamicCollection(store_, name, collection_options(definition));
}

CollectionOptions VectorStore::collection_options(std::optional<RecordDefinition> definition) const {
    CollectionOptions options = options_.collection_defaults;
    if (definition) {
        options.definition = std::move(definition);
    }
    if (!options.embedding_generator) {
        options.embedding_generator = options_.embedding_generator;
    }
    return options;
}

} // namespace elastivec
