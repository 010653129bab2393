/**
 * @file vector_store.hpp
 * @brief Entry point: collection listing, lifecycle and collection handles
 */

#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "collection.hpp"
#include "document_store.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "record_definition.hpp"
#include "record_type.hpp"

namespace elastivec {

/**
 * A VectorStore shares one DocumentStore client among all collections it
 * hands out. The client lives as long as its last owner.
 */
class VectorStore {
public:
    explicit VectorStore(std::shared_ptr<DocumentStore> store, VectorStoreOptions options = {});

    /**
     * Names of all indices. Failures wrap into StorageOperationError with
     * operation "ListCollectionNames".
     */
    std::vector<std::string> list_collection_names(std::stop_token stop = {});

    bool collection_exists(const std::string& name, std::stop_token stop = {});

    void ensure_collection_deleted(const std::string& name, std::stop_token stop = {});

    /**
     * Typed collection handle. The store's default embedding generator and
     * collection defaults apply unless `definition` overrides properties.
     */
    template <typename TKey, typename TRecord>
    Collection<TKey, TRecord> get_collection(const std::string& name, const RecordType<TRecord>& type,
                                             std::optional<RecordDefinition> definition = std::nullopt) const {
        ELASTIVEC_LOG_DEBUG("VectorStore", "Opening typed collection '", name, "'");
        return Collection<TKey, TRecord>(store_, name, type, collection_options(std::move(definition)));
    }

    DynamicCollection get_dynamic_collection(const std::string& name, const RecordDefinition& definition) const;

    const std::shared_ptr<DocumentStore>& document_store() const { return store_; }
    const VectorStoreOptions& options() const { return options_; }

private:
    CollectionOptions collection_options(std::optional<RecordDefinition> definition) const;

    std::shared_ptr<DocumentStore> store_;
    VectorStoreOptions options_;
};

} // namespace elastivec
