/**
 * @file document_store.hpp
 * @brief Backing-store client boundary
 *
 * A DocumentStore is the transport-level client of the search engine:
 * indices hold JSON documents addressed by string ids and are queried with
 * the engine's native query DSL. Failures are reported as TransportError
 * carrying the HTTP-like status code of the failed call.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace elastivec {

/**
 * Document as exchanged with the backing store.
 */
struct StorageDocument {
    std::optional<std::string> id;
    nlohmann::json body = nlohmann::json::object();
};

/**
 * One search hit. score is unset when the engine did not score the hit
 * (sorted queries).
 */
struct SearchHit {
    std::string id;
    nlohmann::json source = nlohmann::json::object();
    std::optional<double> score;
};

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    //-------------------------------------------------------------------------
    // Indices
    //-------------------------------------------------------------------------

    virtual bool index_exists(const std::string& index) = 0;

    /**
     * Create an index with the given mapping ({"properties": {...}}).
     */
    virtual void create_index(const std::string& index, const nlohmann::json& mappings) = 0;

    /**
     * Throws TransportError(404) when the index does not exist.
     */
    virtual void delete_index(const std::string& index) = 0;

    virtual std::vector<std::string> list_indices() = 0;

    //-------------------------------------------------------------------------
    // Documents
    //-------------------------------------------------------------------------

    /**
     * Source of one document, without the excluded fields. std::nullopt when
     * the document does not exist; TransportError(404) when the index does not.
     */
    virtual std::optional<nlohmann::json> get_document(const std::string& index,
                                                       const std::string& id,
                                                       const std::vector<std::string>& exclude_fields) = 0;

    /**
     * Create or replace a document. Returns the stored id.
     */
    virtual std::string index_document(const std::string& index,
                                       const std::string& id,
                                       const nlohmann::json& body) = 0;

    /**
     * Throws TransportError(404) when the document or index does not exist.
     */
    virtual void delete_document(const std::string& index, const std::string& id) = 0;

    //-------------------------------------------------------------------------
    // Queries
    //-------------------------------------------------------------------------

    /**
     * Run a query clause ({"knn": ...}, {"bool": ...}, {"match_all": {}}, ...)
     * and return hits [from, from + size) in rank or sort order.
     * Each sort entry has the form {field: {"order": "asc"|"desc"}}.
     */
    virtual std::vector<SearchHit> search(const std::string& index,
                                          const nlohmann::json& query,
                                          const std::vector<nlohmann::json>& sort,
                                          const std::vector<std::string>& exclude_fields,
                                          size_t from, size_t size) = 0;

    /**
     * Run a retriever ({"rrf": {"retrievers": [...], ...}}).
     */
    virtual std::vector<SearchHit> hybrid_search(const std::string& index,
                                                 const nlohmann::json& retriever,
                                                 const std::vector<std::string>& exclude_fields,
                                                 size_t from, size_t size) = 0;

    //-------------------------------------------------------------------------
    // Bulk (defaults loop over the single-document calls in caller order)
    //-------------------------------------------------------------------------

    virtual std::vector<std::optional<nlohmann::json>> multi_get(const std::string& index,
                                                                 const std::vector<std::string>& ids,
                                                                 const std::vector<std::string>& exclude_fields) {
        std::vector<std::optional<nlohmann::json>> out;
        out.reserve(ids.size());
        for (const auto& id : ids) {
            out.push_back(get_document(index, id, exclude_fields));
        }
        return out;
    }

    virtual std::vector<std::string> bulk_index(const std::string& index,
                                                const std::vector<StorageDocument>& documents) {
        std::vector<std::string> ids;
        ids.reserve(documents.size());
        for (const auto& doc : documents) {
            if (!doc.id) {
                throw TransportError("Bulk index item without an id", 400);
            }
            ids.push_back(index_document(index, *doc.id, doc.body));
        }
        return ids;
    }

    /**
     * Missing documents are not an error for bulk deletes.
     */
    virtual void bulk_delete(const std::string& index, const std::vector<std::string>& ids) {
        for (const auto& id : ids) {
            try {
                delete_document(index, id);
            } catch (const TransportError& e) {
                if (!e.is_not_found()) {
                    throw;
                }
            }
        }
    }
};

} // namespace elastivec
