/**
 * @file memory_document_store.hpp
 * @brief In-process DocumentStore evaluating the native query DSL
 *
 * Supported query clauses: term, terms, range, exists, bool (must, filter,
 * should, must_not, minimum_should_match), match, match_all and knn.
 * Supported retrievers: rrf over knn and standard retrievers.
 *
 * Vector similarity follows the "similarity" of the dense_vector mapping
 * (cosine, dot_product, l2_norm, max_inner_product), scored the way the
 * engine scores kNN hits. Text matching lowercases and splits on
 * non-alphanumeric characters; a match scores the number of matching
 * query terms.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "absl/container/flat_hash_map.h"

#include "document_store.hpp"

namespace elastivec {

/**
 * Lowercase alphanumeric terms of a text.
 */
std::vector<std::string> analyze_text(const std::string& text);

/**
 * kNN score of a document vector under a native similarity name.
 */
double vector_score(const std::string& similarity, const std::vector<float>& query,
                    const std::vector<float>& document);

class MemoryDocumentStore : public DocumentStore {
public:
    MemoryDocumentStore() = default;

    bool index_exists(const std::string& index) override;
    void create_index(const std::string& index, const nlohmann::json& mappings) override;
    void delete_index(const std::string& index) override;
    std::vector<std::string> list_indices() override;

    std::optional<nlohmann::json> get_document(const std::string& index,
                                               const std::string& id,
                                               const std::vector<std::string>& exclude_fields) override;
    std::string index_document(const std::string& index,
                               const std::string& id,
                               const nlohmann::json& body) override;
    void delete_document(const std::string& index, const std::string& id) override;

    std::vector<SearchHit> search(const std::string& index,
                                  const nlohmann::json& query,
                                  const std::vector<nlohmann::json>& sort,
                                  const std::vector<std::string>& exclude_fields,
                                  size_t from, size_t size) override;
    std::vector<SearchHit> hybrid_search(const std::string& index,
                                         const nlohmann::json& retriever,
                                         const std::vector<std::string>& exclude_fields,
                                         size_t from, size_t size) override;

    std::vector<std::optional<nlohmann::json>> multi_get(const std::string& index,
                                                         const std::vector<std::string>& ids,
                                                         const std::vector<std::string>& exclude_fields) override;
    std::vector<std::string> bulk_index(const std::string& index,
                                        const std::vector<StorageDocument>& documents) override;
    void bulk_delete(const std::string& index, const std::vector<std::string>& ids) override;

    /**
     * Mapping the index was created with.
     */
    nlohmann::json mappings(const std::string& index) const;

    size_t document_count(const std::string& index) const;

    /**
     * Stored source of a document, all fields included.
     */
    std::optional<nlohmann::json> raw_document(const std::string& index, const std::string& id) const;

private:
    struct StoredDocument {
        uint64_t seq;               // insertion order, used to break ties
        nlohmann::json source;
    };

    struct Index {
        nlohmann::json mappings;
        absl::flat_hash_map<std::string, StoredDocument> documents;
        uint64_t next_seq = 0;
    };

    struct ScoredDocument {
        const std::string* id;
        const StoredDocument* document;
        double score;
    };

    Index& require_index(const std::string& index);
    const Index& require_index(const std::string& index) const;

    void put_document(Index& idx, const std::string& id, const nlohmann::json& body);

    std::vector<ScoredDocument> run_query(const Index& idx, const nlohmann::json& query) const;
    std::vector<ScoredDocument> run_knn(const Index& idx, const nlohmann::json& knn) const;
    std::vector<ScoredDocument> run_retriever(const Index& idx, const nlohmann::json& retriever) const;

    static std::vector<SearchHit> to_hits(const std::vector<ScoredDocument>& ranked,
                                          const std::vector<std::string>& exclude_fields,
                                          size_t from, size_t size, bool scored);

    mutable std::shared_mutex mutex_;
    absl::flat_hash_map<std::string, Index> indices_;
};

} // namespace elastivec
