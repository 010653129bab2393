/**
 * @file test_util.hpp
 * @brief Shared record types, generators and stores for the unit tests
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "document_store.hpp"
#include "embedding.hpp"
#include "errors.hpp"
#include "record_type.hpp"
#include "types.hpp"

namespace elastivec {
namespace fixtures {

//=============================================================================
// Records
//=============================================================================

struct Hotel {
    std::string hotel_id;
    std::string hotel_name;
    std::optional<std::string> description;
    int64_t rating = 0;
    bool parking_included = false;
    std::vector<std::string> tags;
    std::vector<float> description_embedding;
};

inline RecordType<Hotel> hotel_type() {
    return RecordType<Hotel>()
        .key("HotelId", &Hotel::hotel_id)
        .data("HotelName", &Hotel::hotel_name, {.is_indexed = true})
        .data("Description", &Hotel::description, {.is_full_text_indexed = true})
        .data("Rating", &Hotel::rating, {.is_indexed = true})
        .data("ParkingIncluded", &Hotel::parking_included, {.is_indexed = true})
        .data("Tags", &Hotel::tags, {.is_indexed = true})
        .vector("DescriptionEmbedding", &Hotel::description_embedding, {.dimensions = 4});
}

inline Hotel make_hotel(const std::string& id, const std::string& name, int64_t rating,
                        std::vector<float> embedding, std::vector<std::string> tags = {}) {
    Hotel h;
    h.hotel_id = id;
    h.hotel_name = name;
    h.description = name + " description";
    h.rating = rating;
    h.tags = std::move(tags);
    h.description_embedding = std::move(embedding);
    return h;
}

/**
 * Record whose vector is generated from its text.
 */
struct Article {
    int64_t id = 0;
    std::string category;
    std::string body;
    std::string body_embedding;
};

//=============================================================================
// Embedding generators
//=============================================================================

/**
 * Deterministic text embedding: component i counts the words of the text
 * whose length modulo dims is i.
 */
inline std::vector<float> word_length_embedding(const std::string& text, uint32_t dims) {
    std::vector<float> v(dims, 0.0f);
    size_t len = 0;
    for (size_t i = 0; i <= text.size(); ++i) {
        if (i == text.size() || text[i] == ' ') {
            if (len > 0) {
                v[len % dims] += 1.0f;
            }
            len = 0;
        } else {
            ++len;
        }
    }
    return v;
}

inline std::shared_ptr<FunctionEmbeddingGenerator> make_text_generator(int* calls = nullptr) {
    return std::make_shared<FunctionEmbeddingGenerator>(
        TypeKind::STRING,
        [calls](const FieldValue& input, std::optional<uint32_t> dims) {
            if (calls != nullptr) {
                ++*calls;
            }
            return word_length_embedding(std::get<std::string>(input), dims.value_or(4));
        });
}

inline RecordType<Article> article_type(EmbeddingGeneratorPtr generator = nullptr) {
    return RecordType<Article>()
        .key("Id", &Article::id)
        .data("Category", &Article::category, {.is_indexed = true})
        .data("Body", &Article::body, {.is_full_text_indexed = true})
        .vector("BodyEmbedding", &Article::body_embedding,
                {.dimensions = 4, .embedding_generator = std::move(generator)});
}

//=============================================================================
// Scripted document store
//=============================================================================

/**
 * DocumentStore that records every call and answers from scripted values.
 * Bulk operations use the DocumentStore defaults.
 */
class FakeDocumentStore : public DocumentStore {
public:
    std::vector<std::string> calls;

    bool exists = true;
    std::vector<std::string> indices;
    std::optional<nlohmann::json> document;
    std::vector<SearchHit> hits;
    std::optional<TransportError> failure;       // thrown by every call while set

    nlohmann::json last_query;
    nlohmann::json last_mappings;
    std::vector<nlohmann::json> last_sort;
    std::vector<std::string> last_exclude;
    size_t last_from = 0;
    size_t last_size = 0;
    std::vector<std::pair<std::string, nlohmann::json>> indexed;

    bool index_exists(const std::string&) override {
        record("index_exists");
        return exists;
    }

    void create_index(const std::string&, const nlohmann::json& mappings) override {
        record("create_index");
        last_mappings = mappings;
    }

    void delete_index(const std::string&) override {
        record("delete_index");
    }

    std::vector<std::string> list_indices() override {
        record("list_indices");
        return indices;
    }

    std::optional<nlohmann::json> get_document(const std::string&, const std::string&,
                                               const std::vector<std::string>& exclude_fields) override {
        record("get_document");
        last_exclude = exclude_fields;
        return document;
    }

    std::string index_document(const std::string&, const std::string& id, const nlohmann::json& body) override {
        record("index_document");
        indexed.emplace_back(id, body);
        return id;
    }

    void delete_document(const std::string&, const std::string&) override {
        record("delete_document");
    }

    std::vector<SearchHit> search(const std::string&, const nlohmann::json& query,
                                  const std::vector<nlohmann::json>& sort,
                                  const std::vector<std::string>& exclude_fields,
                                  size_t from, size_t size) override {
        record("search");
        last_query = query;
        last_sort = sort;
        last_exclude = exclude_fields;
        last_from = from;
        last_size = size;
        return hits;
    }

    std::vector<SearchHit> hybrid_search(const std::string&, const nlohmann::json& retriever,
                                         const std::vector<std::string>& exclude_fields,
                                         size_t from, size_t size) override {
        record("hybrid_search");
        last_query = retriever;
        last_exclude = exclude_fields;
        last_from = from;
        last_size = size;
        return hits;
    }

private:
    void record(const char* call) {
        calls.emplace_back(call);
        if (failure) {
            throw *failure;
        }
    }
};

} // namespace fixtures
} // namespace elastivec
