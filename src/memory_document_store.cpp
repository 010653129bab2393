/**
 * @file memory_document_store.cpp
 * @brief In-process DocumentStore and native query DSL evaluation
 */

#include "memory_document_store.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>

#include "absl/container/flat_hash_set.h"

#include "logging.hpp"

namespace elastivec {

using json = nlohmann::json;

//=============================================================================
// Text and vector scoring
//=============================================================================

std::vector<std::string> analyze_text(const std::string& text) {
    std::vector<std::string> terms;
    std::string current;
    current.reserve(32);

    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!current.empty()) {
            terms.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        terms.push_back(std::move(current));
    }
    return terms;
}

double vector_score(const std::string& similarity, const std::vector<float>& query,
                    const std::vector<float>& document) {
    double dot = 0.0;
    double qq = 0.0;
    double dd = 0.0;
    double l2 = 0.0;
    const size_t n = std::min(query.size(), document.size());
    for (size_t i = 0; i < n; ++i) {
        const double q = query[i];
        const double d = document[i];
        dot += q * d;
        qq += q * q;
        dd += d * d;
        l2 += (q - d) * (q - d);
    }

    if (similarity == "cosine") {
        if (qq == 0.0 || dd == 0.0) {
            return 0.5;
        }
        return (1.0 + dot / (std::sqrt(qq) * std::sqrt(dd))) / 2.0;
    }
    if (similarity == "dot_product") {
        return (1.0 + dot) / 2.0;
    }
    if (similarity == "l2_norm") {
        return 1.0 / (1.0 + l2);
    }
    if (similarity == "max_inner_product") {
        return dot < 0.0 ? 1.0 / (1.0 - dot) : dot + 1.0;
    }
    throw TransportError("Unknown vector similarity '" + similarity + "'", 400);
}

//=============================================================================
// Query evaluation
//=============================================================================

namespace {

json lookup(const std::string& id, const json& source, const std::string& field) {
    if (field == "_id") {
        return id;
    }
    auto it = source.find(field);
    if (it == source.end()) {
        return nullptr;
    }
    return *it;
}

std::vector<json> values_of(const json& v) {
    if (v.is_array()) {
        return std::vector<json>(v.begin(), v.end());
    }
    if (v.is_null()) {
        return {};
    }
    return {v};
}

bool values_equal(const json& a, const json& b) {
    if (a.is_number() && b.is_number()) {
        return a.get<double>() == b.get<double>();
    }
    return a == b;
}

/**
 * -1/0/1, or std::nullopt when the two values are not comparable.
 */
std::optional<int> compare_values(const json& a, const json& b) {
    if (a.is_number() && b.is_number()) {
        const double x = a.get<double>();
        const double y = b.get<double>();
        return (x < y) ? -1 : (x > y) ? 1 : 0;
    }
    if (a.is_string() && b.is_string()) {
        const int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        return (c < 0) ? -1 : (c > 0) ? 1 : 0;
    }
    if (a.is_boolean() && b.is_boolean()) {
        return static_cast<int>(a.get<bool>()) - static_cast<int>(b.get<bool>());
    }
    return std::nullopt;
}

int sort_rank(const json& v) {
    if (v.is_number()) return 0;
    if (v.is_string()) return 1;
    if (v.is_boolean()) return 2;
    return 3;
}

/**
 * Total order for sort keys: values of different kinds order by kind
 * (numbers, strings, booleans, then structured values), structured values
 * by their serialized form.
 */
int sort_compare(const json& a, const json& b) {
    const int ra = sort_rank(a);
    const int rb = sort_rank(b);
    if (ra != rb) {
        return (ra < rb) ? -1 : 1;
    }
    if (std::optional<int> c = compare_values(a, b)) {
        return *c;
    }
    const int c = a.dump().compare(b.dump());
    return (c < 0) ? -1 : (c > 0) ? 1 : 0;
}

std::pair<std::string, json> single_entry(const json& body, const char* clause) {
    if (!body.is_object() || body.size() != 1) {
        throw TransportError(std::string("[") + clause + "] query malformed: " + body.dump(), 400);
    }
    return {body.begin().key(), body.begin().value()};
}

std::vector<json> clause_list(const json& body, const char* occur) {
    auto it = body.find(occur);
    if (it == body.end()) {
        return {};
    }
    if (it->is_array()) {
        return std::vector<json>(it->begin(), it->end());
    }
    return {*it};
}

std::optional<double> evaluate(const json& query, const std::string& id, const json& source);

bool range_matches(const json& value, const json& bounds) {
    for (const auto& [op, bound] : bounds.items()) {
        std::optional<int> c = compare_values(value, bound);
        if (!c) {
            return false;
        }
        if (op == "gt" && !(*c > 0)) return false;
        if (op == "gte" && !(*c >= 0)) return false;
        if (op == "lt" && !(*c < 0)) return false;
        if (op == "lte" && !(*c <= 0)) return false;
        if (op != "gt" && op != "gte" && op != "lt" && op != "lte") {
            throw TransportError("[range] query does not support [" + op + "]", 400);
        }
    }
    return true;
}

std::optional<double> evaluate_bool(const json& body, const std::string& id, const json& source) {
    double score = 0.0;

    for (const auto& clause : clause_list(body, "must")) {
        std::optional<double> s = evaluate(clause, id, source);
        if (!s) {
            return std::nullopt;
        }
        score += *s;
    }
    for (const auto& clause : clause_list(body, "filter")) {
        if (!evaluate(clause, id, source)) {
            return std::nullopt;
        }
    }
    for (const auto& clause : clause_list(body, "must_not")) {
        if (evaluate(clause, id, source)) {
            return std::nullopt;
        }
    }

    std::vector<json> should = clause_list(body, "should");
    if (!should.empty()) {
        const bool only_should = clause_list(body, "must").empty() && clause_list(body, "filter").empty();
        const int64_t minimum = body.value("minimum_should_match", only_should ? int64_t{1} : int64_t{0});
        int64_t matched = 0;
        for (const auto& clause : should) {
            if (std::optional<double> s = evaluate(clause, id, source)) {
                ++matched;
                score += *s;
            }
        }
        if (matched < minimum) {
            return std::nullopt;
        }
    }
    return score;
}

std::optional<double> evaluate_match(const json& body, const std::string& id, const json& source) {
    auto [field, spec] = single_entry(body, "match");
    std::string text = spec.is_object() ? spec.value("query", std::string()) : spec.get<std::string>();

    absl::flat_hash_set<std::string> document_terms;
    for (const auto& v : values_of(lookup(id, source, field))) {
        if (!v.is_string()) {
            continue;
        }
        for (auto& term : analyze_text(v.get<std::string>())) {
            document_terms.insert(std::move(term));
        }
    }

    absl::flat_hash_set<std::string> seen;
    double score = 0.0;
    for (const auto& term : analyze_text(text)) {
        if (!seen.insert(term).second) {
            continue;
        }
        if (document_terms.contains(term)) {
            score += 1.0;
        }
    }
    if (score == 0.0) {
        return std::nullopt;
    }
    return score;
}

std::optional<double> evaluate(const json& query, const std::string& id, const json& source) {
    if (!query.is_object() || query.size() != 1) {
        throw TransportError("Malformed query clause: " + query.dump(), 400);
    }
    const std::string& type = query.begin().key();
    const json& body = query.begin().value();

    if (type == "match_all") {
        return 1.0;
    }
    if (type == "term") {
        auto [field, expected] = single_entry(body, "term");
        if (expected.is_object() && expected.contains("value")) {
            expected = expected["value"];
        }
        for (const auto& v : values_of(lookup(id, source, field))) {
            if (values_equal(v, expected)) {
                return 1.0;
            }
        }
        return std::nullopt;
    }
    if (type == "terms") {
        auto [field, expected] = single_entry(body, "terms");
        if (!expected.is_array()) {
            throw TransportError("[terms] query requires an array of values for [" + field + "]", 400);
        }
        for (const auto& v : values_of(lookup(id, source, field))) {
            for (const auto& e : expected) {
                if (values_equal(v, e)) {
                    return 1.0;
                }
            }
        }
        return std::nullopt;
    }
    if (type == "range") {
        auto [field, bounds] = single_entry(body, "range");
        for (const auto& v : values_of(lookup(id, source, field))) {
            if (range_matches(v, bounds)) {
                return 1.0;
            }
        }
        return std::nullopt;
    }
    if (type == "exists") {
        json v = lookup(id, source, body.value("field", std::string()));
        if (v.is_null() || (v.is_array() && v.empty())) {
            return std::nullopt;
        }
        return 1.0;
    }
    if (type == "bool") {
        return evaluate_bool(body, id, source);
    }
    if (type == "match") {
        return evaluate_match(body, id, source);
    }
    if (type == "knn") {
        throw TransportError("[knn] queries cannot be nested in other queries", 400);
    }
    throw TransportError("Unknown query clause [" + type + "]", 400);
}

std::optional<std::vector<float>> stored_vector(const json& value, size_t dims) {
    if (!value.is_array() || value.size() != dims) {
        return std::nullopt;
    }
    std::vector<float> out;
    out.reserve(dims);
    for (const auto& v : value) {
        if (!v.is_number()) {
            return std::nullopt;
        }
        out.push_back(v.get<float>());
    }
    return out;
}

json exclude(const json& source, const std::vector<std::string>& exclude_fields) {
    json out = source;
    for (const auto& field : exclude_fields) {
        out.erase(field);
    }
    return out;
}

} // namespace

//=============================================================================
// Indices
//=============================================================================

MemoryDocumentStore::Index& MemoryDocumentStore::require_index(const std::string& index) {
    auto it = indices_.find(index);
    if (it == indices_.end()) {
        throw TransportError("no such index [" + index + "]", 404);
    }
    return it->second;
}

const MemoryDocumentStore::Index& MemoryDocumentStore::require_index(const std::string& index) const {
    auto it = indices_.find(index);
    if (it == indices_.end()) {
        throw TransportError("no such index [" + index + "]", 404);
    }
    return it->second;
}

bool MemoryDocumentStore::index_exists(const std::string& index) {
    std::shared_lock lock(mutex_);
    return indices_.contains(index);
}

void MemoryDocumentStore::create_index(const std::string& index, const nlohmann::json& mappings) {
    std::unique_lock lock(mutex_);
    if (indices_.contains(index)) {
        throw TransportError("index [" + index + "] already exists", 400);
    }
    Index& idx = indices_[index];
    idx.mappings = mappings;
    auto props = mappings.find("properties");
    ELASTIVEC_LOG_INFO("MemoryStore", "Created index '", index, "' with ",
                       props != mappings.end() ? props->size() : 0, " mapped fields");
}

void MemoryDocumentStore::delete_index(const std::string& index) {
    std::unique_lock lock(mutex_);
    if (indices_.erase(index) == 0) {
        throw TransportError("no such index [" + index + "]", 404);
    }
    ELASTIVEC_LOG_INFO("MemoryStore", "Deleted index '", index, "'");
}

std::vector<std::string> MemoryDocumentStore::list_indices() {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(indices_.size());
    for (const auto& [name, idx] : indices_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json MemoryDocumentStore::mappings(const std::string& index) const {
    std::shared_lock lock(mutex_);
    return require_index(index).mappings;
}

size_t MemoryDocumentStore::document_count(const std::string& index) const {
    std::shared_lock lock(mutex_);
    return require_index(index).documents.size();
}

std::optional<nlohmann::json> MemoryDocumentStore::raw_document(const std::string& index,
                                                                const std::string& id) const {
    std::shared_lock lock(mutex_);
    const Index& idx = require_index(index);
    auto it = idx.documents.find(id);
    if (it == idx.documents.end()) {
        return std::nullopt;
    }
    return it->second.source;
}

//=============================================================================
// Documents
//=============================================================================

void MemoryDocumentStore::put_document(Index& idx, const std::string& id, const nlohmann::json& body) {
    if (!body.is_object()) {
        throw TransportError("Document '" + id + "' must be a JSON object", 400);
    }
    auto it = idx.documents.find(id);
    if (it != idx.documents.end()) {
        it->second.source = body;
        return;
    }
    idx.documents.emplace(id, StoredDocument{idx.next_seq++, body});
}

std::optional<nlohmann::json> MemoryDocumentStore::get_document(const std::string& index,
                                                                const std::string& id,
                                                                const std::vector<std::string>& exclude_fields) {
    std::shared_lock lock(mutex_);
    const Index& idx = require_index(index);
    auto it = idx.documents.find(id);
    if (it == idx.documents.end()) {
        return std::nullopt;
    }
    return exclude(it->second.source, exclude_fields);
}

std::string MemoryDocumentStore::index_document(const std::string& index,
                                                const std::string& id,
                                                const nlohmann::json& body) {
    std::unique_lock lock(mutex_);
    auto it = indices_.find(index);
    if (it == indices_.end()) {
        // Indexing into a missing index creates it with dynamic mappings.
        it = indices_.emplace(index, Index{}).first;
        it->second.mappings = {{"properties", json::object()}};
        ELASTIVEC_LOG_INFO("MemoryStore", "Created index '", index, "' on first write");
    }
    put_document(it->second, id, body);
    return id;
}

void MemoryDocumentStore::delete_document(const std::string& index, const std::string& id) {
    std::unique_lock lock(mutex_);
    Index& idx = require_index(index);
    if (idx.documents.erase(id) == 0) {
        throw TransportError("document [" + id + "] not found in [" + index + "]", 404);
    }
}

std::vector<std::optional<nlohmann::json>> MemoryDocumentStore::multi_get(const std::string& index,
                                                                          const std::vector<std::string>& ids,
                                                                          const std::vector<std::string>& exclude_fields) {
    std::shared_lock lock(mutex_);
    const Index& idx = require_index(index);
    std::vector<std::optional<json>> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = idx.documents.find(id);
        if (it == idx.documents.end()) {
            out.emplace_back(std::nullopt);
        } else {
            out.emplace_back(exclude(it->second.source, exclude_fields));
        }
    }
    return out;
}

std::vector<std::string> MemoryDocumentStore::bulk_index(const std::string& index,
                                                         const std::vector<StorageDocument>& documents) {
    std::unique_lock lock(mutex_);
    auto it = indices_.find(index);
    if (it == indices_.end()) {
        it = indices_.emplace(index, Index{}).first;
        it->second.mappings = {{"properties", json::object()}};
        ELASTIVEC_LOG_INFO("MemoryStore", "Created index '", index, "' on first write");
    }
    std::vector<std::string> ids;
    ids.reserve(documents.size());
    for (const auto& doc : documents) {
        if (!doc.id) {
            throw TransportError("Bulk index item without an id", 400);
        }
        put_document(it->second, *doc.id, doc.body);
        ids.push_back(*doc.id);
    }
    return ids;
}

void MemoryDocumentStore::bulk_delete(const std::string& index, const std::vector<std::string>& ids) {
    std::unique_lock lock(mutex_);
    Index& idx = require_index(index);
    for (const auto& id : ids) {
        idx.documents.erase(id);
    }
}

//=============================================================================
// Search
//=============================================================================

std::vector<MemoryDocumentStore::ScoredDocument> MemoryDocumentStore::run_query(const Index& idx,
                                                                                const nlohmann::json& query) const {
    if (query.is_object() && query.size() == 1 && query.contains("knn")) {
        return run_knn(idx, query["knn"]);
    }

    std::vector<ScoredDocument> matched;
    for (const auto& [id, doc] : idx.documents) {
        if (std::optional<double> score = evaluate(query, id, doc.source)) {
            matched.push_back({&id, &doc, *score});
        }
    }
    std::sort(matched.begin(), matched.end(), [](const ScoredDocument& a, const ScoredDocument& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.document->seq < b.document->seq;
    });
    return matched;
}

std::vector<MemoryDocumentStore::ScoredDocument> MemoryDocumentStore::run_knn(const Index& idx,
                                                                              const nlohmann::json& knn) const {
    const std::string field = knn.value("field", std::string());
    if (field.empty() || !knn.contains("query_vector")) {
        throw TransportError("[knn] requires [field] and [query_vector]", 400);
    }
    const std::vector<float> query_vector = knn["query_vector"].get<std::vector<float>>();
    const int64_t k = knn.value("k", int64_t{10});
    const int64_t num_candidates = knn.value("num_candidates", std::max<int64_t>(k, 100));
    if (k <= 0) {
        throw TransportError("[k] must be greater than 0", 400);
    }
    if (num_candidates < k) {
        throw TransportError("[num_candidates] cannot be less than [k]", 400);
    }

    std::string similarity = "cosine";
    auto props = idx.mappings.find("properties");
    if (props != idx.mappings.end()) {
        auto mapping = props->find(field);
        if (mapping != props->end() && mapping->contains("similarity")) {
            similarity = mapping->at("similarity").get<std::string>();
        }
    }

    std::vector<json> filters;
    if (auto f = knn.find("filter"); f != knn.end()) {
        filters = values_of(*f);
    }

    std::vector<ScoredDocument> candidates;
    for (const auto& [id, doc] : idx.documents) {
        auto v = doc.source.find(field);
        if (v == doc.source.end()) {
            continue;
        }
        std::optional<std::vector<float>> vector = stored_vector(*v, query_vector.size());
        if (!vector) {
            continue;
        }
        bool passes = true;
        for (const auto& filter : filters) {
            if (!evaluate(filter, id, doc.source)) {
                passes = false;
                break;
            }
        }
        if (passes) {
            candidates.push_back({&id, &doc, vector_score(similarity, query_vector, *vector)});
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const ScoredDocument& a, const ScoredDocument& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.document->seq < b.document->seq;
    });
    if (candidates.size() > static_cast<size_t>(k)) {
        candidates.resize(static_cast<size_t>(k));
    }
    return candidates;
}

std::vector<MemoryDocumentStore::ScoredDocument> MemoryDocumentStore::run_retriever(const Index& idx,
                                                                                    const nlohmann::json& retriever) const {
    auto [type, body] = single_entry(retriever, "retriever");

    if (type == "knn") {
        return run_knn(idx, body);
    }
    if (type == "standard") {
        auto query = body.find("query");
        if (query == body.end()) {
            return run_query(idx, json{{"match_all", json::object()}});
        }
        return run_query(idx, *query);
    }
    if (type != "rrf") {
        throw TransportError("Unknown retriever [" + type + "]", 400);
    }

    const auto& retrievers = body.at("retrievers");
    const size_t window = body.value("rank_window_size", size_t{10});
    const double rank_constant = body.value("rank_constant", 60.0);
    if (!retrievers.is_array() || retrievers.size() < 2) {
        throw TransportError("[rrf] requires at least two retrievers", 400);
    }

    absl::flat_hash_map<std::string, ScoredDocument> fused;
    for (const auto& child : retrievers) {
        std::vector<ScoredDocument> ranked = run_retriever(idx, child);
        const size_t n = std::min(ranked.size(), window);
        for (size_t i = 0; i < n; ++i) {
            auto [it, inserted] = fused.try_emplace(*ranked[i].id, ScoredDocument{ranked[i].id, ranked[i].document, 0.0});
            it->second.score += 1.0 / (rank_constant + static_cast<double>(i) + 1.0);
        }
    }

    std::vector<ScoredDocument> results;
    results.reserve(fused.size());
    for (const auto& [id, sd] : fused) {
        results.push_back(sd);
    }
    std::sort(results.begin(), results.end(), [](const ScoredDocument& a, const ScoredDocument& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.document->seq < b.document->seq;
    });
    if (results.size() > window) {
        results.resize(window);
    }
    return results;
}

std::vector<SearchHit> MemoryDocumentStore::to_hits(const std::vector<ScoredDocument>& ranked,
                                                    const std::vector<std::string>& exclude_fields,
                                                    size_t from, size_t size, bool scored) {
    std::vector<SearchHit> hits;
    for (size_t i = from; i < ranked.size() && hits.size() < size; ++i) {
        SearchHit hit;
        hit.id = *ranked[i].id;
        hit.source = exclude(ranked[i].document->source, exclude_fields);
        if (scored) {
            hit.score = ranked[i].score;
        }
        hits.push_back(std::move(hit));
    }
    return hits;
}

std::vector<SearchHit> MemoryDocumentStore::search(const std::string& index,
                                                   const nlohmann::json& query,
                                                   const std::vector<nlohmann::json>& sort,
                                                   const std::vector<std::string>& exclude_fields,
                                                   size_t from, size_t size) {
    std::shared_lock lock(mutex_);
    const Index& idx = require_index(index);
    std::vector<ScoredDocument> ranked = run_query(idx, query);

    if (sort.empty()) {
        return to_hits(ranked, exclude_fields, from, size, true);
    }

    std::vector<std::pair<std::string, bool>> keys;   // (field, ascending)
    for (const auto& entry : sort) {
        auto [field, spec] = single_entry(entry, "sort");
        const std::string order = spec.is_object() ? spec.value("order", std::string("asc")) : spec.get<std::string>();
        keys.emplace_back(field, order != "desc");
    }

    std::stable_sort(ranked.begin(), ranked.end(), [&](const ScoredDocument& a, const ScoredDocument& b) {
        for (const auto& [field, ascending] : keys) {
            json va = lookup(*a.id, a.document->source, field);
            json vb = lookup(*b.id, b.document->source, field);
            // Missing values sort last in either direction.
            if (va.is_null() != vb.is_null()) {
                return vb.is_null();
            }
            const int c = sort_compare(va, vb);
            if (c == 0) {
                continue;
            }
            return ascending ? c < 0 : c > 0;
        }
        return false;
    });
    return to_hits(ranked, exclude_fields, from, size, false);
}

std::vector<SearchHit> MemoryDocumentStore::hybrid_search(const std::string& index,
                                                          const nlohmann::json& retriever,
                                                          const std::vector<std::string>& exclude_fields,
                                                          size_t from, size_t size) {
    std::shared_lock lock(mutex_);
    const Index& idx = require_index(index);
    return to_hits(run_retriever(idx, retriever), exclude_fields, from, size, true);
}

} // namespace elastivec
