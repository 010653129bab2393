#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "collection.hpp"
#include "filter.hpp"
#include "filter_translator.hpp"
#include "index_schema.hpp"
#include "logging.hpp"
#include "memory_document_store.hpp"
#include "vector_store.hpp"

namespace py = pybind11;
using json = nlohmann::json;

namespace {

// Dynamic records cross the boundary as JSON text; values are typed by the model.
elastivec::DynamicRecord record_from_json(const elastivec::CollectionModel& model, const std::string& text) {
    json j = json::parse(text);
    if (!j.is_object()) {
        throw std::invalid_argument("A record must be a JSON object");
    }
    elastivec::DynamicRecord record;
    for (const auto& [name, value] : j.items()) {
        const elastivec::PropertyModel* p = model.find(name);
        if (p == nullptr) {
            throw elastivec::SchemaError("Property '" + name + "' does not exist on the collection");
        }
        if (p->is_vector() && !p->requires_embedding_generation()) {
            record[name] = value.is_null() ? elastivec::FieldValue{} : elastivec::FieldValue(value.get<std::vector<float>>());
        } else {
            record[name] = elastivec::field_value_from_json(value, p->type);
        }
    }
    return record;
}

std::string record_to_json(const elastivec::DynamicRecord& record) {
    json j = json::object();
    for (const auto& [name, value] : record) {
        j[name] = elastivec::field_value_to_json(value);
    }
    return j.dump();
}

elastivec::RecordKey parse_key(const elastivec::DynamicCollection& collection, const std::string& key) {
    return elastivec::storage_id_to_key(key, collection.model().key_property().type.kind);
}

std::optional<elastivec::FilterExpr> parse_filter(const std::optional<std::string>& text) {
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return elastivec::FilterExpr::from_json(json::parse(*text));
}

py::list results_to_list(const std::vector<elastivec::SearchResult<elastivec::DynamicRecord>>& results) {
    py::list out;
    for (const auto& r : results) {
        py::object score = r.score ? py::cast(*r.score) : py::none();
        out.append(py::make_tuple(record_to_json(r.record), score));
    }
    return out;
}

} // namespace

// --- Python Module Definition ---
PYBIND11_MODULE(elastivec, m) {
    m.doc() = "Python bindings for the Elastivec vector store connector";
    m.attr("__version__") = "0.1.0";

    elastivec::init_logging_from_env();

    // Connector errors map to VectorStoreError; everything else to RuntimeError.
    static py::exception<elastivec::VectorStoreError> vector_store_error(m, "VectorStoreError");
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const elastivec::VectorStoreError& e) {
            vector_store_error(e.what());
        } catch (const json::exception& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
    });

    m.def("set_log_level", [](const std::string& level) { elastivec::set_log_level(level); },
          py::arg("level"), "Set the log level: debug, info, warn, error or off.");

    m.def("build_index_schema", [](const std::string& definition) {
        auto model = elastivec::CollectionModelBuilder().build_dynamic(
            elastivec::RecordDefinition::from_json(json::parse(definition)), nullptr);
        return elastivec::build_index_schema(*model).dump();
    }, py::arg("definition"),
    "Index mapping (JSON text) for a record definition given as JSON text.");

    m.def("translate_filter", [](const std::string& filter, const std::string& definition) -> std::optional<std::string> {
        auto model = elastivec::CollectionModelBuilder().build_dynamic(
            elastivec::RecordDefinition::from_json(json::parse(definition)), nullptr);
        auto query = elastivec::translate_filter(elastivec::FilterExpr::from_json(json::parse(filter)), *model);
        if (!query) {
            return std::nullopt;
        }
        return query->dump();
    }, py::arg("filter"), py::arg("definition"),
    "Native query (JSON text) for a JSON filter over a record definition; None matches everything.");

    py::class_<elastivec::DocumentStore, std::shared_ptr<elastivec::DocumentStore>>(m, "DocumentStore")
        .def("list_indices", &elastivec::DocumentStore::list_indices)
        .def("index_exists", &elastivec::DocumentStore::index_exists, py::arg("index"));

    py::class_<elastivec::MemoryDocumentStore, elastivec::DocumentStore,
               std::shared_ptr<elastivec::MemoryDocumentStore>>(m, "MemoryDocumentStore")
        .def(py::init<>())
        .def("mappings", [](const elastivec::MemoryDocumentStore& self, const std::string& index) {
            return self.mappings(index).dump();
        }, py::arg("index"))
        .def("document_count", &elastivec::MemoryDocumentStore::document_count, py::arg("index"));

    py::class_<elastivec::DynamicCollection, std::unique_ptr<elastivec::DynamicCollection>>(m, "DynamicCollection")
        .def_property_readonly("name", &elastivec::DynamicCollection::name)
        .def("collection_exists", [](elastivec::DynamicCollection& self) { return self.collection_exists(); })
        .def("ensure_collection_exists", [](elastivec::DynamicCollection& self) { self.ensure_collection_exists(); })
        .def("ensure_collection_deleted", [](elastivec::DynamicCollection& self) { self.ensure_collection_deleted(); })
        .def("upsert", [](elastivec::DynamicCollection& self, const std::string& record) {
            self.upsert(record_from_json(self.model(), record));
        }, py::arg("record"), "Insert or replace a record given as JSON text.")
        .def("get", [](elastivec::DynamicCollection& self, const std::string& key,
                       bool include_vectors) -> std::optional<std::string> {
            auto record = self.get(parse_key(self, key), elastivec::GetOptions{include_vectors});
            if (!record) {
                return std::nullopt;
            }
            return record_to_json(*record);
        }, py::arg("key"), py::arg("include_vectors") = false)
        .def("get_where", [](elastivec::DynamicCollection& self, const std::string& filter, size_t top,
                             size_t skip, const std::vector<std::pair<std::string, bool>>& order_by) {
            elastivec::FilteredGetOptions options;
            options.skip = skip;
            for (const auto& [property, ascending] : order_by) {
                options.order_by.push_back({property, ascending});
            }
            std::vector<std::string> out;
            for (const auto& record : self.get(elastivec::FilterExpr::from_json(json::parse(filter)), top, options)) {
                out.push_back(record_to_json(record));
            }
            return out;
        }, py::arg("filter"), py::arg("top"), py::arg("skip") = 0,
        py::arg("order_by") = std::vector<std::pair<std::string, bool>>{},
        "Records matching a JSON filter, as JSON text.")
        .def("remove", [](elastivec::DynamicCollection& self, const std::string& key) {
            self.remove(parse_key(self, key));
        }, py::arg("key"))
        .def("search", [](elastivec::DynamicCollection& self, const std::vector<float>& vector, size_t top,
                          const std::optional<std::string>& filter, size_t skip,
                          const std::optional<std::string>& vector_property) {
            elastivec::VectorSearchOptions options;
            options.skip = skip;
            options.filter = parse_filter(filter);
            options.vector_property = vector_property;
            return results_to_list(self.search(vector, top, options));
        }, py::arg("vector"), py::arg("top"), py::arg("filter") = std::nullopt, py::arg("skip") = 0,
        py::arg("vector_property") = std::nullopt,
        "Nearest records as a list of (record JSON, score) tuples.")
        .def("hybrid_search", [](elastivec::DynamicCollection& self, const std::vector<float>& vector,
                                 const std::vector<std::string>& keywords, size_t top,
                                 const std::optional<std::string>& filter, size_t skip) {
            elastivec::HybridSearchOptions options;
            options.skip = skip;
            options.filter = parse_filter(filter);
            return results_to_list(self.hybrid_search(vector, keywords, top, options));
        }, py::arg("vector"), py::arg("keywords"), py::arg("top"), py::arg("filter") = std::nullopt,
        py::arg("skip") = 0);

    py::class_<elastivec::VectorStore>(m, "VectorStore")
        .def(py::init([](std::shared_ptr<elastivec::DocumentStore> store, const std::optional<std::string>& options) {
            elastivec::VectorStoreOptions opts;
            if (options && !options->empty()) {
                opts = elastivec::VectorStoreOptions::from_json(json::parse(*options));
            }
            return elastivec::VectorStore(std::move(store), std::move(opts));
        }), py::arg("store"), py::arg("options") = std::nullopt)
        .def("list_collection_names", [](elastivec::VectorStore& self) { return self.list_collection_names(); })
        .def("collection_exists", [](elastivec::VectorStore& self, const std::string& name) {
            return self.collection_exists(name);
        }, py::arg("name"))
        .def("ensure_collection_deleted", [](elastivec::VectorStore& self, const std::string& name) {
            self.ensure_collection_deleted(name);
        }, py::arg("name"))
        .def("get_dynamic_collection", [](const elastivec::VectorStore& self, const std::string& name,
                                          const std::string& definition) {
            return std::make_unique<elastivec::DynamicCollection>(
                self.get_dynamic_collection(name, elastivec::RecordDefinition::from_json(json::parse(definition))));
        }, py::arg("name"), py::arg("definition"),
        "Collection of dynamic records described by a JSON record definition.");
}
