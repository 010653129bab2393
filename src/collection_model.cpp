/**
 * @file collection_model.cpp
 * @brief CollectionModel lookups and model building/validation
 */

#include "collection_model.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

#include "errors.hpp"
#include "key_codec.hpp"
#include "logging.hpp"

namespace elastivec {

//=============================================================================
// CollectionModel
//=============================================================================

CollectionModel::CollectionModel(std::vector<PropertyModel> properties)
    : properties_(std::move(properties)) {
    bool have_key = false;
    for (size_t i = 0; i < properties_.size(); ++i) {
        const auto& p = properties_[i];
        name_to_index_[p.model_name] = i;
        switch (p.role) {
            case PropertyRole::KEY:
                key_index_ = i;
                have_key = true;
                break;
            case PropertyRole::DATA:
                data_indices_.push_back(i);
                break;
            case PropertyRole::VECTOR:
                vector_indices_.push_back(i);
                if (p.embedding_generator) {
                    embedding_generation_required_ = true;
                }
                break;
        }
    }
    if (!have_key) {
        throw SchemaError("No key property found");
    }
}

std::vector<const PropertyModel*> CollectionModel::data_properties() const {
    std::vector<const PropertyModel*> out;
    out.reserve(data_indices_.size());
    for (size_t i : data_indices_) {
        out.push_back(&properties_[i]);
    }
    return out;
}

std::vector<const PropertyModel*> CollectionModel::vector_properties() const {
    std::vector<const PropertyModel*> out;
    out.reserve(vector_indices_.size());
    for (size_t i : vector_indices_) {
        out.push_back(&properties_[i]);
    }
    return out;
}

const PropertyModel* CollectionModel::find(const std::string& model_name) const {
    auto it = name_to_index_.find(model_name);
    if (it == name_to_index_.end()) {
        return nullptr;
    }
    return &properties_[it->second];
}

const PropertyModel& CollectionModel::get_vector_property_or_single(const std::optional<std::string>& name) const {
    if (name) {
        const PropertyModel* p = find(*name);
        if (p == nullptr) {
            throw SchemaError("Property '" + *name + "' does not exist on the collection");
        }
        if (!p->is_vector()) {
            throw SchemaError("Property '" + *name + "' is not a vector property");
        }
        return *p;
    }

    if (vector_indices_.empty()) {
        throw AmbiguousPropertyError("The collection does not have any vector properties");
    }
    if (vector_indices_.size() > 1) {
        throw AmbiguousPropertyError(
            "The collection has multiple vector properties, so the vector property to use must be specified");
    }
    return properties_[vector_indices_.front()];
}

const PropertyModel& CollectionModel::get_full_text_data_property_or_single(const std::optional<std::string>& name) const {
    if (name) {
        const PropertyModel* p = find(*name);
        if (p == nullptr) {
            throw SchemaError("Property '" + *name + "' does not exist on the collection");
        }
        if (!p->is_data() || !p->is_full_text_indexed) {
            throw SchemaError("Property '" + *name + "' is not a full-text indexed data property");
        }
        return *p;
    }

    const PropertyModel* found = nullptr;
    for (size_t i : data_indices_) {
        const auto& p = properties_[i];
        if (!p.is_full_text_indexed) {
            continue;
        }
        if (found != nullptr) {
            throw AmbiguousPropertyError(
                "The collection has multiple full-text indexed data properties, so the property to use must be specified");
        }
        found = &p;
    }
    if (found == nullptr) {
        throw AmbiguousPropertyError("The collection does not have any full-text indexed data properties");
    }
    return *found;
}

const PropertyModel& CollectionModel::get_data_or_key_property(const std::string& name) const {
    const PropertyModel* p = find(name);
    if (p == nullptr) {
        throw SchemaError("Property '" + name + "' does not exist on the collection");
    }
    if (p->is_vector()) {
        throw SchemaError("Property '" + name + "' is a vector property; expected a data or key property");
    }
    return *p;
}

std::vector<std::string> CollectionModel::vector_storage_names() const {
    std::vector<std::string> names;
    names.reserve(vector_indices_.size());
    for (size_t i : vector_indices_) {
        names.push_back(properties_[i].storage_name);
    }
    return names;
}

//=============================================================================
// CollectionModelBuilder
//=============================================================================

CollectionModelBuilder::CollectionModelBuilder(CollectionOptions options)
    : options_(std::move(options)) {}

CollectionModelPtr CollectionModelBuilder::build_dynamic(const RecordDefinition& definition,
                                                         EmbeddingGeneratorPtr default_generator) const {
    if (definition.empty()) {
        throw SchemaError("A record definition is required for dynamic collections");
    }
    return finish(definition.properties(), default_generator);
}

CollectionModelPtr CollectionModelBuilder::build_static(const RecordDefinition& declared,
                                                        const std::optional<RecordDefinition>& overlay,
                                                        EmbeddingGeneratorPtr default_generator) const {
    std::vector<PropertyDefinition> properties = declared.properties();

    if (overlay) {
        for (const auto& over : overlay->properties()) {
            auto it = std::find_if(properties.begin(), properties.end(),
                                   [&](const PropertyDefinition& p) { return p.name == over.name; });
            if (it == properties.end()) {
                throw SchemaError("Property '" + over.name +
                                  "' in the record definition does not exist on the record type");
            }
            // The member's C++ type stays authoritative; its storage name
            // survives unless the definition overrides it.
            TypeInfo member_type = it->type;
            std::optional<std::string> member_storage_name = it->storage_name;
            *it = over;
            it->type = member_type;
            if (!it->storage_name) {
                it->storage_name = member_storage_name;
            }
        }
    }

    return finish(properties, default_generator);
}

CollectionModelPtr CollectionModelBuilder::finish(const std::vector<PropertyDefinition>& definitions,
                                                  const EmbeddingGeneratorPtr& default_generator) const {
    std::vector<PropertyModel> properties;
    properties.reserve(definitions.size());

    std::vector<std::string> key_names;
    std::unordered_set<std::string> storage_names;

    for (const auto& def : definitions) {
        PropertyModel p;
        p.role = def.role;
        p.model_name = def.name;
        p.type = def.type;
        p.storage_name = def.storage_name ? *def.storage_name : options_.infer_field_name(def.name);

        switch (def.role) {
            case PropertyRole::KEY:
                key_names.push_back(def.name);
                if (!is_supported_key_kind(def.type.kind)) {
                    throw UnsupportedTypeError("Property '" + def.name + "' has unsupported key type '" +
                                               def.type.name + "'. Supported types: " + SUPPORTED_KEY_TYPES);
                }
                break;

            case PropertyRole::DATA:
                // Full-text takes precedence over exact-match indexing.
                p.is_full_text_indexed = def.is_full_text_indexed;
                p.is_indexed = def.is_indexed && !def.is_full_text_indexed;
                break;

            case PropertyRole::VECTOR: {
                if (def.dimensions == 0) {
                    throw SchemaError("Vector property '" + def.name + "' must have a positive number of dimensions");
                }
                p.dimensions = def.dimensions;
                p.distance_function = def.distance_function.value_or(distance_function::COSINE_SIMILARITY);
                p.index_kind = def.index_kind.value_or(index_kind::INT8_HNSW);
                p.embedding_generator = def.embedding_generator ? def.embedding_generator : default_generator;

                if (!is_native_vector_kind(def.type.kind)) {
                    if (!p.embedding_generator) {
                        throw UnsupportedTypeError("Vector property '" + def.name + "' has unsupported type '" +
                                                   def.type.name + "'. Supported types: " + SUPPORTED_VECTOR_TYPES +
                                                   "; other types need an embedding generator");
                    }
                    if (!p.embedding_generator->accepts(def.type)) {
                        throw UnsupportedTypeError("The embedding generator configured on vector property '" +
                                                   def.name + "' does not accept input type '" +
                                                   def.type.name + "'");
                    }
                }
                break;
            }
        }

        if (!storage_names.insert(p.storage_name).second) {
            throw SchemaError("Duplicate storage name '" + p.storage_name + "' (property '" + def.name + "')");
        }
        properties.push_back(std::move(p));
    }

    if (key_names.empty()) {
        throw SchemaError("No key property found on the record");
    }
    if (key_names.size() > 1) {
        std::string names;
        for (const auto& n : key_names) {
            names += names.empty() ? n : ", " + n;
        }
        throw SchemaError("Multiple key properties found: " + names + "; exactly one is required");
    }

    auto model = std::make_shared<const CollectionModel>(std::move(properties));

    if (is_log_enabled(LogLevel::DEBUG)) {
        std::ostringstream summary;
        for (const auto& p : model->properties()) {
            summary << ' ' << p.model_name << "->" << p.storage_name << '(' << property_role_name(p.role) << ')';
        }
        ELASTIVEC_LOG_DEBUG("ModelBuilder", "Built collection model:", summary.str());
    }
    return model;
}

} // namespace elastivec
