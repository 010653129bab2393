/**
 * @file collection_model.hpp
 * @brief Validated schema descriptor of a collection and its builder
 *
 * A CollectionModel lists the key, data and vector properties of a record
 * together with their resolved storage names and vector settings. Models
 * are immutable once built and shared by every operation on a collection.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "embedding.hpp"
#include "options.hpp"
#include "record_definition.hpp"
#include "record_type.hpp"
#include "types.hpp"

namespace elastivec {

//=============================================================================
// Property Model
//=============================================================================

struct PropertyModel {
    PropertyRole role = PropertyRole::DATA;
    std::string model_name;
    std::string storage_name;
    TypeInfo type;

    bool is_indexed = false;
    bool is_full_text_indexed = false;

    uint32_t dimensions = 0;
    std::string distance_function;      // resolved, never empty for vectors
    std::string index_kind;             // resolved, never empty for vectors
    EmbeddingGeneratorPtr embedding_generator;

    bool is_key() const { return role == PropertyRole::KEY; }
    bool is_data() const { return role == PropertyRole::DATA; }
    bool is_vector() const { return role == PropertyRole::VECTOR; }

    /**
     * True when values must go through the embedding generator before
     * they can be stored (the declared type is not a numeric vector).
     */
    bool requires_embedding_generation() const {
        return is_vector() && !is_native_vector_kind(type.kind);
    }
};

//=============================================================================
// Collection Model
//=============================================================================

class CollectionModel {
public:
    explicit CollectionModel(std::vector<PropertyModel> properties);

    const PropertyModel& key_property() const { return properties_[key_index_]; }

    /**
     * All properties in declaration order.
     */
    const std::vector<PropertyModel>& properties() const { return properties_; }

    std::vector<const PropertyModel*> data_properties() const;
    std::vector<const PropertyModel*> vector_properties() const;

    size_t vector_property_count() const { return vector_indices_.size(); }
    const PropertyModel& vector_property(size_t i) const { return properties_[vector_indices_[i]]; }

    /**
     * Look up by model name. nullptr if absent.
     */
    const PropertyModel* find(const std::string& model_name) const;

    /**
     * The named vector property, or the only one when no name is given.
     * Throws SchemaError for an unknown or non-vector name and
     * AmbiguousPropertyError when zero or several candidates exist.
     */
    const PropertyModel& get_vector_property_or_single(const std::optional<std::string>& name) const;

    /**
     * The named full-text data property, or the only full-text one.
     */
    const PropertyModel& get_full_text_data_property_or_single(const std::optional<std::string>& name) const;

    /**
     * A data or key property by model name (ordering, projections).
     */
    const PropertyModel& get_data_or_key_property(const std::string& name) const;

    /**
     * True if any vector property has an embedding generator attached.
     */
    bool embedding_generation_required() const { return embedding_generation_required_; }

    /**
     * Storage names of all vector properties (excluded from fetched sources
     * when vectors are not requested).
     */
    std::vector<std::string> vector_storage_names() const;

private:
    std::vector<PropertyModel> properties_;
    std::unordered_map<std::string, size_t> name_to_index_;
    std::vector<size_t> data_indices_;
    std::vector<size_t> vector_indices_;
    size_t key_index_ = 0;
    bool embedding_generation_required_ = false;
};

using CollectionModelPtr = std::shared_ptr<const CollectionModel>;

//=============================================================================
// Model Builder
//=============================================================================

/**
 * Builds and validates collection models.
 *
 * Storage names resolve to the explicit override (member or definition),
 * else the options' field name inferrer / naming policy.
 */
class CollectionModelBuilder {
public:
    explicit CollectionModelBuilder(CollectionOptions options = {});

    /**
     * Model for a typed record. Properties of `definition`, when given,
     * must name members of `type` and replace their settings.
     */
    template <typename TRecord>
    CollectionModelPtr build(const RecordType<TRecord>& type,
                             const std::optional<RecordDefinition>& definition,
                             EmbeddingGeneratorPtr default_generator) const {
        return build_static(type.to_definition(), definition, std::move(default_generator));
    }

    /**
     * Model for dynamic records, from the definition alone.
     */
    CollectionModelPtr build_dynamic(const RecordDefinition& definition,
                                     EmbeddingGeneratorPtr default_generator) const;

    const CollectionOptions& options() const { return options_; }

private:
    CollectionModelPtr build_static(const RecordDefinition& declared,
                                    const std::optional<RecordDefinition>& overlay,
                                    EmbeddingGeneratorPtr default_generator) const;

    CollectionModelPtr finish(const std::vector<PropertyDefinition>& properties,
                              const EmbeddingGeneratorPtr& default_generator) const;

    CollectionOptions options_;
};

} // namespace elastivec
