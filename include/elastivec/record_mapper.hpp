/**
 * @file record_mapper.hpp
 * @brief Conversion between application records and storage documents
 *
 * The key is carried out of band as the document id and never appears in
 * the document body. Vector values are always stored as flat numeric arrays.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "collection_model.hpp"
#include "document_store.hpp"
#include "errors.hpp"
#include "key_codec.hpp"
#include "record_type.hpp"
#include "types.hpp"

namespace elastivec {

/**
 * Embeddings produced for one record, indexed like
 * CollectionModel::vector_property(i). Entries without a value keep the
 * record's own vector.
 */
using GeneratedEmbeddings = std::vector<std::optional<Embedding>>;

template <typename TRecord>
class RecordMapper {
public:
    virtual ~RecordMapper() = default;

    /**
     * Record -> document. Throws SchemaError when the key is null.
     */
    virtual StorageDocument to_storage(const TRecord& record,
                                       const GeneratedEmbeddings* generated) const = 0;

    /**
     * Document -> record. Vector fields are left out when include_vectors is
     * false or the property is generator-backed.
     */
    virtual TRecord from_storage(const StorageDocument& document, bool include_vectors) const = 0;

    /**
     * Current value of a property (embedding generator input).
     */
    virtual FieldValue property_value(const TRecord& record, const PropertyModel& property) const = 0;
};

//=============================================================================
// Typed Records
//=============================================================================

template <typename TRecord>
class TypedRecordMapper : public RecordMapper<TRecord> {
public:
    using Member = typename RecordType<TRecord>::Member;

    TypedRecordMapper(CollectionModelPtr model, RecordType<TRecord> type, bool ignore_null_values = false)
        : model_(std::move(model)), type_(std::move(type)), ignore_null_values_(ignore_null_values) {
        members_.reserve(model_->properties().size());
        for (const auto& p : model_->properties()) {
            const Member* m = type_.find(p.model_name);
            if (m == nullptr) {
                throw SchemaError("Property '" + p.model_name + "' has no member on the record type");
            }
            members_.push_back(m);
        }
    }

    StorageDocument to_storage(const TRecord& record, const GeneratedEmbeddings* generated) const override {
        StorageDocument doc;
        size_t vector_index = 0;

        const auto& props = model_->properties();
        for (size_t i = 0; i < props.size(); ++i) {
            const PropertyModel& p = props[i];
            const Member& m = *members_[i];

            if (p.is_key()) {
                FieldValue key = m.value(record);
                if (is_null(key)) {
                    throw SchemaError("Key can not be null");
                }
                doc.id = key_to_storage_id(key);
                continue;
            }

            nlohmann::json value = m.encode(record);

            if (p.is_vector()) {
                size_t vi = vector_index++;
                if (generated != nullptr && vi < generated->size() && (*generated)[vi].has_value()) {
                    value = (*generated)[vi]->vector();
                }
            }

            if (value.is_null() && ignore_null_values_) {
                continue;
            }
            doc.body[p.storage_name] = std::move(value);
        }
        return doc;
    }

    TRecord from_storage(const StorageDocument& document, bool include_vectors) const override {
        if (!document.id) {
            throw VectorStoreError("Storage document has no id");
        }

        TRecord record{};
        const auto& props = model_->properties();
        for (size_t i = 0; i < props.size(); ++i) {
            const PropertyModel& p = props[i];
            const Member& m = *members_[i];

            if (p.is_key()) {
                m.assign_key(record, *document.id);
                continue;
            }
            if (p.is_vector() && (!include_vectors || p.requires_embedding_generation())) {
                continue;
            }

            auto it = document.body.find(p.storage_name);
            const nlohmann::json& value = (it == document.body.end()) ? null_value() : *it;
            try {
                m.decode(record, value);
            } catch (const nlohmann::json::exception& e) {
                throw VectorStoreError("Failed to read property '" + p.model_name + "' from document '" +
                                       *document.id + "': " + e.what());
            } catch (const std::invalid_argument& e) {
                throw VectorStoreError("Failed to read property '" + p.model_name + "' from document '" +
                                       *document.id + "': " + e.what());
            }
        }
        return record;
    }

    FieldValue property_value(const TRecord& record, const PropertyModel& property) const override {
        const Member* m = type_.find(property.model_name);
        if (m == nullptr) {
            throw SchemaError("Property '" + property.model_name + "' has no member on the record type");
        }
        return m->value(record);
    }

private:
    static const nlohmann::json& null_value() {
        static const nlohmann::json null_json;
        return null_json;
    }

    CollectionModelPtr model_;
    RecordType<TRecord> type_;
    std::vector<const Member*> members_;   // parallel to model_->properties()
    bool ignore_null_values_;
};

//=============================================================================
// Dynamic Records
//=============================================================================

/**
 * Mapper for DynamicRecord, addressing fields by model name.
 */
class DynamicRecordMapper : public RecordMapper<DynamicRecord> {
public:
    explicit DynamicRecordMapper(CollectionModelPtr model, bool ignore_null_values = false);

    StorageDocument to_storage(const DynamicRecord& record, const GeneratedEmbeddings* generated) const override;
    DynamicRecord from_storage(const StorageDocument& document, bool include_vectors) const override;
    FieldValue property_value(const DynamicRecord& record, const PropertyModel& property) const override;

private:
    CollectionModelPtr model_;
    bool ignore_null_values_;
};

/**
 * Value a dynamic field takes when the document does not contain it:
 * zero for non-nullable numeric and boolean types, null otherwise.
 */
FieldValue default_field_value(const TypeInfo& type);

} // namespace elastivec
