/**
 * @file record_mapper.cpp
 * @brief Dynamic record mapping
 */

#include "record_mapper.hpp"

namespace elastivec {

FieldValue default_field_value(const TypeInfo& type) {
    if (type.nullable) {
        return std::monostate{};
    }
    switch (type.kind) {
        case TypeKind::BOOL:
            return false;
        case TypeKind::INT8:
        case TypeKind::INT16:
        case TypeKind::INT32:
        case TypeKind::INT64:
            return int64_t{0};
        case TypeKind::UINT8:
        case TypeKind::UINT16:
        case TypeKind::UINT32:
        case TypeKind::UINT64:
            return uint64_t{0};
        case TypeKind::FLOAT:
        case TypeKind::DOUBLE:
            return 0.0;
        default:
            return std::monostate{};
    }
}

namespace {

std::vector<float> float_array(const nlohmann::json& j, const PropertyModel& p) {
    if (!j.is_array()) {
        throw VectorStoreError("Vector property '" + p.model_name + "' is not stored as an array");
    }
    std::vector<float> out(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        out[i] = j[i].get<float>();
    }
    return out;
}

} // namespace

DynamicRecordMapper::DynamicRecordMapper(CollectionModelPtr model, bool ignore_null_values)
    : model_(std::move(model)), ignore_null_values_(ignore_null_values) {}

StorageDocument DynamicRecordMapper::to_storage(const DynamicRecord& record,
                                                const GeneratedEmbeddings* generated) const {
    StorageDocument doc;

    const PropertyModel& key = model_->key_property();
    auto key_it = record.find(key.model_name);
    if (key_it == record.end() || is_null(key_it->second)) {
        throw SchemaError("Key can not be null");
    }
    doc.id = key_to_storage_id(key_it->second);

    size_t vector_index = 0;
    for (const auto& p : model_->properties()) {
        if (p.is_key()) {
            continue;
        }

        if (p.is_vector()) {
            size_t vi = vector_index++;
            if (generated != nullptr && vi < generated->size() && (*generated)[vi].has_value()) {
                doc.body[p.storage_name] = (*generated)[vi]->vector();
                continue;
            }
        }

        auto it = record.find(p.model_name);
        if (it == record.end() || is_null(it->second)) {
            if (!ignore_null_values_) {
                doc.body[p.storage_name] = nullptr;
            }
            continue;
        }
        doc.body[p.storage_name] = field_value_to_json(it->second);
    }
    return doc;
}

DynamicRecord DynamicRecordMapper::from_storage(const StorageDocument& document, bool include_vectors) const {
    if (!document.id) {
        throw VectorStoreError("Storage document has no id");
    }

    DynamicRecord record;
    const PropertyModel& key = model_->key_property();
    record[key.model_name] = key_to_field_value(storage_id_to_key(*document.id, key.type.kind));

    for (const auto& p : model_->properties()) {
        if (p.is_key()) {
            continue;
        }

        auto it = document.body.find(p.storage_name);
        if (it == document.body.end()) {
            if (!p.is_vector()) {
                record[p.model_name] = default_field_value(p.type);
            }
            continue;
        }
        if (it->is_null()) {
            record[p.model_name] = std::monostate{};
            continue;
        }

        try {
            if (p.is_vector()) {
                if (!include_vectors || p.requires_embedding_generation()) {
                    continue;
                }
                std::vector<float> values = float_array(*it, p);
                if (p.type.kind == TypeKind::EMBEDDING) {
                    record[p.model_name] = Embedding(std::move(values));
                } else {
                    record[p.model_name] = std::move(values);
                }
                continue;
            }
            record[p.model_name] = field_value_from_json(*it, p.type);
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

FieldValue DynamicRecordMapper::property_value(const DynamicRecord& record, const PropertyModel& property) const {
    auto it = record.find(property.model_name);
    if (it == record.end()) {
        return std::monostate{};
    }
    return it->second;
}

} // namespace elastivec
