/**
 * @file key_codec.cpp
 * @brief Key <-> document id conversion
 */

#include "key_codec.hpp"

#include <charconv>
#include <stdexcept>

namespace elastivec {

bool is_supported_key_kind(TypeKind kind) {
    return kind == TypeKind::STRING || kind == TypeKind::INT64 || kind == TypeKind::UUID;
}

std::string key_to_storage_id(const std::string& key) {
    return key;
}

std::string key_to_storage_id(const char* key) {
    if (key == nullptr) {
        throw SchemaError("Key can not be null");
    }
    return std::string(key);
}

std::string key_to_storage_id(int64_t key) {
    return std::to_string(key);
}

std::string key_to_storage_id(const Uuid& key) {
    return uuid_to_string(key);
}

std::string key_to_storage_id(const RecordKey& key) {
    return std::visit([](const auto& k) { return key_to_storage_id(k); }, key);
}

std::string key_to_storage_id(const FieldValue& key) {
    if (is_null(key)) {
        throw SchemaError("Key can not be null");
    }
    if (const auto* s = std::get_if<std::string>(&key)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&key)) {
        return key_to_storage_id(*i);
    }
    if (const auto* u = std::get_if<Uuid>(&key)) {
        return key_to_storage_id(*u);
    }
    throw UnsupportedTypeError("The key type '" + type_of_value(key).name +
                               "' is not supported. Supported types: " + SUPPORTED_KEY_TYPES);
}

int64_t parse_int64_key(const std::string& id) {
    int64_t value = 0;
    const char* first = id.data();
    const char* last = id.data() + id.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (id.empty() || ec != std::errc() || ptr != last) {
        throw InvalidKeyError("Document id '" + id + "' is not a valid int64 key");
    }
    return value;
}

Uuid parse_uuid_key(const std::string& id) {
    try {
        return parse_uuid(id);
    } catch (const std::invalid_argument&) {
        throw InvalidKeyError("Document id '" + id + "' is not a valid uuid key");
    }
}

RecordKey storage_id_to_key(const std::string& id, TypeKind kind) {
    switch (kind) {
        case TypeKind::STRING:
            return id;
        case TypeKind::INT64:
            return parse_int64_key(id);
        case TypeKind::UUID:
            return parse_uuid_key(id);
        default:
            throw UnsupportedTypeError(std::string("The key type '") + type_kind_name(kind) +
                                       "' is not supported. Supported types: " + SUPPORTED_KEY_TYPES);
    }
}

FieldValue key_to_field_value(const RecordKey& key) {
    return std::visit([](const auto& k) -> FieldValue { return k; }, key);
}

} // namespace elastivec
