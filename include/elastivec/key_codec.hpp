/**
 * @file key_codec.hpp
 * @brief Conversion between typed record keys and storage document ids
 *
 * Document ids are always strings. Supported key types are std::string
 * (passed through), int64_t (decimal text) and Uuid (canonical lowercase
 * 8-4-4-4-12 text).
 */

#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <variant>

#include "errors.hpp"
#include "types.hpp"

namespace elastivec {

/**
 * Key of a record whose key type is only known at runtime.
 */
using RecordKey = std::variant<std::string, int64_t, Uuid>;

inline constexpr const char* SUPPORTED_KEY_TYPES = "string, int64, uuid";

bool is_supported_key_kind(TypeKind kind);

std::string key_to_storage_id(const std::string& key);
std::string key_to_storage_id(const char* key);
std::string key_to_storage_id(int64_t key);
std::string key_to_storage_id(const Uuid& key);
std::string key_to_storage_id(const RecordKey& key);

/**
 * Key held in a dynamic record field. Null keys raise SchemaError.
 */
std::string key_to_storage_id(const FieldValue& key);

/**
 * Any other key type is rejected.
 */
template <typename K>
std::string key_to_storage_id(const K&) {
    throw UnsupportedTypeError(std::string("The key type '") + typeid(K).name() +
                               "' is not supported. Supported types: " + SUPPORTED_KEY_TYPES);
}

/**
 * Parse a storage id as a key of the given kind.
 * Throws InvalidKeyError when the text does not parse.
 */
RecordKey storage_id_to_key(const std::string& id, TypeKind kind);

int64_t parse_int64_key(const std::string& id);
Uuid parse_uuid_key(const std::string& id);

template <typename K>
K storage_id_to_key(const std::string& id) {
    if constexpr (std::is_same_v<K, std::string>) {
        return id;
    } else if constexpr (std::is_same_v<K, int64_t>) {
        return parse_int64_key(id);
    } else if constexpr (std::is_same_v<K, Uuid>) {
        return parse_uuid_key(id);
    } else if constexpr (std::is_same_v<K, RecordKey>) {
        // Without a declared kind the id is kept as text.
        return RecordKey(id);
    } else {
        throw UnsupportedTypeError(std::string("The key type '") + typeid(K).name() +
                                   "' is not supported. Supported types: " + SUPPORTED_KEY_TYPES);
    }
}

/**
 * RecordKey -> FieldValue, for writing keys back into dynamic records.
 */
FieldValue key_to_field_value(const RecordKey& key);

} // namespace elastivec
