/**
 * @file types.cpp
 * @brief Type descriptors, FieldValue conversions, timestamp and UUID text forms
 */

#include "types.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace elastivec {

const char* const SUPPORTED_VECTOR_TYPES =
    "std::vector<float>, std::array<float, N>, std::deque<float>, std::list<float>, "
    "Embedding, or std::optional of one of them";

//=============================================================================
// TypeInfo
//=============================================================================

TypeInfo::TypeInfo(TypeKind k, bool null, std::string n)
    : kind(k), nullable(null), name(std::move(n)) {
    if (name.empty()) {
        name = type_kind_name(kind);
    }
}

const char* type_kind_name(TypeKind kind) {
    switch (kind) {
        case TypeKind::STRING: return "string";
        case TypeKind::BOOL: return "bool";
        case TypeKind::INT8: return "int8";
        case TypeKind::UINT8: return "uint8";
        case TypeKind::INT16: return "int16";
        case TypeKind::UINT16: return "uint16";
        case TypeKind::INT32: return "int32";
        case TypeKind::UINT32: return "uint32";
        case TypeKind::INT64: return "int64";
        case TypeKind::UINT64: return "uint64";
        case TypeKind::FLOAT: return "float";
        case TypeKind::DOUBLE: return "double";
        case TypeKind::TIMESTAMP: return "timestamp";
        case TypeKind::UUID: return "uuid";
        case TypeKind::STRING_ARRAY: return "string[]";
        case TypeKind::INT_ARRAY: return "int[]";
        case TypeKind::DOUBLE_ARRAY: return "double[]";
        case TypeKind::FLOAT_VECTOR: return "float[]";
        case TypeKind::FLOAT_FIXED_ARRAY: return "float[N]";
        case TypeKind::FLOAT_DEQUE: return "deque<float>";
        case TypeKind::FLOAT_LIST: return "list<float>";
        case TypeKind::EMBEDDING: return "embedding";
        case TypeKind::OBJECT: return "object";
    }
    return "object";
}

TypeInfo parse_type_name(const std::string& raw) {
    std::string name = raw;
    bool nullable = false;
    if (!name.empty() && name.back() == '?') {
        nullable = true;
        name.pop_back();
    }

    static const std::pair<const char*, TypeKind> names[] = {
        {"string", TypeKind::STRING},
        {"bool", TypeKind::BOOL},
        {"int8", TypeKind::INT8},
        {"uint8", TypeKind::UINT8},
        {"int16", TypeKind::INT16},
        {"uint16", TypeKind::UINT16},
        {"int32", TypeKind::INT32},
        {"int", TypeKind::INT32},
        {"uint32", TypeKind::UINT32},
        {"int64", TypeKind::INT64},
        {"long", TypeKind::INT64},
        {"uint64", TypeKind::UINT64},
        {"float", TypeKind::FLOAT},
        {"double", TypeKind::DOUBLE},
        {"timestamp", TypeKind::TIMESTAMP},
        {"uuid", TypeKind::UUID},
        {"string[]", TypeKind::STRING_ARRAY},
        {"int[]", TypeKind::INT_ARRAY},
        {"double[]", TypeKind::DOUBLE_ARRAY},
        {"float[]", TypeKind::FLOAT_VECTOR},
        {"float[N]", TypeKind::FLOAT_FIXED_ARRAY},
        {"deque<float>", TypeKind::FLOAT_DEQUE},
        {"list<float>", TypeKind::FLOAT_LIST},
        {"embedding", TypeKind::EMBEDDING},
        {"object", TypeKind::OBJECT},
    };

    for (const auto& [type_name, kind] : names) {
        if (name == type_name) {
            return TypeInfo(kind, nullable);
        }
    }
    // Unknown names are kept as opaque object types so that error messages
    // can still name them.
    return TypeInfo(TypeKind::OBJECT, nullable, name);
}

bool is_integer_kind(TypeKind kind) {
    switch (kind) {
        case TypeKind::INT8:
        case TypeKind::UINT8:
        case TypeKind::INT16:
        case TypeKind::UINT16:
        case TypeKind::INT32:
        case TypeKind::UINT32:
        case TypeKind::INT64:
        case TypeKind::UINT64:
            return true;
        default:
            return false;
    }
}

bool is_numeric_kind(TypeKind kind) {
    return is_integer_kind(kind) || kind == TypeKind::FLOAT || kind == TypeKind::DOUBLE;
}

bool is_native_vector_kind(TypeKind kind) {
    switch (kind) {
        case TypeKind::FLOAT_VECTOR:
        case TypeKind::FLOAT_FIXED_ARRAY:
        case TypeKind::FLOAT_DEQUE:
        case TypeKind::FLOAT_LIST:
        case TypeKind::EMBEDDING:
            return true;
        default:
            return false;
    }
}

//=============================================================================
// FieldValue Helpers
//=============================================================================

TypeInfo type_of_value(const FieldValue& value) {
    return std::visit([](auto&& v) -> TypeInfo {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) return TypeInfo(TypeKind::OBJECT, true, "null");
        else if constexpr (std::is_same_v<T, bool>) return TypeInfo(TypeKind::BOOL);
        else if constexpr (std::is_same_v<T, int64_t>) return TypeInfo(TypeKind::INT64);
        else if constexpr (std::is_same_v<T, uint64_t>) return TypeInfo(TypeKind::UINT64);
        else if constexpr (std::is_same_v<T, double>) return TypeInfo(TypeKind::DOUBLE);
        else if constexpr (std::is_same_v<T, std::string>) return TypeInfo(TypeKind::STRING);
        else if constexpr (std::is_same_v<T, Uuid>) return TypeInfo(TypeKind::UUID);
        else if constexpr (std::is_same_v<T, Timestamp>) return TypeInfo(TypeKind::TIMESTAMP);
        else if constexpr (std::is_same_v<T, std::vector<std::string>>) return TypeInfo(TypeKind::STRING_ARRAY);
        else if constexpr (std::is_same_v<T, std::vector<int64_t>>) return TypeInfo(TypeKind::INT_ARRAY);
        else if constexpr (std::is_same_v<T, std::vector<double>>) return TypeInfo(TypeKind::DOUBLE_ARRAY);
        else if constexpr (std::is_same_v<T, std::vector<float>>) return TypeInfo(TypeKind::FLOAT_VECTOR);
        else return TypeInfo(TypeKind::EMBEDDING);
    }, value);
}

std::string describe_value(const FieldValue& value) {
    if (is_null(value)) {
        return "null";
    }
    return field_value_to_json(value).dump() + " (" + type_of_value(value).name + ")";
}

nlohmann::json field_value_to_json(const FieldValue& value) {
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) return nullptr;
        else if constexpr (std::is_same_v<T, Uuid>) return uuid_to_string(v);
        else if constexpr (std::is_same_v<T, Timestamp>) return format_timestamp(v);
        else if constexpr (std::is_same_v<T, Embedding>) return v.vector();
        else return nlohmann::json(v);
    }, value);
}

namespace {

std::vector<float> float_elements(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Expected a numeric array, got " + std::string(j.type_name()));
    }
    std::vector<float> out;
    out.reserve(j.size());
    for (const auto& elem : j) {
        out.push_back(elem.get<float>());
    }
    return out;
}

} // namespace

FieldValue field_value_from_json(const nlohmann::json& j, const TypeInfo& type) {
    if (j.is_null()) {
        return std::monostate{};
    }

    switch (type.kind) {
        case TypeKind::STRING:
            return j.get<std::string>();
        case TypeKind::BOOL:
            return j.get<bool>();
        case TypeKind::INT8:
        case TypeKind::INT16:
        case TypeKind::INT32:
        case TypeKind::INT64:
            return j.get<int64_t>();
        case TypeKind::UINT8:
        case TypeKind::UINT16:
        case TypeKind::UINT32:
        case TypeKind::UINT64:
            return j.get<uint64_t>();
        case TypeKind::FLOAT:
        case TypeKind::DOUBLE:
            return j.get<double>();
        case TypeKind::TIMESTAMP:
            return parse_timestamp(j.get<std::string>());
        case TypeKind::UUID:
            return parse_uuid(j.get<std::string>());
        case TypeKind::STRING_ARRAY:
            return j.get<std::vector<std::string>>();
        case TypeKind::INT_ARRAY:
            return j.get<std::vector<int64_t>>();
        case TypeKind::DOUBLE_ARRAY:
            return j.get<std::vector<double>>();
        case TypeKind::FLOAT_VECTOR:
        case TypeKind::FLOAT_FIXED_ARRAY:
        case TypeKind::FLOAT_DEQUE:
        case TypeKind::FLOAT_LIST:
            return float_elements(j);
        case TypeKind::EMBEDDING:
            return Embedding(float_elements(j));
        case TypeKind::OBJECT:
            break;
    }

    // Opaque types keep whatever scalar shape the document holds.
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_unsigned()) return j.get<uint64_t>();
    if (j.is_number_integer()) return j.get<int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_array() && !j.empty() && j[0].is_string()) return j.get<std::vector<std::string>>();
    if (j.is_array() && !j.empty() && j[0].is_number_integer()) return j.get<std::vector<int64_t>>();
    if (j.is_array()) return j.get<std::vector<double>>();
    return j.dump();
}

std::optional<std::vector<float>> numeric_vector(const FieldValue& value) {
    if (const auto* v = std::get_if<std::vector<float>>(&value)) {
        return *v;
    }
    if (const auto* e = std::get_if<Embedding>(&value)) {
        return e->vector();
    }
    if (const auto* d = std::get_if<std::vector<double>>(&value)) {
        return std::vector<float>(d->begin(), d->end());
    }
    return std::nullopt;
}

//=============================================================================
// Timestamps and UUIDs
//=============================================================================

std::string format_timestamp(Timestamp ts) {
    auto ms_total = ts.time_since_epoch().count();
    auto secs = ms_total / 1000;
    auto ms = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms));
    return buf;
}

Timestamp parse_timestamp(const std::string& text) {
    std::tm tm_buf{};
    int consumed = 0;
    int matched = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                              &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                              &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed);
    if (matched != 6) {
        throw std::invalid_argument("Malformed timestamp: '" + text + "'");
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;

    int64_t millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }
    if (pos < text.size() && text[pos] != 'Z') {
        throw std::invalid_argument("Only UTC timestamps are supported: '" + text + "'");
    }

    std::time_t secs = timegm(&tm_buf);
    return Timestamp(std::chrono::milliseconds(static_cast<int64_t>(secs) * 1000 + millis));
}

std::string uuid_to_string(const Uuid& id) {
    return boost::uuids::to_string(id);
}

Uuid parse_uuid(const std::string& text) {
    try {
        return boost::uuids::string_generator()(text);
    } catch (const std::runtime_error&) {
        throw std::invalid_argument("Malformed UUID: '" + text + "'");
    }
}

} // namespace elastivec
