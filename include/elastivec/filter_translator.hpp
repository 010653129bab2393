/**
 * @file filter_translator.hpp
 * @brief Compile filter expressions into native boolean/term/range queries
 */

#pragma once

#include <optional>
#include <nlohmann/json.hpp>

#include "collection_model.hpp"
#include "filter.hpp"

namespace elastivec {

/**
 * Translate a filter into a native query clause.
 *
 * Property references bind to model properties by model name; the key
 * property binds to "_id". Returns std::nullopt for a filter that matches
 * every document (a constant `true`).
 *
 * Throws SchemaError for unknown properties, TypeMismatchError for casts a
 * property type cannot take, and UnsupportedExpressionError for any node or
 * shape without a native equivalent.
 */
std::optional<nlohmann::json> translate_filter(const FilterExpr& filter, const CollectionModel& model);

inline std::optional<nlohmann::json> translate_filter(const std::optional<FilterExpr>& filter,
                                                      const CollectionModel& model) {
    if (!filter) {
        return std::nullopt;
    }
    return translate_filter(*filter, model);
}

} // namespace elastivec
