/**
 * @file filter.hpp
 * @brief Filter expression trees over record properties
 *
 * Filters can be built with operators:
 *
 *   (field("Category") == "shoes" && field("Price") < 100) || !field("InStock")
 *   field("Tags").contains("b")
 *   literal(std::vector<std::string>{"a", "b"}).contains(field("Category"))
 *
 * or parsed from the JSON DSL:
 *
 *   {"Category": "shoes"}                       -> EQUAL
 *   {"Price": {"$lt": 100}}                     -> LESS_THAN
 *   {"Category": {"$in": ["a", "b"]}}           -> CONTAINS (literal set)
 *   {"Tags": {"$contains": "b"}}                -> CONTAINS (array property)
 *   {"$and": [{...}, {...}]}, {"$or": [...]}, {"$not": {...}}
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>

#include "types.hpp"

namespace elastivec {

/**
 * Expression node kinds.
 */
enum class ExprKind : uint8_t {
    PROPERTY = 0,       // record.name or record["name"]
    CONSTANT = 1,       // literal value
    PARAMETER = 2,      // free variable other than a property access
    EQUAL = 3,
    NOT_EQUAL = 4,
    LESS_THAN = 5,
    LESS_EQUAL = 6,
    GREATER_THAN = 7,
    GREATER_EQUAL = 8,
    AND = 9,
    OR = 10,
    NOT = 11,
    CONTAINS = 12,      // children[0] contains children[1]
    CONVERT = 13,       // cast of children[0] to `type`
    ADD = 14,
    SUBTRACT = 15,
    MULTIPLY = 16,
    DIVIDE = 17,
    CALL = 18,          // method call `name` on children
};

const char* expr_kind_name(ExprKind kind);

/**
 * A node of a filter expression tree.
 */
struct FilterExpr {
    ExprKind kind = ExprKind::CONSTANT;
    std::string name;                   // PROPERTY / PARAMETER / CALL name
    bool indexer = false;               // PROPERTY accessed as record["name"]
    FieldValue value;                   // CONSTANT
    std::optional<TypeInfo> type;       // CONVERT target
    std::vector<FilterExpr> children;

    static FilterExpr property(std::string name, bool indexer = false);
    static FilterExpr constant(FieldValue value);
    static FilterExpr parameter(std::string name);
    static FilterExpr unary(ExprKind kind, FilterExpr operand);
    static FilterExpr binary(ExprKind kind, FilterExpr lhs, FilterExpr rhs);
    static FilterExpr call(std::string method, std::vector<FilterExpr> arguments);
    static FilterExpr convert(FilterExpr operand, TypeInfo target);

    /**
     * CONTAINS node with this expression as the collection.
     */
    FilterExpr contains(FilterExpr item) const;

    template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, FilterExpr>>>
    FilterExpr contains(const T& item) const {
        return contains(constant(make_field_value(item)));
    }

    /**
     * Method call with this expression as the receiver.
     */
    FilterExpr method(std::string method_name, std::vector<FilterExpr> arguments = {}) const;

    /**
     * Readable rendering for error messages.
     */
    std::string to_string() const;

    /**
     * Parse the JSON DSL. Throws UnsupportedExpressionError on unknown
     * operators or malformed shapes.
     */
    static FilterExpr from_json(const nlohmann::json& j);
};

//=============================================================================
// Builder
//=============================================================================

/**
 * Member access on the record: record.name
 */
inline FilterExpr field(std::string name) {
    return FilterExpr::property(std::move(name));
}

/**
 * Indexer access on a dynamic record: record["name"]
 */
inline FilterExpr indexed_field(std::string name) {
    return FilterExpr::property(std::move(name), true);
}

template <typename T>
FilterExpr literal(const T& value) {
    return FilterExpr::constant(make_field_value(value));
}

inline FilterExpr cast(FilterExpr operand, TypeInfo target) {
    return FilterExpr::convert(std::move(operand), std::move(target));
}

namespace detail {
template <typename T>
using if_not_expr = std::enable_if_t<!std::is_same_v<std::decay_t<T>, FilterExpr>, int>;
} // namespace detail

#define ELASTIVEC_FILTER_BINARY_OPERATOR(op, expr_kind)                                       \
    inline FilterExpr operator op(const FilterExpr& lhs, const FilterExpr& rhs) {              \
        return FilterExpr::binary(ExprKind::expr_kind, lhs, rhs);                              \
    }                                                                                          \
    template <typename T, detail::if_not_expr<T> = 0>                                          \
    FilterExpr operator op(const FilterExpr& lhs, const T& rhs) {                              \
        return FilterExpr::binary(ExprKind::expr_kind, lhs, literal(rhs));                     \
    }                                                                                          \
    template <typename T, detail::if_not_expr<T> = 0>                                          \
    FilterExpr operator op(const T& lhs, const FilterExpr& rhs) {                              \
        return FilterExpr::binary(ExprKind::expr_kind, literal(lhs), rhs);                     \
    }

ELASTIVEC_FILTER_BINARY_OPERATOR(==, EQUAL)
ELASTIVEC_FILTER_BINARY_OPERATOR(!=, NOT_EQUAL)
ELASTIVEC_FILTER_BINARY_OPERATOR(<, LESS_THAN)
ELASTIVEC_FILTER_BINARY_OPERATOR(<=, LESS_EQUAL)
ELASTIVEC_FILTER_BINARY_OPERATOR(>, GREATER_THAN)
ELASTIVEC_FILTER_BINARY_OPERATOR(>=, GREATER_EQUAL)
ELASTIVEC_FILTER_BINARY_OPERATOR(+, ADD)
ELASTIVEC_FILTER_BINARY_OPERATOR(-, SUBTRACT)
ELASTIVEC_FILTER_BINARY_OPERATOR(*, MULTIPLY)
ELASTIVEC_FILTER_BINARY_OPERATOR(/, DIVIDE)

#undef ELASTIVEC_FILTER_BINARY_OPERATOR

inline FilterExpr operator&&(const FilterExpr& lhs, const FilterExpr& rhs) {
    return FilterExpr::binary(ExprKind::AND, lhs, rhs);
}

inline FilterExpr operator||(const FilterExpr& lhs, const FilterExpr& rhs) {
    return FilterExpr::binary(ExprKind::OR, lhs, rhs);
}

inline FilterExpr operator!(const FilterExpr& operand) {
    return FilterExpr::unary(ExprKind::NOT, operand);
}

} // namespace elastivec
