/**
 * @file filter.cpp
 * @brief FilterExpr construction, rendering and JSON DSL parsing
 */

#include "filter.hpp"

#include <limits>
#include <sstream>

#include "errors.hpp"

namespace elastivec {

const char* expr_kind_name(ExprKind kind) {
    switch (kind) {
        case ExprKind::PROPERTY: return "PROPERTY";
        case ExprKind::CONSTANT: return "CONSTANT";
        case ExprKind::PARAMETER: return "PARAMETER";
        case ExprKind::EQUAL: return "EQUAL";
        case ExprKind::NOT_EQUAL: return "NOT_EQUAL";
        case ExprKind::LESS_THAN: return "LESS_THAN";
        case ExprKind::LESS_EQUAL: return "LESS_EQUAL";
        case ExprKind::GREATER_THAN: return "GREATER_THAN";
        case ExprKind::GREATER_EQUAL: return "GREATER_EQUAL";
        case ExprKind::AND: return "AND";
        case ExprKind::OR: return "OR";
        case ExprKind::NOT: return "NOT";
        case ExprKind::CONTAINS: return "CONTAINS";
        case ExprKind::CONVERT: return "CONVERT";
        case ExprKind::ADD: return "ADD";
        case ExprKind::SUBTRACT: return "SUBTRACT";
        case ExprKind::MULTIPLY: return "MULTIPLY";
        case ExprKind::DIVIDE: return "DIVIDE";
        case ExprKind::CALL: return "CALL";
    }
    return "UNKNOWN";
}

//=============================================================================
// Construction
//=============================================================================

FilterExpr FilterExpr::property(std::string name, bool indexer) {
    FilterExpr e;
    e.kind = ExprKind::PROPERTY;
    e.name = std::move(name);
    e.indexer = indexer;
    return e;
}

FilterExpr FilterExpr::constant(FieldValue value) {
    FilterExpr e;
    e.kind = ExprKind::CONSTANT;
    e.value = std::move(value);
    return e;
}

FilterExpr FilterExpr::parameter(std::string name) {
    FilterExpr e;
    e.kind = ExprKind::PARAMETER;
    e.name = std::move(name);
    return e;
}

FilterExpr FilterExpr::unary(ExprKind kind, FilterExpr operand) {
    FilterExpr e;
    e.kind = kind;
    e.children.push_back(std::move(operand));
    return e;
}

FilterExpr FilterExpr::binary(ExprKind kind, FilterExpr lhs, FilterExpr rhs) {
    FilterExpr e;
    e.kind = kind;
    e.children.reserve(2);
    e.children.push_back(std::move(lhs));
    e.children.push_back(std::move(rhs));
    return e;
}

FilterExpr FilterExpr::call(std::string method, std::vector<FilterExpr> arguments) {
    FilterExpr e;
    e.kind = ExprKind::CALL;
    e.name = std::move(method);
    e.children = std::move(arguments);
    return e;
}

FilterExpr FilterExpr::convert(FilterExpr operand, TypeInfo target) {
    FilterExpr e = unary(ExprKind::CONVERT, std::move(operand));
    e.type = std::move(target);
    return e;
}

FilterExpr FilterExpr::contains(FilterExpr item) const {
    return binary(ExprKind::CONTAINS, *this, std::move(item));
}

FilterExpr FilterExpr::method(std::string method_name, std::vector<FilterExpr> arguments) const {
    std::vector<FilterExpr> children;
    children.reserve(arguments.size() + 1);
    children.push_back(*this);
    for (auto& a : arguments) {
        children.push_back(std::move(a));
    }
    return call(std::move(method_name), std::move(children));
}

//=============================================================================
// Rendering
//=============================================================================

namespace {

const char* operator_symbol(ExprKind kind) {
    switch (kind) {
        case ExprKind::EQUAL: return "==";
        case ExprKind::NOT_EQUAL: return "!=";
        case ExprKind::LESS_THAN: return "<";
        case ExprKind::LESS_EQUAL: return "<=";
        case ExprKind::GREATER_THAN: return ">";
        case ExprKind::GREATER_EQUAL: return ">=";
        case ExprKind::AND: return "&&";
        case ExprKind::OR: return "||";
        case ExprKind::ADD: return "+";
        case ExprKind::SUBTRACT: return "-";
        case ExprKind::MULTIPLY: return "*";
        case ExprKind::DIVIDE: return "/";
        default: return nullptr;
    }
}

} // namespace

std::string FilterExpr::to_string() const {
    std::ostringstream oss;
    switch (kind) {
        case ExprKind::PROPERTY:
            if (indexer) {
                oss << "r[\"" << name << "\"]";
            } else {
                oss << "r." << name;
            }
            break;
        case ExprKind::CONSTANT:
            oss << field_value_to_json(value).dump();
            break;
        case ExprKind::PARAMETER:
            oss << name;
            break;
        case ExprKind::NOT:
            oss << "!(" << (children.empty() ? std::string() : children[0].to_string()) << ')';
            break;
        case ExprKind::CONTAINS:
            oss << children[0].to_string() << ".contains(" << children[1].to_string() << ')';
            break;
        case ExprKind::CONVERT:
            oss << '(' << (type ? type->name : std::string("?")) << ")" << children[0].to_string();
            break;
        case ExprKind::CALL:
            oss << name << '(';
            for (size_t i = 0; i < children.size(); ++i) {
                oss << (i ? ", " : "") << children[i].to_string();
            }
            oss << ')';
            break;
        default: {
            const char* sym = operator_symbol(kind);
            oss << '(';
            for (size_t i = 0; i < children.size(); ++i) {
                if (i) oss << ' ' << sym << ' ';
                oss << children[i].to_string();
            }
            oss << ')';
            break;
        }
    }
    return oss.str();
}

//=============================================================================
// JSON DSL
//=============================================================================

namespace {

bool fits_int64(const nlohmann::json& v) {
    return !v.is_number_unsigned() || v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}

FieldValue json_to_constant(const nlohmann::json& v) {
    if (v.is_null()) return std::monostate{};
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_unsigned()) {
        if (fits_int64(v)) return static_cast<int64_t>(v.get<uint64_t>());
        return v.get<uint64_t>();
    }
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number_float()) return v.get<double>();
    if (v.is_string()) return v.get<std::string>();
    if (v.is_array()) {
        if (v.empty()) {
            return std::vector<std::string>{};
        }
        // Elements must share one kind: all strings, or all numbers.
        bool all_strings = true;
        bool all_numbers = true;
        bool all_integers = true;
        for (const auto& elem : v) {
            all_strings = all_strings && elem.is_string();
            all_numbers = all_numbers && elem.is_number();
            all_integers = all_integers && elem.is_number_integer() && fits_int64(elem);
        }
        if (all_strings) {
            return v.get<std::vector<std::string>>();
        }
        if (all_integers) {
            return v.get<std::vector<int64_t>>();
        }
        if (all_numbers) {
            return v.get<std::vector<double>>();
        }
    }
    throw UnsupportedExpressionError("Unsupported filter value: " + v.dump());
}

FilterExpr combine(ExprKind kind, std::vector<FilterExpr> parts) {
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    FilterExpr e;
    e.kind = kind;
    e.children = std::move(parts);
    return e;
}

std::vector<FilterExpr> parse_list(const nlohmann::json& list, const char* op) {
    if (!list.is_array() || list.empty()) {
        throw UnsupportedExpressionError(std::string("Filter operator ") + op + " needs a non-empty array");
    }
    std::vector<FilterExpr> parts;
    for (const auto& child : list) {
        parts.push_back(FilterExpr::from_json(child));
    }
    return parts;
}

FilterExpr parse_operator(const std::string& field_name, const std::string& op, const nlohmann::json& operand) {
    FilterExpr prop = FilterExpr::property(field_name);
    FilterExpr value = FilterExpr::constant(json_to_constant(operand));

    if (op == "$eq") return FilterExpr::binary(ExprKind::EQUAL, prop, value);
    if (op == "$ne") return FilterExpr::binary(ExprKind::NOT_EQUAL, prop, value);
    if (op == "$gt") return FilterExpr::binary(ExprKind::GREATER_THAN, prop, value);
    if (op == "$gte") return FilterExpr::binary(ExprKind::GREATER_EQUAL, prop, value);
    if (op == "$lt") return FilterExpr::binary(ExprKind::LESS_THAN, prop, value);
    if (op == "$lte") return FilterExpr::binary(ExprKind::LESS_EQUAL, prop, value);
    if (op == "$in" || op == "$nin") {
        if (!operand.is_array()) {
            throw UnsupportedExpressionError("Filter operator " + op + " on '" + field_name + "' needs an array");
        }
        FilterExpr in = FilterExpr::binary(ExprKind::CONTAINS, value, prop);
        return op == "$in" ? in : FilterExpr::unary(ExprKind::NOT, std::move(in));
    }
    if (op == "$contains") return FilterExpr::binary(ExprKind::CONTAINS, prop, value);
    throw UnsupportedExpressionError("Unknown filter operator: " + op);
}

} // namespace

FilterExpr FilterExpr::from_json(const nlohmann::json& j) {
    if (!j.is_object() || j.empty()) {
        throw UnsupportedExpressionError("Filter must be a non-empty JSON object: " + j.dump());
    }

    std::vector<FilterExpr> parts;
    for (const auto& [key, val] : j.items()) {
        if (key == "$and") {
            parts.push_back(combine(ExprKind::AND, parse_list(val, "$and")));
        } else if (key == "$or") {
            parts.push_back(combine(ExprKind::OR, parse_list(val, "$or")));
        } else if (key == "$not") {
            parts.push_back(unary(ExprKind::NOT, from_json(val)));
        } else if (!key.empty() && key[0] == '$') {
            throw UnsupportedExpressionError("Unknown filter operator: " + key);
        } else if (val.is_object()) {
            // Operator form: {"field": {"$gt": 10, "$lt": 20}}
            if (val.empty()) {
                throw UnsupportedExpressionError("Empty operator object for field '" + key + "'");
            }
            for (const auto& [op, operand] : val.items()) {
                parts.push_back(parse_operator(key, op, operand));
            }
        } else {
            // Implicit equality: {"field": "value"}
            parts.push_back(binary(ExprKind::EQUAL, property(key), constant(json_to_constant(val))));
        }
    }
    return combine(ExprKind::AND, std::move(parts));
}

} // namespace elastivec
