/**
 * @file filter_translator.cpp
 * @brief Recursive FilterExpr -> native query translation
 */

#include "filter_translator.hpp"

#include "errors.hpp"
#include "key_codec.hpp"

namespace elastivec {

namespace {

using json = nlohmann::json;

constexpr const char* KEY_FIELD = "_id";

bool convertible(const TypeInfo& from, const TypeInfo& to) {
    if (to.kind == TypeKind::OBJECT || from.kind == to.kind) {
        return true;
    }
    return is_numeric_kind(from.kind) && is_numeric_kind(to.kind);
}

bool is_array_kind(TypeKind kind) {
    return kind == TypeKind::STRING_ARRAY || kind == TypeKind::INT_ARRAY ||
           kind == TypeKind::DOUBLE_ARRAY || kind == TypeKind::OBJECT;
}

json bool_clause(const char* occur, json clauses) {
    return {{"bool", {{occur, std::move(clauses)}}}};
}

class FilterTranslator {
public:
    explicit FilterTranslator(const CollectionModel& model) : model_(model) {}

    std::optional<json> translate_root(const FilterExpr& e) {
        if (e.kind == ExprKind::CONSTANT) {
            const bool* b = std::get_if<bool>(&e.value);
            if (b != nullptr && *b) {
                return std::nullopt;
            }
        }
        return translate(e);
    }

private:
    struct Bound {
        const PropertyModel* property;
        std::string field;
    };

    json translate(const FilterExpr& e) {
        switch (e.kind) {
            case ExprKind::EQUAL:
                return translate_equal(e);
            case ExprKind::NOT_EQUAL:
                return translate_not_equal(e);
            case ExprKind::LESS_THAN:
            case ExprKind::LESS_EQUAL:
            case ExprKind::GREATER_THAN:
            case ExprKind::GREATER_EQUAL:
                return translate_comparison(e);
            case ExprKind::AND:
            case ExprKind::OR:
                return translate_logical(e);
            case ExprKind::NOT:
                expect_children(e, 1);
                return bool_clause("must_not", json::array({translate(e.children[0])}));
            case ExprKind::CONTAINS:
                return translate_contains(e);
            case ExprKind::PROPERTY:
            case ExprKind::CONVERT:
                return translate_bool_property(e);
            case ExprKind::CONSTANT:
                return translate_bool_constant(e);
            default:
                throw UnsupportedExpressionError(std::string("Unsupported filter expression node '") +
                                                 expr_kind_name(e.kind) + "': " + e.to_string());
        }
    }

    //-------------------------------------------------------------------------
    // Binding
    //-------------------------------------------------------------------------

    std::optional<Bound> try_bind(const FilterExpr& e) {
        if (e.kind == ExprKind::CONVERT) {
            expect_children(e, 1);
            std::optional<Bound> inner = try_bind(e.children[0]);
            if (inner && e.type && !convertible(inner->property->type, *e.type)) {
                throw TypeMismatchError("Cannot convert property '" + inner->property->model_name +
                                        "' of type '" + inner->property->type.name + "' to '" +
                                        e.type->name + "'");
            }
            return inner;
        }
        if (e.kind != ExprKind::PROPERTY) {
            return std::nullopt;
        }

        const PropertyModel* p = model_.find(e.name);
        if (p == nullptr) {
            throw SchemaError("Property '" + e.name + "' referenced in filter does not exist on the collection");
        }
        if (p->is_vector()) {
            throw UnsupportedExpressionError("Vector property '" + e.name + "' cannot be used in a filter");
        }
        return Bound{p, p->is_key() ? std::string(KEY_FIELD) : p->storage_name};
    }

    static const FilterExpr* as_constant(const FilterExpr& e) {
        if (e.kind == ExprKind::CONSTANT) {
            return &e;
        }
        if (e.kind == ExprKind::CONVERT && e.children.size() == 1) {
            return as_constant(e.children[0]);
        }
        return nullptr;
    }

    static void expect_children(const FilterExpr& e, size_t count) {
        if (e.children.size() != count) {
            throw UnsupportedExpressionError(std::string("Malformed '") + expr_kind_name(e.kind) + "' node: expected " +
                                             std::to_string(count) + " operand(s), got " +
                                             std::to_string(e.children.size()));
        }
    }

    static json key_value(const FieldValue& value) {
        if (const auto* u = std::get_if<uint64_t>(&value)) {
            return std::to_string(*u);
        }
        return key_to_storage_id(value);
    }

    static json value_json(const Bound& b, const FieldValue& value) {
        if (b.property->is_key()) {
            return key_value(value);
        }
        return field_value_to_json(value);
    }

    /**
     * Resolve (property, constant) from a binary node, whichever side the
     * property is on. `flipped` is set when the constant is on the left.
     */
    std::pair<Bound, const FieldValue*> bind_operands(const FilterExpr& e, bool& flipped) {
        expect_children(e, 2);
        const FilterExpr& lhs = e.children[0];
        const FilterExpr& rhs = e.children[1];

        std::optional<Bound> left = try_bind(lhs);
        std::optional<Bound> right = try_bind(rhs);
        const FilterExpr* left_const = as_constant(lhs);
        const FilterExpr* right_const = as_constant(rhs);

        if (left && right_const) {
            flipped = false;
            return {*left, &right_const->value};
        }
        if (right && left_const) {
            flipped = true;
            return {*right, &left_const->value};
        }

        const FilterExpr& offending = (left || left_const) ? rhs : lhs;
        throw UnsupportedExpressionError(std::string("'") + expr_kind_name(e.kind) +
                                         "' must compare a property with a constant; unsupported operand '" +
                                         expr_kind_name(offending.kind) + "' in " + e.to_string());
    }

    //-------------------------------------------------------------------------
    // Nodes
    //-------------------------------------------------------------------------

    json translate_equal(const FilterExpr& e) {
        bool flipped = false;
        auto [bound, value] = bind_operands(e, flipped);
        if (is_null(*value)) {
            return bool_clause("must_not", json::array({{{"exists", {{"field", bound.field}}}}}));
        }
        return {{"term", {{bound.field, value_json(bound, *value)}}}};
    }

    json translate_not_equal(const FilterExpr& e) {
        bool flipped = false;
        auto [bound, value] = bind_operands(e, flipped);
        if (is_null(*value)) {
            return {{"exists", {{"field", bound.field}}}};
        }
        json term = {{"term", {{bound.field, value_json(bound, *value)}}}};
        return bool_clause("must_not", json::array({term}));
    }

    json translate_comparison(const FilterExpr& e) {
        bool flipped = false;
        auto [bound, value] = bind_operands(e, flipped);
        if (is_null(*value)) {
            throw UnsupportedExpressionError("Cannot compare property '" + bound.property->model_name +
                                             "' against null with '" + expr_kind_name(e.kind) + "'");
        }

        ExprKind kind = e.kind;
        if (flipped) {
            switch (kind) {
                case ExprKind::LESS_THAN: kind = ExprKind::GREATER_THAN; break;
                case ExprKind::LESS_EQUAL: kind = ExprKind::GREATER_EQUAL; break;
                case ExprKind::GREATER_THAN: kind = ExprKind::LESS_THAN; break;
                case ExprKind::GREATER_EQUAL: kind = ExprKind::LESS_EQUAL; break;
                default: break;
            }
        }

        const char* bound_name = "lt";
        switch (kind) {
            case ExprKind::LESS_THAN: bound_name = "lt"; break;
            case ExprKind::LESS_EQUAL: bound_name = "lte"; break;
            case ExprKind::GREATER_THAN: bound_name = "gt"; break;
            case ExprKind::GREATER_EQUAL: bound_name = "gte"; break;
            default: break;
        }
        return {{"range", {{bound.field, {{bound_name, value_json(bound, *value)}}}}}};
    }

    json translate_logical(const FilterExpr& e) {
        if (e.children.size() < 2) {
            throw UnsupportedExpressionError(std::string("Malformed '") + expr_kind_name(e.kind) +
                                             "' node: expected at least 2 operands");
        }
        json clauses = json::array();
        for (const auto& child : e.children) {
            clauses.push_back(translate(child));
        }
        if (e.kind == ExprKind::AND) {
            return bool_clause("must", std::move(clauses));
        }
        return {{"bool", {{"should", std::move(clauses)}, {"minimum_should_match", 1}}}};
    }

    json translate_contains(const FilterExpr& e) {
        expect_children(e, 2);
        const FilterExpr& collection = e.children[0];
        const FilterExpr& item = e.children[1];

        // Array property contains a constant.
        if (std::optional<Bound> b = try_bind(collection)) {
            const FilterExpr* c = as_constant(item);
            if (c == nullptr) {
                throw UnsupportedExpressionError(std::string("Contains on property '") + b->property->model_name +
                                                 "' needs a constant operand, got '" +
                                                 expr_kind_name(item.kind) + "'");
            }
            if (!is_array_kind(b->property->type.kind)) {
                throw UnsupportedExpressionError("Contains needs an array property; '" + b->property->model_name +
                                                 "' has type '" + b->property->type.name + "'");
            }
            if (is_null(c->value)) {
                throw UnsupportedExpressionError("Contains on property '" + b->property->model_name +
                                                 "' cannot test for null");
            }
            return {{"terms", {{b->field, json::array({value_json(*b, c->value)})}}}};
        }

        // Constant set contains a property.
        if (const FilterExpr* c = as_constant(collection)) {
            std::optional<Bound> b = try_bind(item);
            if (!b) {
                throw UnsupportedExpressionError(std::string("Contains on a constant set needs a property operand, got '") +
                                                 expr_kind_name(item.kind) + "'");
            }
            json values = field_value_to_json(c->value);
            if (!values.is_array()) {
                throw UnsupportedExpressionError("Contains needs a constant array, got " + describe_value(c->value));
            }
            if (b->property->is_key()) {
                json keys = json::array();
                for (const auto& v : values) {
                    keys.push_back(v.is_string() ? v.get<std::string>() : v.dump());
                }
                values = std::move(keys);
            }
            return {{"terms", {{b->field, std::move(values)}}}};
        }

        throw UnsupportedExpressionError(std::string("Unsupported Contains shape: collection operand '") +
                                         expr_kind_name(collection.kind) + "' in " + e.to_string());
    }

    json translate_bool_property(const FilterExpr& e) {
        std::optional<Bound> b = try_bind(e);
        if (!b) {
            throw UnsupportedExpressionError(std::string("Unsupported filter expression node '") +
                                             expr_kind_name(e.kind) + "': " + e.to_string());
        }
        if (b->property->type.kind != TypeKind::BOOL) {
            throw UnsupportedExpressionError("Property '" + b->property->model_name + "' of type '" +
                                             b->property->type.name + "' cannot be used as a boolean filter");
        }
        return {{"term", {{b->field, true}}}};
    }

    json translate_bool_constant(const FilterExpr& e) {
        const bool* b = std::get_if<bool>(&e.value);
        if (b == nullptr) {
            throw UnsupportedExpressionError("Constant " + describe_value(e.value) + " is not a boolean filter");
        }
        json match_all = {{"match_all", json::object()}};
        if (*b) {
            return match_all;
        }
        return bool_clause("must_not", json::array({match_all}));
    }

    const CollectionModel& model_;
};

} // namespace

std::optional<nlohmann::json> translate_filter(const FilterExpr& filter, const CollectionModel& model) {
    FilterTranslator translator(model);
    return translator.translate_root(filter);
}

} // namespace elastivec
