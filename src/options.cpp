/**
 * @file options.cpp
 * @brief Naming policies and option loading
 */

#include "options.hpp"

#include <cctype>

#include "errors.hpp"

namespace elastivec {

//=============================================================================
// Naming Policies
//=============================================================================

NamingPolicy string_to_naming_policy(const std::string& str) {
    if (str == "camel_case" || str == "camelCase") return NamingPolicy::CAMEL_CASE;
    if (str == "snake_case") return NamingPolicy::SNAKE_CASE;
    if (str == "as_is" || str == "none") return NamingPolicy::AS_IS;
    throw VectorStoreError("Unknown naming policy: " + str);
}

const char* naming_policy_to_string(NamingPolicy policy) {
    switch (policy) {
        case NamingPolicy::CAMEL_CASE: return "camel_case";
        case NamingPolicy::SNAKE_CASE: return "snake_case";
        case NamingPolicy::AS_IS: return "as_is";
    }
    return "camel_case";
}

namespace {

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
char to_lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

// Lower-cases the leading run of capitals, keeping the last one upper when it
// starts the next word ("URLValue" -> "urlValue", "ID" -> "id").
std::string to_camel_case(const std::string& name) {
    std::string out = name;
    for (size_t i = 0; i < out.size(); ++i) {
        if (!is_upper(out[i])) {
            break;
        }
        if (i > 0 && i + 1 < out.size() && is_lower(out[i + 1])) {
            break;
        }
        out[i] = to_lower(out[i]);
    }
    return out;
}

std::string to_snake_case(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (is_upper(c)) {
            bool prev_lower = i > 0 && (is_lower(name[i - 1]) || std::isdigit(static_cast<unsigned char>(name[i - 1])));
            bool next_lower = i + 1 < name.size() && is_lower(name[i + 1]);
            bool prev_upper = i > 0 && is_upper(name[i - 1]);
            if (!out.empty() && out.back() != '_' && (prev_lower || (prev_upper && next_lower))) {
                out.push_back('_');
            }
            out.push_back(to_lower(c));
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::string apply_naming_policy(NamingPolicy policy, const std::string& name) {
    switch (policy) {
        case NamingPolicy::CAMEL_CASE: return to_camel_case(name);
        case NamingPolicy::SNAKE_CASE: return to_snake_case(name);
        case NamingPolicy::AS_IS: return name;
    }
    return name;
}

//=============================================================================
// CollectionOptions
//=============================================================================

std::string CollectionOptions::infer_field_name(const std::string& model_name) const {
    if (field_name_inferrer) {
        return field_name_inferrer(model_name);
    }
    return apply_naming_policy(naming_policy, model_name);
}

CollectionOptions CollectionOptions::from_json(const nlohmann::json& j) {
    CollectionOptions opts;
    if (!j.is_object()) {
        throw VectorStoreError("Collection options must be a JSON object");
    }
    if (j.contains("naming_policy")) {
        opts.naming_policy = string_to_naming_policy(j["naming_policy"].get<std::string>());
    }
    opts.ignore_null_values = j.value("ignore_null_values", opts.ignore_null_values);
    opts.num_candidates_factor = j.value("num_candidates_factor", opts.num_candidates_factor);
    if (j.contains("rank_window_size") && !j["rank_window_size"].is_null()) {
        opts.rank_window_size = j["rank_window_size"].get<uint32_t>();
    }
    opts.rank_constant = j.value("rank_constant", opts.rank_constant);
    if (j.contains("definition")) {
        opts.definition = RecordDefinition::from_json(j["definition"]);
    }

    if (opts.num_candidates_factor == 0) {
        throw VectorStoreError("num_candidates_factor must be positive");
    }
    return opts;
}

nlohmann::json CollectionOptions::to_json() const {
    nlohmann::json j;
    j["naming_policy"] = naming_policy_to_string(naming_policy);
    j["ignore_null_values"] = ignore_null_values;
    j["num_candidates_factor"] = num_candidates_factor;
    if (rank_window_size) {
        j["rank_window_size"] = *rank_window_size;
    } else {
        j["rank_window_size"] = nullptr;
    }
    j["rank_constant"] = rank_constant;
    if (definition) {
        j["definition"] = definition->to_json();
    }
    return j;
}

//=============================================================================
// VectorStoreOptions
//=============================================================================

VectorStoreOptions VectorStoreOptions::from_json(const nlohmann::json& j) {
    VectorStoreOptions opts;
    if (j.contains("collection_defaults")) {
        opts.collection_defaults = CollectionOptions::from_json(j["collection_defaults"]);
    }
    return opts;
}

} // namespace elastivec
