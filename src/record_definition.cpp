/**
 * @file record_definition.cpp
 * @brief RecordDefinition construction and JSON loading
 */

#include "record_definition.hpp"

#include "errors.hpp"

namespace elastivec {

const char* property_role_name(PropertyRole role) {
    switch (role) {
        case PropertyRole::KEY: return "key";
        case PropertyRole::DATA: return "data";
        case PropertyRole::VECTOR: return "vector";
    }
    return "data";
}

//=============================================================================
// PropertyDefinition
//=============================================================================

PropertyDefinition PropertyDefinition::key(const std::string& name, TypeInfo type,
                                           std::optional<std::string> storage_name) {
    PropertyDefinition p;
    p.role = PropertyRole::KEY;
    p.name = name;
    p.type = std::move(type);
    p.storage_name = std::move(storage_name);
    return p;
}

PropertyDefinition PropertyDefinition::data(const std::string& name, TypeInfo type,
                                            const DataOptions& options) {
    PropertyDefinition p;
    p.role = PropertyRole::DATA;
    p.name = name;
    p.type = std::move(type);
    p.storage_name = options.storage_name;
    p.is_indexed = options.is_indexed;
    p.is_full_text_indexed = options.is_full_text_indexed;
    return p;
}

PropertyDefinition PropertyDefinition::vector(const std::string& name, TypeInfo type,
                                              const VectorOptions& options) {
    PropertyDefinition p;
    p.role = PropertyRole::VECTOR;
    p.name = name;
    p.type = std::move(type);
    p.storage_name = options.storage_name;
    p.dimensions = options.dimensions;
    p.distance_function = options.distance_function;
    p.index_kind = options.index_kind;
    p.embedding_generator = options.embedding_generator;
    return p;
}

//=============================================================================
// RecordDefinition
//=============================================================================

RecordDefinition::RecordDefinition(std::initializer_list<PropertyDefinition> properties) {
    for (const auto& p : properties) {
        add(p);
    }
}

RecordDefinition& RecordDefinition::add(PropertyDefinition property) {
    if (property.name.empty()) {
        throw SchemaError("Property name must not be empty");
    }
    if (name_to_index_.count(property.name) > 0) {
        throw SchemaError("Property already exists: " + property.name);
    }
    name_to_index_[property.name] = properties_.size();
    properties_.push_back(std::move(property));
    return *this;
}

const PropertyDefinition* RecordDefinition::find(const std::string& name) const {
    auto it = name_to_index_.find(name);
    if (it == name_to_index_.end()) {
        return nullptr;
    }
    return &properties_[it->second];
}

nlohmann::json RecordDefinition::to_json() const {
    nlohmann::json props = nlohmann::json::array();
    for (const auto& p : properties_) {
        nlohmann::json f;
        f["name"] = p.name;
        f["role"] = property_role_name(p.role);
        f["type"] = p.type.nullable ? p.type.name + "?" : p.type.name;
        if (p.storage_name) {
            f["storage_name"] = *p.storage_name;
        }
        switch (p.role) {
            case PropertyRole::KEY:
                break;
            case PropertyRole::DATA:
                f["indexed"] = p.is_indexed;
                f["full_text"] = p.is_full_text_indexed;
                break;
            case PropertyRole::VECTOR:
                f["dimensions"] = p.dimensions;
                if (p.distance_function) f["distance_function"] = *p.distance_function;
                if (p.index_kind) f["index_kind"] = *p.index_kind;
                break;
        }
        props.push_back(f);
    }
    return {{"properties", props}};
}

RecordDefinition RecordDefinition::from_json(const nlohmann::json& j) {
    const nlohmann::json& props = j.is_object() ? j.at("properties") : j;
    if (!props.is_array()) {
        throw SchemaError("Record definition must be an array of properties");
    }

    RecordDefinition def;
    for (const auto& f : props) {
        if (!f.contains("name") || !f.contains("type")) {
            throw SchemaError("Record definition property needs 'name' and 'type': " + f.dump());
        }
        std::string name = f["name"];
        std::string role_str = f.value("role", "data");
        TypeInfo type = parse_type_name(f["type"].get<std::string>());

        std::optional<std::string> storage_name;
        if (f.contains("storage_name") && f["storage_name"].is_string()) {
            storage_name = f["storage_name"].get<std::string>();
        }

        if (role_str == "key") {
            def.add(PropertyDefinition::key(name, type, storage_name));
        } else if (role_str == "data") {
            DataOptions opts;
            opts.storage_name = storage_name;
            opts.is_indexed = f.value("indexed", false);
            opts.is_full_text_indexed = f.value("full_text", false);
            def.add(PropertyDefinition::data(name, type, opts));
        } else if (role_str == "vector") {
            VectorOptions opts;
            opts.storage_name = storage_name;
            opts.dimensions = f.value("dimensions", 0u);
            if (f.contains("distance_function")) {
                opts.distance_function = f["distance_function"].get<std::string>();
            }
            if (f.contains("index_kind")) {
                opts.index_kind = f["index_kind"].get<std::string>();
            }
            def.add(PropertyDefinition::vector(name, type, opts));
        } else {
            throw SchemaError("Unknown property role '" + role_str + "' for property " + name);
        }
    }
    return def;
}

} // namespace elastivec
