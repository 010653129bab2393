/**
 * @file record_type.hpp
 * @brief Typed record descriptors built from member pointers
 *
 * RecordType<T> declares which members of T form the key, the data fields
 * and the vector fields, with optional storage names and settings:
 *
 *   RecordType<Hotel>()
 *       .key("HotelId", &Hotel::id)
 *       .data("Name", &Hotel::name, {.is_indexed = true})
 *       .data("Description", &Hotel::description, {.is_full_text_indexed = true})
 *       .vector("Embedding", &Hotel::embedding, {.dimensions = 4});
 *
 * Each member carries JSON encode/decode accessors so the typed mapper can
 * move values between T and storage documents without reflection.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "key_codec.hpp"
#include "record_definition.hpp"
#include "types.hpp"

namespace elastivec {

template <typename TRecord>
class RecordType {
public:
    /**
     * Accessors for one declared member.
     */
    struct Member {
        PropertyDefinition definition;
        std::function<nlohmann::json(const TRecord&)> encode;
        std::function<void(TRecord&, const nlohmann::json&)> decode;
        std::function<FieldValue(const TRecord&)> value;
        std::function<void(TRecord&, const std::string&)> assign_key;   // key members only
    };

    RecordType() = default;

    template <typename M>
    RecordType& key(const std::string& name, M TRecord::*member,
                    std::optional<std::string> storage_name = std::nullopt) {
        Member m = make_member(PropertyDefinition::key(name, type_of<M>(), std::move(storage_name)), member);
        m.assign_key = [member](TRecord& record, const std::string& id) {
            record.*member = key_from_id<M>(id);
        };
        return add(std::move(m));
    }

    template <typename M>
    RecordType& data(const std::string& name, M TRecord::*member, const DataOptions& options = {}) {
        return add(make_member(PropertyDefinition::data(name, type_of<M>(), options), member));
    }

    template <typename M>
    RecordType& vector(const std::string& name, M TRecord::*member, const VectorOptions& options) {
        return add(make_member(PropertyDefinition::vector(name, type_of<M>(), options), member));
    }

    const std::vector<Member>& members() const { return members_; }

    const Member* find(const std::string& name) const {
        auto it = name_to_index_.find(name);
        if (it == name_to_index_.end()) {
            return nullptr;
        }
        return &members_[it->second];
    }

    /**
     * The declared properties as a definition, in declaration order.
     */
    RecordDefinition to_definition() const {
        RecordDefinition def;
        for (const auto& m : members_) {
            def.add(m.definition);
        }
        return def;
    }

private:
    template <typename M>
    static Member make_member(PropertyDefinition definition, M TRecord::*member) {
        Member m;
        m.definition = std::move(definition);
        m.encode = [member](const TRecord& record) { return codec::encode(record.*member); };
        m.decode = [member](TRecord& record, const nlohmann::json& j) {
            record.*member = codec::decode<M>(j);
        };
        m.value = [member](const TRecord& record) { return make_field_value(record.*member); };
        return m;
    }

    template <typename M>
    static M key_from_id(const std::string& id) {
        if constexpr (detail::is_optional<M>::value) {
            return M(key_from_id<typename M::value_type>(id));
        } else if constexpr (std::is_same_v<M, std::string> || std::is_same_v<M, int64_t> ||
                             std::is_same_v<M, Uuid>) {
            return storage_id_to_key<M>(id);
        } else {
            throw UnsupportedTypeError(std::string("The key type '") + typeid(M).name() +
                                       "' is not supported. Supported types: " + SUPPORTED_KEY_TYPES);
        }
    }

    RecordType& add(Member member) {
        if (name_to_index_.count(member.definition.name) > 0) {
            throw SchemaError("Property already exists: " + member.definition.name);
        }
        name_to_index_[member.definition.name] = members_.size();
        members_.push_back(std::move(member));
        return *this;
    }

    std::vector<Member> members_;
    std::unordered_map<std::string, size_t> name_to_index_;
};

} // namespace elastivec
