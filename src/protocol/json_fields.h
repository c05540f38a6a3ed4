#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <editrpc/protocol/positional.h>

namespace editrpc::protocol::detail {

using json = nlohmann::json;

// Returns the member of an object, or nullptr when obj is not an object or lacks the key
inline const json* findField(const json& obj, std::string_view key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &*it;
}

inline std::optional<std::string> stringField(const json& obj, std::string_view key) {
    const json* v = findField(obj, key);
    if (!v || !v->is_string()) {
        return std::nullopt;
    }
    return v->get<std::string>();
}

inline std::optional<std::string_view> stringFieldView(const json& obj, std::string_view key) {
    const json* v = findField(obj, key);
    if (!v || !v->is_string()) {
        return std::nullopt;
    }
    return std::string_view{v->get_ref<const std::string&>()};
}

inline std::optional<uint64_t> unsignedField(const json& obj, std::string_view key) {
    const json* v = findField(obj, key);
    if (!v) {
        return std::nullopt;
    }
    return asUnsigned(*v);
}

inline std::optional<bool> boolField(const json& obj, std::string_view key) {
    const json* v = findField(obj, key);
    if (!v || !v->is_boolean()) {
        return std::nullopt;
    }
    return v->get<bool>();
}

// Optional string field: absent or null gives an engaged outer optional holding nullopt;
// a value of any other type gives nullopt.
inline std::optional<std::optional<std::string>> optionalStringField(const json& obj,
                                                                     std::string_view key) {
    const json* v = findField(obj, key);
    if (!v || v->is_null()) {
        return std::optional<std::string>{};
    }
    if (!v->is_string()) {
        return std::nullopt;
    }
    return std::optional<std::string>{v->get<std::string>()};
}

} // namespace editrpc::protocol::detail
