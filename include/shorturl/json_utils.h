#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/json_utils.h — JSON helpers shared by the HTTP layer
// ═══════════════════════════════════════════════════════════════════
//  Thin layer over nlohmann/json: a serialization macro for records
//  and JsonValue, the type behind req.body.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <optional>

namespace shorturl {

// ─────────────────────────────────────────────
//  Macro: SHORTURL_SERIALIZE
//  Declares to_json/from_json for a record type.
//
//    struct Entry {
//        std::string original_url;
//        std::int64_t short_url;
//        SHORTURL_SERIALIZE(Entry, original_url, short_url)
//    };
// ─────────────────────────────────────────────
#define SHORTURL_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  class JsonValue
//  Read-mostly view over a parsed request body.
//  Missing keys yield null instead of throwing.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nlohmann::json::object()) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    template <typename T>
    T get() const {
        return data_.get<T>();
    }

    // Typed field with fallback; wrong type counts as absent
    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        if (data_.is_object() && data_.contains(key)) {
            try {
                return data_.at(key).get<T>();
            } catch (const nlohmann::json::exception&) {
                return defaultValue;
            }
        }
        return defaultValue;
    }

    // String field, nullopt when missing or not a string
    std::optional<std::string> string(const std::string& key) const {
        if (!data_.is_object()) return std::nullopt;
        auto it = data_.find(key);
        if (it == data_.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool has(const std::string& key) const {
        return data_.is_object() && data_.contains(key);
    }
    std::size_t size() const { return data_.size(); }

    std::string dump(int indent = -1) const { return data_.dump(indent); }

    const nlohmann::json& raw() const { return data_; }
    nlohmann::json& raw() { return data_; }

    bool operator==(const JsonValue& other) const { return data_ == other.data_; }

    friend void to_json(nlohmann::json& j, const JsonValue& v) { j = v.data_; }
    friend void from_json(const nlohmann::json& j, JsonValue& v) { v.data_ = j; }

private:
    nlohmann::json data_;
};

} // namespace shorturl
