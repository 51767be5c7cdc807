#include "json/json_value.hpp"

namespace exprc::json {

static auto clone_variant(const JsonValue::ValueVariant& src) -> JsonValue::ValueVariant {
    if (const auto* arr = std::get_if<Box<JsonArray>>(&src)) {
        return make_box<JsonArray>(**arr);
    }
    if (const auto* obj = std::get_if<Box<JsonObject>>(&src)) {
        return make_box<JsonObject>(**obj);
    }
    if (const auto* str = std::get_if<std::string>(&src)) {
        return *str;
    }
    if (const auto* num = std::get_if<JsonNumber>(&src)) {
        return *num;
    }
    if (const auto* b = std::get_if<bool>(&src)) {
        return *b;
    }
    return JsonValue::Null{};
}

JsonValue::JsonValue(const JsonValue& other) : data(clone_variant(other.data)) {}

auto JsonValue::operator=(const JsonValue& other) -> JsonValue& {
    if (this != &other) {
        data = clone_variant(other.data);
    }
    return *this;
}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        auto it = (*obj)->find(key);
        if (it != (*obj)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto JsonValue::get_string(const std::string& key) const -> std::optional<std::string> {
    const JsonValue* member = get(key);
    if (member == nullptr || !member->is_string()) {
        return std::nullopt;
    }
    return member->as_string();
}

auto JsonValue::size() const -> size_t {
    if (const auto* arr = std::get_if<Box<JsonArray>>(&data)) {
        return (*arr)->size();
    }
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    if (is_object()) {
        return as_object() == other.as_object();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    return true;
}

} // namespace exprc::json
