//! # JSON Values
//!
//! `JsonValue` is a variant over the six JSON types. Integers are kept as
//! `int64_t` when they fit so numeric node values from the upstream parser
//! (`numeric_value`) survive without a round trip through `double`.
//!
//! ```cpp
//! JsonValue record(JsonObject{{"original_text", JsonValue("$val * 25")}});
//! if (const auto* text = record.get("original_text"); text && text->is_string()) {
//!     use(text->as_string());
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace exprc::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;

/// Keys are kept ordered so serialized output is deterministic.
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON number stored as an integer or a double depending on its spelling.
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Double };

    Kind kind = Kind::Int64;
    int64_t i64 = 0;
    double f64 = 0.0;

    JsonNumber() = default;
    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind == Kind::Int64 && other.kind == Kind::Int64) {
            return i64 == other.i64;
        }
        return as_f64() == other.as_f64();
    }
};

struct JsonValue {
    using Null = std::monostate;
    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(size_t value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(const JsonValue& other);
    JsonValue(JsonValue&& other) noexcept = default;
    auto operator=(const JsonValue& other) -> JsonValue&;
    auto operator=(JsonValue&& other) noexcept -> JsonValue& = default;
    ~JsonValue() = default;

    // ------------------------------------------------------------------------
    // Type queries
    // ------------------------------------------------------------------------

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ------------------------------------------------------------------------
    // Accessors (callers check the type first)
    // ------------------------------------------------------------------------

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Member lookup; nullptr when absent or when this is not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// String member, or std::nullopt when absent or not a string.
    [[nodiscard]] auto get_string(const std::string& key) const -> std::optional<std::string>;

    [[nodiscard]] auto size() const -> size_t;

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    // ------------------------------------------------------------------------
    // Serialization (json_serializer.cpp)
    // ------------------------------------------------------------------------

    [[nodiscard]] auto to_string() const -> std::string;
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;
};

[[nodiscard]] inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

[[nodiscard]] inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace exprc::json
