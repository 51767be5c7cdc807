//! # Runtime Values
//!
//! The dynamically typed scalar that generated functions operate on. Numbers
//! and strings convert into each other the way the expression language does:
//! a string used as a number is read up to the end of its leading numeric
//! prefix, and a number used as a string gets its shortest decimal spelling.
//!
//! Operations that cannot produce a meaningful result (non-numeric operand,
//! division by zero) yield an `Invalid` value carrying the reason. Invalid
//! values propagate through every operator and are turned into an `Error` by
//! `finish()` at the function boundary.
//!
//! ```cpp
//! rt::Value v = rt::Value::text("4");
//! auto scaled = v * rt::Value::integer(25);   // Integer 100
//! auto bad = rt::Value::text("abc") * v;      // Invalid
//! ```

#ifndef EXPRC_RT_VALUE_HPP
#define EXPRC_RT_VALUE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace exprc::rt {

enum class ValueKind : uint8_t {
    Undef,
    Integer,
    Real,
    Text,
    List,
    Invalid,
};

class Value {
public:
    Value() = default;

    [[nodiscard]] static auto integer(int64_t v) -> Value;
    [[nodiscard]] static auto real(double v) -> Value;
    [[nodiscard]] static auto text(std::string s) -> Value;
    [[nodiscard]] static auto list(std::vector<Value> items) -> Value;
    [[nodiscard]] static auto invalid(std::string reason) -> Value;
    /// 1 for true, "" for false.
    [[nodiscard]] static auto boolean(bool b) -> Value;

    [[nodiscard]] auto kind() const -> ValueKind {
        return kind_;
    }
    [[nodiscard]] auto is_undef() const -> bool {
        return kind_ == ValueKind::Undef;
    }
    [[nodiscard]] auto is_invalid() const -> bool {
        return kind_ == ValueKind::Invalid;
    }
    [[nodiscard]] auto is_list() const -> bool {
        return kind_ == ValueKind::List;
    }

    /// Numeric reading: Integer, Real, or nullopt when there is no numeric prefix.
    [[nodiscard]] auto to_number() const -> std::optional<Value>;

    /// True when the whole string (ignoring surrounding whitespace) is a number.
    [[nodiscard]] auto looks_like_number() const -> bool;

    [[nodiscard]] auto as_double() const -> double;
    [[nodiscard]] auto as_integer() const -> int64_t;
    [[nodiscard]] auto as_string() const -> std::string;

    [[nodiscard]] auto items() const -> const std::vector<Value>& {
        return items_;
    }
    /// Reason for Invalid values.
    [[nodiscard]] auto reason() const -> const std::string& {
        return text_;
    }

    /// Same kind and same payload.
    [[nodiscard]] auto operator==(const Value& other) const -> bool;

private:
    ValueKind kind_ = ValueKind::Undef;
    int64_t int_ = 0;
    double real_ = 0.0;
    std::string text_;
    std::vector<Value> items_;
};

struct Error {
    std::string message;
};

using ValueResult = std::variant<Value, Error>;

[[nodiscard]] inline auto is_error(const ValueResult& r) -> bool {
    return std::holds_alternative<Error>(r);
}

// ============================================================================
// Arithmetic
// ============================================================================

[[nodiscard]] auto operator+(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto operator-(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto operator*(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto operator/(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto operator%(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto operator-(const Value& a) -> Value;
[[nodiscard]] auto operator+(const Value& a) -> Value;
[[nodiscard]] auto power(const Value& base, const Value& exponent) -> Value;

} // namespace exprc::rt

#endif // EXPRC_RT_VALUE_HPP
