//! # Runtime Support Library
//!
//! Primitives that compiled expressions call by name. Each mirrors the
//! semantics of the corresponding expression-language operator or builtin
//! closely enough for tag conversion code; none of them throw.

#ifndef EXPRC_RT_RUNTIME_HPP
#define EXPRC_RT_RUNTIME_HPP

#include "exprc_rt/value.hpp"

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>

namespace exprc::rt {

// ============================================================================
// Evaluation Context
// ============================================================================

/// Named fields visible to boolean gates (`$$self{Make}` reads field "Make").
class EvalContext {
public:
    EvalContext() = default;

    void set_field(const std::string& name, Value value);

    /// Undef when the field is absent.
    [[nodiscard]] auto field(std::string_view name) const -> Value;

    [[nodiscard]] auto has_field(std::string_view name) const -> bool;

private:
    std::map<std::string, Value, std::less<>> fields_;
};

// ============================================================================
// Truth and Function Boundaries
// ============================================================================

/// Undef, "", "0", 0 and invalid values are false.
[[nodiscard]] auto truthy(const Value& v) -> bool;

/// Invalid -> Error, anything else passes through.
[[nodiscard]] auto finish(Value v) -> ValueResult;

[[nodiscard]] auto not_implemented(std::string_view original_text) -> ValueResult;

/// Display text for a value; numbers get their shortest decimal spelling.
[[nodiscard]] auto stringify(const Value& v) -> std::string;

/// `result` as text, or the raw input when `result` is invalid.
[[nodiscard]] auto display_or_raw(const Value& result, const Value& raw) -> std::string;

// ============================================================================
// Comparison
// ============================================================================

[[nodiscard]] auto num_eq(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto num_ne(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto num_lt(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto num_gt(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto num_le(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto num_ge(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto num_cmp(const Value& a, const Value& b) -> Value;

[[nodiscard]] auto str_eq(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto str_ne(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto str_lt(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto str_gt(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto str_le(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto str_ge(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto str_cmp(const Value& a, const Value& b) -> Value;

// ============================================================================
// Logic
// ============================================================================

template <typename F> [[nodiscard]] auto logical_and(const Value& a, F&& rhs) -> Value {
    if (a.is_invalid() || !truthy(a)) {
        return a;
    }
    return rhs();
}

template <typename F> [[nodiscard]] auto logical_or(const Value& a, F&& rhs) -> Value {
    if (!a.is_invalid() && truthy(a)) {
        return a;
    }
    return rhs();
}

template <typename F> [[nodiscard]] auto defined_or(const Value& a, F&& rhs) -> Value {
    if (a.is_undef() || a.is_invalid()) {
        return rhs();
    }
    return a;
}

[[nodiscard]] auto logical_not(const Value& a) -> Value;
[[nodiscard]] auto logical_xor(const Value& a, const Value& b) -> Value;

/// Lazy conditional: only the selected branch is evaluated.
template <typename T, typename E>
[[nodiscard]] auto choose(const Value& condition, T&& if_true, E&& if_false) -> Value {
    if (condition.is_invalid()) {
        return condition;
    }
    return truthy(condition) ? Value(if_true()) : Value(if_false());
}

// ============================================================================
// Bitwise
// ============================================================================

[[nodiscard]] auto bit_and(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto bit_or(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto bit_xor(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto bit_not(const Value& a) -> Value;
[[nodiscard]] auto shl(const Value& a, const Value& b) -> Value;
[[nodiscard]] auto shr(const Value& a, const Value& b) -> Value;

// ============================================================================
// Strings
// ============================================================================

[[nodiscard]] auto concat(std::initializer_list<Value> parts) -> Value;
[[nodiscard]] auto repeat(const Value& text, const Value& count) -> Value;
[[nodiscard]] auto length(const Value& v) -> Value;
[[nodiscard]] auto substr(const Value& s, const Value& offset) -> Value;
[[nodiscard]] auto substr(const Value& s, const Value& offset, const Value& len) -> Value;
[[nodiscard]] auto index(const Value& s, const Value& needle) -> Value;
[[nodiscard]] auto index(const Value& s, const Value& needle, const Value& from) -> Value;
[[nodiscard]] auto uc(const Value& v) -> Value;
[[nodiscard]] auto lc(const Value& v) -> Value;
[[nodiscard]] auto ucfirst(const Value& v) -> Value;
[[nodiscard]] auto lcfirst(const Value& v) -> Value;
[[nodiscard]] auto ord(const Value& v) -> Value;
[[nodiscard]] auto chr(const Value& v) -> Value;
[[nodiscard]] auto defined(const Value& v) -> Value;

/// `sprintf` with Perl conversions (%d %i %u %s %f %e %g %x %X %o %b %c %%).
[[nodiscard]] auto sprintf(const Value& format, std::initializer_list<Value> args) -> Value;

/// Flattens list arguments.
[[nodiscard]] auto join(const Value& separator, std::initializer_list<Value> args) -> Value;

/// Splits on a regex pattern; `" "` splits on runs of whitespace.
[[nodiscard]] auto split(const Value& pattern, const Value& text) -> Value;
[[nodiscard]] auto split(const Value& pattern, const Value& text, const Value& limit) -> Value;

/// Element `index` of a list, or of a whitespace-separated string.
[[nodiscard]] auto element(const Value& subject, int64_t index) -> Value;

/// Pattern match with Perl modifiers (i, x, s, m).
[[nodiscard]] auto matches(const Value& subject, std::string_view pattern,
                           std::string_view modifiers) -> Value;

// ============================================================================
// Numeric Builtins
// ============================================================================

[[nodiscard]] auto int_part(const Value& v) -> Value;
[[nodiscard]] auto abs_value(const Value& v) -> Value;
[[nodiscard]] auto sqrt(const Value& v) -> Value;
[[nodiscard]] auto exp(const Value& v) -> Value;
[[nodiscard]] auto log(const Value& v) -> Value;
[[nodiscard]] auto sin(const Value& v) -> Value;
[[nodiscard]] auto cos(const Value& v) -> Value;
[[nodiscard]] auto atan2(const Value& y, const Value& x) -> Value;
[[nodiscard]] auto hex(const Value& v) -> Value;
[[nodiscard]] auto oct(const Value& v) -> Value;

// ============================================================================
// Binary Packing
// ============================================================================

/// Templates: A a C c n N v V H h x, each with an optional count or `*`.
[[nodiscard]] auto pack(const Value& format, std::initializer_list<Value> args) -> Value;
[[nodiscard]] auto unpack(const Value& format, const Value& data) -> Value;

} // namespace exprc::rt

#endif // EXPRC_RT_RUNTIME_HPP
