#include "exprc_rt/value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace exprc::rt {

namespace {

/// Reads `[ws][+-]digits[.digits][e[+-]digits]` from the start of `s`.
/// Sets `consumed` to the number of characters used (0 when there is no number).
auto parse_numeric_prefix(const std::string& s, size_t& consumed) -> std::optional<Value> {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
        ++i;
    }
    size_t start = i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
        ++i;
    }
    size_t digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        ++i;
        ++digits;
    }
    bool is_real = false;
    if (i < s.size() && s[i] == '.') {
        size_t frac_start = i + 1;
        size_t j = frac_start;
        while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
            ++j;
        }
        if (digits > 0 || j > frac_start) {
            digits += j - frac_start;
            i = j;
            is_real = true;
        }
    }
    if (digits == 0) {
        consumed = 0;
        return std::nullopt;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        size_t j = i + 1;
        if (j < s.size() && (s[j] == '+' || s[j] == '-')) {
            ++j;
        }
        size_t exp_start = j;
        while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
            ++j;
        }
        if (j > exp_start) {
            i = j;
            is_real = true;
        }
    }
    consumed = i;

    std::string number = s.substr(start, i - start);
    if (!is_real) {
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(number.c_str(), &end, 10);
        if (errno != ERANGE) {
            return Value::integer(static_cast<int64_t>(v));
        }
    }
    return Value::real(std::strtod(number.c_str(), nullptr));
}

auto format_real(double v) -> std::string {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "Inf" : "-Inf";
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", v);
    std::string out(buf);
    if (out == "-0") {
        out = "0";
    }
    return out;
}

/// Numeric reading of `v`, or the Invalid value explaining why there is none.
auto numeric(const Value& v, Value& out) -> std::optional<Value> {
    if (v.is_invalid()) {
        return v;
    }
    auto n = v.to_number();
    if (!n) {
        if (v.is_undef()) {
            return Value::invalid("undefined value used as a number");
        }
        return Value::invalid("non-numeric value '" + v.as_string() + "'");
    }
    out = std::move(*n);
    return std::nullopt;
}

template <typename IntOp, typename RealOp>
auto arithmetic(const Value& a, const Value& b, IntOp int_op, RealOp real_op) -> Value {
    Value x;
    Value y;
    if (auto err = numeric(a, x)) {
        return *err;
    }
    if (auto err = numeric(b, y)) {
        return *err;
    }
    if (x.kind() == ValueKind::Integer && y.kind() == ValueKind::Integer) {
        int64_t result = 0;
        if (int_op(x.as_integer(), y.as_integer(), result)) {
            return Value::integer(result);
        }
    }
    return Value::real(real_op(x.as_double(), y.as_double()));
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

auto Value::integer(int64_t v) -> Value {
    Value out;
    out.kind_ = ValueKind::Integer;
    out.int_ = v;
    return out;
}

auto Value::real(double v) -> Value {
    Value out;
    out.kind_ = ValueKind::Real;
    out.real_ = v;
    return out;
}

auto Value::text(std::string s) -> Value {
    Value out;
    out.kind_ = ValueKind::Text;
    out.text_ = std::move(s);
    return out;
}

auto Value::list(std::vector<Value> items) -> Value {
    Value out;
    out.kind_ = ValueKind::List;
    out.items_ = std::move(items);
    return out;
}

auto Value::invalid(std::string reason) -> Value {
    Value out;
    out.kind_ = ValueKind::Invalid;
    out.text_ = std::move(reason);
    return out;
}

auto Value::boolean(bool b) -> Value {
    return b ? integer(1) : text("");
}

// ============================================================================
// Conversion
// ============================================================================

auto Value::to_number() const -> std::optional<Value> {
    switch (kind_) {
    case ValueKind::Integer:
    case ValueKind::Real:
        return *this;
    case ValueKind::Text: {
        size_t consumed = 0;
        return parse_numeric_prefix(text_, consumed);
    }
    default:
        return std::nullopt;
    }
}

auto Value::looks_like_number() const -> bool {
    switch (kind_) {
    case ValueKind::Integer:
    case ValueKind::Real:
        return true;
    case ValueKind::Text: {
        size_t consumed = 0;
        if (!parse_numeric_prefix(text_, consumed)) {
            return false;
        }
        while (consumed < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[consumed]))) {
            ++consumed;
        }
        return consumed == text_.size();
    }
    default:
        return false;
    }
}

auto Value::as_double() const -> double {
    switch (kind_) {
    case ValueKind::Integer:
        return static_cast<double>(int_);
    case ValueKind::Real:
        return real_;
    default: {
        auto n = to_number();
        return n ? n->as_double() : 0.0;
    }
    }
}

auto Value::as_integer() const -> int64_t {
    switch (kind_) {
    case ValueKind::Integer:
        return int_;
    case ValueKind::Real:
        if (std::isnan(real_)) {
            return 0;
        }
        if (real_ >= 9.2233720368547758e18) {
            return std::numeric_limits<int64_t>::max();
        }
        if (real_ <= -9.2233720368547758e18) {
            return std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(real_);
    default: {
        auto n = to_number();
        return n ? n->as_integer() : 0;
    }
    }
}

auto Value::as_string() const -> std::string {
    switch (kind_) {
    case ValueKind::Undef:
    case ValueKind::Invalid:
        return "";
    case ValueKind::Integer:
        return std::to_string(int_);
    case ValueKind::Real:
        return format_real(real_);
    case ValueKind::Text:
        return text_;
    case ValueKind::List: {
        std::string out;
        for (size_t i = 0; i < items_.size(); ++i) {
            if (i > 0) {
                out += ' ';
            }
            out += items_[i].as_string();
        }
        return out;
    }
    }
    return "";
}

auto Value::operator==(const Value& other) const -> bool {
    if (kind_ != other.kind_) {
        return false;
    }
    switch (kind_) {
    case ValueKind::Undef:
        return true;
    case ValueKind::Integer:
        return int_ == other.int_;
    case ValueKind::Real:
        return real_ == other.real_;
    case ValueKind::Text:
    case ValueKind::Invalid:
        return text_ == other.text_;
    case ValueKind::List:
        return items_ == other.items_;
    }
    return false;
}

// ============================================================================
// Arithmetic
// ============================================================================

auto operator+(const Value& a, const Value& b) -> Value {
    return arithmetic(
        a, b, [](int64_t x, int64_t y, int64_t& r) { return !__builtin_add_overflow(x, y, &r); },
        [](double x, double y) { return x + y; });
}

auto operator-(const Value& a, const Value& b) -> Value {
    return arithmetic(
        a, b, [](int64_t x, int64_t y, int64_t& r) { return !__builtin_sub_overflow(x, y, &r); },
        [](double x, double y) { return x - y; });
}

auto operator*(const Value& a, const Value& b) -> Value {
    return arithmetic(
        a, b, [](int64_t x, int64_t y, int64_t& r) { return !__builtin_mul_overflow(x, y, &r); },
        [](double x, double y) { return x * y; });
}

auto operator/(const Value& a, const Value& b) -> Value {
    Value x;
    Value y;
    if (auto err = numeric(a, x)) {
        return *err;
    }
    if (auto err = numeric(b, y)) {
        return *err;
    }
    if (y.as_double() == 0.0) {
        return Value::invalid("division by zero");
    }
    if (x.kind() == ValueKind::Integer && y.kind() == ValueKind::Integer) {
        int64_t n = x.as_integer();
        int64_t d = y.as_integer();
        if (!(n == std::numeric_limits<int64_t>::min() && d == -1) && n % d == 0) {
            return Value::integer(n / d);
        }
    }
    return Value::real(x.as_double() / y.as_double());
}

auto operator%(const Value& a, const Value& b) -> Value {
    Value x;
    Value y;
    if (auto err = numeric(a, x)) {
        return *err;
    }
    if (auto err = numeric(b, y)) {
        return *err;
    }
    int64_t n = x.as_integer();
    int64_t d = y.as_integer();
    if (d == 0) {
        return Value::invalid("modulus by zero");
    }
    if (d == -1) {
        return Value::integer(0);
    }
    int64_t r = n % d;
    // Result takes the sign of the right operand
    if (r != 0 && ((r < 0) != (d < 0))) {
        r += d;
    }
    return Value::integer(r);
}

auto operator-(const Value& a) -> Value {
    Value x;
    if (auto err = numeric(a, x)) {
        return *err;
    }
    if (x.kind() == ValueKind::Integer && x.as_integer() != std::numeric_limits<int64_t>::min()) {
        return Value::integer(-x.as_integer());
    }
    return Value::real(-x.as_double());
}

auto operator+(const Value& a) -> Value {
    return a;
}

auto power(const Value& base, const Value& exponent) -> Value {
    return arithmetic(
        base, exponent,
        [](int64_t x, int64_t y, int64_t& r) {
            if (y < 0) {
                return false;
            }
            if (x == 0 || x == 1) {
                r = (y == 0) ? 1 : x;
                return true;
            }
            if (x == -1) {
                r = (y % 2 == 0) ? 1 : -1;
                return true;
            }
            int64_t acc = 1;
            for (int64_t i = 0; i < y; ++i) {
                if (__builtin_mul_overflow(acc, x, &acc)) {
                    return false;
                }
            }
            r = acc;
            return true;
        },
        [](double x, double y) { return std::pow(x, y); });
}

} // namespace exprc::rt
