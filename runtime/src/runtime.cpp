#include "exprc_rt/runtime.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace exprc::rt {

namespace {

auto first_invalid(std::initializer_list<const Value*> values) -> const Value* {
    for (const Value* v : values) {
        if (v->is_invalid()) {
            return v;
        }
    }
    return nullptr;
}

auto bits_of(const Value& v, uint64_t& out) -> std::optional<Value> {
    if (v.is_invalid()) {
        return v;
    }
    auto n = v.to_number();
    if (!n) {
        return Value::invalid("non-numeric value '" + v.as_string() + "' in bitwise operation");
    }
    out = static_cast<uint64_t>(n->as_integer());
    return std::nullopt;
}

auto from_bits(uint64_t bits) -> Value {
    if (bits <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Value::integer(static_cast<int64_t>(bits));
    }
    return Value::real(static_cast<double>(bits));
}

template <typename Op> auto bitwise(const Value& a, const Value& b, Op op) -> Value {
    uint64_t x = 0;
    uint64_t y = 0;
    if (auto err = bits_of(a, x)) {
        return *err;
    }
    if (auto err = bits_of(b, y)) {
        return *err;
    }
    return from_bits(op(x, y));
}

/// -1, 0, 1, or nullopt when either side has no numeric reading.
auto numeric_order(const Value& a, const Value& b) -> std::optional<int> {
    auto x = a.to_number();
    auto y = b.to_number();
    if (!x || !y) {
        return std::nullopt;
    }
    if (x->kind() == ValueKind::Integer && y->kind() == ValueKind::Integer) {
        int64_t l = x->as_integer();
        int64_t r = y->as_integer();
        return l < r ? -1 : (l > r ? 1 : 0);
    }
    double l = x->as_double();
    double r = y->as_double();
    if (std::isnan(l) || std::isnan(r)) {
        return std::nullopt;
    }
    return l < r ? -1 : (l > r ? 1 : 0);
}

template <typename Pred> auto compare_numeric(const Value& a, const Value& b, Pred pred) -> Value {
    if (const Value* bad = first_invalid({&a, &b})) {
        return *bad;
    }
    auto order = numeric_order(a, b);
    if (!order) {
        return Value::invalid("numeric comparison of '" + a.as_string() + "' and '" +
                              b.as_string() + "'");
    }
    return Value::boolean(pred(*order));
}

template <typename Pred> auto compare_string(const Value& a, const Value& b, Pred pred) -> Value {
    if (const Value* bad = first_invalid({&a, &b})) {
        return *bad;
    }
    int c = a.as_string().compare(b.as_string());
    return Value::boolean(pred(c < 0 ? -1 : (c > 0 ? 1 : 0)));
}

/// Applies a double -> double function to a numeric value.
template <typename F> auto math(const Value& v, F f) -> Value {
    if (v.is_invalid()) {
        return v;
    }
    auto n = v.to_number();
    if (!n) {
        return Value::invalid("non-numeric value '" + v.as_string() + "'");
    }
    return Value::real(f(n->as_double()));
}

auto transform_text(const Value& v, bool upper, bool first_only) -> Value {
    if (v.is_invalid() || v.is_undef()) {
        return v;
    }
    std::string s = v.as_string();
    for (auto& c : s) {
        auto byte = static_cast<unsigned char>(c);
        c = static_cast<char>(upper ? std::toupper(byte) : std::tolower(byte));
        if (first_only) {
            break;
        }
    }
    return Value::text(std::move(s));
}

auto flatten(std::initializer_list<Value> args) -> std::vector<Value> {
    std::vector<Value> out;
    for (const auto& arg : args) {
        if (arg.is_list()) {
            out.insert(out.end(), arg.items().begin(), arg.items().end());
        } else {
            out.push_back(arg);
        }
    }
    return out;
}

auto parse_radix(std::string_view s, int radix) -> Value {
    uint64_t acc = 0;
    for (char c : s) {
        if (c == '_') {
            continue;
        }
        int digit = -1;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        }
        if (digit < 0 || digit >= radix) {
            break;
        }
        acc = acc * static_cast<uint64_t>(radix) + static_cast<uint64_t>(digit);
    }
    return from_bits(acc);
}

} // namespace

// ============================================================================
// Evaluation Context
// ============================================================================

void EvalContext::set_field(const std::string& name, Value value) {
    fields_[name] = std::move(value);
}

auto EvalContext::field(std::string_view name) const -> Value {
    auto it = fields_.find(name);
    return it != fields_.end() ? it->second : Value();
}

auto EvalContext::has_field(std::string_view name) const -> bool {
    return fields_.find(name) != fields_.end();
}

// ============================================================================
// Truth and Function Boundaries
// ============================================================================

auto truthy(const Value& v) -> bool {
    switch (v.kind()) {
    case ValueKind::Undef:
    case ValueKind::Invalid:
        return false;
    case ValueKind::Integer:
        return v.as_integer() != 0;
    case ValueKind::Real:
        return v.as_double() != 0.0;
    case ValueKind::Text: {
        std::string s = v.as_string();
        return !s.empty() && s != "0";
    }
    case ValueKind::List:
        return !v.items().empty();
    }
    return false;
}

auto finish(Value v) -> ValueResult {
    if (v.is_invalid()) {
        return Error{v.reason()};
    }
    return v;
}

auto not_implemented(std::string_view original_text) -> ValueResult {
    return Error{"expression not implemented: " + std::string(original_text)};
}

auto stringify(const Value& v) -> std::string {
    return v.as_string();
}

auto display_or_raw(const Value& result, const Value& raw) -> std::string {
    return result.is_invalid() ? raw.as_string() : result.as_string();
}

// ============================================================================
// Comparison
// ============================================================================

auto num_eq(const Value& a, const Value& b) -> Value {
    return compare_numeric(a, b, [](int o) { return o == 0; });
}
auto num_ne(const Value& a, const Value& b) -> Value {
    return compare_numeric(a, b, [](int o) { return o != 0; });
}
auto num_lt(const Value& a, const Value& b) -> Value {
    return compare_numeric(a, b, [](int o) { return o < 0; });
}
auto num_gt(const Value& a, const Value& b) -> Value {
    return compare_numeric(a, b, [](int o) { return o > 0; });
}
auto num_le(const Value& a, const Value& b) -> Value {
    return compare_numeric(a, b, [](int o) { return o <= 0; });
}
auto num_ge(const Value& a, const Value& b) -> Value {
    return compare_numeric(a, b, [](int o) { return o >= 0; });
}

auto num_cmp(const Value& a, const Value& b) -> Value {
    if (const Value* bad = first_invalid({&a, &b})) {
        return *bad;
    }
    auto order = numeric_order(a, b);
    return order ? Value::integer(*order) : Value();
}

auto str_eq(const Value& a, const Value& b) -> Value {
    return compare_string(a, b, [](int o) { return o == 0; });
}
auto str_ne(const Value& a, const Value& b) -> Value {
    return compare_string(a, b, [](int o) { return o != 0; });
}
auto str_lt(const Value& a, const Value& b) -> Value {
    return compare_string(a, b, [](int o) { return o < 0; });
}
auto str_gt(const Value& a, const Value& b) -> Value {
    return compare_string(a, b, [](int o) { return o > 0; });
}
auto str_le(const Value& a, const Value& b) -> Value {
    return compare_string(a, b, [](int o) { return o <= 0; });
}
auto str_ge(const Value& a, const Value& b) -> Value {
    return compare_string(a, b, [](int o) { return o >= 0; });
}

auto str_cmp(const Value& a, const Value& b) -> Value {
    if (const Value* bad = first_invalid({&a, &b})) {
        return *bad;
    }
    int c = a.as_string().compare(b.as_string());
    return Value::integer(c < 0 ? -1 : (c > 0 ? 1 : 0));
}

// ============================================================================
// Logic
// ============================================================================

auto logical_not(const Value& a) -> Value {
    if (a.is_invalid()) {
        return a;
    }
    return Value::boolean(!truthy(a));
}

auto logical_xor(const Value& a, const Value& b) -> Value {
    if (const Value* bad = first_invalid({&a, &b})) {
        return *bad;
    }
    return Value::boolean(truthy(a) != truthy(b));
}

// ============================================================================
// Bitwise
// ============================================================================

auto bit_and(const Value& a, const Value& b) -> Value {
    return bitwise(a, b, [](uint64_t x, uint64_t y) { return x & y; });
}

auto bit_or(const Value& a, const Value& b) -> Value {
    return bitwise(a, b, [](uint64_t x, uint64_t y) { return x | y; });
}

auto bit_xor(const Value& a, const Value& b) -> Value {
    return bitwise(a, b, [](uint64_t x, uint64_t y) { return x ^ y; });
}

auto bit_not(const Value& a) -> Value {
    uint64_t x = 0;
    if (auto err = bits_of(a, x)) {
        return *err;
    }
    return from_bits(~x);
}

auto shl(const Value& a, const Value& b) -> Value {
    return bitwise(a, b, [](uint64_t x, uint64_t y) { return y >= 64 ? 0 : x << y; });
}

auto shr(const Value& a, const Value& b) -> Value {
    return bitwise(a, b, [](uint64_t x, uint64_t y) { return y >= 64 ? 0 : x >> y; });
}

// ============================================================================
// Strings
// ============================================================================

auto concat(std::initializer_list<Value> parts) -> Value {
    std::string out;
    for (const auto& part : parts) {
        if (part.is_invalid()) {
            return part;
        }
        out += part.as_string();
    }
    return Value::text(std::move(out));
}

auto repeat(const Value& text, const Value& count) -> Value {
    constexpr size_t MAX_REPEAT_BYTES = 16u << 20;
    if (const Value* bad = first_invalid({&text, &count})) {
        return *bad;
    }
    int64_t n = count.as_integer();
    std::string unit = text.as_string();
    if (n <= 0 || unit.empty()) {
        return Value::text("");
    }
    if (static_cast<uint64_t>(n) > MAX_REPEAT_BYTES / unit.size()) {
        return Value::invalid("repetition count " + std::to_string(n) + " too large");
    }
    std::string out;
    out.reserve(unit.size() * static_cast<size_t>(n));
    for (int64_t i = 0; i < n; ++i) {
        out += unit;
    }
    return Value::text(std::move(out));
}

auto length(const Value& v) -> Value {
    if (v.is_undef() || v.is_invalid()) {
        return v;
    }
    return Value::integer(static_cast<int64_t>(v.as_string().size()));
}

auto substr(const Value& s, const Value& offset) -> Value {
    if (const Value* bad = first_invalid({&s, &offset})) {
        return *bad;
    }
    std::string str = s.as_string();
    return substr(s, offset, Value::integer(static_cast<int64_t>(str.size())));
}

auto substr(const Value& s, const Value& offset, const Value& len) -> Value {
    if (const Value* bad = first_invalid({&s, &offset, &len})) {
        return *bad;
    }
    std::string str = s.as_string();
    auto size = static_cast<int64_t>(str.size());
    int64_t start = offset.as_integer();
    if (start < 0) {
        start += size;
    }
    if (start < 0 || start > size) {
        return Value();
    }
    int64_t count = len.as_integer();
    int64_t end = count < 0 ? size + count : start + count;
    end = std::min(end, size);
    if (end <= start) {
        return Value::text("");
    }
    return Value::text(str.substr(static_cast<size_t>(start), static_cast<size_t>(end - start)));
}

auto index(const Value& s, const Value& needle) -> Value {
    return index(s, needle, Value::integer(0));
}

auto index(const Value& s, const Value& needle, const Value& from) -> Value {
    if (const Value* bad = first_invalid({&s, &needle, &from})) {
        return *bad;
    }
    std::string str = s.as_string();
    int64_t start = std::clamp<int64_t>(from.as_integer(), 0, static_cast<int64_t>(str.size()));
    size_t pos = str.find(needle.as_string(), static_cast<size_t>(start));
    return Value::integer(pos == std::string::npos ? -1 : static_cast<int64_t>(pos));
}

auto uc(const Value& v) -> Value {
    return transform_text(v, true, false);
}

auto lc(const Value& v) -> Value {
    return transform_text(v, false, false);
}

auto ucfirst(const Value& v) -> Value {
    return transform_text(v, true, true);
}

auto lcfirst(const Value& v) -> Value {
    return transform_text(v, false, true);
}

auto ord(const Value& v) -> Value {
    if (v.is_invalid()) {
        return v;
    }
    std::string s = v.as_string();
    return Value::integer(s.empty() ? 0 : static_cast<unsigned char>(s[0]));
}

auto chr(const Value& v) -> Value {
    if (v.is_invalid()) {
        return v;
    }
    int64_t code = v.as_integer();
    if (code < 0 || code > 0x10FFFF) {
        code = 0xFFFD;
    }
    std::string out;
    if (code < 0x100) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code >> 18));
        out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
    return Value::text(std::move(out));
}

auto defined(const Value& v) -> Value {
    return Value::boolean(!v.is_undef() && !v.is_invalid());
}

auto join(const Value& separator, std::initializer_list<Value> args) -> Value {
    if (separator.is_invalid()) {
        return separator;
    }
    std::string sep = separator.as_string();
    std::string out;
    bool first = true;
    for (const auto& item : flatten(args)) {
        if (item.is_invalid()) {
            return item;
        }
        if (!first) {
            out += sep;
        }
        out += item.as_string();
        first = false;
    }
    return Value::text(std::move(out));
}

auto element(const Value& subject, int64_t index) -> Value {
    if (subject.is_invalid()) {
        return subject;
    }
    std::vector<Value> items;
    if (subject.is_list()) {
        items = subject.items();
    } else if (!subject.is_undef()) {
        Value parts = split(Value::text(" "), subject);
        items = parts.items();
    }
    auto count = static_cast<int64_t>(items.size());
    if (index < 0) {
        index += count;
    }
    if (index < 0 || index >= count) {
        return Value();
    }
    return items[static_cast<size_t>(index)];
}

// ============================================================================
// Numeric Builtins
// ============================================================================

auto int_part(const Value& v) -> Value {
    if (v.is_invalid()) {
        return v;
    }
    auto n = v.to_number();
    if (!n) {
        return Value::invalid("non-numeric value '" + v.as_string() + "'");
    }
    if (n->kind() == ValueKind::Integer) {
        return *n;
    }
    double t = std::trunc(n->as_double());
    if (std::fabs(t) < 9.2e18) {
        return Value::integer(static_cast<int64_t>(t));
    }
    return Value::real(t);
}

auto abs_value(const Value& v) -> Value {
    if (v.is_invalid()) {
        return v;
    }
    auto n = v.to_number();
    if (!n) {
        return Value::invalid("non-numeric value '" + v.as_string() + "'");
    }
    if (n->kind() == ValueKind::Integer && n->as_integer() != std::numeric_limits<int64_t>::min()) {
        return Value::integer(std::abs(n->as_integer()));
    }
    return Value::real(std::fabs(n->as_double()));
}

auto sqrt(const Value& v) -> Value {
    if (!v.is_invalid() && v.as_double() < 0) {
        return Value::invalid("square root of negative number");
    }
    return math(v, [](double x) { return std::sqrt(x); });
}

auto exp(const Value& v) -> Value {
    return math(v, [](double x) { return std::exp(x); });
}

auto log(const Value& v) -> Value {
    if (!v.is_invalid() && v.as_double() <= 0) {
        return Value::invalid("logarithm of non-positive number");
    }
    return math(v, [](double x) { return std::log(x); });
}

auto sin(const Value& v) -> Value {
    return math(v, [](double x) { return std::sin(x); });
}

auto cos(const Value& v) -> Value {
    return math(v, [](double x) { return std::cos(x); });
}

auto atan2(const Value& y, const Value& x) -> Value {
    if (const Value* bad = first_invalid({&y, &x})) {
        return *bad;
    }
    return Value::real(std::atan2(y.as_double(), x.as_double()));
}

auto hex(const Value& v) -> Value {
    if (v.is_invalid()) {
        return v;
    }
    std::string s = v.as_string();
    std::string_view digits = s;
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
        digits.remove_prefix(2);
    } else if (digits.starts_with("x") || digits.starts_with("X")) {
        digits.remove_prefix(1);
    }
    return parse_radix(digits, 16);
}

auto oct(const Value& v) -> Value {
    if (v.is_invalid()) {
        return v;
    }
    std::string s = v.as_string();
    std::string_view digits = s;
    while (!digits.empty() && std::isspace(static_cast<unsigned char>(digits.front()))) {
        digits.remove_prefix(1);
    }
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
        return parse_radix(digits.substr(2), 16);
    }
    if (digits.starts_with("0b") || digits.starts_with("0B")) {
        return parse_radix(digits.substr(2), 2);
    }
    if (digits.starts_with("0o") || digits.starts_with("0O")) {
        return parse_radix(digits.substr(2), 8);
    }
    return parse_radix(digits, 8);
}

} // namespace exprc::rt
