//! # Runtime Library Tests
//!
//! Value conversions and arithmetic, the comparison and logic primitives,
//! string builtins, sprintf, pattern matching and binary packing.

#include "exprc_rt/runtime.hpp"

#include <cmath>
#include <cstdint>
#include <gtest/gtest.h>
#include <ostream>

namespace exprc::rt {

// Readable failure output
void PrintTo(const Value& v, std::ostream* os) {
    switch (v.kind()) {
    case ValueKind::Undef:
        *os << "undef";
        break;
    case ValueKind::Invalid:
        *os << "invalid(" << v.reason() << ")";
        break;
    case ValueKind::Text:
        *os << '"' << v.as_string() << '"';
        break;
    default:
        *os << v.as_string();
        break;
    }
}

} // namespace exprc::rt

using namespace exprc::rt;

namespace {

auto texts(std::initializer_list<const char*> items) -> Value {
    std::vector<Value> values;
    for (const char* item : items) {
        values.push_back(Value::text(item));
    }
    return Value::list(std::move(values));
}

auto integers(std::initializer_list<int64_t> items) -> Value {
    std::vector<Value> values;
    for (int64_t item : items) {
        values.push_back(Value::integer(item));
    }
    return Value::list(std::move(values));
}

const Value TRUE_VALUE = Value::integer(1);
const Value FALSE_VALUE = Value::text("");

} // namespace

// ============================================================================
// Conversion
// ============================================================================

TEST(ValueTest, NumericPrefix) {
    EXPECT_EQ(Value::text("42").to_number(), Value::integer(42));
    EXPECT_EQ(Value::text("  -7 apples").to_number(), Value::integer(-7));
    EXPECT_EQ(Value::text("3.5mm").to_number(), Value::real(3.5));
    EXPECT_EQ(Value::text("1e3").to_number(), Value::real(1000.0));
    EXPECT_EQ(Value::text(".5").to_number(), Value::real(0.5));
    EXPECT_FALSE(Value::text("abc").to_number().has_value());
    EXPECT_FALSE(Value().to_number().has_value());
}

TEST(ValueTest, LooksLikeNumber) {
    EXPECT_TRUE(Value::text(" 42 ").looks_like_number());
    EXPECT_TRUE(Value::real(1.5).looks_like_number());
    EXPECT_FALSE(Value::text("3.5mm").looks_like_number());
    EXPECT_FALSE(Value::text("").looks_like_number());
}

TEST(ValueTest, StringSpelling) {
    EXPECT_EQ(Value::integer(-12).as_string(), "-12");
    EXPECT_EQ(Value::real(2.5).as_string(), "2.5");
    EXPECT_EQ(Value::real(0.1 + 0.2).as_string(), "0.3");
    EXPECT_EQ(Value::real(-0.0).as_string(), "0");
    EXPECT_EQ(Value::real(1e21).as_string(), "1e+21");
    EXPECT_EQ(Value().as_string(), "");
    EXPECT_EQ(integers({1, 2, 3}).as_string(), "1 2 3");
}

TEST(ValueTest, Truth) {
    EXPECT_FALSE(truthy(Value()));
    EXPECT_FALSE(truthy(Value::text("")));
    EXPECT_FALSE(truthy(Value::text("0")));
    EXPECT_FALSE(truthy(Value::integer(0)));
    EXPECT_FALSE(truthy(Value::invalid("x")));
    EXPECT_TRUE(truthy(Value::text("0.0")));
    EXPECT_TRUE(truthy(Value::text("00")));
    EXPECT_TRUE(truthy(Value::real(0.5)));
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST(ArithmeticTest, IntegersStayIntegers) {
    EXPECT_EQ(Value::text("4") * Value::integer(25), Value::integer(100));
    EXPECT_EQ(Value::integer(6) / Value::integer(3), Value::integer(2));
    EXPECT_EQ(Value::integer(7) / Value::integer(2), Value::real(3.5));
    EXPECT_EQ(Value::integer(2) - Value::text("5"), Value::integer(-3));
    EXPECT_EQ(power(Value::integer(2), Value::integer(10)), Value::integer(1024));
    EXPECT_EQ(power(Value::integer(2), Value::integer(-1)), Value::real(0.5));
}

TEST(ArithmeticTest, OverflowWidensToReal) {
    Value big = Value::integer(INT64_MAX);
    Value sum = big + Value::integer(1);
    EXPECT_EQ(sum.kind(), ValueKind::Real);
}

TEST(ArithmeticTest, ModulusTakesSignOfRightOperand) {
    EXPECT_EQ(Value::integer(-7) % Value::integer(3), Value::integer(2));
    EXPECT_EQ(Value::integer(7) % Value::integer(-3), Value::integer(-2));
    EXPECT_EQ(Value::integer(7) % Value::integer(3), Value::integer(1));
}

TEST(ArithmeticTest, InvalidOperands) {
    Value bad = Value::text("abc") * Value::integer(2);
    ASSERT_TRUE(bad.is_invalid());
    EXPECT_EQ(bad.reason(), "non-numeric value 'abc'");

    EXPECT_EQ((Value() + Value::integer(1)).reason(), "undefined value used as a number");
    EXPECT_EQ((Value::integer(1) / Value::integer(0)).reason(), "division by zero");
    EXPECT_EQ((Value::integer(1) % Value::integer(0)).reason(), "modulus by zero");

    // The first invalid operand wins and propagates
    EXPECT_EQ((bad + Value::integer(1)).reason(), "non-numeric value 'abc'");
    EXPECT_TRUE((-bad).is_invalid());
}

TEST(ArithmeticTest, FinishTurnsInvalidIntoError) {
    auto ok = finish(Value::integer(3));
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(std::get<Value>(ok), Value::integer(3));

    auto failed = finish(Value::invalid("division by zero"));
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(std::get<Error>(failed).message, "division by zero");

    auto missing = not_implemented("$val =~ s/a/b/");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(std::get<Error>(missing).message, "expression not implemented: $val =~ s/a/b/");
}

// ============================================================================
// Comparison and Logic
// ============================================================================

TEST(ComparisonTest, Numeric) {
    EXPECT_EQ(num_eq(Value::text("10"), Value::real(10.0)), TRUE_VALUE);
    EXPECT_EQ(num_lt(Value::integer(2), Value::text("10")), TRUE_VALUE);
    EXPECT_EQ(num_ge(Value::integer(2), Value::integer(3)), FALSE_VALUE);
    EXPECT_EQ(num_cmp(Value::integer(3), Value::integer(2)), Value::integer(1));
    EXPECT_TRUE(num_eq(Value::text("Canon"), Value::integer(1)).is_invalid());
    EXPECT_TRUE(num_cmp(Value::text("Canon"), Value::integer(1)).is_undef());
}

TEST(ComparisonTest, String) {
    EXPECT_EQ(str_eq(Value::text("Canon"), Value::text("Canon")), TRUE_VALUE);
    EXPECT_EQ(str_eq(Value::integer(10), Value::text("10.0")), FALSE_VALUE);
    EXPECT_EQ(str_lt(Value::text("abc"), Value::text("abd")), TRUE_VALUE);
    EXPECT_EQ(str_cmp(Value::text("b"), Value::text("a")), Value::integer(1));
}

TEST(LogicTest, ShortCircuit) {
    int evaluated = 0;
    auto rhs = [&] {
        ++evaluated;
        return Value::text("rhs");
    };

    EXPECT_EQ(logical_and(Value::text(""), rhs), Value::text(""));
    EXPECT_EQ(logical_or(Value::integer(5), rhs), Value::integer(5));
    EXPECT_EQ(defined_or(Value::integer(0), rhs), Value::integer(0));
    EXPECT_EQ(evaluated, 0);

    EXPECT_EQ(logical_and(Value::integer(1), rhs), Value::text("rhs"));
    EXPECT_EQ(logical_or(Value::text("0"), rhs), Value::text("rhs"));
    EXPECT_EQ(defined_or(Value(), rhs), Value::text("rhs"));
    EXPECT_EQ(evaluated, 3);
}

TEST(LogicTest, ChooseEvaluatesOneBranch) {
    int evaluated = 0;
    auto one = [&] {
        ++evaluated;
        return Value::integer(1);
    };
    auto two = [&] {
        ++evaluated;
        return Value::integer(2);
    };
    EXPECT_EQ(choose(Value::text("yes"), one, two), Value::integer(1));
    EXPECT_EQ(choose(Value::integer(0), one, two), Value::integer(2));
    EXPECT_EQ(evaluated, 2);

    EXPECT_TRUE(choose(Value::invalid("bad"), one, two).is_invalid());
    EXPECT_EQ(evaluated, 2);
}

TEST(LogicTest, NotAndXor) {
    EXPECT_EQ(logical_not(Value::integer(0)), TRUE_VALUE);
    EXPECT_EQ(logical_not(Value::text("x")), FALSE_VALUE);
    EXPECT_EQ(logical_xor(Value::integer(1), Value::integer(0)), TRUE_VALUE);
    EXPECT_EQ(logical_xor(Value::integer(1), Value::integer(2)), FALSE_VALUE);
}

TEST(BitwiseTest, Operators) {
    EXPECT_EQ(bit_and(Value::integer(0xF0), Value::integer(0x3C)), Value::integer(0x30));
    EXPECT_EQ(bit_or(Value::integer(0x01), Value::text("6")), Value::integer(0x07));
    EXPECT_EQ(bit_xor(Value::integer(0xFF), Value::integer(0x0F)), Value::integer(0xF0));
    EXPECT_EQ(shl(Value::integer(1), Value::integer(4)), Value::integer(16));
    EXPECT_EQ(shr(Value::integer(0x100), Value::integer(8)), Value::integer(1));
    EXPECT_TRUE(bit_and(Value::text("x"), Value::integer(1)).is_invalid());
}

// ============================================================================
// Strings
// ============================================================================

TEST(StringTest, ConcatAndRepeat) {
    EXPECT_EQ(concat({Value::text("a"), Value::integer(1), Value::real(2.5)}),
              Value::text("a12.5"));
    EXPECT_TRUE(concat({Value::text("a"), Value::invalid("x")}).is_invalid());
    EXPECT_EQ(repeat(Value::text("ab"), Value::integer(3)), Value::text("ababab"));
    EXPECT_EQ(repeat(Value::text("-"), Value::integer(0)), Value::text(""));
    EXPECT_TRUE(repeat(Value::text("x"), Value::integer(int64_t{1} << 40)).is_invalid());
}

TEST(StringTest, Substr) {
    EXPECT_EQ(substr(Value::text("Canon EOS"), Value::integer(6)), Value::text("EOS"));
    EXPECT_EQ(substr(Value::text("abcdef"), Value::integer(-3), Value::integer(2)),
              Value::text("de"));
    EXPECT_EQ(substr(Value::text("abcdef"), Value::integer(1), Value::integer(-2)),
              Value::text("bcd"));
    EXPECT_TRUE(substr(Value::text("abc"), Value::integer(5)).is_undef());
}

TEST(StringTest, SearchAndCase) {
    EXPECT_EQ(index(Value::text("hello"), Value::text("l")), Value::integer(2));
    EXPECT_EQ(index(Value::text("hello"), Value::text("l"), Value::integer(3)), Value::integer(3));
    EXPECT_EQ(index(Value::text("hello"), Value::text("z")), Value::integer(-1));
    EXPECT_EQ(length(Value::text("hello")), Value::integer(5));
    EXPECT_TRUE(length(Value()).is_undef());
    EXPECT_EQ(uc(Value::text("abc")), Value::text("ABC"));
    EXPECT_EQ(lc(Value::text("ABC")), Value::text("abc"));
    EXPECT_EQ(ucfirst(Value::text("abc")), Value::text("Abc"));
    EXPECT_EQ(lcfirst(Value::text("ABC")), Value::text("aBC"));
}

TEST(StringTest, Characters) {
    EXPECT_EQ(ord(Value::text("A")), Value::integer(65));
    EXPECT_EQ(ord(Value::text("")), Value::integer(0));
    EXPECT_EQ(chr(Value::integer(65)), Value::text("A"));
    EXPECT_EQ(chr(Value::integer(0x263A)), Value::text("\xE2\x98\xBA"));
    EXPECT_EQ(defined(Value()), FALSE_VALUE);
    EXPECT_EQ(defined(Value::text("")), TRUE_VALUE);
}

TEST(StringTest, JoinFlattensLists) {
    EXPECT_EQ(join(Value::text(","), {texts({"a", "b"}), Value::text("c")}),
              Value::text("a,b,c"));
    EXPECT_EQ(join(Value::text(" "), {}), Value::text(""));
}

TEST(StringTest, Split) {
    EXPECT_EQ(split(Value::text(" "), Value::text("  a b  c ")), texts({"a", "b", "c"}));
    EXPECT_EQ(split(Value::text(","), Value::text("a,b,,c,,")), texts({"a", "b", "", "c"}));
    EXPECT_EQ(split(Value::text(","), Value::text("a,b,c"), Value::integer(2)),
              texts({"a", "b,c"}));
    EXPECT_EQ(split(Value::text(""), Value::text("abc")), texts({"a", "b", "c"}));
    EXPECT_EQ(split(Value::text("\\s*x\\s*"), Value::text("4 x 3")), texts({"4", "3"}));
    EXPECT_EQ(split(Value::text(","), Value::text("")), Value::list({}));
    EXPECT_TRUE(split(Value::text("("), Value::text("abc")).is_invalid());
}

TEST(StringTest, Element) {
    Value words = Value::text("10 20 30");
    EXPECT_EQ(element(words, 1), Value::text("20"));
    EXPECT_EQ(element(words, -1), Value::text("30"));
    EXPECT_TRUE(element(words, 5).is_undef());
    EXPECT_EQ(element(integers({4, 5}), 0), Value::integer(4));
}

// ============================================================================
// sprintf
// ============================================================================

TEST(SprintfTest, Conversions) {
    auto fmt = [](const char* format, std::initializer_list<Value> args) {
        return sprintf(Value::text(format), args).as_string();
    };
    EXPECT_EQ(fmt("%.2f", {Value::real(3.14159)}), "3.14");
    EXPECT_EQ(fmt("%d mm", {Value::text("50.7")}), "50 mm");
    EXPECT_EQ(fmt("%5s|%-5s|", {Value::text("ab"), Value::text("cd")}), "   ab|cd   |");
    EXPECT_EQ(fmt("%x %04X", {Value::integer(255), Value::integer(255)}), "ff 00FF");
    EXPECT_EQ(fmt("%o", {Value::integer(8)}), "10");
    EXPECT_EQ(fmt("%b %08b", {Value::integer(5), Value::integer(5)}), "101 00000101");
    EXPECT_EQ(fmt("%c", {Value::integer(65)}), "A");
    EXPECT_EQ(fmt("100%%", {}), "100%");
    EXPECT_EQ(fmt("%.3s", {Value::text("abcdef")}), "abc");
    EXPECT_EQ(fmt("%*d", {Value::integer(4), Value::integer(7)}), "   7");
}

TEST(SprintfTest, Arguments) {
    EXPECT_EQ(sprintf(Value::text("%d.%d"), {integers({1, 2})}), Value::text("1.2"));
    EXPECT_EQ(sprintf(Value::text("[%s]"), {}), Value::text("[]"));
    EXPECT_EQ(sprintf(Value::text("%ld"), {Value::integer(9)}), Value::text("9"));
    EXPECT_EQ(sprintf(Value::text("%y"), {Value::integer(9)}), Value::text("%y"));
    EXPECT_TRUE(sprintf(Value::text("%d"), {Value::invalid("x")}).is_invalid());
}

// ============================================================================
// Pattern Matching
// ============================================================================

TEST(MatchTest, Modifiers) {
    Value model = Value::text("Canon EOS 5D");
    EXPECT_EQ(matches(model, "^Canon", ""), TRUE_VALUE);
    EXPECT_EQ(matches(model, "^canon", ""), FALSE_VALUE);
    EXPECT_EQ(matches(model, "^canon", "i"), TRUE_VALUE);
    EXPECT_EQ(matches(model, "^ C a n o n # brand\n", "x"), TRUE_VALUE);
    EXPECT_EQ(matches(model, "\\A5D", ""), FALSE_VALUE);
    EXPECT_EQ(matches(model, "5D\\z", ""), TRUE_VALUE);
}

TEST(MatchTest, InvalidPattern) {
    Value result = matches(Value::text("abc"), "(", "");
    ASSERT_TRUE(result.is_invalid());
    EXPECT_EQ(result.reason(), "invalid pattern '('");
}

// ============================================================================
// Numeric Builtins
// ============================================================================

TEST(NumericBuiltinTest, IntAndAbs) {
    EXPECT_EQ(int_part(Value::real(-3.7)), Value::integer(-3));
    EXPECT_EQ(int_part(Value::text("42.9mm")), Value::integer(42));
    EXPECT_EQ(abs_value(Value::integer(-5)), Value::integer(5));
    EXPECT_EQ(abs_value(Value::real(-2.5)), Value::real(2.5));
    EXPECT_TRUE(int_part(Value::text("abc")).is_invalid());
}

TEST(NumericBuiltinTest, Math) {
    EXPECT_EQ(sqrt(Value::integer(16)), Value::real(4.0));
    EXPECT_EQ(exp(Value::integer(0)), Value::real(1.0));
    EXPECT_EQ(log(Value::integer(1)), Value::real(0.0));
    EXPECT_EQ(sqrt(Value::integer(-1)).reason(), "square root of negative number");
    EXPECT_EQ(log(Value::integer(0)).reason(), "logarithm of non-positive number");
    EXPECT_DOUBLE_EQ(atan2(Value::integer(1), Value::integer(1)).as_double(), std::atan2(1.0, 1.0));
}

TEST(NumericBuiltinTest, Radix) {
    EXPECT_EQ(hex(Value::text("0x1F")), Value::integer(31));
    EXPECT_EQ(hex(Value::text("ff")), Value::integer(255));
    EXPECT_EQ(oct(Value::text("755")), Value::integer(493));
    EXPECT_EQ(oct(Value::text("0x1F")), Value::integer(31));
    EXPECT_EQ(oct(Value::text("0b101")), Value::integer(5));
}

// ============================================================================
// Binary Packing
// ============================================================================

TEST(PackTest, Pack) {
    EXPECT_EQ(pack(Value::text("n"), {Value::integer(258)}).as_string(), std::string("\x01\x02"));
    EXPECT_EQ(pack(Value::text("v"), {Value::integer(258)}).as_string(), std::string("\x02\x01"));
    EXPECT_EQ(pack(Value::text("A4"), {Value::text("ab")}).as_string(), "ab  ");
    EXPECT_EQ(pack(Value::text("a3"), {Value::text("ab")}).as_string(), std::string("ab\0", 3));
    EXPECT_EQ(pack(Value::text("H4"), {Value::text("1f2e")}).as_string(), "\x1f\x2e");
    EXPECT_EQ(pack(Value::text("C*"), {integers({1, 2, 3})}).as_string(), "\x01\x02\x03");
}

TEST(PackTest, Unpack) {
    EXPECT_EQ(unpack(Value::text("n"), Value::text("\x01\x02")), integers({258}));
    EXPECT_EQ(unpack(Value::text("N"), Value::text(std::string("\0\0\x01\0", 4))),
              integers({256}));
    EXPECT_EQ(unpack(Value::text("C*"), Value::text("\x01\xff")), integers({1, 255}));
    EXPECT_EQ(unpack(Value::text("c"), Value::text("\xff")), integers({-1}));
    EXPECT_EQ(unpack(Value::text("x C"), Value::text("\x01\x02")), integers({2}));
    EXPECT_EQ(unpack(Value::text("A4"), Value::text("ab  ")), texts({"ab"}));
    EXPECT_EQ(unpack(Value::text("H*"), Value::text("\x1f\x2e")), texts({"1f2e"}));
}

TEST(PackTest, UnknownTemplateLetter) {
    EXPECT_EQ(pack(Value::text("Z"), {Value::integer(1)}).reason(),
              "unsupported pack template letter 'Z'");
    EXPECT_EQ(unpack(Value::text("Q"), Value::text("abc")).reason(),
              "unsupported unpack template letter 'Q'");
}

// ============================================================================
// Context and Display
// ============================================================================

TEST(EvalContextTest, Fields) {
    EvalContext ctx;
    ctx.set_field("Make", Value::text("Canon"));
    EXPECT_TRUE(ctx.has_field("Make"));
    EXPECT_EQ(ctx.field("Make"), Value::text("Canon"));
    EXPECT_FALSE(ctx.has_field("Model"));
    EXPECT_TRUE(ctx.field("Model").is_undef());
}

TEST(DisplayTest, RawFallback) {
    EXPECT_EQ(display_or_raw(Value::real(0.5), Value::integer(2)), "0.5");
    EXPECT_EQ(display_or_raw(Value::invalid("bad"), Value::text("raw")), "raw");
    EXPECT_EQ(stringify(Value::integer(7)), "7");
}
