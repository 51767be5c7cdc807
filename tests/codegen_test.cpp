//! # C++ Code Generator Tests
//!
//! Signatures per context, generated bodies for representative shapes,
//! fallback stand-ins and unsupported constructs.

#include "codegen/cpp_gen.hpp"
#include "normalizer/normalizer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace exprc;
using namespace exprc::ast;
using namespace exprc::codegen;
using namespace exprc::test;

namespace {

auto lower_tree(const json::JsonValue& tree) -> NormalizedNode {
    static const normalizer::Normalizer pipeline = normalizer::Normalizer::standard();
    auto lowered = normalizer::normalize_expression(pipeline, load(tree));
    EXPECT_TRUE(is_ok(lowered)) << (is_err(lowered) ? unwrap_err(lowered).message : "");
    if (is_err(lowered)) {
        return NormalizedNode{};
    }
    return std::move(unwrap(lowered));
}

auto generate(const json::JsonValue& tree, ExpressionContext context) -> std::string {
    CppCodeGen gen;
    auto code = gen.generate(lower_tree(tree), context, "f");
    EXPECT_TRUE(is_ok(code)) << (is_err(code) ? unwrap_err(code).message : "");
    return is_ok(code) ? unwrap(code) : std::string{};
}

auto unsupported_reason(const json::JsonValue& tree, ExpressionContext context) -> std::string {
    CppCodeGen gen;
    auto code = gen.generate(lower_tree(tree), context, "f");
    EXPECT_TRUE(is_err(code));
    return is_err(code) ? unwrap_err(code).message : std::string{};
}

} // namespace

// ============================================================================
// Signatures
// ============================================================================

TEST(CppCodeGenTest, SignaturePerContext) {
    CppCodeGen gen;
    EXPECT_EQ(gen.signature(ExpressionContext::ValueTransform, "value_conv_1"),
              "auto value_conv_1([[maybe_unused]] rt::Value val) -> rt::ValueResult");
    EXPECT_EQ(gen.signature(ExpressionContext::DisplayFormat, "print_conv_1"),
              "auto print_conv_1([[maybe_unused]] rt::Value val) -> std::string");
    EXPECT_EQ(gen.signature(ExpressionContext::BooleanGate, "condition_1"),
              "auto condition_1([[maybe_unused]] rt::Value val, [[maybe_unused]] const "
              "rt::EvalContext& ctx) -> bool");
}

TEST(CppCodeGenTest, RuntimeNamespaceOption) {
    CppGenOptions options;
    options.runtime_namespace = "exprc::rt";
    options.indent = 2;
    CppCodeGen gen(options);

    EXPECT_EQ(gen.signature(ExpressionContext::ValueTransform, "f"),
              "auto f([[maybe_unused]] exprc::rt::Value val) -> exprc::rt::ValueResult");

    auto code = gen.generate(lower_tree(ppi_doc({ppi_sym("$val")})),
                             ExpressionContext::ValueTransform, "f");
    ASSERT_TRUE(is_ok(code));
    EXPECT_NE(unwrap(code).find("\n  return exprc::rt::finish(val);\n"), std::string::npos);
}

// ============================================================================
// Generated Bodies
// ============================================================================

TEST(CppCodeGenTest, ValueTransformProduct) {
    auto code = generate(ppi_doc({ppi_sym("$val"), ppi_op("*"), ppi_num("25")}),
                         ExpressionContext::ValueTransform);
    EXPECT_EQ(code, "auto f([[maybe_unused]] rt::Value val) -> rt::ValueResult {\n"
                    "    return rt::finish((val * rt::Value::integer(25)));\n"
                    "}\n");
}

TEST(CppCodeGenTest, DisplayFormatConcatenation) {
    auto code = generate(ppi_doc({ppi_dq("a"), ppi_op("."), ppi_sq("b")}),
                         ExpressionContext::DisplayFormat);
    EXPECT_NE(code.find("return rt::display_or_raw(rt::concat({rt::Value::text(\"a\"), "
                        "rt::Value::text(\"b\")}), val);"),
              std::string::npos);
}

TEST(CppCodeGenTest, BooleanGateReadsContextField) {
    auto code = generate(ppi_doc({ppi_sym("$count"), ppi_op("=="), ppi_num("582")}),
                         ExpressionContext::BooleanGate);
    EXPECT_NE(code.find("return rt::truthy(rt::num_eq(ctx.field(\"count\"), "
                        "rt::Value::integer(582)));"),
              std::string::npos);
}

TEST(CppCodeGenTest, RegexMatch) {
    auto code = generate(ppi_doc({ppi_sym("$val"), ppi_op("=~"),
                                  ppi_token("Regexp::Match", "/^EOS/i")}),
                         ExpressionContext::BooleanGate);
    EXPECT_NE(code.find("return rt::truthy(rt::matches(val, \"^EOS\", \"i\"));"),
              std::string::npos);
}

TEST(CppCodeGenTest, InterpolatedString) {
    auto code = generate(ppi_doc({ppi_dq("$val mm")}), ExpressionContext::DisplayFormat);
    EXPECT_NE(code.find("rt::concat({val, rt::Value::text(\" mm\")})"), std::string::npos);
}

TEST(CppCodeGenTest, RealLiteral) {
    auto code = generate(ppi_doc({ppi_sym("$val"), ppi_op("/"), ppi_num("2.5")}),
                         ExpressionContext::ValueTransform);
    EXPECT_NE(code.find("(val / rt::Value::real(2.5))"), std::string::npos);
}

TEST(CppCodeGenTest, SprintfWithConstantFormat) {
    auto tree = ppi_doc({ppi_word("sprintf"),
                         ppi_list({ppi_dq("%.1f"), ppi_op(","), ppi_sym("$val")})});
    auto code = generate(tree, ExpressionContext::DisplayFormat);
    EXPECT_NE(code.find("rt::sprintf(rt::Value::text(\"%.1f\"), {val})"), std::string::npos);
}

TEST(CppCodeGenTest, TopLevelSafeDivisionBecomesStatements) {
    auto tree = ppi_doc({ppi_sym("$val"), ppi_op("?"), ppi_num("1"), ppi_op("/"), ppi_sym("$val"),
                         ppi_op(":"), ppi_num("0")});
    auto code = generate(tree, ExpressionContext::ValueTransform);
    EXPECT_EQ(code, "auto f([[maybe_unused]] rt::Value val) -> rt::ValueResult {\n"
                    "    const rt::Value divisor_1 = val;\n"
                    "    if (divisor_1.is_invalid()) {\n"
                    "        return rt::finish(divisor_1);\n"
                    "    }\n"
                    "    if (rt::truthy(divisor_1)) {\n"
                    "        return rt::finish(rt::Value::integer(1) / divisor_1);\n"
                    "    } else {\n"
                    "        return rt::finish(rt::Value::integer(0));\n"
                    "    }\n"
                    "}\n");
}

TEST(CppCodeGenTest, TopLevelTernaryInDisplayFormat) {
    auto tree = ppi_doc({ppi_sym("$val"), ppi_op("?"), ppi_dq("On"), ppi_op(":"), ppi_dq("Off")});
    auto code = generate(tree, ExpressionContext::DisplayFormat);
    EXPECT_NE(code.find("const rt::Value condition_1 = val;"), std::string::npos);
    EXPECT_NE(code.find("        return rt::stringify(val);\n"), std::string::npos);
    EXPECT_NE(code.find("return rt::display_or_raw(rt::Value::text(\"On\"), val);"),
              std::string::npos);
    EXPECT_NE(code.find("return rt::display_or_raw(rt::Value::text(\"Off\"), val);"),
              std::string::npos);
}

TEST(CppCodeGenTest, NestedTernaryUsesChoose) {
    auto tree = ppi_doc({ppi_sym("$val"), ppi_op("+"), ppi_list({ppi_sym("$val"), ppi_op("?"),
                                                                 ppi_num("1"), ppi_op(":"),
                                                                 ppi_num("2")})});
    auto code = generate(tree, ExpressionContext::ValueTransform);
    EXPECT_NE(code.find("rt::choose(val, [&] { return rt::Value::integer(1); }, "
                        "[&] { return rt::Value::integer(2); })"),
              std::string::npos);
}

TEST(CppCodeGenTest, NegativeLiteralIsFolded) {
    auto code = generate(ppi_doc({ppi_sym("$val"), ppi_op("*"), ppi_op("-"), ppi_num("1")}),
                         ExpressionContext::ValueTransform);
    EXPECT_NE(code.find("(val * rt::Value::integer(-1))"), std::string::npos);
}

// ============================================================================
// Unsupported Constructs
// ============================================================================

TEST(CppCodeGenTest, UnknownFunction) {
    auto tree = ppi_doc({ppi_word("foo"), ppi_list({ppi_sym("$val")})});
    EXPECT_EQ(unsupported_reason(tree, ExpressionContext::ValueTransform), "function 'foo'");
}

TEST(CppCodeGenTest, ContextFieldOutsideCondition) {
    auto tree = ppi_doc({ppi_sym("$count"), ppi_op("+"), ppi_num("1")});
    EXPECT_EQ(unsupported_reason(tree, ExpressionContext::ValueTransform),
              "context field '$count' outside a condition");
}

TEST(CppCodeGenTest, WrongArgumentCount) {
    auto tree = ppi_doc({ppi_word("substr"), ppi_list({ppi_sym("$val")})});
    EXPECT_EQ(unsupported_reason(tree, ExpressionContext::DisplayFormat),
              "function 'substr' with 1 arguments");
}

// ============================================================================
// Fallbacks and Literals
// ============================================================================

TEST(CppCodeGenTest, FallbackBodies) {
    CppCodeGen gen;
    EXPECT_EQ(gen.fallback(ExpressionContext::ValueTransform, "value_conv_1", "$val =~ s/a/b/"),
              "auto value_conv_1([[maybe_unused]] rt::Value val) -> rt::ValueResult {\n"
              "    return rt::not_implemented(\"$val =~ s/a/b/\");\n"
              "}\n");
    EXPECT_NE(gen.fallback(ExpressionContext::DisplayFormat, "print_conv_1", "x")
                  .find("    return rt::stringify(val);\n"),
              std::string::npos);
    EXPECT_NE(gen.fallback(ExpressionContext::BooleanGate, "condition_1", "x")
                  .find("    return false;\n"),
              std::string::npos);
}

TEST(CppStringLiteralTest, Escapes) {
    EXPECT_EQ(cpp_string_literal("plain"), "\"plain\"");
    EXPECT_EQ(cpp_string_literal("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(cpp_string_literal("line\nnext\ttab"), "\"line\\nnext\\ttab\"");
    EXPECT_EQ(cpp_string_literal(std::string("\x01\xC3", 2)), "\"\\001\\303\"");
}
