//! # Normalizer Unit Tests
//!
//! The full pipeline on loaded trees: pass ordering, precedence of mixed
//! expressions, idempotence, run-time order verification and lowering into
//! the closed IR.

#include "ast/normalized.hpp"
#include "normalizer/normalizer.hpp"
#include "normalizer/passes/binary_operators.hpp"
#include "normalizer/passes/conditional_assignment.hpp"
#include "normalizer/passes/element_access.hpp"
#include "normalizer/passes/formatted_print.hpp"
#include "normalizer/passes/function_call.hpp"
#include "normalizer/passes/list_operators.hpp"
#include "normalizer/passes/logical_keywords.hpp"
#include "normalizer/passes/postfix_conditional.hpp"
#include "normalizer/passes/safe_division.hpp"
#include "normalizer/passes/string_operators.hpp"
#include "normalizer/passes/ternary.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace exprc;
using namespace exprc::ast;
using namespace exprc::normalizer;
using namespace exprc::test;

namespace {

/// `length $val ? 1/$val : 0`
auto length_guard_tree() -> json::JsonValue {
    return ppi_doc({ppi_word("length"), ppi_ws(), ppi_sym("$val"), ppi_ws(), ppi_op("?"), ppi_ws(),
                    ppi_num("1"), ppi_op("/"), ppi_sym("$val"), ppi_ws(), ppi_op(":"), ppi_ws(),
                    ppi_num("0")});
}

/// `$$self{Make} eq "Canon"`
auto make_check_tree() -> json::JsonValue {
    auto subscript = ppi_node("Structure::Subscript",
                              {ppi_node("Statement::Expression", {ppi_word("Make")})});
    return ppi_doc({ppi_token("Cast", "$"), ppi_sym("$self"), subscript, ppi_ws(), ppi_op("eq"),
                    ppi_ws(), ppi_dq("Canon")});
}

/// Reports Low tier until it has transformed one node, then High.
class FlippingPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "Flipping";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return flipped_ ? PrecedenceTier::High : PrecedenceTier::Low;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return -1;
    }

    [[nodiscard]] auto transform(Node node) const -> Node override {
        flipped_ = true;
        return node;
    }

private:
    mutable bool flipped_ = false;
};

} // namespace

// ============================================================================
// Pass Ordering
// ============================================================================

TEST(NormalizerTest, StandardPassOrder) {
    auto normalizer = Normalizer::standard();
    std::vector<std::string> expected = {
        "ElementAccess",   "FormattedPrint", "FunctionCall",    "SafeDivision",
        "StringOperators", "BinaryOperators", "Ternary",        "ListOperators",
        "LogicalKeywords", "ConditionalAssignment", "PostfixConditional",
    };
    EXPECT_EQ(normalizer.pass_names(), expected);
    EXPECT_EQ(normalizer.pass_count(), expected.size());
}

TEST(NormalizerTest, RegistrationOrderDoesNotMatter) {
    Normalizer reversed;
    reversed.add_pass(std::make_unique<PostfixConditionalPass>());
    reversed.add_pass(std::make_unique<LogicalKeywordsPass>());
    reversed.add_pass(std::make_unique<ConditionalAssignmentPass>());
    reversed.add_pass(std::make_unique<ListOperatorsPass>());
    reversed.add_pass(std::make_unique<TernaryPass>());
    reversed.add_pass(std::make_unique<BinaryOperatorsPass>());
    reversed.add_pass(std::make_unique<StringOperatorsPass>());
    reversed.add_pass(std::make_unique<SafeDivisionPass>());
    reversed.add_pass(std::make_unique<FunctionCallPass>());
    reversed.add_pass(std::make_unique<FormattedPrintPass>());
    reversed.add_pass(std::make_unique<ElementAccessPass>());

    auto standard = Normalizer::standard();
    EXPECT_EQ(reversed.pass_names(), standard.pass_names());

    Node raw = load(length_guard_tree());
    EXPECT_EQ(reversed.normalize(raw), standard.normalize(raw));
}

TEST(NormalizerTest, OutOfOrderPassIsAnInternalError) {
    auto normalizer = Normalizer::standard();
    normalizer.add_pass(std::make_unique<FlippingPass>());
    ASSERT_EQ(normalizer.pass_names().back(), "Flipping");

    Node raw = load(ppi_doc({ppi_sym("$val"), ppi_op("*"), ppi_num("2")}));
    try {
        (void)normalizer.normalize(raw);
        FAIL() << "expected InternalCompilerError";
    } catch (const InternalCompilerError& e) {
        EXPECT_EQ(e.kind(), InternalErrorKind::PrecedenceInvariantViolation);
        EXPECT_NE(std::string(e.what()).find("Flipping"), std::string::npos);
    }
}

// ============================================================================
// Whole Expressions
// ============================================================================

TEST(NormalizerTest, NamedUnaryInsideConditional) {
    EXPECT_EQ(normalized_sexpr(length_guard_tree()),
              R"((doc (stmt (ternary "?:" (call "length" (args (sym "$val"))) )"
              R"((binop "/" (num "1" "1") (sym "$val")) (num "0" "0")))))");
}

TEST(NormalizerTest, NamedUnaryTakesTheSum) {
    auto tree = ppi_doc({ppi_word("int"), ppi_ws(), ppi_sym("$val"), ppi_ws(), ppi_op("+"),
                         ppi_ws(), ppi_num("0.5")});
    EXPECT_EQ(normalized_sexpr(tree),
              R"((doc (stmt (call "int" (args (binop "+" (sym "$val") (num "0.5" "0.5")))))))");
}

TEST(NormalizerTest, NamedUnaryTakesTheProduct) {
    auto tree = ppi_doc({ppi_word("length"), ppi_ws(), ppi_sym("$val"), ppi_ws(), ppi_op("*"),
                         ppi_ws(), ppi_num("2")});
    EXPECT_EQ(normalized_sexpr(tree),
              R"((doc (stmt (call "length" (args (binop "*" (sym "$val") (num "2" "2")))))))");
}

TEST(NormalizerTest, NamedUnaryBindsTighterThanComparison) {
    auto tree = ppi_doc({ppi_word("length"), ppi_ws(), ppi_sym("$val"), ppi_ws(), ppi_op(">"),
                         ppi_ws(), ppi_num("3")});
    EXPECT_EQ(normalized_sexpr(tree),
              R"((doc (stmt (binop ">" (call "length" (args (sym "$val"))) (num "3" "3")))))");
}

TEST(NormalizerTest, SafeDivisionIdiom) {
    auto tree = ppi_doc({ppi_sym("$val"), ppi_ws(), ppi_op("?"), ppi_ws(), ppi_num("1"),
                         ppi_op("/"), ppi_sym("$val"), ppi_ws(), ppi_op(":"), ppi_ws(),
                         ppi_num("0")});
    EXPECT_EQ(normalized_sexpr(tree), R"((doc (stmt (safediv (num "1" "1") (sym "$val")))))");
}

TEST(NormalizerTest, ConcatenationChain) {
    auto tree = ppi_doc({ppi_dq("a"), ppi_ws(), ppi_op("."), ppi_ws(), ppi_dq("b"), ppi_ws(),
                         ppi_op("."), ppi_ws(), ppi_dq("c")});
    EXPECT_EQ(normalized_sexpr(tree),
              R"((doc (stmt (concat "." (quote "\"a\"" "a") (quote "\"b\"" "b") )"
              R"((quote "\"c\"" "c")))))");
}

TEST(NormalizerTest, ContextFieldComparison) {
    EXPECT_EQ(normalized_sexpr(make_check_tree()),
              R"((doc (stmt (binop "eq" (sym "$$self{Make}") (quote "\"Canon\"" "Canon")))))");
}

TEST(NormalizerTest, ConditionalAssignmentBlock) {
    auto tree = ppi_node(
        "Document",
        {ppi_node("Statement", {ppi_sym("$flag"), ppi_ws(), ppi_op("and"), ppi_ws(),
                                ppi_sym("$val"), ppi_ws(), ppi_op("*="), ppi_ws(), ppi_num("2"),
                                ppi_token("Structure", ";")}),
         ppi_ws(), ppi_node("Statement", {ppi_sym("$val")})});
    EXPECT_EQ(normalized_sexpr(tree), R"((condassign (guarded "*=" (sym "$flag") (sym "$val") )"
                                      R"((num "2" "2")) (stmt (sym "$val"))))");
}

TEST(NormalizerTest, IsIdempotent) {
    auto normalizer = Normalizer::standard();
    for (const auto& tree : {length_guard_tree(), make_check_tree()}) {
        Node once = normalizer.normalize(load(tree));
        Node twice = normalizer.normalize(once);
        EXPECT_EQ(to_sexpr(twice), to_sexpr(once));
    }
}

TEST(NormalizerTest, LayoutDoesNotChangeTheTree) {
    auto spaced = ppi_doc({ppi_sym("$val"), ppi_ws(), ppi_op("*"), ppi_ws(), ppi_num("25")});
    auto tight = ppi_doc({ppi_sym("$val"), ppi_op("*"), ppi_num("25")});
    EXPECT_EQ(normalized_sexpr(spaced), normalized_sexpr(tight));
}

// ============================================================================
// Lowering
// ============================================================================

TEST(LoweringTest, ProductOfValueAndLiteral) {
    auto normalizer = Normalizer::standard();
    auto lowered = normalize_expression(
        normalizer, load(ppi_doc({ppi_sym("$val"), ppi_op("*"), ppi_num("25")})));
    ASSERT_TRUE(is_ok(lowered));

    const NormalizedNode& root = unwrap(lowered);
    ASSERT_TRUE(root.is<BinaryOp>());
    const auto& bin = root.as<BinaryOp>();
    EXPECT_EQ(bin.op, "*");
    ASSERT_TRUE(bin.lhs->is<Symbol>());
    EXPECT_EQ(bin.lhs->as<Symbol>().kind, SymbolKind::Value);
    ASSERT_TRUE(bin.rhs->is<Literal>());
    EXPECT_EQ(bin.rhs->as<Literal>().text, "25");
}

TEST(LoweringTest, ContextFieldName) {
    auto normalizer = Normalizer::standard();
    auto lowered = normalize_expression(normalizer, load(make_check_tree()));
    ASSERT_TRUE(is_ok(lowered));

    const auto& bin = unwrap(lowered).as<BinaryOp>();
    ASSERT_TRUE(bin.lhs->is<Symbol>());
    EXPECT_EQ(bin.lhs->as<Symbol>().kind, SymbolKind::ContextField);
    EXPECT_EQ(bin.lhs->as<Symbol>().name, "Make");
    EXPECT_TRUE(bin.rhs->as<Literal>().interpolate);
}

TEST(LoweringTest, OpaqueTokenIsUnsupported) {
    auto normalizer = Normalizer::standard();
    auto lowered = normalize_expression(
        normalizer, load(ppi_doc({ppi_token("Regexp::Substitute", "s/ +$//")})));
    ASSERT_TRUE(is_err(lowered));
    EXPECT_EQ(unwrap_err(lowered).message.rfind("unsupported token", 0), 0u);
}

TEST(LoweringTest, UnreducedSequenceIsUnsupported) {
    auto normalizer = Normalizer::standard();
    auto lowered = normalize_expression(
        normalizer, load(ppi_doc({ppi_sym("$val"), ppi_sym("$other")})));
    ASSERT_TRUE(is_err(lowered));
    EXPECT_EQ(unwrap_err(lowered).message, "sequence not reduced to a single expression");
    EXPECT_FALSE(unwrap_err(lowered).fragment.empty());
}

TEST(ClassifySymbolTest, Spellings) {
    Symbol symbol;
    ASSERT_TRUE(classify_symbol("$_", symbol));
    EXPECT_EQ(symbol.kind, SymbolKind::Value);

    ASSERT_TRUE(classify_symbol("$$self{Exif}{Make}", symbol));
    EXPECT_EQ(symbol.kind, SymbolKind::ContextField);
    EXPECT_EQ(symbol.name, "Exif.Make");

    ASSERT_TRUE(classify_symbol("$count", symbol));
    EXPECT_EQ(symbol.name, "count");

    EXPECT_FALSE(classify_symbol("@list", symbol));
    EXPECT_FALSE(classify_symbol("$1x", symbol));
}
