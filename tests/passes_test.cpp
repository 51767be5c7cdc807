//! # Normalizer Pass Tests
//!
//! Each pass in isolation, on hand-built trees whose children are already
//! normalized the way the orchestrator would leave them.

#include "ast/node.hpp"
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

#include <gtest/gtest.h>

using namespace exprc::ast;
using namespace exprc::normalizer;

namespace {

auto cast(std::string sigil) -> Node {
    return Node::leaf(NodeKind::Cast, std::move(sigil));
}

auto hash_subscript(std::string key) -> Node {
    return Node::leaf(NodeKind::StructureSubscript, "{}", std::move(key));
}

auto array_subscript(std::string index) -> Node {
    return Node::leaf(NodeKind::StructureSubscript, "[]", std::move(index));
}

auto semicolon() -> Node {
    return Node::leaf(NodeKind::Punctuation, ";");
}

auto args(std::string bounds, std::vector<Node> items) -> Node {
    return Node::branch(NodeKind::ArgList, std::move(bounds), std::move(items));
}

} // namespace

// ============================================================================
// High Tier
// ============================================================================

TEST(ElementAccessPassTest, FoldsCastSymbolSubscript) {
    ElementAccessPass pass;
    Node result = pass.transform(statement({cast("$"), sym("$self"), hash_subscript("Make")}));
    EXPECT_EQ(result, statement({sym("$$self{Make}")}));
}

TEST(ElementAccessPassTest, FoldsArrowSubscript) {
    ElementAccessPass pass;
    Node result = pass.transform(statement({sym("$self"), op("->"), hash_subscript("Model")}));
    EXPECT_EQ(result, statement({sym("$$self{Model}")}));
}

TEST(ElementAccessPassTest, FoldsNestedSubscripts) {
    ElementAccessPass pass;
    Node result = pass.transform(
        statement({cast("$"), sym("$self"), hash_subscript("A"), hash_subscript("B")}));
    EXPECT_EQ(result, statement({sym("$$self{A}{B}")}));
}

TEST(ElementAccessPassTest, ArrayIndexBecomesElementAccess) {
    ElementAccessPass pass;
    Node result = pass.transform(statement({sym("$val"), array_subscript("2"), op("+"), num("1")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (elem "2" (sym "$val")) (op "+") (num "1" "1")))");
}

TEST(FunctionCallPassTest, ParenthesizedCall) {
    FunctionCallPass pass;
    Node result = pass.transform(statement({word("int"), args("()", {sym("$val")})}));
    EXPECT_EQ(to_sexpr(result), R"x((stmt (call "int" (args "()" (sym "$val")))))x");
}

TEST(FunctionCallPassTest, NamedUnaryTakesOneTerm) {
    FunctionCallPass pass;
    Node result = pass.transform(statement({word("length"), sym("$val"), op("?"), num("1")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (call "length" (args (sym "$val"))) (op "?") (num "1" "1")))");
}

TEST(FunctionCallPassTest, NamedUnaryBeforeLooserOperator) {
    FunctionCallPass pass;
    Node result = pass.transform(statement({word("length"), sym("$val"), op(">"), num("3")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (call "length" (args (sym "$val"))) (op ">") (num "3" "3")))");
}

TEST(FunctionCallPassTest, NamedUnaryBeforeTighterOperatorIsLeft) {
    FunctionCallPass pass;
    Node sum = statement({word("int"), sym("$val"), op("+"), num("0.5")});
    EXPECT_EQ(pass.transform(sum), sum);

    Node product = statement({word("length"), sym("$val"), op("*"), num("2")});
    EXPECT_EQ(pass.transform(product), product);
}

TEST(FunctionCallPassTest, LeavesMethodsAndSprintfAlone) {
    FunctionCallPass pass;
    Node method = statement({sym("$self"), op("->"), word("Options"), args("()", {})});
    EXPECT_EQ(pass.transform(method), method);

    Node sprintf_call = statement({word("sprintf"), args("()", {dquote("%d"), sym("$val")})});
    EXPECT_EQ(pass.transform(sprintf_call), sprintf_call);
}

TEST(FunctionCallPassTest, MethodAfterOtherTokens) {
    FunctionCallPass pass;
    Node method = statement({num("1"), op("+"), sym("$self"), op("->"), word("Options"),
                             args("()", {dquote("Unknown")})});
    EXPECT_EQ(pass.transform(method), method);

    Node call_after_method = statement({sym("$self"), op("->"), word("Options"), args("()", {}),
                                        op("+"), word("int"), args("()", {sym("$val")})});
    EXPECT_EQ(to_sexpr(pass.transform(call_after_method)),
              R"x((stmt (sym "$self") (op "->") (word "Options") (args "()") (op "+") )x"
              R"x((call "int" (args "()" (sym "$val")))))x");
}

TEST(FormattedPrintPassTest, SprintfWithArguments) {
    FormattedPrintPass pass;
    Node result = pass.transform(
        statement({word("sprintf"), args("()", {dquote("%.2f"), sym("$val")})}));
    EXPECT_EQ(to_sexpr(result),
              R"x((stmt (sprintf "sprintf" (args "()" (quote "\"%.2f\"" "%.2f") (sym "$val")))))x");
}

TEST(SafeDivisionPassTest, RecognizesIdiom) {
    SafeDivisionPass pass;
    Node result = pass.transform(statement(
        {sym("$val"), op("?"), num("1"), op("/"), sym("$val"), op(":"), num("0")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (safediv (num "1" "1") (sym "$val"))))");
}

TEST(SafeDivisionPassTest, RequiresMatchingGuard) {
    SafeDivisionPass pass;
    Node other_guard = statement(
        {sym("$x"), op("?"), num("1"), op("/"), sym("$val"), op(":"), num("0")});
    EXPECT_EQ(pass.transform(other_guard), other_guard);

    Node nonzero_fallback = statement(
        {sym("$val"), op("?"), num("1"), op("/"), sym("$val"), op(":"), num("1")});
    EXPECT_EQ(pass.transform(nonzero_fallback), nonzero_fallback);
}

TEST(SafeDivisionPassTest, GuardClaimedByOperatorOnTheLeft) {
    SafeDivisionPass pass;
    Node claimed = statement({num("2"), op("*"), sym("$val"), op("?"), num("1"), op("/"),
                              sym("$val"), op(":"), num("0")});
    EXPECT_EQ(pass.transform(claimed), claimed);
}

TEST(StringOperatorsPassTest, ConcatenationIsNary) {
    StringOperatorsPass pass;
    Node result = pass.transform(
        statement({dquote("a"), op("."), dquote("b"), op("."), dquote("c")}));
    ASSERT_EQ(result.children.size(), 1u);
    const Node& concat = result.children[0];
    EXPECT_EQ(concat.kind, NodeKind::StringConcat);
    EXPECT_EQ(concat.children.size(), 3u);
}

TEST(StringOperatorsPassTest, TighterOperatorKeepsOperand) {
    StringOperatorsPass pass;
    Node claimed = statement({sym("$a"), op("*"), sym("$b"), op("."), sym("$c")});
    EXPECT_EQ(pass.transform(claimed), claimed);
}

TEST(StringOperatorsPassTest, Repetition) {
    StringOperatorsPass pass;
    Node result = pass.transform(statement({dquote("-"), op("x"), num("3")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (repeat "x" (quote "\"-\"" "-") (num "3" "3"))))");
}

// ============================================================================
// Medium Tier
// ============================================================================

TEST(BinaryOperatorsPassTest, SimpleProduct) {
    BinaryOperatorsPass pass;
    Node result = pass.transform(statement({sym("$val"), op("*"), num("25")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (binop "*" (sym "$val") (num "25" "25"))))");
}

TEST(BinaryOperatorsPassTest, PrecedenceClimbing) {
    BinaryOperatorsPass pass;
    Node result =
        pass.transform(statement({num("1"), op("+"), num("2"), op("*"), num("3")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (binop "+" (num "1" "1") (binop "*" (num "2" "2") (num "3" "3")))))");
}

TEST(BinaryOperatorsPassTest, PowerIsRightAssociative) {
    BinaryOperatorsPass pass;
    Node result =
        pass.transform(statement({num("2"), op("**"), num("3"), op("**"), num("2")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (binop "**" (num "2" "2") (binop "**" (num "3" "3") (num "2" "2")))))");
}

TEST(BinaryOperatorsPassTest, SubtractionIsLeftAssociative) {
    BinaryOperatorsPass pass;
    Node result =
        pass.transform(statement({num("8"), op("-"), num("4"), op("-"), num("2")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (binop "-" (binop "-" (num "8" "8") (num "4" "4")) (num "2" "2"))))");
}

TEST(BinaryOperatorsPassTest, ConcatenationChainIsOneNode) {
    BinaryOperatorsPass pass;
    Node result =
        pass.transform(statement({sym("$a"), op("."), sym("$b"), op("."), sym("$c")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (concat "." (sym "$a") (sym "$b") (sym "$c"))))");
}

TEST(BinaryOperatorsPassTest, PrefixOperator) {
    BinaryOperatorsPass pass;
    Node result = pass.transform(statement({op("-"), sym("$val"), op("*"), num("2")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (binop "*" (unop "-" (sym "$val")) (num "2" "2"))))");
}

TEST(BinaryOperatorsPassTest, NamedUnaryTakesTighterOperators) {
    BinaryOperatorsPass pass;
    Node result = pass.transform(statement({word("int"), sym("$val"), op("+"), num("0.5")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (call "int" (args (binop "+" (sym "$val") (num "0.5" "0.5"))))))");
}

TEST(BinaryOperatorsPassTest, NamedUnaryStopsAtRelational) {
    BinaryOperatorsPass pass;
    Node result = pass.transform(
        statement({word("length"), sym("$val"), op("*"), num("2"), op(">"), num("3")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (binop ">" (call "length" (args (binop "*" (sym "$val") (num "2" "2")))) )"
              R"((num "3" "3"))))");
}

TEST(BinaryOperatorsPassTest, NamedUnaryAsRightOperand) {
    BinaryOperatorsPass pass;
    Node result = pass.transform(
        statement({num("2"), op("*"), word("int"), sym("$val"), op("-"), num("1")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (binop "*" (num "2" "2") )"
              R"((call "int" (args (binop "-" (sym "$val") (num "1" "1")))))))");
}

TEST(BinaryOperatorsPassTest, UnparseableRunIsLeftAlone) {
    BinaryOperatorsPass pass;
    Node broken = statement({sym("$a"), sym("$b"), op("+"), num("1")});
    EXPECT_EQ(pass.transform(broken), broken);
}

TEST(BinaryOperatorsPassTest, RunsStopAtTernaryMarkers) {
    BinaryOperatorsPass pass;
    Node result = pass.transform(statement(
        {sym("$val"), op(">"), num("0"), op("?"), sym("$val"), op(":"), num("0")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (binop ">" (sym "$val") (num "0" "0")) (op "?") )"
                                R"((sym "$val") (op ":") (num "0" "0")))");
}

TEST(TernaryPassTest, SingleConditional) {
    TernaryPass pass;
    Node result =
        pass.transform(statement({sym("$val"), op("?"), dquote("On"), op(":"), dquote("Off")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (ternary "?:" (sym "$val") (quote "\"On\"" "On") (quote "\"Off\"" "Off"))))");
}

TEST(TernaryPassTest, ChainsNestToTheRight) {
    TernaryPass pass;
    Node result = pass.transform(statement({sym("$a"), op("?"), num("1"), op(":"), sym("$b"),
                                            op("?"), num("2"), op(":"), num("3")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (ternary "?:" (sym "$a") (num "1" "1") )"
                                R"((ternary "?:" (sym "$b") (num "2" "2") (num "3" "3")))))");
}

// ============================================================================
// Low Tier
// ============================================================================

TEST(ListOperatorsPassTest, ParenthesizedLists) {
    ListOperatorsPass pass;
    EXPECT_EQ(to_sexpr(pass.transform(Node::branch(NodeKind::StructureList, "()", {}))),
              R"x((args "()"))x");
    EXPECT_EQ(to_sexpr(pass.transform(paren_list({sym("$val")}))), R"x((args "()" (sym "$val")))x");
}

TEST(ListOperatorsPassTest, CommaStatementBecomesArgList) {
    ListOperatorsPass pass;
    Node result = pass.transform(statement({num("1"), op(","), num("2"), semicolon()}));
    EXPECT_EQ(to_sexpr(result), R"((args (num "1" "1") (num "2" "2")))");
}

TEST(ListOperatorsPassTest, RightwardCallsNest) {
    ListOperatorsPass pass;
    Node result = pass.transform(statement({word("join"), dquote(","), op(","), word("unpack"),
                                            dquote("C*"), op(","), sym("$val")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (call "join" (args (quote "\",\"" ",") )"
              R"((call "unpack" (args (quote "\"C*\"" "C*") (sym "$val")))))))");
}

TEST(ConditionalAssignmentPassTest, GuardedStatement) {
    ConditionalAssignmentPass pass;
    Node result = pass.transform(
        statement({sym("$flag"), op("and"), sym("$val"), op("+="), num("1"), semicolon()}));
    EXPECT_EQ(to_sexpr(result), R"((guarded "+=" (sym "$flag") (sym "$val") (num "1" "1")))");
}

TEST(ConditionalAssignmentPassTest, OrNegatesCondition) {
    ConditionalAssignmentPass pass;
    Node result =
        pass.transform(statement({sym("$flag"), op("or"), sym("$val"), op("="), num("0")}));
    EXPECT_EQ(to_sexpr(result),
              R"((guarded "=" (unop "!" (sym "$flag")) (sym "$val") (num "0" "0")))");
}

TEST(ConditionalAssignmentPassTest, DocumentBecomesBlock) {
    ConditionalAssignmentPass pass;
    Node guarded = pass.transform(
        statement({sym("$flag"), op("and"), sym("$val"), op("*="), num("2"), semicolon()}));
    ASSERT_EQ(guarded.kind, NodeKind::GuardedAssignment);

    Node result = pass.transform(document({guarded, statement({sym("$val")})}));
    EXPECT_EQ(result.kind, NodeKind::ConditionalAssignment);
    EXPECT_EQ(result.children.size(), 2u);

    Node plain = document({statement({sym("$val")})});
    EXPECT_EQ(pass.transform(plain), plain);
}

TEST(LogicalKeywordsPassTest, AndNot) {
    LogicalKeywordsPass pass;
    Node result = pass.transform(statement({sym("$a"), op("and"), op("not"), sym("$b")}));
    EXPECT_EQ(to_sexpr(result), R"((stmt (binop "and" (sym "$a") (unop "not" (sym "$b")))))");
}

TEST(LogicalKeywordsPassTest, AndBindsTighterThanOr) {
    LogicalKeywordsPass pass;
    Node result = pass.transform(
        statement({sym("$a"), op("or"), sym("$b"), op("and"), sym("$c")}));
    EXPECT_EQ(to_sexpr(result),
              R"((stmt (binop "or" (sym "$a") (binop "and" (sym "$b") (sym "$c")))))");
}

TEST(PostfixConditionalPassTest, IfModifier) {
    PostfixConditionalPass pass;
    Node result = pass.transform(statement({sym("$val"), word("if"), sym("$flag"), semicolon()}));
    EXPECT_EQ(to_sexpr(result), R"((postfix "if" (sym "$val") (sym "$flag")))");
}

TEST(PostfixConditionalPassTest, ReturnUnless) {
    PostfixConditionalPass pass;
    Node result = pass.transform(statement({word("return"), num("1"), word("unless"), sym("$x")}));
    EXPECT_EQ(to_sexpr(result), R"((postfix "unless" (num "1" "1") (sym "$x")))");
}

TEST(PostfixConditionalPassTest, AssignmentBecomesGuarded) {
    PostfixConditionalPass pass;
    Node result = pass.transform(
        statement({sym("$val"), op("="), num("0"), word("unless"), sym("$ok")}));
    EXPECT_EQ(to_sexpr(result),
              R"((guarded "=" (unop "!" (sym "$ok")) (sym "$val") (num "0" "0")))");
}
