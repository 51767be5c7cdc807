//! # Operator Table
//!
//! Binding powers follow perlop's precedence list, scaled so that every
//! level has room: a higher number binds tighter. Passes use these values
//! both to order themselves within a tier and to decide whether an operand
//! is "free" to be grabbed by the operator they reduce.
//!
//! | Level | Operators | Binding power |
//! |-------|-----------|---------------|
//! | terms, list operators (leftward) | `f(...)`, `$x`, `"..."` | 210 |
//! | exponent | `**` | 180 |
//! | unary | `! ~ \ + -` | 170 |
//! | binding | `=~ !~` | 160 |
//! | multiplicative | `* / % x` | 150 |
//! | additive | `+ - .` | 140 |
//! | shift | `<< >>` | 130 |
//! | named unary | `length`, `defined`... | 120 |
//! | relational | `< > <= >= lt gt le ge` | 100 |
//! | equality | `== != <=> eq ne cmp` | 90 |
//! | bitwise and | `&` | 80 |
//! | bitwise or | `\| ^` | 70 |
//! | logical and | `&&` | 60 |
//! | logical or | `\|\| //` | 50 |
//! | range | `..` | 40 |
//! | conditional | `?:` | 30 |
//! | assignment | `= += -=`... | 20 |
//! | comma | `, =>` | 10 |
//! | list operators (rightward) | `join LIST` | 8 |
//! | low not | `not` | 5 |
//! | low and | `and` | 3 |
//! | low or | `or xor` | 1 |
//! | statement modifiers | `EXPR if COND` | 0 |

#pragma once

#include "ast/node.hpp"

#include <string_view>

namespace exprc::normalizer {

namespace bp {
constexpr int SUBSCRIPT = 215; ///< `{key}` / `[n]` complete the term they follow
constexpr int TERM = 210;
constexpr int SAFE_DIVISION = 205; ///< Whole-idiom match, after terms are grouped
constexpr int POWER = 180;
constexpr int UNARY = 170;
constexpr int BINDING = 160;
constexpr int MULTIPLICATIVE = 150;
constexpr int ADDITIVE = 140;
constexpr int SHIFT = 130;
constexpr int NAMED_UNARY = 120;
constexpr int RELATIONAL = 100;
constexpr int EQUALITY = 90;
constexpr int BIT_AND = 80;
constexpr int BIT_OR = 70;
constexpr int LOGICAL_AND = 60;
constexpr int LOGICAL_OR = 50;
constexpr int RANGE = 40;
constexpr int CONDITIONAL = 30;
constexpr int ASSIGNMENT = 20;
constexpr int COMMA = 10;
constexpr int LIST_OPERATOR = 8;
constexpr int LOW_NOT = 5;
constexpr int GUARDED_ASSIGNMENT = 4; ///< `COND and $val OP= V;` statements
constexpr int LOW_AND = 3;
constexpr int LOW_OR = 1;
constexpr int STATEMENT_MODIFIER = 0;
} // namespace bp

enum class Assoc { Left, Right, NonAssoc };

struct OperatorInfo {
    std::string_view text;
    int binding_power;
    Assoc assoc;
};

/// Infix operators reduced by the binary-operator pass (`**` down to `|| //`).
/// nullptr for anything else.
[[nodiscard]] auto binary_operator(std::string_view text) -> const OperatorInfo*;

/// Infix `and`, `or`, `xor`.
[[nodiscard]] auto low_logical_operator(std::string_view text) -> const OperatorInfo*;

/// `! ~ \ + -` in prefix position.
[[nodiscard]] auto is_prefix_operator(std::string_view text) -> bool;

[[nodiscard]] auto is_assignment_operator(std::string_view text) -> bool;

/// Named unary operators that take one following term without parentheses.
[[nodiscard]] auto is_named_unary(std::string_view word) -> bool;

/// Functions that take everything to their right as arguments without parentheses.
[[nodiscard]] auto is_list_operator(std::string_view word) -> bool;

/// Words that are syntax rather than function names.
[[nodiscard]] auto is_keyword(std::string_view word) -> bool;

// ============================================================================
// Token classification shared by passes
// ============================================================================

/// Something that can stand as an operand: symbols, literals, and reduced nodes.
[[nodiscard]] auto is_operand(const ast::Node& node) -> bool;

/// An operator token at `index` is infix when the token before it is an operand.
[[nodiscard]] auto is_infix_position(const std::vector<ast::Node>& children, size_t index) -> bool;

/// Binding power of the operator token immediately left of the operand at `index`
/// (as infix or prefix), or -1 when nothing to the left can take the operand.
[[nodiscard]] auto left_binding_power(const std::vector<ast::Node>& children, size_t index) -> int;

/// Binding power of the infix operator immediately right of the operand at
/// `index`, or -1 when nothing to the right can take the operand.
[[nodiscard]] auto right_binding_power(const std::vector<ast::Node>& children, size_t index)
    -> int;

} // namespace exprc::normalizer
