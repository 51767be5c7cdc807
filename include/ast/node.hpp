//! # Expression Tree Nodes
//!
//! A single `Node` type carries both the raw tree delivered by the upstream
//! parser and the canonical nodes the normalizer passes build out of it. Raw
//! kinds mirror the upstream token/structure classes; canonical kinds are the
//! small set of shapes the lowering step understands.
//!
//! ## Field conventions
//!
//! | Kind | `content` | `value` | children |
//! |------|-----------|---------|----------|
//! | Symbol | `$val`, `$$self{Make}` | | |
//! | Number | source spelling | decimal spelling | |
//! | Quote | source spelling with delimiters | decoded body | |
//! | Regex | modifiers (`i`, `x`...) | pattern | |
//! | Subscript | `{}` or `[]` | key, when it is a bare word, string or integer | raw |
//! | BinaryOp, UnaryOp | operator | | operands |
//! | FunctionCall | function name | | one ArgList |
//! | ArgList | `()` when parenthesized | | items |
//! | GuardedAssignment | assignment operator | | condition, target, value |
//! | ElementAccess | index | | subject |

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace exprc::ast {

enum class NodeKind : uint8_t {
    // Raw kinds (upstream parser)
    Document,
    Statement,
    Expression,
    StructureList,
    StructureBlock,
    StructureSubscript,
    Symbol,
    Cast,
    Number,
    Quote,
    Regex,
    Operator,
    Word,
    Punctuation,
    Opaque, ///< Valid upstream token with no compilation rule (s///, tr///, heredoc)

    // Canonical kinds (built by normalizer passes)
    ArgList,
    BinaryOp,
    UnaryOp,
    StringConcat,
    StringRepeat,
    Ternary,
    SafeDivision,
    FunctionCall,
    FormattedPrint,
    ElementAccess,
    PostfixConditional,
    GuardedAssignment,
    ConditionalAssignment,
};

[[nodiscard]] auto node_kind_name(NodeKind kind) -> const char*;

/// True for kinds produced by passes rather than by the upstream parser.
[[nodiscard]] auto is_canonical_kind(NodeKind kind) -> bool;

struct Node {
    NodeKind kind = NodeKind::Document;
    std::string content;
    std::string value;
    std::vector<Node> children;

    [[nodiscard]] static auto leaf(NodeKind kind, std::string content, std::string value = {})
        -> Node;
    [[nodiscard]] static auto branch(NodeKind kind, std::string content, std::vector<Node> children)
        -> Node;

    [[nodiscard]] auto is(NodeKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_operator(std::string_view op) const -> bool {
        return kind == NodeKind::Operator && content == op;
    }

    [[nodiscard]] auto is_word(std::string_view word) const -> bool {
        return kind == NodeKind::Word && content == word;
    }

    [[nodiscard]] auto operator==(const Node& other) const -> bool = default;
};

// ============================================================================
// Builders (tests and passes)
// ============================================================================

[[nodiscard]] auto sym(std::string name) -> Node;
[[nodiscard]] auto num(std::string text) -> Node;
/// Double-quoted string literal with the given decoded body.
[[nodiscard]] auto dquote(std::string body) -> Node;
/// Single-quoted string literal with the given decoded body.
[[nodiscard]] auto squote(std::string body) -> Node;
[[nodiscard]] auto op(std::string text) -> Node;
[[nodiscard]] auto word(std::string text) -> Node;
[[nodiscard]] auto statement(std::vector<Node> children) -> Node;
[[nodiscard]] auto document(std::vector<Node> statements) -> Node;
[[nodiscard]] auto paren_list(std::vector<Node> children) -> Node;

/// Decimal spelling of a numeric literal (`0x1F` -> `31`, `1_000` -> `1000`,
/// `017` -> `15`); floats keep their spelling minus underscores. Empty when the
/// text is not a number.
[[nodiscard]] auto decimal_spelling(std::string_view text) -> std::string;

/// True for a double-quoted (or qq) string, whose body interpolates.
[[nodiscard]] auto is_interpolating(const Node& quote) -> bool;

// ============================================================================
// Serialization
// ============================================================================

/// Canonical s-expression. Two trees are equal iff their serializations are.
///
/// `(stmt (binop "*" (sym "$val") (num "25" "25")))`
[[nodiscard]] auto to_sexpr(const Node& node) -> std::string;

} // namespace exprc::ast
