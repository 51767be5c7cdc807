//! # Normalized Expression IR
//!
//! The closed set of shapes the code generator is written against. Produced
//! by `lower()` from a fully normalized `Node` tree; anything the passes left
//! in raw form is rejected here with `UnsupportedConstruct` instead of being
//! passed through.
//!
//! ```cpp
//! auto lowered = lower(normalizer.normalize(raw));
//! if (is_ok(lowered) && unwrap(lowered).is<BinaryOp>()) {
//!     const auto& bin = unwrap(lowered).as<BinaryOp>();
//!     // bin.op == "*", bin.lhs->is<Symbol>()
//! }
//! ```

#pragma once

#include "ast/node.hpp"
#include "common.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace exprc::ast {

struct NormalizedNode;
using NormalizedPtr = Box<NormalizedNode>;

/// No generation rule exists for a shape. Recovered through a fallback.
struct UnsupportedConstruct {
    std::string message;
    std::string fragment; ///< Serialized offending subtree, if any
};

// ============================================================================
// Leaves
// ============================================================================

enum class LiteralKind { Number, String, Regex, Undef };

struct Literal {
    LiteralKind kind = LiteralKind::Undef;
    std::string text;         ///< Decimal spelling, decoded string body, or regex pattern
    bool interpolate = false; ///< String: double-quoted
    std::string modifiers;    ///< Regex: i, x, s, m
};

enum class SymbolKind {
    Value,        ///< $val (and $_), the function parameter
    ContextField, ///< $$self{Name}, $self->{Name}, or another named scalar
};

struct Symbol {
    SymbolKind kind = SymbolKind::Value;
    std::string name;   ///< Field key for ContextField
    std::string source; ///< Spelling in the source expression
};

// ============================================================================
// Composites
// ============================================================================

struct BinaryOp {
    std::string op;
    NormalizedPtr lhs;
    NormalizedPtr rhs;
};

struct UnaryOp {
    std::string op;
    NormalizedPtr operand;
};

/// N-ary, left to right.
struct StringConcat {
    std::vector<NormalizedPtr> parts;
};

struct StringRepeat {
    NormalizedPtr text;
    NormalizedPtr count;
};

struct Ternary {
    NormalizedPtr condition;
    NormalizedPtr if_true;
    NormalizedPtr if_false;
};

/// `$x ? N / $x : 0`. The divisor doubles as the guard.
struct SafeDivision {
    NormalizedPtr numerator;
    NormalizedPtr divisor;
};

struct FunctionCall {
    std::string name;
    std::vector<NormalizedPtr> args;
};

struct FormattedPrint {
    NormalizedPtr format;
    std::vector<NormalizedPtr> args;
};

struct ElementAccess {
    NormalizedPtr subject;
    int64_t index = 0;
};

struct PostfixConditional {
    NormalizedPtr body;
    NormalizedPtr predicate;
    bool negated = false; ///< `unless`
};

/// `COND and $val OP= VALUE`
struct GuardedAssignment {
    NormalizedPtr condition;
    std::string op; ///< "=", "-=", "+=", "*=", "/=", ".="
    Symbol target;
    NormalizedPtr value;
};

/// Guarded assignments run in order, then `result` is evaluated.
struct ConditionalAssignment {
    std::vector<GuardedAssignment> guards;
    NormalizedPtr result;
};

/// Parenthesized or comma list in value position.
struct ListExpr {
    std::vector<NormalizedPtr> items;
};

struct NormalizedNode {
    std::variant<Literal, Symbol, BinaryOp, UnaryOp, StringConcat, StringRepeat, Ternary,
                 SafeDivision, FunctionCall, FormattedPrint, ElementAccess, PostfixConditional,
                 ConditionalAssignment, ListExpr>
        kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

/// Converts a normalized tree into the closed IR.
[[nodiscard]] auto lower(const Node& node) -> Result<NormalizedNode, UnsupportedConstruct>;

/// Classifies a scalar spelling. False for arrays, hashes and punctuation variables.
[[nodiscard]] auto classify_symbol(const std::string& spelling, Symbol& out) -> bool;

} // namespace exprc::ast
