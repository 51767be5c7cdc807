//! # Expression Contexts
//!
//! The calling convention a compiled expression must satisfy. Fixed per
//! expression when it is registered.

#pragma once

#include <optional>
#include <string_view>

namespace exprc::ast {

enum class ExpressionContext {
    ValueTransform, ///< (Value) -> Result<Value, Error>
    DisplayFormat,  ///< (Value) -> string, never fails
    BooleanGate,    ///< (Value, EvalContext) -> bool, failures read as false
};

inline constexpr ExpressionContext ALL_CONTEXTS[] = {
    ExpressionContext::ValueTransform,
    ExpressionContext::DisplayFormat,
    ExpressionContext::BooleanGate,
};

[[nodiscard]] constexpr auto context_name(ExpressionContext ctx) -> std::string_view {
    switch (ctx) {
    case ExpressionContext::ValueTransform:
        return "ValueTransform";
    case ExpressionContext::DisplayFormat:
        return "DisplayFormat";
    case ExpressionContext::BooleanGate:
        return "BooleanGate";
    }
    return "Unknown";
}

/// Prefix of generated function names for the context.
[[nodiscard]] constexpr auto context_prefix(ExpressionContext ctx) -> std::string_view {
    switch (ctx) {
    case ExpressionContext::ValueTransform:
        return "value_conv_";
    case ExpressionContext::DisplayFormat:
        return "print_conv_";
    case ExpressionContext::BooleanGate:
        return "condition_";
    }
    return "expr_";
}

/// Accepts the context names and the tag-table names they come from
/// (ValueConv, PrintConv, Condition).
[[nodiscard]] constexpr auto parse_context(std::string_view name)
    -> std::optional<ExpressionContext> {
    if (name == "ValueTransform" || name == "ValueConv") {
        return ExpressionContext::ValueTransform;
    }
    if (name == "DisplayFormat" || name == "PrintConv") {
        return ExpressionContext::DisplayFormat;
    }
    if (name == "BooleanGate" || name == "Condition") {
        return ExpressionContext::BooleanGate;
    }
    return std::nullopt;
}

} // namespace exprc::ast
