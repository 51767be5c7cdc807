//! # C++ Code Generator
//!
//! Turns a normalized expression into one C++ function written against the
//! `exprc::rt` runtime library. The signature depends on the expression
//! context:
//!
//! | Context | Signature | On failure |
//! |---------|-----------|------------|
//! | ValueTransform | `auto f(rt::Value val) -> rt::ValueResult` | `rt::Error` |
//! | DisplayFormat | `auto f(rt::Value val) -> std::string` | raw input as text |
//! | BooleanGate | `auto f(rt::Value val, const rt::EvalContext& ctx) -> bool` | `false` |
//!
//! Conditionals at the top of an expression are emitted as `if`/`else`
//! statements; nested ones go through `rt::choose` so only the selected branch
//! is evaluated. A shape with no rule is reported as `UnsupportedConstruct`,
//! never approximated.

#pragma once

#include "ast/expression_context.hpp"
#include "ast/normalized.hpp"
#include "common.hpp"

#include <string>
#include <string_view>

namespace exprc::codegen {

/// Options for C++ generation. Doc comments belong to ModuleEmitterOptions.
struct CppGenOptions {
    std::string runtime_namespace = "rt";   ///< Namespace qualifier for runtime calls.
    int indent = 4;                         ///< Spaces per indentation level.
};

/// C++ generator for normalized expressions.
class CppCodeGen {
public:
    explicit CppCodeGen(CppGenOptions options = {});

    /// Generates the full function definition (signature and body).
    [[nodiscard]] auto generate(const ast::NormalizedNode& root, ast::ExpressionContext context,
                                const std::string& name) const
        -> Result<std::string, ast::UnsupportedConstruct>;

    /// Stand-in for an expression that could not be compiled.
    [[nodiscard]] auto fallback(ast::ExpressionContext context, const std::string& name,
                                const std::string& original_text) const -> std::string;

    /// `auto NAME(...) -> R`, without a body.
    [[nodiscard]] auto signature(ast::ExpressionContext context, const std::string& name) const
        -> std::string;

    [[nodiscard]] auto options() const -> const CppGenOptions& {
        return options_;
    }

private:
    CppGenOptions options_;
};

/// Quoted C++ string literal for arbitrary bytes.
[[nodiscard]] auto cpp_string_literal(std::string_view text) -> std::string;

} // namespace exprc::codegen
