#pragma once

// Function Call Pass
//
// `name(...)` becomes a FunctionCall. A named unary operator written without
// parentheses (`length $val`, `defined $$self{X}`) takes the single term
// that follows it when the next operator binds looser than a named unary
// (`length $val > 3`, `length $val ? ...`). Otherwise the word is left for
// BinaryOperatorsPass, which parses it as a prefix operator.
//
// sprintf and method calls (`->name(...)`) are left alone.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class FunctionCallPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "FunctionCall";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::High;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::TERM;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
