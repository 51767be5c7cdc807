#pragma once

// Binary Operators Pass
//
// Precedence climbing over every run of operands and infix/prefix operators,
// from `**` down to `|| //`, with bare named unaries (`int`, `length`...)
// as prefix operators. Runs are bounded by anything that is not part of
// such an expression: `? :`, commas, assignment, low-precedence keywords,
// other barewords and statement terminators.
//
// A run that does not parse (two operands in a row, a dangling operator) is
// left unchanged.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class BinaryOperatorsPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "BinaryOperators";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::Medium;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::POWER;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
