#pragma once

// String Operators Pass
//
// Reduces `x` (repetition) and runs of `.` (concatenation) whose operands are
// already terms. A run is only reduced when no tighter operator on either side
// claims its end operands; the rest is left to the binary operator pass.
//
// Concatenation chains become one n-ary StringConcat.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class StringOperatorsPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "StringOperators";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::High;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::MULTIPLICATIVE;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
