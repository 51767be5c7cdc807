#pragma once

// Conditional Assignment Pass
//
// Statement level: `COND and $val OP= VALUE;` becomes a GuardedAssignment
// (`or` negates the condition).
//
// Document level: guarded assignments followed by a final result expression
// become one ConditionalAssignment block.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class ConditionalAssignmentPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "ConditionalAssignment";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::Low;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::GUARDED_ASSIGNMENT;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
