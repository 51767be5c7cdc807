#pragma once

// Postfix Conditional Pass
//
// `BODY if PRED;` and `BODY unless PRED;` statements. When BODY is an
// assignment to a scalar the statement becomes a GuardedAssignment instead.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class PostfixConditionalPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "PostfixConditional";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::Low;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::STATEMENT_MODIFIER;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
