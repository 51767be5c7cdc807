#pragma once

// List Operators Pass
//
// - Parenthesized lists become ArgList nodes marked `()`
// - Comma lists in an expression or statement become ArgList nodes
// - List operators without parentheses (`join ",", LIST`) take every
//   comma-separated term to their right, innermost (rightmost) first

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class ListOperatorsPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "ListOperators";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::Low;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::COMMA;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
