#pragma once

// Ternary Pass
//
// `COND ? A : B` with single-node parts becomes a Ternary. The rightmost `?`
// is reduced first, which makes chains right-associative:
// `a ? b : c ? d : e` is `a ? b : (c ? d : e)`.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class TernaryPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "Ternary";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::Medium;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::CONDITIONAL;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
