#pragma once

// Safe Division Pass
//
// Recognizes the zero-guarded reciprocal idiom `$x ? N / $x : 0` as a whole,
// before the generic operator passes can split it. Both symbols must be
// spelled the same and the fallback must be the literal 0.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class SafeDivisionPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "SafeDivision";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::High;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::SAFE_DIVISION;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
