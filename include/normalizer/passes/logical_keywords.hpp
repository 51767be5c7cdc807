#pragma once

// Logical Keywords Pass
//
// Low-precedence `not`, `and`, `or`, `xor`. Runs that contain an assignment
// are left for the conditional assignment pass.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class LogicalKeywordsPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "LogicalKeywords";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::Low;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::LOW_NOT;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
