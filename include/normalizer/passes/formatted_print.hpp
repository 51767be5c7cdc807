#pragma once

// Formatted Print Pass
//
// `sprintf(FORMAT, ARGS...)` becomes a FormattedPrint node holding the
// argument list, format first.

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class FormattedPrintPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "FormattedPrint";
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
