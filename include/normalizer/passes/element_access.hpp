#pragma once

// Element Access Pass
//
// Folds subscripts into the term they follow:
// - `$$self{Make}` (cast, symbol, subscript) becomes the symbol `$$self{Make}`
// - `$self->{Make}` becomes the same symbol
// - `$$self{A}{B}` keeps folding into one symbol
// - `$x[2]` becomes an ElementAccess node

#include "normalizer/normalizer_pass.hpp"
#include "normalizer/operator_table.hpp"

namespace exprc::normalizer {

class ElementAccessPass : public NormalizerPass {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "ElementAccess";
    }

    [[nodiscard]] auto tier() const -> PrecedenceTier override {
        return PrecedenceTier::High;
    }

    [[nodiscard]] auto binding_power() const -> int override {
        return bp::SUBSCRIPT;
    }

    [[nodiscard]] auto transform(ast::Node node) const -> ast::Node override;
};

} // namespace exprc::normalizer
