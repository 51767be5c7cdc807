//! # Normalizer
//!
//! Runs the registered passes over a raw expression tree, bottom-up. Every
//! node's children are normalized first; then each pass, in precedence order,
//! gets one chance to rewrite the node's direct children.
//!
//! ```cpp
//! auto normalizer = Normalizer::standard();
//! ast::Node canonical = normalizer.normalize(raw);
//! auto lowered = normalize_expression(normalizer, raw); // normalize + lower
//! ```
//!
//! The normalizer is immutable once built and can be shared between threads.

#pragma once

#include "ast/normalized.hpp"
#include "common.hpp"
#include "normalizer/normalizer_pass.hpp"

#include <memory>
#include <vector>

namespace exprc::normalizer {

class Normalizer {
public:
    Normalizer() = default;

    /// All built-in passes.
    [[nodiscard]] static auto standard() -> Normalizer;

    /// Adds a pass and re-sorts the pipeline.
    void add_pass(std::unique_ptr<NormalizerPass> pass);

    /// Throws InternalCompilerError (PrecedenceInvariantViolation) if the
    /// passes are observed out of order while running.
    [[nodiscard]] auto normalize(const ast::Node& root) const -> ast::Node;

    [[nodiscard]] auto pass_count() const -> size_t {
        return passes_.size();
    }

    /// Pass names in execution order.
    [[nodiscard]] auto pass_names() const -> std::vector<std::string>;

private:
    auto normalize_node(ast::Node node) const -> ast::Node;

    std::vector<std::unique_ptr<NormalizerPass>> passes_;
};

/// Registers the built-in passes on `normalizer`.
void configure_standard_passes(Normalizer& normalizer);

/// Normalizes `root` and lowers it into the closed IR.
[[nodiscard]] auto normalize_expression(const Normalizer& normalizer, const ast::Node& root)
    -> Result<ast::NormalizedNode, ast::UnsupportedConstruct>;

} // namespace exprc::normalizer
