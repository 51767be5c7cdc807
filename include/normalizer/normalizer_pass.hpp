//! # Normalizer Pass Interface
//!
//! A pass recognizes one syntactic pattern among the direct children of a
//! node and rewrites it into a canonical node. Passes are stateless: the same
//! instance is shared by every worker thread, so `transform` must not touch
//! anything but its argument.
//!
//! ## Ordering
//!
//! Passes run in ascending tier order and, within a tier, from the tightest
//! binding power to the loosest. The orchestrator sorts on registration and
//! verifies the order again while running.
//!
//! | Tier | Patterns |
//! |------|----------|
//! | High | subscripts, function calls, sprintf, safe division, `.` / `x` |
//! | Medium | infix and prefix operators, `?:` |
//! | Low | list operators, guarded assignment, `and`/`or`/`not`, `if`/`unless` |

#pragma once

#include "ast/node.hpp"

#include <cstdint>
#include <string>

namespace exprc::normalizer {

enum class PrecedenceTier : uint8_t {
    High = 0,
    Medium = 1,
    Low = 2,
};

[[nodiscard]] auto tier_name(PrecedenceTier tier) -> const char*;

/// Base class for normalizer passes.
class NormalizerPass {
public:
    virtual ~NormalizerPass() = default;

    /// Pass name for logging and ordering ties.
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    [[nodiscard]] virtual auto tier() const -> PrecedenceTier = 0;

    /// Binding power of the operators this pass reduces (see `operator_table.hpp`).
    [[nodiscard]] virtual auto binding_power() const -> int = 0;

    /// Rewrites matches among `node`'s direct children. Returns the node
    /// unchanged when nothing matches.
    [[nodiscard]] virtual auto transform(ast::Node node) const -> ast::Node = 0;
};

/// Sort key: lower tier first, then higher binding power, then name.
[[nodiscard]] auto runs_before(const NormalizerPass& a, const NormalizerPass& b) -> bool;

} // namespace exprc::normalizer
