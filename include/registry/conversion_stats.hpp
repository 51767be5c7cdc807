//! # Conversion Statistics
//!
//! Coverage counters collected by the function registry: how many expressions
//! were registered per context, how many distinct functions they collapsed
//! into, and how many of those were generated versus replaced by a fallback.
//! Every fallback keeps its source text and reason so the gaps can be worked
//! through.

#pragma once

#include "ast/expression_context.hpp"
#include "json/json_value.hpp"

#include <array>
#include <string>
#include <vector>

namespace exprc::registry {

struct FallbackRecord {
    std::string function_name;
    std::string original_text;
    std::string reason;
};

/// Counters for one expression context.
struct ContextStats {
    size_t registrations = 0;    ///< Call sites registered
    size_t unique_functions = 0; ///< Distinct functions after dedup
    size_t generated = 0;
    size_t fallback = 0;
    std::vector<FallbackRecord> fallbacks; ///< Sorted by function name

    /// Generated share of unique functions, in percent. 100 when there are none.
    [[nodiscard]] auto coverage_percent() const -> double;
};

class ConversionStats {
public:
    [[nodiscard]] auto for_context(ast::ExpressionContext context) -> ContextStats&;
    [[nodiscard]] auto for_context(ast::ExpressionContext context) const -> const ContextStats&;

    /// Sum over all contexts.
    [[nodiscard]] auto totals() const -> ContextStats;

    [[nodiscard]] auto total_fallbacks() const -> size_t {
        return totals().fallback;
    }

    /// `{"contexts": {...}, "totals": {...}}`
    [[nodiscard]] auto to_json() const -> json::JsonValue;

    /// Multi-line human-readable summary.
    [[nodiscard]] auto summary() const -> std::string;

private:
    std::array<ContextStats, 3> per_context_;
};

} // namespace exprc::registry
