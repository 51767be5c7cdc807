//! # Function Registry
//!
//! Corpus-wide intern table for compiled expressions. Each registered
//! expression is keyed by the fingerprint of its context and normalized tree;
//! expressions with the same key share one function and one name.
//!
//! ## Lifecycle
//!
//! One registry per compilation run. Workers call `resolve_or_fallback()`
//! concurrently; `finish()` drains everything into sorted, deterministic
//! output once all workers are done.
//!
//! ```cpp
//! FunctionRegistry registry;
//! auto fn = registry.resolve_or_fallback(spec);   // any thread
//! RegistryOutput out = registry.finish();          // after join
//! ```
//!
//! ## Outcomes
//!
//! Every registered expression ends as exactly one of:
//! - a generated function, or
//! - a fallback: the per-context default, with the reason recorded in
//!   `ConversionStats`.
//!
//! Two different normalized trees producing the same name are a compiler
//! defect and throw `InternalCompilerError{DuplicateNameCollision}`.

#pragma once

#include "ast/expression_context.hpp"
#include "ast/node.hpp"
#include "codegen/cpp_gen.hpp"
#include "registry/conversion_stats.hpp"

#include <array>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace exprc::registry {

/// Where an expression is used in the tag tables.
struct UsageContext {
    std::string module;
    std::string table;
    std::string tag;

    auto operator==(const UsageContext& other) const -> bool = default;
    auto operator<(const UsageContext& other) const -> bool {
        return std::tie(module, table, tag) < std::tie(other.module, other.table, other.tag);
    }
};

/// One expression reference from the corpus. Immutable once built.
struct FunctionSpec {
    std::string original_text;
    ast::ExpressionContext context = ast::ExpressionContext::ValueTransform;
    std::optional<ast::Node> normalized; ///< Absent when the upstream tree was malformed
    std::string input_error;             ///< Why `normalized` is absent
    std::optional<UsageContext> usage;
};

/// A function as it will be emitted.
struct GeneratedFunction {
    std::string name;
    ast::ExpressionContext context = ast::ExpressionContext::ValueTransform;
    std::string source;        ///< Complete definition
    std::string original_text; ///< Representative text (lexicographically first)
    bool is_fallback = false;
    std::string fallback_reason;
    std::vector<UsageContext> usages; ///< Sorted, unique
    size_t call_sites = 0;
};

/// `(original_text, context) -> function` mapping for the dispatcher.
struct CallSite {
    std::string original_text;
    ast::ExpressionContext context = ast::ExpressionContext::ValueTransform;
    std::string function_name;
};

/// Everything a drained registry produced.
struct RegistryOutput {
    std::vector<GeneratedFunction> functions; ///< Sorted by name
    std::vector<CallSite> call_sites;         ///< Sorted by (context, original_text)
    ConversionStats stats;
};

/// Derives a function name from a context and a dedup key.
using NamingFn = std::string (*)(ast::ExpressionContext context, const std::string& dedup_key);

/// `function_name(context, spec_fingerprint(context, dedup_key))`
[[nodiscard]] auto fingerprint_name(ast::ExpressionContext context, const std::string& dedup_key)
    -> std::string;

class FunctionRegistry {
public:
    explicit FunctionRegistry(codegen::CppCodeGen generator = codegen::CppCodeGen{},
                              NamingFn naming = &fingerprint_name);

    FunctionRegistry(const FunctionRegistry&) = delete;
    auto operator=(const FunctionRegistry&) -> FunctionRegistry& = delete;

    /// Records the call site and returns the function name. Does not generate code.
    auto register_spec(const FunctionSpec& spec) -> std::string;

    /// Registers the spec and makes sure its function is generated, or
    /// replaced by a fallback when no generation rule applies.
    auto resolve_or_fallback(const FunctionSpec& spec) -> GeneratedFunction;

    /// Resolves anything still pending and drains the registry.
    [[nodiscard]] auto finish() -> RegistryOutput;

    /// Name a spec would be registered under.
    [[nodiscard]] auto name_for(const FunctionSpec& spec) const -> std::string;

    [[nodiscard]] auto function_count() const -> size_t;

private:
    struct Entry {
        GeneratedFunction function;
        std::string dedup_key; ///< Serialized tree the name was derived from
        FunctionSpec spec;     ///< Representative spec, used for late resolution
        bool resolved = false;
    };

    [[nodiscard]] static auto dedup_key(const FunctionSpec& spec) -> std::string;

    /// Lowers and generates. Pure; safe to call without the lock.
    [[nodiscard]] auto compile(const FunctionSpec& spec, const std::string& name) const
        -> Result<std::string, ast::UnsupportedConstruct>;

    /// Requires `mutex_` held.
    auto record(const FunctionSpec& spec, const std::string& name, const std::string& key)
        -> Entry&;

    void store(Entry& entry, Result<std::string, ast::UnsupportedConstruct> outcome);

    codegen::CppCodeGen generator_;
    NamingFn naming_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> functions_;
    std::map<std::pair<ast::ExpressionContext, std::string>, std::string> call_sites_;
    std::array<size_t, 3> registrations_{};
};

} // namespace exprc::registry
