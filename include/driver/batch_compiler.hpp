//! # Batch Compiler
//!
//! Runs every corpus record through load, normalize and registry resolution
//! on a pool of worker threads. Per-expression work is independent; the
//! registry insert is the only shared step.
//!
//! An `InternalCompilerError` on any worker stops the remaining workers and
//! is rethrown from `run()` once all threads are joined.

#pragma once

#include "driver/corpus.hpp"
#include "normalizer/normalizer.hpp"
#include "registry/function_registry.hpp"

#include <cstddef>
#include <vector>

namespace exprc::driver {

/// Loads and normalizes one record. Malformed trees are kept as input errors.
[[nodiscard]] auto build_spec(const normalizer::Normalizer& normalizer, const CorpusRecord& record)
    -> registry::FunctionSpec;

class BatchCompiler {
public:
    /// `jobs == 0` uses the hardware concurrency.
    BatchCompiler(const normalizer::Normalizer& normalizer, registry::FunctionRegistry& registry,
                  size_t jobs = 0);

    void run(const std::vector<CorpusRecord>& records);

    [[nodiscard]] auto thread_count() const -> size_t {
        return jobs_;
    }

private:
    const normalizer::Normalizer& normalizer_;
    registry::FunctionRegistry& registry_;
    size_t jobs_;
};

} // namespace exprc::driver
