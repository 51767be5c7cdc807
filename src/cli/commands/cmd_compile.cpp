//! # Compile Command
//!
//! ```text
//! load corpus ─> BatchCompiler (N threads) ─> FunctionRegistry::finish()
//!                                                  │
//!                       ┌──────────────────────────┼───────────────────┐
//!                       v                          v                   v
//!                  module.cpp                lookup.json          report.json
//! ```
//!
//! All artifacts are written before strict mode decides the exit status.

#include "cmd_compile.hpp"

#include "codegen/cpp_gen.hpp"
#include "driver/batch_compiler.hpp"
#include "driver/corpus.hpp"
#include "driver/module_emitter.hpp"
#include "log/log.hpp"
#include "normalizer/normalizer.hpp"
#include "registry/function_registry.hpp"

#include <iostream>

namespace exprc::cli {

static bool write_artifact(const std::string& path, const std::string& content) {
    auto written = driver::write_text_file(path, content);
    if (is_err(written)) {
        EXPRC_LOG_ERROR("cli", unwrap_err(written));
        std::cerr << "error: " << unwrap_err(written) << "\n";
        return false;
    }
    return true;
}

int run_compile(const CompileOptions& options) {
    auto corpus = driver::load_corpus_file(options.input_path);
    if (is_err(corpus)) {
        EXPRC_LOG_ERROR("cli", unwrap_err(corpus).message);
        std::cerr << "error: " << unwrap_err(corpus).message << "\n";
        return 1;
    }

    codegen::CppGenOptions gen_options;

    auto normalizer = normalizer::Normalizer::standard();
    registry::FunctionRegistry registry{codegen::CppCodeGen(gen_options)};
    driver::BatchCompiler compiler(normalizer, registry, options.jobs);
    compiler.run(unwrap(corpus).records);

    registry::RegistryOutput output = registry.finish();

    driver::ModuleEmitterOptions emit_options;
    emit_options.emit_comments = options.emit_comments;
    emit_options.source_name = options.input_path;
    emit_options.corpus_checksum = unwrap(corpus).checksum;
    driver::ModuleEmitter emitter(emit_options);

    if (!write_artifact(options.output_path, emitter.emit_module(output))) {
        return 1;
    }
    if (!options.lookup_path.empty() &&
        !write_artifact(options.lookup_path, emitter.lookup_json(output).to_string_pretty() + "\n")) {
        return 1;
    }
    if (!options.report_path.empty() &&
        !write_artifact(options.report_path, emitter.report_json(output).to_string_pretty() + "\n")) {
        return 1;
    }

    std::string summary = output.stats.summary();
    EXPRC_LOG_INFO("cli", summary);
    std::cout << summary;

    const auto totals = output.stats.totals();
    for (const auto& fallback : totals.fallbacks) {
        EXPRC_LOG_DEBUG("cli", "fallback " << fallback.function_name << " '"
                                           << fallback.original_text << "': " << fallback.reason);
    }

    if (options.strict && totals.fallback > 0) {
        EXPRC_LOG_ERROR("cli", totals.fallback << " expression(s) fell back in strict mode");
        std::cerr << "error: " << totals.fallback
                  << " expression(s) could not be compiled (--strict)\n";
        return 1;
    }
    return 0;
}

} // namespace exprc::cli
