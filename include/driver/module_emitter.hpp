//! # Module Emitter
//!
//! Writes the artifacts of a drained registry:
//!
//! | Artifact | Content |
//! |----------|---------|
//! | module (`.cpp`) | every function in `exprc::generated`, plus the three `find_*` lookups |
//! | lookup (`.json`) | `[{original_text, expression_type, function}]` |
//! | report (`.json`) | per-context coverage and the list of fallbacks |
//!
//! Output depends only on the registry contents, never on thread scheduling.

#pragma once

#include "json/json_value.hpp"
#include "registry/function_registry.hpp"

#include <string>

namespace exprc::driver {

struct ModuleEmitterOptions {
    bool emit_comments = true;   ///< Doc comment above each function
    std::string source_name;     ///< Corpus path, for the header comment
    std::string corpus_checksum; ///< crc32c_hex of the corpus
};

class ModuleEmitter {
public:
    explicit ModuleEmitter(ModuleEmitterOptions options = {});

    /// Complete C++ translation unit.
    [[nodiscard]] auto emit_module(const registry::RegistryOutput& output) const -> std::string;

    [[nodiscard]] auto lookup_json(const registry::RegistryOutput& output) const -> json::JsonValue;

    [[nodiscard]] auto report_json(const registry::RegistryOutput& output) const -> json::JsonValue;

private:
    ModuleEmitterOptions options_;

    void emit_doc_comment(std::string& out, const registry::GeneratedFunction& fn) const;
    void emit_lookup_table(std::string& out, const registry::RegistryOutput& output,
                           ast::ExpressionContext context) const;
};

/// Writes `content` to `path`. Returns an error message on failure.
[[nodiscard]] auto write_text_file(const std::string& path, const std::string& content)
    -> Result<bool, std::string>;

} // namespace exprc::driver
