//! # Expression Corpus
//!
//! The input of a compilation run: every expression reference extracted from
//! the tag tables, each with its context, its source text and the tree the
//! upstream parser produced for it.
//!
//! ```json
//! {"expressions": [
//!   {"expression_type": "ValueTransform", "original_text": "$val * 25",
//!    "parsed_ast": {"class": "PPI::Document", "children": [...]},
//!    "usage": {"module": "Canon", "table": "CameraSettings", "tag": "FocalLength"}}
//! ]}
//! ```
//!
//! A top-level array of records is accepted as well. Structural problems with
//! a record (no type, no text) reject the whole corpus; a malformed
//! `parsed_ast` is only a problem for that one expression.

#pragma once

#include "ast/expression_context.hpp"
#include "common.hpp"
#include "json/json_value.hpp"
#include "registry/function_registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace exprc::driver {

struct CorpusRecord {
    ast::ExpressionContext context = ast::ExpressionContext::ValueTransform;
    std::string original_text;
    json::JsonValue parsed_ast; ///< Null when the record carries none
    std::optional<registry::UsageContext> usage;
};

struct Corpus {
    std::vector<CorpusRecord> records;
    std::string checksum; ///< crc32c_hex of the corpus text
};

struct CorpusError {
    std::string message;
};

/// Parses corpus JSON text.
[[nodiscard]] auto parse_corpus(std::string_view text) -> Result<Corpus, CorpusError>;

/// Reads and parses a corpus file.
[[nodiscard]] auto load_corpus_file(const std::string& path) -> Result<Corpus, CorpusError>;

} // namespace exprc::driver
