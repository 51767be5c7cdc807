//! # Raw Tree Loading
//!
//! Converts the upstream parser's JSON node objects into `Node` trees.
//!
//! ```json
//! {"class": "PPI::Statement", "children": [
//!     {"class": "PPI::Token::Symbol", "content": "$val", "symbol_type": "scalar"},
//!     {"class": "PPI::Token::Operator", "content": "*"},
//!     {"class": "PPI::Token::Number", "content": "25", "numeric_value": 25}]}
//! ```
//!
//! Whitespace, comment and POD tokens are dropped so that expressions that
//! differ only in layout load to identical trees.

#pragma once

#include "ast/node.hpp"
#include "common.hpp"
#include "json/json_value.hpp"

#include <string>

namespace exprc::ast {

/// The upstream tree for one expression is malformed. Recovered per expression.
struct ParseInputError {
    std::string message;
    std::string node_class; ///< Class of the offending node, when known
};

[[nodiscard]] auto load_node(const json::JsonValue& json) -> Result<Node, ParseInputError>;

/// Splits a match literal (`/EOS/i`, `m{^D\d}`, `qr/x/`) into pattern and modifiers.
/// Returns false when the delimiters are unbalanced.
[[nodiscard]] auto split_regex_literal(std::string_view literal, std::string& pattern,
                                       std::string& modifiers) -> bool;

} // namespace exprc::ast
