//! # JSON Parser
//!
//! Recursive-descent parser over a `std::string_view`, tracking line and
//! column for error messages. Corpus files produced by the upstream parser
//! can be deep (one nesting level per AST node), so depth is bounded rather
//! than left to the native stack.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace exprc::json {

class JsonParser {
public:
    static constexpr size_t MAX_DEPTH = 512;

    explicit JsonParser(std::string_view input);

    /// Parses one complete document; trailing non-whitespace is an error.
    auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;
};

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace exprc::json
