//! # JSON Errors
//!
//! Parse errors with source location, reported back to the user when a
//! corpus file is not valid JSON.

#pragma once

#include <cstddef>
#include <string>

namespace exprc::json {

struct JsonError {
    std::string message;
    size_t line = 0;   ///< 1-based, 0 if unknown
    size_t column = 0; ///< 1-based, 0 if unknown
    size_t offset = 0; ///< Byte offset into the input

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// "line X, column Y: message", or just the message without a location.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace exprc::json
