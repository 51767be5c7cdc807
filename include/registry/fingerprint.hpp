//! # Expression Fingerprinting
//!
//! 128-bit fingerprints over the serialized normalized tree of an expression.
//! The dedup key of a function is the fingerprint of its context and its
//! tree; the function name is derived from the high 64 bits.
//!
//! Uses CRC32C (Castagnoli) from `common/crc32c.hpp`.

#pragma once

#include "ast/expression_context.hpp"

#include <cstdint>
#include <string>

namespace exprc::registry {

/// 128-bit fingerprint.
struct Fingerprint {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const Fingerprint& other) const = default;
    bool operator!=(const Fingerprint& other) const = default;

    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character hex string representation.
    [[nodiscard]] std::string to_hex() const;
};

/// Compute a fingerprint from raw bytes.
[[nodiscard]] Fingerprint fingerprint_bytes(const void* data, size_t len);

/// Compute a fingerprint from a string.
[[nodiscard]] Fingerprint fingerprint_string(const std::string& str);

/// Combine two fingerprints into one.
[[nodiscard]] Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b);

/// Dedup key of an expression: its context and serialized tree.
[[nodiscard]] Fingerprint spec_fingerprint(ast::ExpressionContext context,
                                           const std::string& serialized_tree);

/// `value_conv_`, `print_conv_` or `condition_` followed by 16 hex digits.
[[nodiscard]] std::string function_name(ast::ExpressionContext context, Fingerprint fingerprint);

} // namespace exprc::registry
