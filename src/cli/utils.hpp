//! # CLI Utilities Interface
//!
//! | Function          | Description                          |
//! |-------------------|--------------------------------------|
//! | `print_usage()`   | Print CLI help text                  |
//! | `print_version()` | Print compiler version               |
//! | `parse_jobs()`    | Validate a `--jobs` value            |

#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace exprc::cli {

// Help text
void print_usage();
void print_version();

// Argument helpers
std::optional<size_t> parse_jobs(std::string_view text);

} // namespace exprc::cli
