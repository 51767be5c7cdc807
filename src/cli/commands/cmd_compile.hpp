//! # Compile Command Interface
//!
//! `exprc compile` turns a corpus into a generated C++ module, an optional
//! lookup table and an optional coverage report.

#pragma once
#include <cstddef>
#include <string>

namespace exprc::cli {

struct CompileOptions {
    std::string input_path;
    std::string output_path;
    std::string lookup_path; ///< Empty = not written
    std::string report_path; ///< Empty = not written
    size_t jobs = 0;         ///< 0 = hardware concurrency
    bool emit_comments = true;
    bool strict = false; ///< Any fallback makes the run fail
};

/// 0 on success, 1 on input/output errors or a strict-mode fallback.
/// Internal compiler errors propagate to the dispatcher.
int run_compile(const CompileOptions& options);

} // namespace exprc::cli
