//! # Normalize Command Interface
//!
//! `exprc normalize` prints the normalized tree of every corpus record, or the
//! reason it could not be loaded or lowered. Used to debug the passes.

#pragma once
#include <string>

namespace exprc::cli {

int run_normalize(const std::string& path);

} // namespace exprc::cli
