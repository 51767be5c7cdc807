//! # Normalize Command
//!
//! Output, one block per record:
//!
//! ```text
//! [ValueTransform] $val * 25
//!   (doc (stmt (binop "*" (sym "$val") (num "25" "25"))))
//! ```
//!
//! A record whose tree fails to lower gets an extra `unsupported:` line.

#include "cmd_normalize.hpp"

#include "ast/node_loader.hpp"
#include "ast/normalized.hpp"
#include "driver/corpus.hpp"
#include "log/log.hpp"
#include "normalizer/normalizer.hpp"

#include <iostream>

namespace exprc::cli {

int run_normalize(const std::string& path) {
    auto corpus = driver::load_corpus_file(path);
    if (is_err(corpus)) {
        EXPRC_LOG_ERROR("cli", unwrap_err(corpus).message);
        std::cerr << "error: " << unwrap_err(corpus).message << "\n";
        return 1;
    }

    auto normalizer = normalizer::Normalizer::standard();
    for (const auto& record : unwrap(corpus).records) {
        std::cout << "[" << ast::context_name(record.context) << "] " << record.original_text
                  << "\n";

        auto loaded = ast::load_node(record.parsed_ast);
        if (is_err(loaded)) {
            std::cout << "  parse error: " << unwrap_err(loaded).message << "\n";
            continue;
        }
        ast::Node normalized = normalizer.normalize(unwrap(loaded));
        std::cout << "  " << ast::to_sexpr(normalized) << "\n";

        auto lowered = ast::lower(normalized);
        if (is_err(lowered)) {
            std::cout << "  unsupported: " << unwrap_err(lowered).message << "\n";
        }
    }
    return 0;
}

} // namespace exprc::cli
