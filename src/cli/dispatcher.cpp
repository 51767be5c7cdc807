//! # CLI Command Dispatcher
//!
//! ```text
//! exprc_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ compile        → run_compile()
//!   └─ normalize      → run_normalize()
//! ```
//!
//! Logging flags may appear anywhere and are consumed before dispatch.
//!
//! ## Return Codes
//!
//! | Code | Meaning                                          |
//! |------|--------------------------------------------------|
//! | 0    | Success                                          |
//! | 1    | Usage or input error, or a fallback under --strict |
//! | 2    | Internal compiler error                          |

#include "commands/cmd_compile.hpp"
#include "commands/cmd_normalize.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace exprc::cli {

static int compile_usage_error(const std::string& message) {
    std::cerr << "error: " << message << "\n";
    std::cerr << "Usage: exprc compile <corpus.json> -o <module.cpp> [--lookup <file>] "
                 "[--report <file>] [--jobs N] [--no-comments] [--strict]\n";
    return 1;
}

static int dispatch_compile(const std::vector<std::string>& args) {
    CompileOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](const char* flag) -> const std::string* {
            if (i + 1 >= args.size()) {
                compile_usage_error(std::string(flag) + " needs a value");
                return nullptr;
            }
            return &args[++i];
        };

        if (arg == "-o" || arg == "--output") {
            const std::string* v = value("-o");
            if (v == nullptr) {
                return 1;
            }
            options.output_path = *v;
        } else if (arg == "--lookup") {
            const std::string* v = value("--lookup");
            if (v == nullptr) {
                return 1;
            }
            options.lookup_path = *v;
        } else if (arg == "--report") {
            const std::string* v = value("--report");
            if (v == nullptr) {
                return 1;
            }
            options.report_path = *v;
        } else if (arg == "--jobs" || arg == "-j") {
            const std::string* v = value("--jobs");
            if (v == nullptr) {
                return 1;
            }
            auto jobs = parse_jobs(*v);
            if (!jobs) {
                return compile_usage_error("invalid --jobs value '" + *v + "'");
            }
            options.jobs = *jobs;
        } else if (arg.starts_with("--jobs=")) {
            auto jobs = parse_jobs(std::string_view(arg).substr(7));
            if (!jobs) {
                return compile_usage_error("invalid --jobs value '" + arg.substr(7) + "'");
            }
            options.jobs = *jobs;
        } else if (arg == "--no-comments") {
            options.emit_comments = false;
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return compile_usage_error("unknown option '" + arg + "'");
        } else if (options.input_path.empty()) {
            options.input_path = arg;
        } else {
            return compile_usage_error("unexpected argument '" + arg + "'");
        }
    }

    if (options.input_path.empty()) {
        return compile_usage_error("no corpus given");
    }
    if (options.output_path.empty()) {
        return compile_usage_error("no output module given (-o)");
    }
    return run_compile(options);
}

} // namespace exprc::cli

using namespace exprc;

int exprc_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (!log::is_log_option(argv[i])) {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        cli::print_usage();
        return 0;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    if (command == "--help" || command == "-h") {
        cli::print_usage();
        return 0;
    }
    if (command == "--version" || command == "-V") {
        cli::print_version();
        return 0;
    }

    try {
        if (command == "compile") {
            return cli::dispatch_compile(args);
        }
        if (command == "normalize") {
            if (args.size() != 1) {
                std::cerr << "Usage: exprc normalize <corpus.json>\n";
                return 1;
            }
            return cli::run_normalize(args[0]);
        }
    } catch (const InternalCompilerError& e) {
        EXPRC_LOG_FATAL("cli", "internal compiler error: " << e.what());
        std::cerr << "internal compiler error: " << e.what() << "\n";
        log::Logger::instance().flush();
        return 2;
    }

    std::cerr << "error: unknown command '" << command << "'\n";
    std::cerr << "Run 'exprc --help' for usage.\n";
    return 1;
}
