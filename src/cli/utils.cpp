//! # CLI Utilities

#include "utils.hpp"

#include "common.hpp"

#include <charconv>
#include <iostream>

namespace exprc::cli {

void print_usage() {
    std::cout << "exprc - tag-table expression compiler\n\n";
    std::cout << "Usage: exprc <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  compile <corpus.json> -o <module.cpp>   Compile a corpus to a C++ module\n";
    std::cout << "  normalize <corpus.json>                 Print normalized trees\n\n";
    std::cout << "Compile options:\n";
    std::cout << "  -o, --output <file>   Generated C++ module (required)\n";
    std::cout << "  --lookup <file>       Write the call-site lookup table as JSON\n";
    std::cout << "  --report <file>       Write the coverage report as JSON\n";
    std::cout << "  --jobs <n>, -j <n>    Worker threads (0 = hardware concurrency)\n";
    std::cout << "  --no-comments         Omit doc comments from generated functions\n";
    std::cout << "  --strict              Exit with status 1 if any expression fell back\n\n";
    std::cout << "Logging:\n";
    std::cout << "  -v, -vv, -vvv         Info, Debug, Trace\n";
    std::cout << "  -q, --quiet           Errors only\n";
    std::cout << "  --log-level=<level>   trace|debug|info|warn|error|fatal|off\n";
    std::cout << "  --log-filter=<spec>   e.g. normalize=trace,*=warn\n";
    std::cout << "  --log-file=<path>     Also write logs to a file\n";
    std::cout << "  --log-format=<fmt>    text|json\n";
    std::cout << "  EXPRC_LOG             Level or filter when no flag is given\n\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -V, --version         Show version\n";
}

void print_version() {
    std::cout << "exprc " << VERSION << "\n";
}

std::optional<size_t> parse_jobs(std::string_view text) {
    size_t jobs = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), jobs);
    if (ec != std::errc{} || ptr != text.data() + text.size() || jobs > 1024) {
        return std::nullopt;
    }
    return jobs;
}

} // namespace exprc::cli
