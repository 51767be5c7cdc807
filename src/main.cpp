//! # exprc Entry Point
//!
//! `main()` delegates to the CLI driver (`cli/driver.hpp`), which parses the
//! command line, runs the command and maps failures to exit codes.
//!
//! ```bash
//! exprc compile corpus.json -o generated.cpp --lookup lookup.json --report report.json
//! exprc normalize corpus.json
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return exprc_main(argc, argv);
}
