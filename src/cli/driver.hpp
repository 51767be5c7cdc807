//! # Compiler Driver Interface
//!
//! `exprc_main()` dispatches to the command handler named by argv[1].

#pragma once

// Main compiler driver entry point
int exprc_main(int argc, char* argv[]);
