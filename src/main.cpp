//! # jsonast Entry Point
//!
//! The `main()` function only delegates to the CLI driver
//! (`cli/driver.hpp`), which parses arguments, sets up logging and runs the
//! check.

#include "cli/driver.hpp"

/// Main entry point for the `jsonast` tool.
///
/// @param argc Argument count from the operating system
/// @param argv Argument vector (null-terminated strings)
/// @return Exit code: 0 valid, 1 syntax error, 2 usage or I/O error
int main(int argc, char* argv[]) {
    return jsonast_main(argc, argv);
}
