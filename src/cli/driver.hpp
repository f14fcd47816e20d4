//! # Command-Line Driver
//!
//! `jsonast_main()` checks one JSON document and reports the result.
//!
//! ## Usage
//!
//! ```bash
//! jsonast config.json                 # config.json: ok
//! jsonast --dump config.json          # one line per node
//! jsonast --value -                   # read stdin, summarize the value
//! jsonast --max-depth=64 -vv data.json
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Document is valid |
//! | 1 | Syntax error |
//! | 2 | Usage or I/O error |

#pragma once

#include "jsonast/common.hpp"
#include "jsonast/json/json_parser.hpp"
#include "jsonast/json/json_value.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace jsonast::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_SYNTAX = 1;
constexpr int EXIT_USAGE = 2;

/// Options collected from the command line, logging flags excluded.
struct CheckOptions {
    bool dump = false;
    bool value = false;
    bool help = false;
    bool version = false;
    json::ParseOptions parse;

    /// File path, or `-` for stdin.
    std::string input;
};

/// Parses driver arguments (without the program name).
///
/// Logging options are skipped; they are handled by `log::parse_log_options`.
/// Returns a usage message on unknown options, a bad `--max-depth` or a
/// missing input.
[[nodiscard]] auto parse_args(const std::vector<std::string>& args)
    -> Result<CheckOptions, std::string>;

/// Failure to read the input file or stdin.
struct InputError {
    std::string message;
};

/// Reads a whole file, or stdin for `-`, as raw bytes.
[[nodiscard]] auto read_input(const std::string& path) -> Result<std::string, InputError>;

/// Summarizes a value by kind and size, e.g. `object (2 members)`.
[[nodiscard]] auto describe_value(const json::JsonValue& value) -> std::string;

/// Checks `text` and writes the report for `name`.
///
/// # Returns
///
/// `EXIT_OK` or `EXIT_SYNTAX`.
auto check_text(std::string_view name, std::string_view text, const CheckOptions& options,
                std::ostream& out, std::ostream& err) -> int;

/// Reads `options.input` and checks it.
auto run_check(const CheckOptions& options, std::ostream& out, std::ostream& err) -> int;

void print_usage(std::ostream& out);

} // namespace jsonast::cli

/// Driver entry point; returns the process exit code.
int jsonast_main(int argc, char* argv[]);
