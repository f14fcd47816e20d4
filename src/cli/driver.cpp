//! # CLI Driver Implementation
//!
//! ```text
//! jsonast_main()
//!   ├─ parse_log_options() → Logger::init()
//!   ├─ parse_args()        → usage errors exit 2
//!   └─ run_check()
//!        ├─ read_input()   → I/O errors exit 2
//!        └─ check_text()
//!             ├─ parse_json()    → syntax errors exit 1
//!             ├─ --dump  → traverse()
//!             └─ --value → ast_to_value()
//! ```

#include "cli/driver.hpp"

#include "jsonast/json/json_traverse.hpp"
#include "jsonast/log/log.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>

namespace jsonast::cli {

namespace {

auto usage_error(std::string message) -> Result<CheckOptions, std::string> {
    return Result<CheckOptions, std::string>(std::in_place_index<1>, std::move(message));
}

} // namespace

// ============================================================================
// Input
// ============================================================================

auto read_input(const std::string& path) -> Result<std::string, InputError> {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return InputError{"cannot open " + path};
    }
    buffer << file.rdbuf();
    if (file.bad()) {
        return InputError{"cannot read " + path};
    }
    return buffer.str();
}

// ============================================================================
// Arguments
// ============================================================================

auto parse_args(const std::vector<std::string>& args) -> Result<CheckOptions, std::string> {
    CheckOptions options;
    bool has_input = false;

    for (const auto& arg : args) {
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.version = true;
        } else if (arg == "--dump") {
            options.dump = true;
        } else if (arg == "--value") {
            options.value = true;
        } else if (arg.starts_with("--max-depth=")) {
            std::string_view digits = std::string_view(arg).substr(12);
            size_t depth = 0;
            auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), depth);
            if (digits.empty() || ec != std::errc() || end != digits.data() + digits.size()) {
                return usage_error("invalid --max-depth value: " + std::string(digits));
            }
            options.parse.max_depth = depth;
        } else if (arg != "-" && arg.starts_with("-")) {
            return usage_error("unknown option: " + arg);
        } else if (has_input) {
            return usage_error("only one input may be given");
        } else {
            options.input = arg;
            has_input = true;
        }
    }

    if (!has_input && !options.help && !options.version) {
        return usage_error("no input file");
    }
    return options;
}

void print_usage(std::ostream& out) {
    out << "jsonast " << VERSION << "\n\n";
    out << "Usage: jsonast [options] <file|->\n\n";
    out << "Options:\n";
    out << "  --dump             Print every node with its JSON Pointer and span\n";
    out << "  --value            Summarize the converted value\n";
    out << "  --max-depth=N      Reject nesting deeper than N (0 = unlimited)\n";
    out << "  --help, -h         Show this help\n";
    out << "  --version, -V      Show version\n";
    out << "\nLogging:\n";
    out << "  -v, -vv, -vvv      Info, debug or trace output\n";
    out << "  -q, --quiet        Errors only\n";
    out << "  --log-level=LEVEL  trace, debug, info, warn, error, fatal, off\n";
    out << "  --log-filter=SPEC  Per-module levels, e.g. json=trace,*=warn\n";
    out << "  --log-file=PATH    Also write log records to PATH\n";
    out << "  --log-format=FMT   text or json\n";
}

// ============================================================================
// Checking
// ============================================================================

auto describe_value(const json::JsonValue& value) -> std::string {
    auto count = [](size_t n, const char* noun) {
        return std::to_string(n) + " " + noun + (n == 1 ? "" : "s");
    };

    if (value.is_object()) {
        return "object (" + count(value.size(), "member") + ")";
    }
    if (value.is_array()) {
        return "array (" + count(value.size(), "element") + ")";
    }
    if (value.is_string()) {
        return "string (" + count(value.as_string().size(), "byte") + ")";
    }
    if (value.is_number()) {
        return "number";
    }
    if (value.is_bool()) {
        return "boolean";
    }
    return "null";
}

auto check_text(std::string_view name, std::string_view text, const CheckOptions& options,
                std::ostream& out, std::ostream& err) -> int {
    auto result = json::parse_json(text, options.parse);
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        JSONAST_LOG_INFO("cli", name << " rejected (" << json::error_kind_name(error.kind)
                                     << ")");
        err << name << ":" << error.line << ":" << error.column << ": " << error.message << "\n";
        return EXIT_SYNTAX;
    }

    const json::AstNode& root = unwrap(result);
    JSONAST_LOG_INFO("cli", name << " accepted, root " << json::kind_name(root.kind()));
    out << name << ": ok\n";

    if (options.dump) {
        json::traverse(root, [&out](const json::AstNodeRef& ref, const json::AstPath& path) {
            out << "\"" << json::to_json_pointer(path) << "\" " << json::kind_name(ref.kind())
                << " [" << ref.start() << ", " << ref.end() << ")\n";
            return true;
        });
    }

    if (options.value) {
        out << "value: " << describe_value(json::ast_to_value(root)) << "\n";
    }
    return EXIT_OK;
}

auto run_check(const CheckOptions& options, std::ostream& out, std::ostream& err) -> int {
    std::string name = options.input == "-" ? "<stdin>" : options.input;

    auto input = read_input(options.input);
    if (is_err(input)) {
        const auto& message = unwrap_err(input).message;
        JSONAST_LOG_ERROR("cli", message);
        err << "jsonast: " << message << "\n";
        return EXIT_USAGE;
    }

    JSONAST_LOG_DEBUG("cli", "read " << unwrap(input).size() << " bytes from " << name);
    return check_text(name, unwrap(input), options, out, err);
}

} // namespace jsonast::cli

int jsonast_main(int argc, char* argv[]) {
    using namespace jsonast;

    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = cli::parse_args(args);
    if (is_err(parsed)) {
        std::cerr << "jsonast: " << unwrap_err(parsed) << "\n\n";
        cli::print_usage(std::cerr);
        return cli::EXIT_USAGE;
    }

    const auto& options = unwrap(parsed);
    if (options.help) {
        cli::print_usage(std::cout);
        return cli::EXIT_OK;
    }
    if (options.version) {
        std::cout << "jsonast " << VERSION << "\n";
        return cli::EXIT_OK;
    }

    int code = cli::run_check(options, std::cout, std::cerr);
    log::Logger::instance().flush();
    return code;
}
