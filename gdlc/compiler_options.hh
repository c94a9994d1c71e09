#pragma once

#include "logger.hh"
#include <filesystem>
#include <set>
#include <string>

namespace gdl::driver {

/// What the driver does with the input
enum class OutputMode {
    Compile,        // Generate TypeScript (default)
    Validate,       // Lexer + parser only (--validate)
    Check,          // Full analysis, no code generation (--check)
    PrintMetadata   // Print declared names and assets (--print-metadata)
};

/// Compiler options (driver configuration only)
struct CompilerOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::filesystem::path input_file;
    std::filesystem::path output_file;               // -o; default <input stem>.ts
    bool to_stdout = false;                          // --stdout

    // ========================================================================
    // Generator Options
    // ========================================================================

    bool debug = false;                              // -g, --debug
    bool source_map = false;                         // --source-map
    bool optimize = false;                           // -O, --optimize

    // ========================================================================
    // Semantic Analysis Options
    // ========================================================================

    bool warnings_as_errors = false;                 // -Werror
    bool suppress_all_warnings = false;              // -w
    std::set<std::string> disabled_warnings;         // -Wno-W001

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    int verbose = 0;                                 // -v, --verbose (-vv for debug traces)
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color=<auto|always|never>

    OutputMode output_mode = OutputMode::Compile;
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace gdl::driver
