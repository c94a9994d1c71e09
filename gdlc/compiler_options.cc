#include "compiler_options.hh"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace gdl::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

static void set_mode(CompilerOptions& opts, OutputMode mode, const char* flag) {
    if (opts.output_mode != OutputMode::Compile && opts.output_mode != mode) {
        throw std::runtime_error(std::string("Option ") + flag +
                                 " cannot be combined with another mode option");
    }
    opts.output_mode = mode;
}

static ColorMode parse_color_mode(const std::string& value) {
    if (value == "auto") return ColorMode::Auto;
    if (value == "always") return ColorMode::Always;
    if (value == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid value for --color: '" + value +
                             "' (expected auto, always or never)");
}

// ============================================================================
// Main Parser
// ============================================================================

CompilerOptions parse_command_line(int argc, char** argv) {
    CompilerOptions opts;
    bool have_input = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose += 1;
            continue;
        }

        if (std::strcmp(arg, "-vv") == 0) {
            opts.verbose += 2;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color_mode(get_option_value(arg, "--color="));
            continue;
        }

        // Modes
        if (std::strcmp(arg, "--validate") == 0) {
            set_mode(opts, OutputMode::Validate, arg);
            continue;
        }

        if (std::strcmp(arg, "--check") == 0) {
            set_mode(opts, OutputMode::Check, arg);
            continue;
        }

        if (std::strcmp(arg, "--print-metadata") == 0) {
            set_mode(opts, OutputMode::PrintMetadata, arg);
            continue;
        }

        // Output
        if (std::strcmp(arg, "--stdout") == 0) {
            opts.to_stdout = true;
            continue;
        }

        if (starts_with(arg, "-o")) {
            std::string value = get_option_value(arg, "-o");
            if (value.empty() && i + 1 < argc) {
                value = argv[++i];
            }
            if (value.empty()) {
                throw std::runtime_error("Option -o requires argument");
            }
            opts.output_file = value;
            continue;
        }

        // Generator options
        if (std::strcmp(arg, "-g") == 0 || std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
            continue;
        }

        if (std::strcmp(arg, "--source-map") == 0) {
            opts.source_map = true;
            continue;
        }

        if (std::strcmp(arg, "-O") == 0 || std::strcmp(arg, "--optimize") == 0) {
            opts.optimize = true;
            continue;
        }

        // Warning options
        if (std::strcmp(arg, "-Werror") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }

        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        if (starts_with(arg, "-Wno-")) {
            std::string warning = get_option_value(arg, "-Wno-");
            if (warning.empty()) {
                throw std::runtime_error("Option -Wno- requires a warning code");
            }
            opts.disabled_warnings.insert(warning);
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file
        if (have_input) {
            throw std::runtime_error(std::string("Multiple input files specified: ") + arg);
        }
        opts.input_file = arg;
        have_input = true;
    }

    // Validation
    if (!have_input) {
        throw std::runtime_error("No input file specified");
    }

    if (opts.quiet && opts.verbose > 0) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (opts.to_stdout && !opts.output_file.empty()) {
        throw std::runtime_error("Cannot specify both -o and --stdout");
    }

    if (opts.output_file.empty()) {
        opts.output_file = opts.input_file.stem();
        opts.output_file += ".ts";
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <input.gdl>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <file>               Output file (default: <input stem>.ts)\n";
    std::cout << "  --stdout                Write generated code to standard output\n";
    std::cout << "\n";

    std::cout << "Modes:\n";
    std::cout << "  --validate              Syntax check only\n";
    std::cout << "  --check                 Full analysis without code generation\n";
    std::cout << "  --print-metadata        Print declared entities, behaviors, scenes and assets\n";
    std::cout << "\n";

    std::cout << "Code Generation:\n";
    std::cout << "  -g, --debug             Emit source-location comments\n";
    std::cout << "  --source-map            Print the source map after compiling\n";
    std::cout << "  -O, --optimize          Accepted for compatibility, no effect\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -vv                     Verbose output with pipeline debug traces\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color=<when>          Colorize output: auto (default), always, never\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat all warnings as errors\n";
    std::cout << "  -Wno-<code>             Disable specific warning\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " platformer.gdl\n";
    std::cout << "  " << program_name << " -o build/game.ts platformer.gdl\n";
    std::cout << "  " << program_name << " --check -Wno-W001 platformer.gdl\n";
}

void print_version() {
    std::cout << "GDL Compiler v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace gdl::driver
