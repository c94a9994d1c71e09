#include "compiler.hh"
#include <gdl/parser.hh>
#include <fstream>
#include <iostream>
#include <sstream>

namespace gdl::driver {

namespace {
    std::string join(const std::vector<std::string>& parts) {
        std::string result;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result += ", ";
            result += parts[i];
        }
        return result;
    }
}

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    try {
        logger_.verbose("Reading: " + options_.input_file.string());
        const std::string source = read_source();
        logger_.debug("Read " + std::to_string(source.size()) + " bytes");

        switch (options_.output_mode) {
            case OutputMode::Validate:
                return run_validation(source);
            case OutputMode::Check:
                return run_check(source);
            case OutputMode::PrintMetadata:
                return print_metadata(source);
            case OutputMode::Compile:
                break;
        }
        return run_compile(source);

    } catch (const std::exception& e) {
        logger_.error(e.what());
        return 1;
    }
}

// ============================================================================
// Modes
// ============================================================================

int Compiler::run_validation(const std::string& source) {
    logger_.verbose("Validating syntax...");

    gdl::compiler pipeline;
    auto result = pipeline.validate(source);
    print_diagnostics(result.errors, result.warnings);

    if (!result.valid) {
        return 1;
    }
    logger_.success("Syntax OK: " + options_.input_file.string());
    return 0;
}

int Compiler::run_check(const std::string& source) {
    logger_.verbose("Parsing...");
    auto parsed = parse_gdl(source);
    logger_.debug("Parsed " + std::to_string(parsed.program.body.size()) + " declarations");
    if (parsed.has_errors()) {
        print_diagnostics(parsed.errors, {});
        return 1;
    }

    logger_.verbose("Running semantic analysis...");
    auto result = semantic::analyze(parsed.program, make_analysis_options());
    logger_.debug("Analysis produced " + std::to_string(result.errors.size()) + " errors, " +
                  std::to_string(result.warnings.size()) + " warnings");
    print_diagnostics(result.errors, result.warnings);

    if (!result.valid) {
        return 1;
    }
    logger_.success("No errors: " + options_.input_file.string());
    return 0;
}

int Compiler::print_metadata(const std::string& source) {
    auto parsed = parse_gdl(source);
    print_diagnostics(parsed.errors, {});

    // Best effort: a partial program still lists what it declares
    const auto meta = extract_metadata(parsed.program);
    std::cout << "entities: " << join(meta.entities) << "\n";
    std::cout << "behaviors: " << join(meta.behaviors) << "\n";
    std::cout << "scenes: " << join(meta.scenes) << "\n";
    std::cout << "assets: " << join(meta.assets) << "\n";

    return parsed.has_errors() ? 1 : 0;
}

int Compiler::run_compile(const std::string& source) {
    if (!options_.to_stdout) {
        logger_.info("Compiling: " + options_.input_file.string());
    }

    compile_options opts;
    opts.debug = options_.debug;
    opts.source_map = options_.source_map;
    opts.optimize = options_.optimize;

    gdl::compiler pipeline;
    auto result = pipeline.compile(source, opts, make_analysis_options());

    logger_.verbose("Pipeline finished in " + std::to_string(result.compilation_time_ms) + " ms");
    if (result.ast) {
        logger_.debug("Program has " + std::to_string(result.ast->body.size()) + " declarations");
    }
    if (result.code) {
        logger_.debug("Generated " + std::to_string(result.code->size()) + " bytes, " +
                      std::to_string(result.source_map.size()) + " source map entries");
    }
    print_diagnostics(result.errors, result.warnings);

    if (!result.success || !result.code) {
        return 1;
    }

    write_output(*result.code);

    if (options_.source_map) {
        print_source_map(result.source_map);
    }

    if (!options_.to_stdout) {
        logger_.success("Generated: " + options_.output_file.string());
    }
    return 0;
}

// ============================================================================
// Utility Methods
// ============================================================================

std::string Compiler::read_source() const {
    std::ifstream ifs(options_.input_file, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open input file: " + options_.input_file.string());
    }

    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad()) {
        throw std::runtime_error("Failed to read input file: " + options_.input_file.string());
    }
    return oss.str();
}

void Compiler::write_output(const std::string& code) {
    if (options_.to_stdout) {
        std::cout << code;
        return;
    }

    logger_.verbose("Writing: " + options_.output_file.string());

    // Create parent directories if needed
    auto parent = options_.output_file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream ofs(options_.output_file);
    if (!ofs) {
        throw std::runtime_error("Failed to open file for writing: " + options_.output_file.string());
    }

    ofs << code;

    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + options_.output_file.string());
    }
}

semantic::analysis_options Compiler::make_analysis_options() const {
    semantic::analysis_options opts;
    opts.warnings_as_errors = options_.warnings_as_errors;
    opts.suppress_warnings = options_.suppress_all_warnings;
    opts.disabled_warnings = options_.disabled_warnings;
    return opts;
}

void Compiler::print_diagnostics(const std::vector<diagnostic>& errors,
                                 const std::vector<diagnostic>& warnings) {
    const std::string file = options_.input_file.string();

    for (const auto& diag : errors) {
        logger_.report(diag, file);
    }
    for (const auto& diag : warnings) {
        logger_.report(diag, file);
    }

    // Summary
    if (!errors.empty()) {
        logger_.error("Total errors: " + std::to_string(errors.size()));
    }
    if (!warnings.empty()) {
        logger_.warning("Total warnings: " + std::to_string(warnings.size()));
    }
}

void Compiler::print_source_map(const std::vector<codegen::source_map_entry>& entries) {
    // Keep stdout clean for the generated module
    std::ostream& os = options_.to_stdout ? std::cerr : std::cout;

    os << "Source map:\n";
    for (const auto& entry : entries) {
        os << "  " << entry.generated_line << " <- "
           << options_.input_file.string() << ":"
           << entry.source.line << ":" << entry.source.column
           << " " << entry.symbol << "\n";
    }
}

}  // namespace gdl::driver
