#pragma once

#include "compiler_options.hh"
#include "logger.hh"
#include <gdl/compiler.hh>
#include <gdl/semantic.hh>
#include <string>
#include <vector>

namespace gdl::driver {

/// Main compiler driver
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Run the selected mode on the input file
    /// Returns 0 on success, non-zero on error
    int compile();

private:
    // ========================================================================
    // Modes
    // ========================================================================

    /// --validate: lexer and parser only
    int run_validation(const std::string& source);

    /// --check: parse and analyze, no code generation
    int run_check(const std::string& source);

    /// --print-metadata: declared names and assets
    int print_metadata(const std::string& source);

    /// Default: full pipeline, write the TypeScript module
    int run_compile(const std::string& source);

    // ========================================================================
    // Utility Methods
    // ========================================================================

    /// Read the whole input file
    std::string read_source() const;

    /// Write generated code to the output file or stdout
    void write_output(const std::string& code);

    /// Analysis options from -Werror, -w and -Wno-<code>
    semantic::analysis_options make_analysis_options() const;

    /// Print diagnostics and error/warning totals
    void print_diagnostics(const std::vector<diagnostic>& errors,
                           const std::vector<diagnostic>& warnings);

    void print_source_map(const std::vector<codegen::source_map_entry>& entries);

    // ========================================================================
    // State
    // ========================================================================

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace gdl::driver
