//
// Main semantic analysis pipeline
//

#include <gdl/semantic.hh>

namespace gdl::semantic {
    analysis_result analyze(const ast::program& program, const analysis_options& opts) {
        analysis_result result;
        std::vector <diagnostic> diagnostics;

        // Phase 1: Symbol collection (with keyword and class name checks)
        symbol_table symbols = phases::collect_symbols(program, diagnostics);

        // Phase 2: Reference validation
        phases::validate_references(program, symbols, diagnostics);

        // Phase 3: Property schemas
        phases::check_property_schemas(program, diagnostics);

        // Split by level, dropping disabled warnings
        for (auto& diag : diagnostics) {
            if (diag.level == diagnostic_level::error) {
                result.errors.push_back(std::move(diag));
                continue;
            }

            if (opts.suppress_warnings || opts.disabled_warnings.contains(diag.code)) {
                continue;
            }

            // Treat warnings as errors if requested
            if (opts.warnings_as_errors) {
                diag.level = diagnostic_level::error;
                result.errors.push_back(std::move(diag));
            } else {
                result.warnings.push_back(std::move(diag));
            }
        }

        result.valid = result.errors.empty();
        return result;
    }
} // namespace gdl::semantic
