//
// Semantic Analysis for GDL
//
// Three passes over the top-level declarations of a parsed program. The
// analyzer never mutates the AST and never throws; every problem becomes a
// diagnostic attached to the offending source range.
//
// ANALYSIS PHASES:
//   1. Symbol Collection     - Entity, behavior and scene tables, duplicates,
//                              target-language name collisions
//   2. Reference Validation  - behaviors lists, spawn types, defaultScene,
//                              unused behaviors, duplicate spawn names
//   3. Property Schemas      - physics/scale/size/pixelArt/behaviors shape
//
// USAGE EXAMPLE:
//   auto parsed = gdl::parse_gdl(source);
//
//   semantic::analysis_options opts;
//   opts.disabled_warnings = {"W001"};
//
//   auto result = semantic::analyze(parsed.program, opts);
//   if (!result.valid) {
//       result.print_diagnostics(std::cerr, "level.gdl");
//   }
//

#pragma once

#include <gdl/ast.hh>
#include <gdl/diagnostic.hh>
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gdl::semantic {

// ============================================================================
// Symbol Tables
// ============================================================================

/// Declarations of one program, keyed by name. Pointers refer into the
/// analyzed ast::program and are valid only while it lives.
struct symbol_table {
    const ast::game_decl* game = nullptr;
    std::map<std::string, const ast::entity_decl*> entities;
    std::map<std::string, const ast::behavior_decl*> behaviors;
    std::map<std::string, const ast::scene_decl*> scenes;

    const ast::entity_decl* find_entity(std::string_view name) const;
    const ast::behavior_decl* find_behavior(std::string_view name) const;
    const ast::scene_decl* find_scene(std::string_view name) const;
};

// ============================================================================
// Options and Result
// ============================================================================

struct analysis_options {
    bool warnings_as_errors = false;           // -Werror
    bool suppress_warnings = false;            // -w
    std::set<std::string> disabled_warnings;   // -Wno-W001
};

struct analysis_result {
    bool valid = true;                  ///< errors.empty()
    std::vector<diagnostic> errors;
    std::vector<diagnostic> warnings;

    [[nodiscard]] bool has_errors() const { return !errors.empty(); }
    [[nodiscard]] bool has_warnings() const { return !warnings.empty(); }

    /// Print every diagnostic followed by an "N errors, M warnings generated." summary.
    void print_diagnostics(std::ostream& os, const std::string& file = "<input>") const;
};

/// Run all phases. Pure function of its input: symbol tables are rebuilt
/// on every call.
analysis_result analyze(const ast::program& program, const analysis_options& opts = {});

// ============================================================================
// Phases (exposed for testing)
// ============================================================================

namespace phases {
    /// Phase 1: build the symbol tables; report duplicate declarations
    /// and declaration names that would collide in generated code.
    symbol_table collect_symbols(const ast::program& program,
                                 std::vector<diagnostic>& diags);

    /// Phase 2: check that every referenced behavior, entity type and
    /// default scene is declared.
    void validate_references(const ast::program& program,
                             const symbol_table& symbols,
                             std::vector<diagnostic>& diags);

    /// Phase 3: check known properties against their fixed schema.
    void check_property_schemas(const ast::program& program,
                                std::vector<diagnostic>& diags);
}

// ============================================================================
// Suggestions
// ============================================================================

/// Levenshtein distance between two names.
std::size_t edit_distance(std::string_view a, std::string_view b);

/// Candidates within edit distance 2 of `name`, closest first.
std::vector<std::string> similar_names(std::string_view name,
                                       const std::vector<std::string>& candidates);

} // namespace gdl::semantic
