//
// Code Generation API
//
// Syntax-directed translation of a semantically valid program into a
// TypeScript module that builds the described game against the runtime.
// Output is deterministic: the same program and options always produce
// byte-identical text.
//

#pragma once

#include <gdl/ast.hh>
#include <gdl/token.hh>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace gdl::codegen {

// ============================================================================
// Code Generation Exceptions
// ============================================================================

/**
 * Base exception for code generation errors.
 */
class codegen_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Thrown when the generator meets a program that semantic analysis should
 * have rejected (e.g. a Vector2 position without exactly two components).
 */
class invalid_ast_error : public codegen_error {
public:
    explicit invalid_ast_error(const std::string& what_arg)
        : codegen_error("Invalid AST passed to generator: " + what_arg) {}
};

// ============================================================================
// Options and Output
// ============================================================================

struct generator_options {
    bool debug = false;        ///< Emit a source-location comment above every declaration
    bool source_map = false;   ///< Record generated-line to source-position mappings
    bool optimize = false;     ///< Accepted for API compatibility; no effect
};

struct source_map_entry {
    std::size_t generated_line;   ///< 1-based line in the generated module
    source_pos source;            ///< Start of the originating declaration
    std::string symbol;           ///< Generated symbol (class or constant name)
};

struct generated_module {
    std::string code;
    std::vector<source_map_entry> source_map;   // empty unless requested
};

/// Generate the TypeScript module for `program`.
/// Throws invalid_ast_error on input that violates the analyzer's guarantees.
generated_module generate(const ast::program& program, const generator_options& opts = {});

/// TypeScript expression for a GDL value. Identifiers become string
/// literals (they name things symbolically); numbers keep their source
/// spelling.
std::string render_value(const ast::expr& value);

/// TypeScript expression for a spawn position. A named point becomes its
/// quoted name; anything else must be a vector and is built with
/// `new Vector2(x, y)` and the runtime's static Vector2 arithmetic.
/// Throws invalid_ast_error for a position that is not a vector.
std::string render_position(const ast::expr& position);

/// TypeScript type annotation for a GDL value ("number", "string[]", ...).
std::string ts_type_of(const ast::expr& value);

}  // namespace gdl::codegen
