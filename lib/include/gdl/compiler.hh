//
// GDL Compilation Pipeline
//
// source text -> lexer -> parser -> semantic analysis -> TypeScript
//
// The pipeline never throws. Syntax and semantic problems come back as
// diagnostics; an exception escaping any stage is reported as a single
// UNEXPECTED_ERROR diagnostic.
//
// USAGE EXAMPLE:
//   gdl::compiler c;
//   auto result = c.compile(source, {.debug = true});
//   if (result.success) {
//       write_file("game.ts", *result.code);
//   }
//

#pragma once

#include <gdl/ast.hh>
#include <gdl/codegen.hh>
#include <gdl/diagnostic.hh>
#include <gdl/semantic.hh>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gdl {

struct compile_options {
    bool optimize = false;     ///< Accepted, no effect
    bool source_map = false;   ///< Fill compilation_result::source_map
    bool debug = false;        ///< Source-location comments in generated code
};

/// Names declared by a program, in declaration order.
struct compilation_metadata {
    std::vector<std::string> entities;
    std::vector<std::string> behaviors;
    std::vector<std::string> scenes;
    std::vector<std::string> assets;   ///< Distinct entity sprite paths
};

struct compilation_result {
    bool success = false;
    std::optional<std::string> code;
    std::optional<ast::program> ast;
    std::vector<diagnostic> errors;
    std::vector<diagnostic> warnings;
    std::optional<compilation_metadata> metadata;
    std::vector<codegen::source_map_entry> source_map;
    double compilation_time_ms = 0.0;
};

struct validation_result {
    bool valid = false;
    std::vector<diagnostic> errors;
    std::vector<diagnostic> warnings;
};

/// Stateless pipeline driver. Every call builds its own lexer, parser and
/// analyzer, so one instance may be shared between threads.
class compiler {
public:
    compilation_result compile(std::string_view source,
                               const compile_options& opts = {},
                               const semantic::analysis_options& analysis = {}) const;

    /// Lexer and parser only.
    validation_result validate(std::string_view source) const;

    /// Deferred compile; runs on the thread that first calls get().
    /// `source` is copied.
    std::future<compilation_result> compile_async(std::string source,
                                                  compile_options opts = {},
                                                  semantic::analysis_options analysis = {}) const;
};

/// Metadata of a parsed program.
compilation_metadata extract_metadata(const ast::program& program);

} // namespace gdl
