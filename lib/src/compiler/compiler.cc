//
// Compilation pipeline
//

#include <gdl/compiler.hh>
#include <gdl/parser.hh>
#include <chrono>
#include <exception>
#include <set>
#include <type_traits>

namespace gdl {

namespace {
    double elapsed_ms(std::chrono::steady_clock::time_point start) {
        const auto d = std::chrono::steady_clock::now() - start;
        return std::chrono::duration<double, std::milli>(d).count();
    }

    diagnostic unexpected(const std::string& prefix, const std::exception& e) {
        return make_error(diag_codes::UNEXPECTED_ERROR, prefix + e.what(), std::nullopt);
    }
}

compilation_metadata extract_metadata(const ast::program& program) {
    compilation_metadata meta;
    std::set<std::string> seen_assets;

    for (const auto& decl : program.body) {
        std::visit([&](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, ast::game_decl>) {
                // Game settings are not listed
            } else if constexpr (std::is_same_v<T, ast::entity_decl>) {
                meta.entities.push_back(d.name);
                if (const auto* sprite = ast::find_property(d.properties, "sprite")) {
                    const auto* path = std::get_if<ast::string_literal>(&sprite->value.node);
                    if (path && seen_assets.insert(path->value).second) {
                        meta.assets.push_back(path->value);
                    }
                }
            } else if constexpr (std::is_same_v<T, ast::behavior_decl>) {
                meta.behaviors.push_back(d.name);
            } else if constexpr (std::is_same_v<T, ast::scene_decl>) {
                meta.scenes.push_back(d.name);
            } else {
                static_assert(ast::unhandled_node<T>, "declaration kind has no metadata");
            }
        }, decl);
    }
    return meta;
}

compilation_result compiler::compile(std::string_view source,
                                     const compile_options& opts,
                                     const semantic::analysis_options& analysis) const {
    const auto start = std::chrono::steady_clock::now();
    compilation_result result;
    parse_output parsed;
    bool have_program = false;

    try {
        // Stage 1+2: tokens and AST
        parsed = parse_gdl(source);
        have_program = true;
        result.metadata = extract_metadata(parsed.program);

        if (parsed.has_errors()) {
            result.errors = std::move(parsed.errors);
            result.ast = std::move(parsed.program);
            result.compilation_time_ms = elapsed_ms(start);
            return result;
        }

        // Stage 3: semantic analysis
        auto verdict = semantic::analyze(parsed.program, analysis);
        result.errors = std::move(verdict.errors);
        result.warnings = std::move(verdict.warnings);

        if (!verdict.valid) {
            result.ast = std::move(parsed.program);
            result.compilation_time_ms = elapsed_ms(start);
            return result;
        }

        // Stage 4: TypeScript
        codegen::generator_options gen_opts;
        gen_opts.debug = opts.debug;
        gen_opts.source_map = opts.source_map;
        gen_opts.optimize = opts.optimize;

        auto module = codegen::generate(parsed.program, gen_opts);
        result.code = std::move(module.code);
        result.source_map = std::move(module.source_map);
        result.ast = std::move(parsed.program);
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.code.reset();
        result.source_map.clear();
        result.errors.push_back(unexpected("Compilation error: ", e));
        if (have_program) {
            result.ast = std::move(parsed.program);
        }
    }

    result.compilation_time_ms = elapsed_ms(start);
    return result;
}

validation_result compiler::validate(std::string_view source) const {
    validation_result result;

    try {
        auto parsed = parse_gdl(source);
        result.errors = std::move(parsed.errors);
    } catch (const std::exception& e) {
        result.errors.push_back(unexpected("Validation error: ", e));
    }

    result.valid = result.errors.empty();
    return result;
}

std::future<compilation_result> compiler::compile_async(std::string source,
                                                        compile_options opts,
                                                        semantic::analysis_options analysis) const {
    return std::async(std::launch::deferred,
                      [self = *this, source = std::move(source), opts, analysis = std::move(analysis)] {
                          return self.compile(source, opts, analysis);
                      });
}

} // namespace gdl
