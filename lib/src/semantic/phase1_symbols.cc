//
// Phase 1: Symbol Collection
//
// Builds the entity, behavior and scene tables from the top-level
// declarations. The first declaration of a name wins; later ones are
// reported and left out of the tables.
//

#include <gdl/semantic.hh>
#include <gdl/codegen/ts/ts_string_utils.hh>
#include <map>
#include <type_traits>

namespace gdl::semantic::phases {

namespace {
    // Helper: add error with related location
    void add_error_related(std::vector<diagnostic>& diags,
                           const char* code,
                           const std::string& message,
                           const source_range& range,
                           const source_range& related_range,
                           const std::string& related_msg) {
        auto d = make_error(code, message, range);
        d.related_range = related_range;
        d.related_message = related_msg;
        diags.push_back(std::move(d));
    }

    // Helper: warn when a name would be renamed in generated code
    void check_reserved_name(std::vector<diagnostic>& diags,
                             const std::string& what,
                             const std::string& name,
                             const source_range& range) {
        if (!codegen::is_reserved_ts_identifier(name)) {
            return;
        }
        auto d = make_warning(diag_codes::W_KEYWORD_COLLISION,
                              what + " name '" + name + "' is reserved in TypeScript and will be emitted as '" +
                              codegen::sanitize_ts_identifier(name) + "'",
                              range);
        d.suggestions.push_back(codegen::sanitize_ts_identifier(name));
        diags.push_back(std::move(d));
    }

    template<typename Decl>
    void insert_symbol(std::map<std::string, const Decl*>& table,
                       const Decl& decl,
                       const char* kind,
                       std::vector<diagnostic>& diags) {
        auto [it, inserted] = table.emplace(decl.name, &decl);
        if (!inserted) {
            add_error_related(diags,
                              diag_codes::E_DUPLICATE_DEFINITION,
                              std::string(kind) + " '" + decl.name + "' is already defined",
                              decl.name_range,
                              it->second->name_range,
                              std::string(kind) + " '" + decl.name + "' first declared here");
        }
    }

    struct class_owner {
        const char* kind;
        std::string name;
        source_range range;
    };

    // Entities keep their name, behaviors and scenes get a suffix, so an
    // entity can end up with the same class name as a behavior or scene.
    void check_class_collisions(const ast::program& program,
                                const symbol_table& symbols,
                                std::vector<diagnostic>& diags) {
        std::map<std::string, class_owner> classes;

        auto claim = [&](const std::string& cls, const char* kind, const std::string& name, const source_range& range) {
            auto [it, inserted] = classes.emplace(cls, class_owner{kind, name, range});
            if (!inserted) {
                add_error_related(diags,
                                  diag_codes::E_CLASS_NAME_COLLISION,
                                  std::string(kind) + " '" + name + "' generates class '" + cls +
                                  "', which is already generated for " + it->second.kind + " '" +
                                  it->second.name + "'",
                                  range,
                                  it->second.range,
                                  std::string(it->second.kind) + " '" + it->second.name + "' declared here");
            }
        };

        // Only declarations that made it into the tables; duplicates were
        // already reported as E005
        for (const auto& decl : program.body) {
            std::visit([&](const auto& d) {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, ast::game_decl>) {
                    // No class of its own
                } else if constexpr (std::is_same_v<T, ast::entity_decl>) {
                    if (symbols.find_entity(d.name) == &d) {
                        claim(codegen::entity_class_name(d.name), "Entity", d.name, d.name_range);
                    }
                } else if constexpr (std::is_same_v<T, ast::behavior_decl>) {
                    if (symbols.find_behavior(d.name) == &d) {
                        claim(codegen::behavior_class_name(d.name), "Behavior", d.name, d.name_range);
                    }
                } else if constexpr (std::is_same_v<T, ast::scene_decl>) {
                    if (symbols.find_scene(d.name) == &d) {
                        claim(codegen::scene_class_name(d.name), "Scene", d.name, d.name_range);
                    }
                } else {
                    static_assert(ast::unhandled_node<T>, "declaration kind has no class");
                }
            }, decl);
        }
    }
}

symbol_table collect_symbols(const ast::program& program, std::vector<diagnostic>& diags) {
    symbol_table symbols;

    for (const auto& decl : program.body) {
        std::visit([&](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, ast::game_decl>) {
                if (symbols.game) {
                    add_error_related(diags,
                                      diag_codes::E_DUPLICATE_GAME,
                                      "Game configuration is already defined",
                                      d.range,
                                      symbols.game->range,
                                      "first game configuration is here");
                } else {
                    symbols.game = &d;
                }
            } else if constexpr (std::is_same_v<T, ast::entity_decl>) {
                insert_symbol(symbols.entities, d, "Entity", diags);
                check_reserved_name(diags, "Entity", d.name, d.name_range);
            } else if constexpr (std::is_same_v<T, ast::behavior_decl>) {
                insert_symbol(symbols.behaviors, d, "Behavior", diags);
            } else if constexpr (std::is_same_v<T, ast::scene_decl>) {
                insert_symbol(symbols.scenes, d, "Scene", diags);
                for (const auto& spawn : d.spawns) {
                    if (spawn.name) {
                        check_reserved_name(diags, "Spawn", *spawn.name, spawn.range);
                    }
                }
            } else {
                static_assert(ast::unhandled_node<T>, "declaration kind is not collected");
            }
        }, decl);
    }

    check_class_collisions(program, symbols, diags);

    return symbols;
}

} // namespace gdl::semantic::phases
