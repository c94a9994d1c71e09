//
// Phase 2: Reference Validation
//
// Resolves every by-name reference against the symbol tables:
//   entity behaviors list -> behavior table
//   scene spawn type      -> entity table
//   game defaultScene     -> scene table
//

#include <gdl/semantic.hh>
#include <gdl/codegen/ts/ts_string_utils.hh>
#include <set>
#include <type_traits>

namespace gdl::semantic::phases {

namespace {
    template<typename Decl>
    std::vector<std::string> names_of(const std::map<std::string, const Decl*>& table) {
        std::vector<std::string> names;
        names.reserve(table.size());
        for (const auto& [name, decl] : table) {
            names.push_back(name);
        }
        return names;
    }

    // Helper: add undefined-name error with did-you-mean suggestions
    void add_undefined(std::vector<diagnostic>& diags,
                       const char* code,
                       const std::string& message,
                       const source_range& range,
                       const std::string& name,
                       const std::vector<std::string>& candidates) {
        auto d = make_error(code, message, range);
        d.suggestions = similar_names(name, candidates);
        diags.push_back(std::move(d));
    }

    void check_entity(const ast::entity_decl& entity,
                      const symbol_table& symbols,
                      std::vector<diagnostic>& diags) {
        if (const auto* prop = ast::find_property(entity.properties, "behaviors")) {
            if (const auto* arr = std::get_if<ast::array_literal>(&prop->value.node)) {
                for (const auto& element : arr->elements) {
                    if (!std::holds_alternative<ast::identifier>(element.node)) {
                        diags.push_back(make_warning(
                            diag_codes::W_IGNORED_BEHAVIOR_REF,
                            std::string("Ignoring ") + ast::kind_name(element) +
                            " in behaviors list of entity '" + entity.name + "'; expected a behavior name",
                            ast::range_of(element)));
                    }
                }
            }
        }

        for (const auto& behavior : entity.behaviors) {
            if (!symbols.find_behavior(behavior.name)) {
                add_undefined(diags,
                              diag_codes::E_UNDEFINED_BEHAVIOR,
                              "Behavior '" + behavior.name + "' is not defined",
                              behavior.range,
                              behavior.name,
                              names_of(symbols.behaviors));
            }
        }
    }

    void check_scene(const ast::scene_decl& scene,
                     const symbol_table& symbols,
                     std::vector<diagnostic>& diags) {
        // Keyed by the generated local, so `class` and `class_` clash too
        std::map<std::string, const ast::spawn_stmt*> spawn_names;

        for (const auto& spawn : scene.spawns) {
            if (!symbols.find_entity(spawn.entity_type)) {
                add_undefined(diags,
                              diag_codes::E_UNDEFINED_ENTITY,
                              "Entity '" + spawn.entity_type + "' is not defined",
                              spawn.type_range,
                              spawn.entity_type,
                              names_of(symbols.entities));
            }

            if (spawn.name) {
                auto [it, inserted] = spawn_names.emplace(codegen::sanitize_ts_identifier(*spawn.name), &spawn);
                if (!inserted) {
                    auto d = make_error(diag_codes::E_DUPLICATE_SPAWN_NAME,
                                        "Spawn name '" + *spawn.name + "' is already used in scene '" +
                                        scene.name + "'",
                                        spawn.range);
                    d.related_range = it->second->range;
                    d.related_message = "'" + *it->second->name + "' first spawned here";
                    diags.push_back(std::move(d));
                }
            }
        }
    }

    void check_game(const ast::game_decl& game,
                    const symbol_table& symbols,
                    std::vector<diagnostic>& diags) {
        const auto* prop = ast::find_property(game.properties, "defaultScene");
        if (!prop) {
            return;
        }
        const auto* scene = ast::symbolic_value(prop->value);
        if (scene && !symbols.find_scene(*scene)) {
            add_undefined(diags,
                          diag_codes::E_UNDEFINED_SCENE,
                          "Default scene '" + *scene + "' is not defined",
                          ast::range_of(prop->value),
                          *scene,
                          names_of(symbols.scenes));
        }
    }
}

void validate_references(const ast::program& program,
                         const symbol_table& symbols,
                         std::vector<diagnostic>& diags) {
    std::set<std::string> used_behaviors;

    for (const auto& decl : program.body) {
        std::visit([&](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, ast::game_decl>) {
                check_game(d, symbols, diags);
            } else if constexpr (std::is_same_v<T, ast::entity_decl>) {
                check_entity(d, symbols, diags);
                for (const auto& behavior : d.behaviors) {
                    used_behaviors.insert(behavior.name);
                }
            } else if constexpr (std::is_same_v<T, ast::behavior_decl>) {
                // Checked below once every entity has been seen
            } else if constexpr (std::is_same_v<T, ast::scene_decl>) {
                check_scene(d, symbols, diags);
            } else {
                static_assert(ast::unhandled_node<T>, "declaration kind is not resolved");
            }
        }, decl);
    }

    // Unused behaviors, in declaration order
    for (const auto& decl : program.body) {
        const auto* behavior = std::get_if<ast::behavior_decl>(&decl);
        if (!behavior || symbols.find_behavior(behavior->name) != behavior) {
            continue;
        }
        if (!used_behaviors.contains(behavior->name)) {
            diags.push_back(make_warning(diag_codes::W_UNUSED_BEHAVIOR,
                                         "Behavior '" + behavior->name + "' is never used by any entity",
                                         behavior->name_range));
        }
    }
}

} // namespace gdl::semantic::phases
