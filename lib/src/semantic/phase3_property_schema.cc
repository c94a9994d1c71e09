//
// Phase 3: Property Schema Checking
//
// Known properties have a fixed shape. Unknown properties are passed
// through to generated code untouched and are not checked here.
//
// Property            Where           Accepted values
// ------------------  --------------  ----------------------------------------
// physics             entity          static dynamic kinematic platformer topdown
// physics             game            arcade matter
// scale               game            fit exact zoom
// size                game/entity/    [width, height]
//                     scene
// pixelArt            game            true | false
// behaviors           entity          [Name, ...]
// spawn position      scene           vector or named point
// Vector2(...)        any value       exactly 2 numbers
//

#include <gdl/semantic.hh>
#include <algorithm>
#include <string>
#include <type_traits>

namespace gdl::semantic::phases {

namespace {
    const std::vector<std::string> physics_modes = {"static", "dynamic", "kinematic", "platformer", "topdown"};
    const std::vector<std::string> scale_modes = {"fit", "exact", "zoom"};
    const std::vector<std::string> physics_engines = {"arcade", "matter"};

    std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        if (parts.empty()) return "";

        std::string result = parts[0];
        for (std::size_t i = 1; i < parts.size(); ++i) {
            result += sep + parts[i];
        }
        return result;
    }

    // Helper: enumerated property given as identifier or string
    void check_enum(std::vector<diagnostic>& diags,
                    const char* code,
                    const ast::property& prop,
                    const std::string& what,
                    const std::vector<std::string>& valid) {
        const auto* value = ast::symbolic_value(prop.value);
        if (value && std::find(valid.begin(), valid.end(), *value) != valid.end()) {
            return;
        }

        std::string message = "Invalid " + what + " ";
        if (value) {
            message += "'" + *value + "'";
        } else {
            message += std::string("value of kind ") + ast::kind_name(prop.value);
        }
        message += ". Expected one of: " + join(valid, ", ");

        auto d = make_error(code, message, prop.range);
        d.suggestions = valid;
        diags.push_back(std::move(d));
    }

    void check_size(std::vector<diagnostic>& diags, const std::vector<ast::property>& props) {
        const auto* prop = ast::find_property(props, "size");
        if (!prop) {
            return;
        }
        const auto* arr = std::get_if<ast::array_literal>(&prop->value.node);
        if (!arr || arr->elements.size() != 2) {
            diags.push_back(make_error(diag_codes::E_INVALID_SIZE,
                                       "Size must be an array with 2 elements [width, height]",
                                       prop->range));
        }
    }

    void check_game(const ast::game_decl& game, std::vector<diagnostic>& diags) {
        check_size(diags, game.properties);

        if (const auto* scale = ast::find_property(game.properties, "scale")) {
            check_enum(diags, diag_codes::E_INVALID_SCALE_MODE, *scale, "scale mode", scale_modes);
        }
        if (const auto* physics = ast::find_property(game.properties, "physics")) {
            check_enum(diags, diag_codes::E_INVALID_PHYSICS_ENGINE, *physics, "physics engine", physics_engines);
        }
        if (const auto* pixel_art = ast::find_property(game.properties, "pixelArt")) {
            if (!std::holds_alternative<ast::boolean_literal>(pixel_art->value.node)) {
                diags.push_back(make_error(diag_codes::E_INVALID_PIXEL_ART,
                                           "pixelArt must be a boolean (true or false)",
                                           pixel_art->range));
            }
        }
    }

    void check_entity(const ast::entity_decl& entity, std::vector<diagnostic>& diags) {
        if (const auto* physics = ast::find_property(entity.properties, "physics")) {
            check_enum(diags, diag_codes::E_INVALID_PHYSICS_MODE, *physics, "physics mode", physics_modes);
        }

        check_size(diags, entity.properties);

        if (const auto* behaviors = ast::find_property(entity.properties, "behaviors")) {
            if (!std::holds_alternative<ast::array_literal>(behaviors->value.node)) {
                diags.push_back(make_error(diag_codes::E_INVALID_BEHAVIOR_LIST,
                                           "Behaviors must be an array of behavior names",
                                           behaviors->range));
            }
        }
    }

    // ------------------------------------------------------------------------
    // Vector2 values
    // ------------------------------------------------------------------------

    void check_vector_values(const ast::expr& value, std::vector<diagnostic>& diags) {
        std::visit([&diags](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::array_literal>) {
                for (const auto& element : node.elements) {
                    check_vector_values(element, diags);
                }
            } else if constexpr (std::is_same_v<T, ast::object_literal>) {
                for (const auto& prop : node.properties) {
                    check_vector_values(prop.value, diags);
                }
            } else if constexpr (std::is_same_v<T, ast::call_expr>) {
                if (node.callee != "Vector2") {
                    for (const auto& arg : node.arguments) {
                        check_vector_values(arg, diags);
                    }
                    return;
                }
                if (node.arguments.size() != 2) {
                    diags.push_back(make_error(diag_codes::E_INVALID_SPAWN_POSITION,
                                               "Vector2 must have 2 components (x, y)",
                                               node.range));
                    return;
                }
                for (const auto& arg : node.arguments) {
                    if (!std::holds_alternative<ast::number_literal>(arg.node)) {
                        diags.push_back(make_error(diag_codes::E_INVALID_SPAWN_POSITION,
                                                   "Vector2 components must be numbers",
                                                   ast::range_of(arg)));
                    }
                }
            } else if constexpr (std::is_same_v<T, ast::member_expr>) {
                if (node.object) check_vector_values(*node.object, diags);
            } else if constexpr (std::is_same_v<T, ast::unary_expr>) {
                if (node.operand) check_vector_values(*node.operand, diags);
            } else if constexpr (std::is_same_v<T, ast::binary_expr>) {
                if (node.left) check_vector_values(*node.left, diags);
                if (node.right) check_vector_values(*node.right, diags);
            } else if constexpr (std::is_same_v<T, ast::string_literal> ||
                                 std::is_same_v<T, ast::number_literal> ||
                                 std::is_same_v<T, ast::boolean_literal> ||
                                 std::is_same_v<T, ast::identifier>) {
                // Leaves
            } else {
                static_assert(ast::unhandled_node<T>, "value kind is not checked");
            }
        }, value.node);
    }

    void check_property_values(const std::vector<ast::property>& props, std::vector<diagnostic>& diags) {
        for (const auto& prop : props) {
            check_vector_values(prop.value, diags);
        }
    }

    // ------------------------------------------------------------------------
    // Spawn positions
    //
    // A position is a vector or the name of a point the runtime knows
    // (`at center`). Vectors combine with + and -, scale with * and / by a
    // number, and expose their components as .x and .y.
    // ------------------------------------------------------------------------

    enum class position_shape {
        number,
        vector,
        named,
        invalid    // already reported
    };

    const char* describe(position_shape shape) {
        switch (shape) {
            case position_shape::number: return "a number";
            case position_shape::vector: return "a vector";
            case position_shape::named:  return "a named point";
            case position_shape::invalid: break;
        }
        return "an invalid value";
    }

    class position_checker {
        public:
            explicit position_checker(std::vector<diagnostic>& diags)
                : diags_(diags) {
            }

            void check(const ast::expr& position) {
                const auto shape = shape_of(position, true);
                if (shape == position_shape::number) {
                    report("Spawn position must be a vector [x, y] or a named point, got a number",
                           ast::range_of(position));
                }
            }

        private:
            position_shape report(const std::string& message, const source_range& range) {
                diags_.push_back(make_error(diag_codes::E_INVALID_SPAWN_POSITION, message, range));
                return position_shape::invalid;
            }

            position_shape shape_of(const ast::expr& e, bool whole);
            position_shape vector_of(const std::vector<ast::expr>& components, const source_range& range);
            position_shape unary_shape(const ast::unary_expr& u);
            position_shape binary_shape(const ast::binary_expr& b);

            std::vector<diagnostic>& diags_;
    };

    position_shape position_checker::shape_of(const ast::expr& e, bool whole) {
        return std::visit([this, whole, &e](const auto& node) -> position_shape {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::number_literal>) {
                return position_shape::number;
            } else if constexpr (std::is_same_v<T, ast::identifier>) {
                if (whole) {
                    return position_shape::named;
                }
                return report("Named point '" + node.name + "' must be the whole spawn position", node.range);
            } else if constexpr (std::is_same_v<T, ast::string_literal>) {
                if (whole) {
                    return position_shape::named;
                }
                return report("Named point '" + node.value + "' must be the whole spawn position", node.range);
            } else if constexpr (std::is_same_v<T, ast::array_literal>) {
                return vector_of(node.elements, node.range);
            } else if constexpr (std::is_same_v<T, ast::call_expr>) {
                if (node.callee != "Vector2") {
                    return report("Unsupported call '" + node.callee + "' in spawn position", node.range);
                }
                return vector_of(node.arguments, node.range);
            } else if constexpr (std::is_same_v<T, ast::member_expr>) {
                if (!node.object) {
                    return position_shape::invalid;
                }
                const auto object = shape_of(*node.object, false);
                if (object == position_shape::invalid) {
                    return object;
                }
                if (object == position_shape::vector && (node.member == "x" || node.member == "y")) {
                    return position_shape::number;
                }
                return report("Member '." + node.member + "' is only available as .x or .y on a vector",
                              node.range);
            } else if constexpr (std::is_same_v<T, ast::unary_expr>) {
                return unary_shape(node);
            } else if constexpr (std::is_same_v<T, ast::binary_expr>) {
                return binary_shape(node);
            } else if constexpr (std::is_same_v<T, ast::boolean_literal> ||
                                 std::is_same_v<T, ast::object_literal>) {
                return report(std::string("Unsupported ") + ast::kind_name(e) + " in spawn position", node.range);
            } else {
                static_assert(ast::unhandled_node<T>, "position kind is not checked");
            }
        }, e.node);
    }
    position_shape position_checker::vector_of(const std::vector<ast::expr>& components,
                                               const source_range& range) {
        bool valid = true;
        for (const auto& component : components) {
            const auto shape = shape_of(component, false);
            if (shape == position_shape::invalid) {
                valid = false;
            } else if (shape != position_shape::number) {
                report(std::string("Vector components must be numbers, got ") + describe(shape),
                       ast::range_of(component));
                valid = false;
            }
        }

        if (components.size() != 2) {
            return report("Spawn position must have 2 elements [x, y]", range);
        }
        return valid ? position_shape::vector : position_shape::invalid;
    }

    position_shape position_checker::unary_shape(const ast::unary_expr& u) {
        if (!u.operand) {
            return position_shape::invalid;
        }
        const auto operand = shape_of(*u.operand, false);
        if (operand == position_shape::invalid) {
            return operand;
        }
        if (u.op != "-") {
            return report("Operator '" + u.op + "' cannot be used in a spawn position", u.range);
        }
        return operand;
    }

    position_shape position_checker::binary_shape(const ast::binary_expr& b) {
        if (!b.left || !b.right) {
            return position_shape::invalid;
        }
        const auto left = shape_of(*b.left, false);
        const auto right = shape_of(*b.right, false);
        if (left == position_shape::invalid || right == position_shape::invalid) {
            return position_shape::invalid;
        }

        constexpr auto number = position_shape::number;
        constexpr auto vector = position_shape::vector;

        if (b.op == "+" || b.op == "-") {
            if (left == right) {
                return left;
            }
        } else if (b.op == "*") {
            if (left == number && right == number) {
                return number;
            }
            if ((left == vector && right == number) || (left == number && right == vector)) {
                return vector;
            }
        } else if (b.op == "/") {
            if (right == number) {
                return left;
            }
        }

        return report("Operator '" + b.op + "' cannot combine " + describe(left) + " and " + describe(right),
                      b.range);
    }

    void check_scene(const ast::scene_decl& scene, std::vector<diagnostic>& diags) {
        check_size(diags, scene.properties);

        position_checker positions(diags);
        for (const auto& spawn : scene.spawns) {
            positions.check(spawn.position);
        }
    }
}

void check_property_schemas(const ast::program& program, std::vector<diagnostic>& diags) {
    for (const auto& decl : program.body) {
        std::visit([&diags](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, ast::game_decl>) {
                check_game(d, diags);
            } else if constexpr (std::is_same_v<T, ast::entity_decl>) {
                check_entity(d, diags);
            } else if constexpr (std::is_same_v<T, ast::behavior_decl>) {
                // Behavior properties have no fixed shape
            } else if constexpr (std::is_same_v<T, ast::scene_decl>) {
                check_scene(d, diags);
            } else {
                static_assert(ast::unhandled_node<T>, "declaration kind is not checked");
            }
            check_property_values(d.properties, diags);
        }, decl);
    }
}

} // namespace gdl::semantic::phases
