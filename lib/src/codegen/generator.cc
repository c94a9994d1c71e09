//
// TypeScript module generator
//
// The module body is generated first so that the import preamble only
// lists the runtime symbols the body actually uses.
//

#include <gdl/codegen.hh>
#include <gdl/codegen/ts/ts_code_writer.hh>
#include <gdl/codegen/ts/ts_string_utils.hh>

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <type_traits>

namespace gdl::codegen {

namespace {
    const std::map<std::string, std::string>& runtime_modules() {
        static const std::map<std::string, std::string> modules = {
            {"ComponentType", "./core/types"},
            {"Entity", "./core/ecs/Entity"},
            {"GameEngine", "./core/GameEngine"},
            {"Vector2", "./core/math/Vector2"}
        };
        return modules;
    }

    bool is_vector2_call(const ast::expr& e) {
        const auto* call = std::get_if<ast::call_expr>(&e.node);
        return call && call->callee == "Vector2";
    }

    bool uses_vector2(const ast::expr& e) {
        return std::visit([](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::array_literal>) {
                return std::any_of(node.elements.begin(), node.elements.end(),
                                   [](const ast::expr& el) { return uses_vector2(el); });
            } else if constexpr (std::is_same_v<T, ast::object_literal>) {
                return std::any_of(node.properties.begin(), node.properties.end(),
                                   [](const ast::property& p) { return uses_vector2(p.value); });
            } else if constexpr (std::is_same_v<T, ast::call_expr>) {
                return node.callee == "Vector2" ||
                       std::any_of(node.arguments.begin(), node.arguments.end(),
                                   [](const ast::expr& arg) { return uses_vector2(arg); });
            } else if constexpr (std::is_same_v<T, ast::member_expr>) {
                return node.object && uses_vector2(*node.object);
            } else if constexpr (std::is_same_v<T, ast::unary_expr>) {
                return node.operand && uses_vector2(*node.operand);
            } else if constexpr (std::is_same_v<T, ast::binary_expr>) {
                return (node.left && uses_vector2(*node.left)) ||
                       (node.right && uses_vector2(*node.right));
            } else {
                // Literals and identifiers
                return false;
            }
        }, e.node);
    }

    std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string result;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result += sep;
            result += parts[i];
        }
        return result;
    }

    std::string render_operand(const ast::expr& e) {
        if (std::holds_alternative<ast::binary_expr>(e.node)) {
            return "(" + render_value(e) + ")";
        }
        return render_value(e);
    }

    std::string render_number(const ast::number_literal& n) {
        if (!n.text.empty()) {
            return n.text;
        }
        std::ostringstream oss;
        oss << n.value;
        return oss.str();
    }

    std::string render_array(const ast::array_literal& arr) {
        std::vector<std::string> parts;
        for (const auto& el : arr.elements) {
            parts.push_back(render_value(el));
        }
        return "[" + join(parts, ", ") + "]";
    }

    std::string render_object(const ast::object_literal& obj) {
        if (obj.properties.empty()) {
            return "{}";
        }
        std::vector<std::string> parts;
        for (const auto& p : obj.properties) {
            parts.push_back(p.name + ": " + render_value(p.value));
        }
        return "{ " + join(parts, ", ") + " }";
    }

    std::string render_call(const ast::call_expr& call) {
        std::vector<std::string> args;
        for (const auto& arg : call.arguments) {
            args.push_back(render_value(arg));
        }
        if (call.callee == "Vector2") {
            if (args.size() != 2) {
                throw invalid_ast_error("Vector2 needs 2 components, got " + std::to_string(args.size()));
            }
            return "new Vector2(" + args[0] + ", " + args[1] + ")";
        }
        // Other calls stay symbolic data for the runtime to interpret
        return "{ call: " + quote_ts_string(call.callee) + ", args: [" + join(args, ", ") + "] }";
    }

    // Operand of a unary minus; keeps `- -5` from printing as `--5`
    std::string render_negated(const ast::expr& operand, const std::string& text) {
        if (std::holds_alternative<ast::unary_expr>(operand.node) ||
            std::holds_alternative<ast::binary_expr>(operand.node) ||
            (!text.empty() && text.front() == '-')) {
            return "(" + text + ")";
        }
        return text;
    }

    // ------------------------------------------------------------------------
    // Spawn positions
    // ------------------------------------------------------------------------

    struct position_part {
        std::string text;
        bool is_vector;
    };

    position_part render_position_part(const ast::expr& e);

    std::string render_position_operand(const ast::expr& e, const position_part& part) {
        if (std::holds_alternative<ast::binary_expr>(e.node) && !part.is_vector) {
            return "(" + part.text + ")";
        }
        return part.text;
    }

    position_part render_vector(const std::vector<ast::expr>& components) {
        if (components.size() != 2) {
            throw invalid_ast_error("Vector2 needs 2 components, got " + std::to_string(components.size()));
        }
        std::vector<std::string> parts;
        for (const auto& component : components) {
            auto part = render_position_part(component);
            if (part.is_vector) {
                throw invalid_ast_error("vector used as a Vector2 component");
            }
            parts.push_back(std::move(part.text));
        }
        return {"new Vector2(" + parts[0] + ", " + parts[1] + ")", true};
    }

    position_part render_position_binary(const ast::binary_expr& b) {
        if (!b.left || !b.right) {
            throw invalid_ast_error("binary expression without both operands");
        }
        const auto left = render_position_part(*b.left);
        const auto right = render_position_part(*b.right);

        if (!left.is_vector && !right.is_vector) {
            return {render_position_operand(*b.left, left) + " " + b.op + " " +
                    render_position_operand(*b.right, right), false};
        }
        if (left.is_vector && right.is_vector) {
            if (b.op == "+") return {"Vector2.add(" + left.text + ", " + right.text + ")", true};
            if (b.op == "-") return {"Vector2.subtract(" + left.text + ", " + right.text + ")", true};
        } else if (b.op == "*") {
            const auto& vec = left.is_vector ? left : right;
            const auto& scalar = left.is_vector ? right : left;
            return {"Vector2.multiply(" + vec.text + ", " + scalar.text + ")", true};
        } else if (b.op == "/" && left.is_vector) {
            return {"Vector2.divide(" + left.text + ", " + right.text + ")", true};
        }
        throw invalid_ast_error("operator '" + b.op + "' does not apply to these position operands");
    }

    position_part render_position_part(const ast::expr& e) {
        return std::visit([&e](const auto& node) -> position_part {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::number_literal>) {
                return {render_number(node), false};
            } else if constexpr (std::is_same_v<T, ast::array_literal>) {
                return render_vector(node.elements);
            } else if constexpr (std::is_same_v<T, ast::call_expr>) {
                if (node.callee != "Vector2") {
                    throw invalid_ast_error("call to '" + node.callee + "' in a spawn position");
                }
                return render_vector(node.arguments);
            } else if constexpr (std::is_same_v<T, ast::member_expr>) {
                if (!node.object) {
                    throw invalid_ast_error("member access without an object");
                }
                const auto object = render_position_part(*node.object);
                if (!object.is_vector || (node.member != "x" && node.member != "y")) {
                    throw invalid_ast_error("member '" + node.member + "' in a spawn position");
                }
                return {object.text + "." + node.member, false};
            } else if constexpr (std::is_same_v<T, ast::unary_expr>) {
                if (!node.operand) {
                    throw invalid_ast_error("unary expression without an operand");
                }
                if (node.op != "-") {
                    throw invalid_ast_error("operator '" + node.op + "' in a spawn position");
                }
                const auto operand = render_position_part(*node.operand);
                if (operand.is_vector) {
                    return {"Vector2.negate(" + operand.text + ")", true};
                }
                return {"-" + render_negated(*node.operand, operand.text), false};
            } else if constexpr (std::is_same_v<T, ast::binary_expr>) {
                return render_position_binary(node);
            } else if constexpr (std::is_same_v<T, ast::string_literal> ||
                                 std::is_same_v<T, ast::boolean_literal> ||
                                 std::is_same_v<T, ast::identifier> ||
                                 std::is_same_v<T, ast::object_literal>) {
                throw invalid_ast_error(std::string(ast::kind_name(e)) + " inside a spawn position");
            } else {
                static_assert(ast::unhandled_node<T>, "position kind has no rendering");
            }
        }, e.node);
    }

    std::string single_line(std::string text) {
        std::replace(text.begin(), text.end(), '\n', ' ');
        std::replace(text.begin(), text.end(), '\r', ' ');
        return text;
    }

    // ========================================================================
    // Module generator
    // ========================================================================

    class module_generator {
        public:
            module_generator(const generator_options& opts, std::ostream& os)
                : opts_(opts),
                  writer_(os) {
            }

            void emit(const ast::program& program);

            const std::set<std::string>& imports() const { return imports_; }
            std::vector<source_map_entry>& source_map() { return source_map_; }

        private:
            void require(const std::string& symbol) { imports_.insert(symbol); }

            std::string value(const ast::expr& e) {
                if (uses_vector2(e)) {
                    require("Vector2");
                }
                return render_value(e);
            }

            void declare_class(const std::string& name);
            void begin_unit(const std::string& title, const std::string& symbol, const source_range& range);

            void emit_game(const ast::game_decl& game);
            void emit_entity(const ast::entity_decl& entity);
            void emit_behavior(const ast::behavior_decl& behavior);
            void emit_scene(const ast::scene_decl& scene);
            void emit_spawn(const ast::spawn_stmt& spawn, std::set<std::string>& locals);
            void emit_main(const ast::program& program);
            void emit_registry(const std::string& title,
                               const std::string& name,
                               const std::vector<std::pair<std::string, std::string>>& entries);

            const generator_options& opts_;
            TsCodeWriter writer_;
            std::set<std::string> imports_;
            std::set<std::string> classes_;
            std::vector<source_map_entry> source_map_;
            const ast::game_decl* game_ = nullptr;
    };

    void module_generator::emit(const ast::program& program) {
        require("GameEngine");

        for (const auto& decl : program.body) {
            std::visit([this](const auto& d) {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, ast::game_decl>) {
                    emit_game(d);
                } else if constexpr (std::is_same_v<T, ast::entity_decl>) {
                    emit_entity(d);
                } else if constexpr (std::is_same_v<T, ast::behavior_decl>) {
                    emit_behavior(d);
                } else if constexpr (std::is_same_v<T, ast::scene_decl>) {
                    emit_scene(d);
                } else {
                    static_assert(ast::unhandled_node<T>, "declaration kind is not generated");
                }
            }, decl);
            writer_ << blank;
        }

        emit_main(program);
    }

    void module_generator::declare_class(const std::string& name) {
        if (name.empty()) {
            throw invalid_ast_error("declaration without a name");
        }
        if (!classes_.insert(name).second) {
            throw invalid_ast_error("class '" + name + "' would be declared twice");
        }
    }

    void module_generator::begin_unit(const std::string& title,
                                      const std::string& symbol,
                                      const source_range& range) {
        writer_.write_comment(title);
        if (opts_.debug) {
            writer_ << "// source: line " << range.start.line
                    << ", column " << range.start.column << endl;
        }
        if (opts_.source_map) {
            source_map_.push_back(source_map_entry{writer_.current_line(), range.start, symbol});
        }
    }

    // ------------------------------------------------------------------------
    // game
    // ------------------------------------------------------------------------

    void module_generator::emit_game(const ast::game_decl& game) {
        if (game_) {
            throw invalid_ast_error("more than one game declaration");
        }
        game_ = &game;

        begin_unit("Game Configuration", "gameConfig", game.range);
        auto config = writer_.write_object("export const gameConfig = {");
        for (const auto& prop : game.properties) {
            config.write_entry(prop.name, value(prop.value));
        }
    }

    // ------------------------------------------------------------------------
    // entity
    // ------------------------------------------------------------------------

    void module_generator::emit_entity(const ast::entity_decl& entity) {
        const auto cls = entity_class_name(entity.name);
        declare_class(cls);
        require("Entity");
        require("ComponentType");

        begin_unit("Entity: " + entity.name, cls, entity.range);
        auto klass = writer_.write_class(cls, "Entity");

        {
            auto ctor = writer_.write_function("constructor(id: string, name: string, scene: string)");
            writer_.write_line("super(id, name, scene);");
            writer_.write_line("this.setupComponents();");
        }
        writer_.write_blank_line();

        auto setup = writer_.write_function("private setupComponents(): void");
        {
            auto transform = writer_.write_object("this.addComponent(ComponentType.Transform, {", "});");
            transform.write_entry("position", "{ x: 0, y: 0 }");
            transform.write_entry("rotation", "0");
            transform.write_entry("scale", "{ x: 1, y: 1 }");
        }

        if (const auto* sprite = ast::find_property(entity.properties, "sprite")) {
            auto component = writer_.write_object("this.addComponent(ComponentType.Sprite, {", "});");
            component.write_entry("texture", value(sprite->value));
            component.write_entry("alpha", "1");
            component.write_entry("visible", "true");
        }

        if (const auto* physics = ast::find_property(entity.properties, "physics")) {
            auto component = writer_.write_object("this.addComponent(ComponentType.Physics, {", "});");
            component.write_entry("mode", value(physics->value));
            component.write_entry("velocity", "{ x: 0, y: 0 }");
            component.write_entry("acceleration", "{ x: 0, y: 0 }");
        }

        if (const auto* props = ast::find_property(entity.properties, "properties")) {
            if (const auto* obj = std::get_if<ast::object_literal>(&props->value.node)) {
                for (const auto& custom : obj->properties) {
                    writer_.write_line("this.setProperty(" + quote_ts_string(custom.name) + ", " +
                                       value(custom.value) + ");");
                }
            }
        }

        if (!entity.behaviors.empty()) {
            std::vector<std::string> names;
            for (const auto& behavior : entity.behaviors) {
                names.push_back(quote_ts_string(behavior.name));
            }
            writer_.write_line("this.applyBehaviors([" + join(names, ", ") + "]);");
        }
    }

    // ------------------------------------------------------------------------
    // behavior
    // ------------------------------------------------------------------------

    void module_generator::emit_behavior(const ast::behavior_decl& behavior) {
        const auto cls = behavior_class_name(behavior.name);
        declare_class(cls);
        require("Entity");

        begin_unit("Behavior: " + behavior.name, cls, behavior.range);
        auto klass = writer_.write_class(cls);
        bool separate = false;

        if (const auto* props = ast::find_property(behavior.properties, "properties")) {
            if (const auto* obj = std::get_if<ast::object_literal>(&props->value.node)) {
                for (const auto& field : obj->properties) {
                    klass.write_field(sanitize_ts_identifier(field.name) + ": " +
                                      ts_type_of(field.value) + " = " + value(field.value));
                    separate = true;
                }
            }
        }

        if (const auto* methods = ast::find_property(behavior.properties, "methods")) {
            if (const auto* obj = std::get_if<ast::object_literal>(&methods->value.node)) {
                for (const auto& method : obj->properties) {
                    if (separate) {
                        writer_.write_blank_line();
                    }
                    auto fn = writer_.write_function(sanitize_ts_identifier(method.name) + "(): void");
                    writer_.write_comment("Method implementation");
                    separate = true;
                }
            }
        }

        if (ast::find_property(behavior.properties, "update")) {
            if (separate) {
                writer_.write_blank_line();
            }
            auto fn = writer_.write_function("update(entity: Entity, deltaTime: number): void");
            writer_.write_comment("Update implementation");
        }
    }

    // ------------------------------------------------------------------------
    // scene
    // ------------------------------------------------------------------------

    void module_generator::emit_scene(const ast::scene_decl& scene) {
        const auto cls = scene_class_name(scene.name);
        declare_class(cls);
        require("Entity");
        require("Vector2");

        begin_unit("Scene: " + scene.name, cls, scene.range);
        auto klass = writer_.write_class(cls);
        klass.write_field("private engine: GameEngine");
        klass.write_field("private entities: Map<string, Entity> = new Map()");
        klass.write_field("private settings: Map<string, unknown> = new Map()");
        klass.write_field("private nextId = 0");
        writer_.write_blank_line();

        {
            auto ctor = writer_.write_function("constructor(engine: GameEngine)");
            writer_.write_line("this.engine = engine;");
        }
        writer_.write_blank_line();

        {
            auto init = writer_.write_function("initialize(): void");
            for (const auto& prop : scene.properties) {
                writer_.write_line("this.settings.set(" + quote_ts_string(prop.name) + ", " +
                                   value(prop.value) + ");");
            }

            std::set<std::string> locals;
            for (const auto& spawn : scene.spawns) {
                emit_spawn(spawn, locals);
            }

            for (const auto& event : scene.events) {
                writer_.write_comment("Event: " + single_line(event.trigger));
            }
        }
        writer_.write_blank_line();

        {
            auto update = writer_.write_function("update(deltaTime: number): void");
            writer_.write_comment("Scene update logic");
        }
        writer_.write_blank_line();

        {
            auto cleanup = writer_.write_function("cleanup(): void");
            writer_.write_line("this.entities.clear();");
        }
        writer_.write_blank_line();

        auto spawn_fn = writer_.write_function("private spawnEntity(type: string, position: Vector2 | string): Entity");
        spawn_fn << "const EntityClass = EntityRegistry.get(type);" << endl;
        {
            auto missing = writer_.write_if("!EntityClass");
            writer_.write_line("throw new Error(`Unknown entity type: ${type}`);");
        }
        writer_.write_line("const entity = new EntityClass(`${type}_${this.nextId++}`, type, " +
                           quote_ts_string(scene.name) + ");");
        spawn_fn << "this.engine.addEntity(entity, position);" << endl
                 << "return entity;" << endl;
    }

    void module_generator::emit_spawn(const ast::spawn_stmt& spawn, std::set<std::string>& locals) {
        const std::string call = "this.spawnEntity(" + quote_ts_string(spawn.entity_type) + ", " +
                                 render_position(spawn.position) + ")";

        if (!spawn.name) {
            writer_ << call << ";" << endl;
            return;
        }

        const auto local = sanitize_ts_identifier(*spawn.name);
        if (!locals.insert(local).second) {
            throw invalid_ast_error("spawn name '" + *spawn.name + "' is used twice in one scene");
        }
        writer_ << "const " << local << " = " << call << ";" << endl;
        writer_ << "this.entities.set(" << quote_ts_string(*spawn.name) << ", " << local << ");" << endl;
    }

    // ------------------------------------------------------------------------
    // initialization and registries
    // ------------------------------------------------------------------------

    void module_generator::emit_main(const ast::program& program) {
        writer_.write_comment("Main game initialization");
        {
            auto init = writer_.write_function("export function initializeGame(engine: GameEngine): void");
            if (game_) {
                {
                    auto config = writer_.write_object("engine.updateConfig({", "});");
                    for (const auto& prop : game_->properties) {
                        if (prop.name == "defaultScene") {
                            continue;
                        }
                        if (prop.name == "size") {
                            const auto* arr = std::get_if<ast::array_literal>(&prop.value.node);
                            if (!arr || arr->elements.size() != 2) {
                                throw invalid_ast_error("game size is not a 2-element array");
                            }
                            config.write_entry("width", value(arr->elements[0]));
                            config.write_entry("height", value(arr->elements[1]));
                            continue;
                        }
                        config.write_entry(prop.name, value(prop.value));
                    }
                }
                if (const auto* scene = ast::find_property(game_->properties, "defaultScene")) {
                    writer_.write_line("loadScene(engine, " + value(scene->value) + ");");
                }
            }
        }
        writer_.write_blank_line();

        writer_.write_comment("Helper function to load scenes");
        {
            auto load = writer_.write_function("export function loadScene(engine: GameEngine, sceneName: string): void");
            load << "const SceneClass = SceneRegistry.get(sceneName);" << endl;
            auto found = writer_.write_if("SceneClass");
            writer_.write_line("const scene = new SceneClass(engine);");
            writer_.write_line("scene.initialize();");
            auto missing = found.write_else();
            writer_.write_line("console.error(`Scene ${sceneName} not found`);");
        }
        writer_.write_blank_line();

        writer_.write_type_alias("Constructor", "new (...args: any[]) => any");

        std::vector<std::pair<std::string, std::string>> entities;
        std::vector<std::pair<std::string, std::string>> behaviors;
        std::vector<std::pair<std::string, std::string>> scenes;
        for (const auto& decl : program.body) {
            std::visit([&](const auto& d) {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, ast::game_decl>) {
                    // Not registered
                } else if constexpr (std::is_same_v<T, ast::entity_decl>) {
                    entities.emplace_back(d.name, entity_class_name(d.name));
                } else if constexpr (std::is_same_v<T, ast::behavior_decl>) {
                    behaviors.emplace_back(d.name, behavior_class_name(d.name));
                } else if constexpr (std::is_same_v<T, ast::scene_decl>) {
                    scenes.emplace_back(d.name, scene_class_name(d.name));
                } else {
                    static_assert(ast::unhandled_node<T>, "declaration kind is not registered");
                }
            }, decl);
        }

        emit_registry("Entity registry", "EntityRegistry", entities);
        emit_registry("Behavior registry", "BehaviorRegistry", behaviors);
        emit_registry("Scene registry", "SceneRegistry", scenes);
    }

    void module_generator::emit_registry(const std::string& title,
                                         const std::string& name,
                                         const std::vector<std::pair<std::string, std::string>>& entries) {
        writer_.write_blank_line();
        writer_.write_comment(title);

        const std::string decl = "export const " + name + " = new Map<string, Constructor>(";
        if (entries.empty()) {
            writer_.write_line(decl + ");");
            return;
        }

        auto registry = writer_.write_object(decl + "[", "]);");
        for (const auto& [key, cls] : entries) {
            registry << "[" << quote_ts_string(key) << ", " << cls << "]," << endl;
        }
    }
}

// ============================================================================
// Value rendering
// ============================================================================

std::string render_value(const ast::expr& value) {
    return std::visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::string_literal>) {
            return quote_ts_string(node.value);
        } else if constexpr (std::is_same_v<T, ast::number_literal>) {
            return render_number(node);
        } else if constexpr (std::is_same_v<T, ast::boolean_literal>) {
            return node.value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, ast::identifier>) {
            return quote_ts_string(node.name);
        } else if constexpr (std::is_same_v<T, ast::array_literal>) {
            return render_array(node);
        } else if constexpr (std::is_same_v<T, ast::object_literal>) {
            return render_object(node);
        } else if constexpr (std::is_same_v<T, ast::call_expr>) {
            return render_call(node);
        } else if constexpr (std::is_same_v<T, ast::member_expr>) {
            if (!node.object) {
                throw invalid_ast_error("member access without an object");
            }
            return render_operand(*node.object) + "." + node.member;
        } else if constexpr (std::is_same_v<T, ast::unary_expr>) {
            if (!node.operand) {
                throw invalid_ast_error("unary expression without an operand");
            }
            return node.op + render_negated(*node.operand, render_value(*node.operand));
        } else if constexpr (std::is_same_v<T, ast::binary_expr>) {
            if (!node.left || !node.right) {
                throw invalid_ast_error("binary expression without both operands");
            }
            return render_operand(*node.left) + " " + node.op + " " + render_operand(*node.right);
        } else {
            static_assert(ast::unhandled_node<T>, "expression kind has no rendering");
        }
    }, value.node);
}

std::string render_position(const ast::expr& position) {
    if (const auto* id = std::get_if<ast::identifier>(&position.node)) {
        return quote_ts_string(id->name);
    }
    if (const auto* str = std::get_if<ast::string_literal>(&position.node)) {
        return quote_ts_string(str->value);
    }
    auto part = render_position_part(position);
    if (!part.is_vector) {
        throw invalid_ast_error("spawn position is a number, not a vector");
    }
    return part.text;
}

std::string ts_type_of(const ast::expr& value) {
    if (std::holds_alternative<ast::string_literal>(value.node) ||
        std::holds_alternative<ast::identifier>(value.node)) {
        return "string";
    }
    if (std::holds_alternative<ast::number_literal>(value.node)) {
        return "number";
    }
    if (std::holds_alternative<ast::boolean_literal>(value.node)) {
        return "boolean";
    }
    if (const auto* arr = std::get_if<ast::array_literal>(&value.node)) {
        if (arr->elements.empty()) {
            return "unknown[]";
        }
        return ts_type_of(arr->elements.front()) + "[]";
    }
    if (is_vector2_call(value)) {
        return "Vector2";
    }
    if (std::holds_alternative<ast::object_literal>(value.node) ||
        std::holds_alternative<ast::call_expr>(value.node)) {
        return "Record<string, unknown>";
    }
    return "unknown";
}

// ============================================================================
// Entry point
// ============================================================================

generated_module generate(const ast::program& program, const generator_options& opts) {
    std::ostringstream body;
    module_generator gen(opts, body);
    gen.emit(program);

    std::ostringstream out;
    TsCodeWriter header(out);
    const auto& modules = runtime_modules();
    for (const auto& symbol : gen.imports()) {
        header.write_import(symbol, modules.at(symbol));
    }
    header.write_blank_line();
    const auto offset = header.current_line() - 1;

    out << body.str();

    generated_module result;
    result.code = out.str();
    result.source_map = std::move(gen.source_map());
    for (auto& entry : result.source_map) {
        entry.generated_line += offset;
    }
    return result;
}

}  // namespace gdl::codegen
