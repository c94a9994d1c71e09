//
// Parser tests: top-level declarations, properties and values
//

#include <doctest/doctest.h>
#include <gdl/lexer.hh>
#include <gdl/parser.hh>

using namespace gdl;

TEST_SUITE("Parser - Declarations") {
    TEST_CASE("Empty program") {
        auto out = parse_gdl("");

        CHECK_FALSE(out.has_errors());
        CHECK(out.program.body.empty());
    }

    TEST_CASE("Game declaration") {
        auto out = parse_gdl(R"(
            game {
                title: "Platformer",
                size: [800, 600],
                pixelArt: true,
                defaultScene: Main
            }
        )");

        REQUIRE_FALSE(out.has_errors());
        REQUIRE(out.program.body.size() == 1);

        const auto* game = std::get_if<ast::game_decl>(&out.program.body[0]);
        REQUIRE(game != nullptr);
        REQUIRE(game->properties.size() == 4);

        const auto* title = ast::find_property(game->properties, "title");
        REQUIRE(title != nullptr);
        const auto* title_value = std::get_if<ast::string_literal>(&title->value.node);
        REQUIRE(title_value != nullptr);
        CHECK(title_value->value == "Platformer");

        const auto* size = ast::find_property(game->properties, "size");
        REQUIRE(size != nullptr);
        const auto* dims = std::get_if<ast::array_literal>(&size->value.node);
        REQUIRE(dims != nullptr);
        REQUIRE(dims->elements.size() == 2);
        const auto* width = std::get_if<ast::number_literal>(&dims->elements[0].node);
        REQUIRE(width != nullptr);
        CHECK(width->value == doctest::Approx(800.0));
        CHECK(width->text == "800");

        const auto* pixel_art = ast::find_property(game->properties, "pixelArt");
        REQUIRE(pixel_art != nullptr);
        CHECK(std::get<ast::boolean_literal>(pixel_art->value.node).value);

        const auto* scene = ast::find_property(game->properties, "defaultScene");
        REQUIRE(scene != nullptr);
        CHECK(std::get<ast::identifier>(scene->value.node).name == "Main");
    }

    TEST_CASE("Entity declaration exposes its behavior list") {
        auto out = parse_gdl(R"(
            entity Player {
                sprite: "player.png"
                physics: dynamic
                behaviors: [Jump, Move]
            }
        )");

        REQUIRE_FALSE(out.has_errors());
        REQUIRE(out.program.body.size() == 1);

        const auto* entity = std::get_if<ast::entity_decl>(&out.program.body[0]);
        REQUIRE(entity != nullptr);
        CHECK(entity->name == "Player");
        CHECK(entity->name_range.start.line == 2);
        CHECK(entity->name_range.start.column == 20);
        CHECK(entity->properties.size() == 3);

        REQUIRE(entity->behaviors.size() == 2);
        CHECK(entity->behaviors[0].name == "Jump");
        CHECK(entity->behaviors[1].name == "Move");
    }

    TEST_CASE("Behavior list keeps identifiers only") {
        auto out = parse_gdl(R"(entity P { behaviors: [Jump, "Fly", 3] })");

        REQUIRE_FALSE(out.has_errors());
        const auto& entity = std::get<ast::entity_decl>(out.program.body[0]);
        REQUIRE(entity.behaviors.size() == 1);
        CHECK(entity.behaviors[0].name == "Jump");
    }

    TEST_CASE("Behavior declaration with nested objects") {
        auto out = parse_gdl(R"(
            behavior Patrol {
                properties: { speed: 50 range: 200 }
                methods: { turn: true; wait: false }
                update: true
            }
        )");

        REQUIRE_FALSE(out.has_errors());
        const auto* behavior = std::get_if<ast::behavior_decl>(&out.program.body[0]);
        REQUIRE(behavior != nullptr);
        CHECK(behavior->name == "Patrol");
        REQUIRE(behavior->properties.size() == 3);

        const auto& props = std::get<ast::object_literal>(behavior->properties[0].value.node);
        REQUIRE(props.properties.size() == 2);
        CHECK(props.properties[0].name == "speed");
        CHECK(props.properties[1].name == "range");

        const auto& methods = std::get<ast::object_literal>(behavior->properties[1].value.node);
        CHECK(methods.properties.size() == 2);

        CHECK(behavior->properties[2].name == "update");
    }

    TEST_CASE("Keywords may name properties") {
        auto out = parse_gdl(R"(entity E { body: "box", animations: { idle: [0, 1] } })");

        REQUIRE_FALSE(out.has_errors());
        const auto& entity = std::get<ast::entity_decl>(out.program.body[0]);
        CHECK(ast::find_property(entity.properties, "body") != nullptr);
        CHECK(ast::find_property(entity.properties, "animations") != nullptr);
    }

    TEST_CASE("Property separators are optional") {
        auto out = parse_gdl("game { a: 1; b: 2, c: 3 d: 4 }");

        REQUIRE_FALSE(out.has_errors());
        CHECK(std::get<ast::game_decl>(out.program.body[0]).properties.size() == 4);
    }

    TEST_CASE("Value forms") {
        auto out = parse_gdl(R"(
            game {
                empty: {}
                nested: [[1, 2], []]
                tuple: (3, 4)
                ai: follow(player, 50)
                negative: -5
                ratio: 0.75
            }
        )");

        REQUIRE_FALSE(out.has_errors());
        const auto& props = std::get<ast::game_decl>(out.program.body[0]).properties;

        SUBCASE("Empty object") {
            const auto& obj = std::get<ast::object_literal>(ast::find_property(props, "empty")->value.node);
            CHECK(obj.properties.empty());
        }

        SUBCASE("Nested arrays") {
            const auto& arr = std::get<ast::array_literal>(ast::find_property(props, "nested")->value.node);
            REQUIRE(arr.elements.size() == 2);
            CHECK(std::get<ast::array_literal>(arr.elements[0].node).elements.size() == 2);
            CHECK(std::get<ast::array_literal>(arr.elements[1].node).elements.empty());
        }

        SUBCASE("Tuples are arrays") {
            const auto& arr = std::get<ast::array_literal>(ast::find_property(props, "tuple")->value.node);
            CHECK(arr.elements.size() == 2);
        }

        SUBCASE("Call-like value") {
            const auto& call = std::get<ast::call_expr>(ast::find_property(props, "ai")->value.node);
            CHECK(call.callee == "follow");
            REQUIRE(call.arguments.size() == 2);
            CHECK(std::get<ast::identifier>(call.arguments[0].node).name == "player");
        }

        SUBCASE("Numbers keep their spelling") {
            const auto& neg = std::get<ast::number_literal>(ast::find_property(props, "negative")->value.node);
            CHECK(neg.value == doctest::Approx(-5.0));
            CHECK(neg.text == "-5");

            const auto& ratio = std::get<ast::number_literal>(ast::find_property(props, "ratio")->value.node);
            CHECK(ratio.value == doctest::Approx(0.75));
        }
    }

    TEST_CASE("Declarations keep source order") {
        auto out = parse_gdl(R"(
            scene Main {}
            entity A {}
            behavior B {}
            game {}
        )");

        REQUIRE_FALSE(out.has_errors());
        REQUIRE(out.program.body.size() == 4);
        CHECK(std::string(ast::kind_name(out.program.body[0])) == "scene");
        CHECK(std::string(ast::kind_name(out.program.body[1])) == "entity");
        CHECK(std::string(ast::kind_name(out.program.body[2])) == "behavior");
        CHECK(std::string(ast::kind_name(out.program.body[3])) == "game");
        CHECK(ast::name_of(out.program.body[0]) == "Main");
        CHECK(ast::name_of(out.program.body[3]).empty());
    }

    TEST_CASE("Declaration ranges") {
        auto out = parse_gdl("entity A {\n  x: 1\n}");

        REQUIRE_FALSE(out.has_errors());
        auto range = ast::range_of(out.program.body[0]);
        CHECK(range.start.line == 1);
        CHECK(range.start.column == 1);
        CHECK(range.end.line == 3);
        CHECK(range.end.column == 2);
    }

    TEST_CASE("parse() accepts a token stream without end marker") {
        auto tokens = tokenize("game { title: \"x\" }");
        tokens.pop_back();

        auto out = parse(std::move(tokens));
        CHECK_FALSE(out.has_errors());
        CHECK(out.program.body.size() == 1);
    }
}
