//
// Parser tests: spawn position expressions
//

#include <doctest/doctest.h>
#include <gdl/parser.hh>
#include <string>

using namespace gdl;

namespace {
    // Parse "scene S { spawn A at <position> }" and return the position
    ast::expr parse_position(const std::string& position) {
        auto out = parse_gdl("scene S { spawn A at " + position + " }");
        REQUIRE_FALSE(out.has_errors());
        auto& scene = std::get<ast::scene_decl>(out.program.body.at(0));
        REQUIRE(scene.spawns.size() == 1);
        return std::move(scene.spawns[0].position);
    }
}

TEST_SUITE("Parser - Position Expressions") {
    TEST_CASE("Identifier position") {
        auto pos = parse_position("center");

        const auto* id = std::get_if<ast::identifier>(&pos.node);
        REQUIRE(id != nullptr);
        CHECK(id->name == "center");
    }

    TEST_CASE("Arithmetic inside a vector") {
        auto pos = parse_position("[x + 10, y * 2]");

        const auto& call = std::get<ast::call_expr>(pos.node);
        REQUIRE(call.arguments.size() == 2);

        const auto& first = std::get<ast::binary_expr>(call.arguments[0].node);
        CHECK(first.op == "+");
        CHECK(std::get<ast::identifier>(first.left->node).name == "x");

        const auto& second = std::get<ast::binary_expr>(call.arguments[1].node);
        CHECK(second.op == "*");
    }

    TEST_CASE("Multiplication binds tighter than addition") {
        auto pos = parse_position("[1 + 2 * 3, 0]");

        const auto& call = std::get<ast::call_expr>(pos.node);
        const auto& sum = std::get<ast::binary_expr>(call.arguments[0].node);
        CHECK(sum.op == "+");
        CHECK(std::holds_alternative<ast::number_literal>(sum.left->node));

        const auto& product = std::get<ast::binary_expr>(sum.right->node);
        CHECK(product.op == "*");
    }

    TEST_CASE("Addition is left associative") {
        auto pos = parse_position("[1 + 2 + 3, 0]");

        const auto& call = std::get<ast::call_expr>(pos.node);
        const auto& outer = std::get<ast::binary_expr>(call.arguments[0].node);
        CHECK(std::holds_alternative<ast::binary_expr>(outer.left->node));
        CHECK(std::holds_alternative<ast::number_literal>(outer.right->node));
    }

    TEST_CASE("Parentheses around a single expression group it") {
        auto pos = parse_position("(cx + 1)");

        const auto* sum = std::get_if<ast::binary_expr>(&pos.node);
        REQUIRE(sum != nullptr);
        CHECK(sum->op == "+");
    }

    TEST_CASE("Trailing comma makes a one-element vector") {
        auto pos = parse_position("(5,)");

        const auto* call = std::get_if<ast::call_expr>(&pos.node);
        REQUIRE(call != nullptr);
        CHECK(call->callee == "Vector2");
        CHECK(call->arguments.size() == 1);
    }

    TEST_CASE("Unary operators") {
        auto pos = parse_position("[-x, !flag]");

        const auto& call = std::get<ast::call_expr>(pos.node);
        const auto& neg = std::get<ast::unary_expr>(call.arguments[0].node);
        CHECK(neg.op == "-");
        CHECK(std::get<ast::identifier>(neg.operand->node).name == "x");

        const auto& inv = std::get<ast::unary_expr>(call.arguments[1].node);
        CHECK(inv.op == "!");
    }

    TEST_CASE("Member access") {
        auto pos = parse_position("player.spawn_point");

        const auto* member = std::get_if<ast::member_expr>(&pos.node);
        REQUIRE(member != nullptr);
        CHECK(member->member == "spawn_point");
        CHECK(std::get<ast::identifier>(member->object->node).name == "player");
    }

    TEST_CASE("Function call position") {
        auto pos = parse_position("randomPoint(10, 20)");

        const auto* call = std::get_if<ast::call_expr>(&pos.node);
        REQUIRE(call != nullptr);
        CHECK(call->callee == "randomPoint");
        CHECK(call->arguments.size() == 2);
    }

    TEST_CASE("Explicit Vector2 call") {
        auto pos = parse_position("Vector2(1, 2)");

        const auto& call = std::get<ast::call_expr>(pos.node);
        CHECK(call.callee == "Vector2");
        CHECK(call.arguments.size() == 2);
    }

    TEST_CASE("Position followed by a name") {
        auto out = parse_gdl("scene S { spawn A at [1, 2] * 2 as big }");

        REQUIRE_FALSE(out.has_errors());
        const auto& spawn = std::get<ast::scene_decl>(out.program.body[0]).spawns.at(0);
        CHECK(std::holds_alternative<ast::binary_expr>(spawn.position.node));
        CHECK(spawn.name == std::optional<std::string>("big"));
    }
}
