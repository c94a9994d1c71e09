//
// Tests for Phase 2: Reference Validation
//

#include <doctest/doctest.h>
#include <gdl/parser.hh>
#include <gdl/semantic.hh>

using namespace gdl;
using namespace gdl::semantic;

namespace {
    // Helper: run phases 1 and 2, returning only the phase 2 diagnostics
    std::vector<diagnostic> check_references(const std::string& source) {
        auto parsed = parse_gdl(source);
        REQUIRE_FALSE(parsed.has_errors());

        std::vector<diagnostic> symbol_diags;
        auto symbols = phases::collect_symbols(parsed.program, symbol_diags);

        std::vector<diagnostic> diags;
        phases::validate_references(parsed.program, symbols, diags);
        return diags;
    }

    std::vector<diagnostic> with_code(const std::vector<diagnostic>& diags, const std::string& code) {
        std::vector<diagnostic> result;
        for (const auto& d : diags) {
            if (d.code == code) result.push_back(d);
        }
        return result;
    }
}

TEST_SUITE("Semantic Analysis - References") {
    TEST_CASE("Valid program has no reference diagnostics") {
        auto diags = check_references(R"(
            game { defaultScene: Main }
            behavior Jump {}
            entity Player { behaviors: [Jump] }
            scene Main { spawn Player at [0, 0] as hero }
        )");

        CHECK(diags.empty());
    }

    TEST_CASE("Undefined behavior") {
        auto diags = check_references(R"(
            behavior Jump {}
            entity Player { behaviors: [Jmp, Jump] }
        )");

        auto undefined = with_code(diags, diag_codes::E_UNDEFINED_BEHAVIOR);
        REQUIRE(undefined.size() == 1);
        CHECK(undefined[0].is_error());
        CHECK(undefined[0].message == "Behavior 'Jmp' is not defined");
        CHECK(undefined[0].suggestions == std::vector<std::string>{"Jump"});
        REQUIRE(undefined[0].range.has_value());
        CHECK(undefined[0].range->start.line == 3);
        CHECK(undefined[0].range->start.column == 41);
    }

    TEST_CASE("No suggestion for distant names") {
        auto diags = check_references(R"(
            behavior Jump {}
            entity Player { behaviors: [Teleport, Jump] }
        )");

        auto undefined = with_code(diags, diag_codes::E_UNDEFINED_BEHAVIOR);
        REQUIRE(undefined.size() == 1);
        CHECK(undefined[0].suggestions.empty());
    }

    TEST_CASE("Undefined spawned entity") {
        auto diags = check_references(R"(
            entity Player {}
            scene Main { spawn Playr at [0, 0] }
        )");

        REQUIRE(diags.size() == 1);
        CHECK(diags[0].code == diag_codes::E_UNDEFINED_ENTITY);
        CHECK(diags[0].message == "Entity 'Playr' is not defined");
        CHECK(diags[0].suggestions == std::vector<std::string>{"Player"});
        CHECK(diags[0].range->start.column == 32);
    }

    TEST_CASE("Undefined default scene") {
        SUBCASE("Identifier") {
            auto diags = check_references("scene Main {}\ngame { defaultScene: Mian }");

            REQUIRE(diags.size() == 1);
            CHECK(diags[0].code == diag_codes::E_UNDEFINED_SCENE);
            CHECK(diags[0].message == "Default scene 'Mian' is not defined");
            CHECK(diags[0].suggestions == std::vector<std::string>{"Main"});
            CHECK(diags[0].range->start.line == 2);
            CHECK(diags[0].range->start.column == 22);
        }

        SUBCASE("String") {
            auto diags = check_references(R"(game { defaultScene: "Level1" })");

            REQUIRE(diags.size() == 1);
            CHECK(diags[0].message == "Default scene 'Level1' is not defined");
        }

        SUBCASE("Declared scene given as string") {
            auto diags = check_references(R"(scene Level1 {} game { defaultScene: "Level1" })");
            CHECK(diags.empty());
        }
    }

    TEST_CASE("Unused behaviors are reported in declaration order") {
        auto diags = check_references(R"(
            behavior Zoom {}
            behavior Jump {}
            behavior Fly {}
            entity Player { behaviors: [Jump] }
        )");

        auto unused = with_code(diags, diag_codes::W_UNUSED_BEHAVIOR);
        REQUIRE(unused.size() == 2);
        CHECK_FALSE(unused[0].is_error());
        CHECK(unused[0].message == "Behavior 'Zoom' is never used by any entity");
        CHECK(unused[1].message == "Behavior 'Fly' is never used by any entity");
        CHECK(unused[0].range->start.line == 2);
    }

    TEST_CASE("Non-identifier behavior references are ignored with a warning") {
        auto diags = check_references(R"(
            behavior Jump {}
            entity Player { behaviors: [Jump, "Fly", 3] }
        )");

        auto ignored = with_code(diags, diag_codes::W_IGNORED_BEHAVIOR_REF);
        REQUIRE(ignored.size() == 2);
        CHECK(ignored[0].message == "Ignoring string in behaviors list of entity 'Player'; expected a behavior name");
        CHECK(ignored[1].message == "Ignoring number in behaviors list of entity 'Player'; expected a behavior name");
        CHECK(with_code(diags, diag_codes::E_UNDEFINED_BEHAVIOR).empty());
    }

    TEST_CASE("Duplicate spawn names within a scene") {
        SUBCASE("Same name") {
            auto diags = check_references(R"(
                entity Coin {}
                scene Main {
                    spawn Coin at [0, 0] as bonus
                    spawn Coin at [5, 5] as bonus
                }
            )");

            REQUIRE(diags.size() == 1);
            CHECK(diags[0].code == diag_codes::E_DUPLICATE_SPAWN_NAME);
            CHECK(diags[0].message == "Spawn name 'bonus' is already used in scene 'Main'");
            CHECK(diags[0].range->start.line == 5);
            CHECK(diags[0].related_range->start.line == 4);
            CHECK(diags[0].related_message == std::optional<std::string>("'bonus' first spawned here"));
        }

        SUBCASE("Names that sanitize to the same local") {
            auto diags = check_references(R"(
                entity Coin {}
                scene Main {
                    spawn Coin at [0, 0] as class
                    spawn Coin at [5, 5] as class_
                }
            )");

            REQUIRE(diags.size() == 1);
            CHECK(diags[0].message == "Spawn name 'class_' is already used in scene 'Main'");
        }

        SUBCASE("Same name in different scenes") {
            auto diags = check_references(R"(
                entity Coin {}
                scene A { spawn Coin at [0, 0] as bonus }
                scene B { spawn Coin at [0, 0] as bonus }
            )");

            CHECK(diags.empty());
        }

        SUBCASE("Anonymous spawns never clash") {
            auto diags = check_references(R"(
                entity Coin {}
                scene A { spawn Coin at [0, 0] spawn Coin at [0, 0] }
            )");

            CHECK(diags.empty());
        }
    }

    TEST_CASE("Suggestions") {
        CHECK(edit_distance("", "") == 0);
        CHECK(edit_distance("Jump", "Jump") == 0);
        CHECK(edit_distance("Jmp", "Jump") == 1);
        CHECK(edit_distance("kitten", "sitting") == 3);
        CHECK(edit_distance("", "abc") == 3);

        auto names = similar_names("Plyer", {"Player", "Prayer", "Enemy", "Plyers"});
        CHECK(names == std::vector<std::string>{"Player", "Plyers", "Prayer"});

        CHECK(similar_names("X", {}).empty());
    }
}
