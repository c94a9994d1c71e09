//
// Tests for the GDL lexer
//

#include <doctest/doctest.h>
#include <gdl/lexer.hh>
#include <stdexcept>

using namespace gdl;

namespace {
    std::vector<std::string> values_of(const std::vector<token>& tokens) {
        std::vector<std::string> values;
        for (const auto& t : tokens) {
            values.push_back(t.value);
        }
        return values;
    }
}

TEST_SUITE("Lexer") {
    TEST_CASE("Empty source yields only end of input") {
        auto tokens = tokenize("");

        REQUIRE(tokens.size() == 1);
        CHECK(tokens[0].kind == token_kind::end_of_input);
        CHECK(tokens[0].pos.line == 1);
        CHECK(tokens[0].pos.column == 1);
    }

    TEST_CASE("Game block token stream") {
        auto tokens = tokenize(R"(game { title: "Hi" })");

        REQUIRE(tokens.size() == 7);
        CHECK(tokens[0].is(token_kind::keyword, "game"));
        CHECK(tokens[1].is(token_kind::punctuation, "{"));
        CHECK(tokens[2].is(token_kind::identifier, "title"));
        CHECK(tokens[3].is(token_kind::punctuation, ":"));
        CHECK(tokens[4].is(token_kind::string, "Hi"));
        CHECK(tokens[5].is(token_kind::punctuation, "}"));
        CHECK(tokens[6].is(token_kind::end_of_input));
    }

    TEST_CASE("Keywords, booleans and identifiers") {
        auto tokens = tokenize("sprite true false null Player spawnPoint");

        REQUIRE(tokens.size() == 7);
        CHECK(tokens[0].is(token_kind::keyword, "sprite"));
        CHECK(tokens[1].is(token_kind::boolean, "true"));
        CHECK(tokens[2].is(token_kind::boolean, "false"));
        CHECK(tokens[3].is(token_kind::keyword, "null"));
        CHECK(tokens[4].is(token_kind::identifier, "Player"));
        CHECK(tokens[5].is(token_kind::identifier, "spawnPoint"));
    }

    TEST_CASE("Keyword table") {
        CHECK(is_keyword("game"));
        CHECK(is_keyword("during"));
        CHECK(is_keyword("within"));
        CHECK_FALSE(is_keyword("Game"));
        CHECK_FALSE(is_keyword("player"));

        CHECK(is_declaration_keyword("entity"));
        CHECK(is_declaration_keyword("scene"));
        CHECK_FALSE(is_declaration_keyword("spawn"));
    }

    TEST_CASE("Numbers") {
        SUBCASE("Integers, decimals and exponents") {
            auto tokens = tokenize("42 3.14 1e3 2.5e-2");
            REQUIRE(tokens.size() == 5);
            for (std::size_t i = 0; i < 4; ++i) {
                CHECK(tokens[i].kind == token_kind::number);
            }
            CHECK(values_of(tokens) == std::vector<std::string>{"42", "3.14", "1e3", "2.5e-2", ""});
        }

        SUBCASE("Leading minus directly before a digit is part of the number") {
            auto tokens = tokenize("-7");
            REQUIRE(tokens.size() == 2);
            CHECK(tokens[0].is(token_kind::number, "-7"));
        }

        SUBCASE("Minus separated by space is an operator") {
            auto tokens = tokenize("- 7");
            REQUIRE(tokens.size() == 3);
            CHECK(tokens[0].is(token_kind::op, "-"));
            CHECK(tokens[1].is(token_kind::number, "7"));
        }

        SUBCASE("Dot without following digit is not part of the number") {
            auto tokens = tokenize("1.");
            REQUIRE(tokens.size() == 3);
            CHECK(tokens[0].is(token_kind::number, "1"));
            CHECK(tokens[1].is(token_kind::punctuation, "."));
        }

        SUBCASE("Exponent marker without digits stays out") {
            auto tokens = tokenize("5e");
            REQUIRE(tokens.size() == 3);
            CHECK(tokens[0].is(token_kind::number, "5"));
            CHECK(tokens[1].is(token_kind::identifier, "e"));
        }
    }

    TEST_CASE("Strings") {
        SUBCASE("Double and single quotes") {
            auto tokens = tokenize(R"("double" 'single')");
            REQUIRE(tokens.size() == 3);
            CHECK(tokens[0].is(token_kind::string, "double"));
            CHECK(tokens[1].is(token_kind::string, "single"));
        }

        SUBCASE("Escape sequences") {
            auto tokens = tokenize(R"("a\nb\tc \"q\" \\ \z")");
            REQUIRE(tokens.size() == 2);
            CHECK(tokens[0].value == "a\nb\tc \"q\" \\ z");
        }

        SUBCASE("Unterminated string is closed at end of input") {
            auto tokens = tokenize(R"("abc)");
            REQUIRE(tokens.size() == 2);
            CHECK(tokens[0].is(token_kind::string, "abc"));
            CHECK(tokens[1].is(token_kind::end_of_input));
        }
    }

    TEST_CASE("Comments are skipped") {
        auto tokens = tokenize("// line comment\nentity /* block\ncomment */ Player");

        REQUIRE(tokens.size() == 3);
        CHECK(tokens[0].is(token_kind::keyword, "entity"));
        CHECK(tokens[1].is(token_kind::identifier, "Player"));
        CHECK(tokens[1].pos.line == 3);
    }

    TEST_CASE("Unterminated block comment runs to end of input") {
        auto tokens = tokenize("game /* never closed");

        REQUIRE(tokens.size() == 2);
        CHECK(tokens[0].is(token_kind::keyword, "game"));
        CHECK(tokens[1].is(token_kind::end_of_input));
    }

    TEST_CASE("Operators") {
        auto tokens = tokenize("== != <= >= += -= *= /= && || + * / ! < >");

        std::vector<std::string> expected = {
            "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "&&", "||",
            "+", "*", "/", "!", "<", ">"
        };
        REQUIRE(tokens.size() == expected.size() + 1);
        for (std::size_t i = 0; i < expected.size(); ++i) {
            CHECK(tokens[i].is(token_kind::op, expected[i]));
        }
    }

    TEST_CASE("Unknown characters become punctuation") {
        auto tokens = tokenize("@ .");

        REQUIRE(tokens.size() == 3);
        CHECK(tokens[0].is(token_kind::punctuation, "@"));
        CHECK(tokens[1].is(token_kind::punctuation, "."));
    }

    TEST_CASE("Source positions") {
        auto tokens = tokenize("game\n  entity Hero");

        REQUIRE(tokens.size() == 4);
        CHECK(tokens[0].pos.line == 1);
        CHECK(tokens[0].pos.column == 1);
        CHECK(tokens[0].end.column == 5);

        CHECK(tokens[1].pos.line == 2);
        CHECK(tokens[1].pos.column == 3);
        CHECK(tokens[1].pos.offset == 7);

        CHECK(tokens[2].pos.column == 10);
        CHECK(tokens[2].end.offset == 18);
    }

    TEST_CASE("A lexer tokenizes exactly once") {
        lexer lex("game {}");
        auto tokens = lex.tokenize();
        CHECK(tokens.size() == 4);

        CHECK_THROWS_AS(lex.tokenize(), std::logic_error);
    }

    TEST_CASE("Tokenizing is deterministic") {
        const char* source = R"(scene Main { spawn Player at [100, 200] as hero })";
        auto a = tokenize(source);
        auto b = tokenize(source);

        REQUIRE(a.size() == b.size());
        for (std::size_t i = 0; i < a.size(); ++i) {
            CHECK(a[i].kind == b[i].kind);
            CHECK(a[i].value == b[i].value);
            CHECK(a[i].pos.offset == b[i].pos.offset);
        }
    }
}
