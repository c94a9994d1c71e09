//
// Unit tests for CodeWriter and RAII block classes
//

#include <doctest/doctest.h>
#include <gdl/codegen/code_writer.hh>
#include <sstream>
#include <string>
#include <utility>

using namespace gdl::codegen;

// ============================================================================
// CodeWriter Basic Tests
// ============================================================================

TEST_CASE("CodeWriter: Basic output") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Write single line") {
        writer.write_line("hello");
        CHECK(oss.str() == "hello\n");
    }

    SUBCASE("Write multiple lines") {
        writer.write_line("line1");
        writer.write_line("line2");
        CHECK(oss.str() == "line1\nline2\n");
    }

    SUBCASE("Write blank line") {
        writer.write_blank_line();
        CHECK(oss.str() == "\n");
    }

    SUBCASE("Write comment") {
        writer.write_comment("Scene: Main");
        CHECK(oss.str() == "// Scene: Main\n");
    }
}

TEST_CASE("CodeWriter: Indentation") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Indent increases level") {
        writer.indent();
        writer.write_line("indented");
        CHECK(oss.str() == "    indented\n");
        CHECK(writer.current_indent_level() == 1);
    }

    SUBCASE("Unindent decreases level") {
        writer.indent();
        writer.indent();
        writer.unindent();
        writer.write_line("single indent");
        CHECK(oss.str() == "    single indent\n");
    }

    SUBCASE("Unindent at level 0 is safe") {
        writer.unindent();
        writer.write_line("no indent");
        CHECK(oss.str() == "no indent\n");
    }

    SUBCASE("Blank lines carry no indentation") {
        writer.indent();
        writer.write_line("");
        writer.write_blank_line();
        CHECK(oss.str() == "\n\n");
    }
}

TEST_CASE("CodeWriter: Line counting") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    CHECK(writer.current_line() == 1);

    writer.write_line("first");
    CHECK(writer.current_line() == 2);

    writer.write_blank_line();
    CHECK(writer.current_line() == 3);

    writer.write_line("x\ny");
    CHECK(writer.current_line() == 5);

    writer << "streamed" << endl;
    CHECK(writer.current_line() == 6);

    writer << blank;
    CHECK(writer.current_line() == 7);
}

// ============================================================================
// IfBlock Tests
// ============================================================================

TEST_CASE("IfBlock: Basic usage") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Simple if block") {
        {
            auto if_block = writer.write_if("!EntityClass");
            writer.write_line("throw new Error(\"missing\");");
        }

        std::string expected = "if (!EntityClass) {\n"
                              "    throw new Error(\"missing\");\n"
                              "}\n";
        CHECK(oss.str() == expected);
    }

    SUBCASE("If-else chain") {
        {
            auto if_block = writer.write_if("SceneClass");
            writer.write_line("scene.initialize();");

            auto else_block = if_block.write_else();
            writer.write_line("console.error(\"not found\");");
        }

        std::string expected = "if (SceneClass) {\n"
                              "    scene.initialize();\n"
                              "} else {\n"
                              "    console.error(\"not found\");\n"
                              "}\n";
        CHECK(oss.str() == expected);
    }

    SUBCASE("Moved block closes once") {
        {
            auto first = writer.write_if("a");
            auto second = std::move(first);
            writer.write_line("b();");
        }

        CHECK(oss.str() == "if (a) {\n    b();\n}\n");
    }
}

// ============================================================================
// Nested Blocks Tests
// ============================================================================

TEST_CASE("Nested blocks") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    {
        auto if_block = writer.write_if("condition1");
        writer.write_line("outer();");

        {
            auto nested_if = writer.write_if("condition2");
            writer.write_line("inner();");
        }

        writer.write_line("after_nested();");
    }

    std::string expected = "if (condition1) {\n"
                          "    outer();\n"
                          "    if (condition2) {\n"
                          "        inner();\n"
                          "    }\n"
                          "    after_nested();\n"
                          "}\n";
    CHECK(oss.str() == expected);
    CHECK(writer.current_indent_level() == 0);
}

// ============================================================================
// Streaming Operator Tests
// ============================================================================

TEST_CASE("Streaming operators: Basic usage") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Chain multiple strings") {
        writer << "Hello" << " " << "World" << endl;
        CHECK(oss.str() == "Hello World\n");
    }

    SUBCASE("Stream with sizes") {
        std::size_t line = 12;
        std::size_t column = 3;
        writer << "// source: line " << line << ", column " << column << endl;
        CHECK(oss.str() == "// source: line 12, column 3\n");
    }

    SUBCASE("Nothing is written before endl") {
        writer << "pending";
        CHECK(oss.str().empty());
        writer << endl;
        CHECK(oss.str() == "pending\n");
    }
}

TEST_CASE("Streaming operators: Manipulators") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    writer << "Level 0" << endl;
    writer.indent();
    writer << "Level 1" << endl;
    writer << blank;
    writer.unindent();
    writer << "Level 0" << endl;

    std::string expected = "Level 0\n"
                          "    Level 1\n"
                          "\n"
                          "Level 0\n";
    CHECK(oss.str() == expected);
}

TEST_CASE("Streaming operators: If-block with streams") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    {
        auto if_block = writer.write_if("x > 0");
        if_block << "return x;" << endl;
    }

    std::string expected = "if (x > 0) {\n"
                          "    return x;\n"
                          "}\n";
    CHECK(oss.str() == expected);
}
