//
// GDL Parser
//
// Recursive descent over the token sequence produced by gdl::lexer.
// Syntax errors do not stop parsing: each one is recorded and the parser
// resynchronizes at the next `;`, `}` or declaration keyword, so a single
// pass reports every independent mistake. The error list is part of the
// returned value.
//

#pragma once

#include <gdl/ast.hh>
#include <gdl/diagnostic.hh>
#include <gdl/token.hh>
#include <string_view>
#include <vector>

namespace gdl {
    struct parse_output {
        ast::program program;
        std::vector<diagnostic> errors;   // all with code E001

        [[nodiscard]] bool has_errors() const { return !errors.empty(); }
    };

    /// Parse a token sequence. A missing trailing end_of_input token is
    /// tolerated.
    parse_output parse(std::vector<token> tokens);

    /// Tokenize and parse GDL source text.
    parse_output parse_gdl(std::string_view source);
}
