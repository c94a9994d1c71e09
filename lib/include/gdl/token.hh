//
// Tokens produced by the GDL lexer
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gdl {
    /// Location of a character in the source text.
    /// Lines and columns are 1-based, offset is a 0-based byte index.
    struct source_pos {
        std::size_t line = 1;
        std::size_t column = 1;
        std::size_t offset = 0;
    };

    /// Half-open span of source text [start, end).
    struct source_range {
        source_pos start;
        source_pos end;
    };

    enum class token_kind {
        identifier,
        string,
        number,
        boolean,
        keyword,
        op,
        punctuation,
        end_of_input
    };

    struct token {
        token_kind kind;
        std::string value;   // unescaped for strings, verbatim otherwise
        source_pos pos;
        source_pos end;

        [[nodiscard]] bool is(token_kind k) const { return kind == k; }
        [[nodiscard]] bool is(token_kind k, std::string_view v) const {
            return kind == k && value == v;
        }

        [[nodiscard]] source_range range() const { return {pos, end}; }
    };

    /// Human readable name of a token kind ("identifier", "end of input", ...)
    const char* to_string(token_kind kind);

    /// True for the reserved words of the language. `true` and `false`
    /// are reserved too, but lex as boolean tokens.
    bool is_keyword(std::string_view word);

    /// True for the four words that open a top-level declaration.
    bool is_declaration_keyword(std::string_view word);
}
