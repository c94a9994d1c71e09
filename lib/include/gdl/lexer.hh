//
// GDL Lexer
//
// Single left-to-right scan over the source text. The lexer is lenient:
// it never reports an error. Characters it does not understand become
// one-character punctuation tokens and unterminated strings or block
// comments are closed at end of input. The parser is responsible for
// rejecting whatever does not fit the grammar.
//

#pragma once

#include <gdl/token.hh>
#include <string>
#include <string_view>
#include <vector>

namespace gdl {
    class lexer {
        public:
            explicit lexer(std::string_view source);

            /// Produce the complete token sequence, terminated by a single
            /// end_of_input token. A lexer tokenizes exactly once; calling
            /// this a second time throws std::logic_error.
            std::vector<token> tokenize();

        private:
            [[nodiscard]] bool at_end() const { return index_ >= source_.size(); }
            [[nodiscard]] char peek(std::size_t ahead = 0) const;
            char advance();

            void skip_whitespace_and_comments();

            token read_number();
            token read_string();
            token read_word();
            token read_operator();
            token make_token(token_kind kind, std::string value, const source_pos& start) const;

            std::string source_;
            std::size_t index_ = 0;
            source_pos pos_;
            bool consumed_ = false;
    };

    /// Convenience wrapper: tokenize the whole source with a fresh lexer.
    std::vector<token> tokenize(std::string_view source);
}
