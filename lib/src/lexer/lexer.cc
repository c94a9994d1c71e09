//
// GDL Lexer implementation
//

#include <gdl/lexer.hh>
#include <array>
#include <cctype>
#include <stdexcept>

namespace gdl {

namespace {
    constexpr std::array<std::string_view, 30> keyword_list = {
        "game", "entity", "behavior", "scene",
        "sprite", "physics", "body", "animations",
        "properties", "methods", "update",
        "on", "when", "spawn", "at", "as",
        "if", "else", "for", "while",
        "true", "false", "null",
        "grid", "random", "repeat", "within",
        "every", "after", "during"
    };

    bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool is_identifier_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    bool is_identifier_part(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    bool is_punctuation(char c) {
        switch (c) {
            case '{': case '}': case '(': case ')':
            case '[': case ']': case ',': case ':': case ';':
                return true;
            default:
                return false;
        }
    }

    bool is_operator(char c) {
        switch (c) {
            case '+': case '-': case '*': case '/': case '%':
            case '=': case '<': case '>': case '!':
            case '&': case '|': case '^': case '~':
                return true;
            default:
                return false;
        }
    }
}

// ============================================================================
// Token helpers
// ============================================================================

const char* to_string(token_kind kind) {
    switch (kind) {
        case token_kind::identifier:   return "identifier";
        case token_kind::string:       return "string";
        case token_kind::number:       return "number";
        case token_kind::boolean:      return "boolean";
        case token_kind::keyword:      return "keyword";
        case token_kind::op:           return "operator";
        case token_kind::punctuation:  return "punctuation";
        case token_kind::end_of_input: return "end of input";
    }
    return "token";
}

bool is_keyword(std::string_view word) {
    for (const auto& kw : keyword_list) {
        if (kw == word) {
            return true;
        }
    }
    return false;
}

bool is_declaration_keyword(std::string_view word) {
    return word == "game" || word == "entity" || word == "behavior" || word == "scene";
}

// ============================================================================
// Lexer
// ============================================================================

lexer::lexer(std::string_view source)
    : source_(source) {
}

char lexer::peek(std::size_t ahead) const {
    const auto i = index_ + ahead;
    return i < source_.size() ? source_[i] : '\0';
}

char lexer::advance() {
    const char c = source_[index_++];
    pos_.offset = index_;
    if (c == '\n') {
        pos_.line++;
        pos_.column = 1;
    } else {
        pos_.column++;
    }
    return c;
}

token lexer::make_token(token_kind kind, std::string value, const source_pos& start) const {
    return token{kind, std::move(value), start, pos_};
}

std::vector<token> lexer::tokenize() {
    if (consumed_) {
        throw std::logic_error("lexer::tokenize() called twice on the same lexer");
    }
    consumed_ = true;

    std::vector<token> tokens;

    while (true) {
        skip_whitespace_and_comments();
        if (at_end()) {
            break;
        }

        const char c = peek();
        if (is_digit(c) || (c == '-' && is_digit(peek(1)))) {
            tokens.push_back(read_number());
        } else if (c == '"' || c == '\'') {
            tokens.push_back(read_string());
        } else if (is_identifier_start(c)) {
            tokens.push_back(read_word());
        } else if (is_punctuation(c)) {
            const auto start = pos_;
            tokens.push_back(make_token(token_kind::punctuation, std::string(1, advance()), start));
        } else if (is_operator(c)) {
            tokens.push_back(read_operator());
        } else {
            // Unknown characters are handed to the parser as punctuation
            const auto start = pos_;
            tokens.push_back(make_token(token_kind::punctuation, std::string(1, advance()), start));
        }
    }

    tokens.push_back(make_token(token_kind::end_of_input, "", pos_));
    return tokens;
}

void lexer::skip_whitespace_and_comments() {
    while (!at_end()) {
        const char c = peek();
        if (is_space(c)) {
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (!at_end() && peek() != '\n') {
                advance();
            }
        } else if (c == '/' && peek(1) == '*') {
            advance();
            advance();
            while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
                advance();
            }
            if (!at_end()) {
                advance();
                advance();
            }
        } else {
            return;
        }
    }
}

token lexer::read_number() {
    const auto start = pos_;
    std::string text;

    if (peek() == '-') {
        text += advance();
    }
    while (is_digit(peek())) {
        text += advance();
    }

    if (peek() == '.' && is_digit(peek(1))) {
        text += advance();
        while (is_digit(peek())) {
            text += advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        const bool signed_exp = (peek(1) == '+' || peek(1) == '-') && is_digit(peek(2));
        if (is_digit(peek(1)) || signed_exp) {
            text += advance();
            if (signed_exp) {
                text += advance();
            }
            while (is_digit(peek())) {
                text += advance();
            }
        }
    }

    return make_token(token_kind::number, std::move(text), start);
}

token lexer::read_string() {
    const auto start = pos_;
    const char quote = advance();
    std::string value;

    while (!at_end() && peek() != quote) {
        if (peek() == '\\') {
            advance();
            if (at_end()) {
                break;
            }
            const char escaped = advance();
            switch (escaped) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default:  value += escaped; break;
            }
        } else {
            value += advance();
        }
    }

    // Unterminated strings are closed silently at end of input
    if (!at_end()) {
        advance();
    }

    return make_token(token_kind::string, std::move(value), start);
}

token lexer::read_word() {
    const auto start = pos_;
    std::string word;
    while (is_identifier_part(peek())) {
        word += advance();
    }

    token_kind kind = token_kind::identifier;
    if (word == "true" || word == "false") {
        kind = token_kind::boolean;
    } else if (is_keyword(word)) {
        kind = token_kind::keyword;
    }
    return make_token(kind, std::move(word), start);
}

token lexer::read_operator() {
    const auto start = pos_;
    std::string op(1, advance());
    const char first = op[0];
    const char next = peek();

    switch (first) {
        case '=': case '!': case '<': case '>':
        case '+': case '-': case '*': case '/':
            if (next == '=') {
                op += advance();
            }
            break;
        case '&': case '|':
            if (next == first) {
                op += advance();
            }
            break;
        default:
            break;
    }

    return make_token(token_kind::op, std::move(op), start);
}

std::vector<token> tokenize(std::string_view source) {
    lexer lex(source);
    return lex.tokenize();
}

} // namespace gdl
