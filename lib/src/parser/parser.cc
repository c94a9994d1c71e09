//
// GDL recursive-descent parser
//

#include <gdl/parser.hh>
#include <gdl/lexer.hh>
#include "parse_result.hh"

#include <charconv>
#include <string>
#include <utility>

namespace gdl {

using detail::parse_result;
using detail::syntax_error;

namespace {

    std::string describe(const token& tok) {
        if (tok.is(token_kind::end_of_input)) {
            return "end of input";
        }
        return "'" + tok.value + "'";
    }

    std::string describe_with_kind(const token& tok) {
        if (tok.is(token_kind::end_of_input)) {
            return "end of input";
        }
        return std::string(to_string(tok.kind)) + " '" + tok.value + "'";
    }

    // Values, position operands and operator chains each count as one level
    constexpr std::size_t max_nesting_depth = 256;

    // Counts nesting levels for the current parse path and restores the
    // count when the path returns.
    class nesting_scope {
        public:
            explicit nesting_scope(std::size_t& depth)
                : depth_(depth),
                  saved_(depth) {
            }

            ~nesting_scope() { depth_ = saved_; }

            nesting_scope(const nesting_scope&) = delete;
            nesting_scope& operator=(const nesting_scope&) = delete;

            [[nodiscard]] bool enter() { return ++depth_ <= max_nesting_depth; }

        private:
            std::size_t& depth_;
            std::size_t saved_;
    };

    syntax_error too_deep(const token& at) {
        return syntax_error{"Nesting too deep (more than " + std::to_string(max_nesting_depth) + " levels)",
                            at.range()};
    }

    double parse_number(const std::string& text) {
        double value = 0.0;
        std::from_chars(text.data(), text.data() + text.size(), value);
        return value;
    }

    class parser {
        public:
            explicit parser(std::vector<token> tokens)
                : tokens_(std::move(tokens)) {
                if (tokens_.empty() || !tokens_.back().is(token_kind::end_of_input)) {
                    source_pos end_pos = tokens_.empty() ? source_pos{} : tokens_.back().end;
                    tokens_.push_back(token{token_kind::end_of_input, "", end_pos, end_pos});
                }
            }

            parse_output run();

        private:
            // ----------------------------------------------------------------
            // Token stream
            // ----------------------------------------------------------------
            const token& peek(std::size_t offset = 0) const {
                const auto i = current_ + offset;
                return i < tokens_.size() ? tokens_[i] : tokens_.back();
            }

            const token& previous() const {
                return current_ > 0 ? tokens_[current_ - 1] : tokens_.front();
            }

            const token& advance() {
                if (!at_end()) {
                    current_++;
                }
                return previous();
            }

            [[nodiscard]] bool at_end() const { return peek().is(token_kind::end_of_input); }

            [[nodiscard]] bool check_punct(std::string_view value) const {
                return peek().is(token_kind::punctuation, value);
            }

            bool match_punct(std::string_view value) {
                if (check_punct(value)) {
                    advance();
                    return true;
                }
                return false;
            }

            [[nodiscard]] bool at_declaration_keyword() const {
                return peek().is(token_kind::keyword) && is_declaration_keyword(peek().value);
            }

            parse_result<token> consume(token_kind kind, std::string_view value);
            parse_result<token> consume(token_kind kind);
            void synchronize(std::size_t decl_start);

            // ----------------------------------------------------------------
            // Declarations
            // ----------------------------------------------------------------
            parse_result<ast::declaration> parse_declaration();
            parse_result<ast::game_decl> parse_game();
            parse_result<ast::entity_decl> parse_entity();
            parse_result<ast::behavior_decl> parse_behavior();
            parse_result<ast::scene_decl> parse_scene();

            // ----------------------------------------------------------------
            // Properties and values
            // ----------------------------------------------------------------
            [[nodiscard]] bool at_property_start() const;
            parse_result<std::vector<ast::property>> parse_property_list();
            parse_result<ast::property> parse_property();
            parse_result<ast::expr> parse_value();
            parse_result<std::vector<ast::expr>> parse_value_list(std::string_view close);
            parse_result<ast::expr> parse_object();

            // ----------------------------------------------------------------
            // Scene statements
            // ----------------------------------------------------------------
            parse_result<ast::spawn_stmt> parse_spawn();
            parse_result<ast::event_stmt> parse_event();
            parse_result<source_range> parse_handler();

            parse_result<ast::expr> parse_additive();
            parse_result<ast::expr> parse_multiplicative();
            parse_result<ast::expr> parse_unary();
            parse_result<ast::expr> parse_postfix();
            parse_result<ast::expr> parse_primary();
            parse_result<std::vector<ast::expr>> parse_expression_list(std::string_view close);

            std::vector<token> tokens_;
            std::size_t current_ = 0;
            std::size_t depth_ = 0;
            std::vector<diagnostic> errors_;
    };

    // ========================================================================
    // Driver loop and recovery
    // ========================================================================

    parse_output parser::run() {
        parse_output out;

        while (!at_end()) {
            const auto decl_start = current_;
            auto decl = parse_declaration();
            if (decl.ok()) {
                out.program.body.push_back(decl.take());
            } else {
                errors_.push_back(make_error(diag_codes::E_SYNTAX, decl.error().message, decl.error().range));
                synchronize(decl_start);
            }
        }

        if (!out.program.body.empty()) {
            out.program.range = source_range{
                ast::range_of(out.program.body.front()).start,
                ast::range_of(out.program.body.back()).end
            };
        }

        out.errors = std::move(errors_);
        return out;
    }

    void parser::synchronize(std::size_t decl_start) {
        // A declaration keyword that ended a broken declaration starts the next one
        if (current_ == decl_start || !at_declaration_keyword()) {
            advance();
        }

        while (!at_end()) {
            const auto& prev = previous();
            if (prev.is(token_kind::punctuation, ";") || prev.is(token_kind::punctuation, "}")) {
                return;
            }
            if (at_declaration_keyword()) {
                return;
            }
            advance();
        }
    }

    parse_result<token> parser::consume(token_kind kind, std::string_view value) {
        if (peek().is(kind, value)) {
            return advance();
        }
        return syntax_error{
            "Expected '" + std::string(value) + "', got " + describe(peek()),
            peek().range()
        };
    }

    parse_result<token> parser::consume(token_kind kind) {
        if (peek().is(kind)) {
            return advance();
        }
        return syntax_error{
            std::string("Expected ") + to_string(kind) + ", got " + describe_with_kind(peek()),
            peek().range()
        };
    }

    // ========================================================================
    // Declarations
    // ========================================================================

    parse_result<ast::declaration> parser::parse_declaration() {
        const auto& tok = peek();

        if (tok.is(token_kind::keyword)) {
            if (tok.value == "game") {
                auto r = parse_game();
                if (!r.ok()) return r.error();
                return ast::declaration{r.take()};
            }
            if (tok.value == "entity") {
                auto r = parse_entity();
                if (!r.ok()) return r.error();
                return ast::declaration{r.take()};
            }
            if (tok.value == "behavior") {
                auto r = parse_behavior();
                if (!r.ok()) return r.error();
                return ast::declaration{r.take()};
            }
            if (tok.value == "scene") {
                auto r = parse_scene();
                if (!r.ok()) return r.error();
                return ast::declaration{r.take()};
            }
            return syntax_error{"Unexpected keyword: " + tok.value, tok.range()};
        }

        return syntax_error{
            "Expected declaration keyword, got " + describe_with_kind(tok),
            tok.range()
        };
    }

    parse_result<ast::game_decl> parser::parse_game() {
        const auto start = advance().pos;   // 'game'

        auto open = consume(token_kind::punctuation, "{");
        if (!open.ok()) return open.error();

        auto props = parse_property_list();
        if (!props.ok()) return props.error();

        auto close = consume(token_kind::punctuation, "}");
        if (!close.ok()) return close.error();

        return ast::game_decl{{start, close.value().end}, props.take()};
    }

    parse_result<ast::entity_decl> parser::parse_entity() {
        const auto start = advance().pos;   // 'entity'

        auto name = consume(token_kind::identifier);
        if (!name.ok()) return name.error();

        auto open = consume(token_kind::punctuation, "{");
        if (!open.ok()) return open.error();

        auto props = parse_property_list();
        if (!props.ok()) return props.error();

        auto close = consume(token_kind::punctuation, "}");
        if (!close.ok()) return close.error();

        ast::entity_decl decl;
        decl.range = {start, close.value().end};
        decl.name = name.value().value;
        decl.name_range = name.value().range();
        decl.properties = props.take();

        // Expose the identifiers of the `behaviors` array as the behavior list
        if (const auto* behaviors = ast::find_property(decl.properties, "behaviors")) {
            if (const auto* arr = std::get_if<ast::array_literal>(&behaviors->value.node)) {
                for (const auto& element : arr->elements) {
                    if (const auto* id = std::get_if<ast::identifier>(&element.node)) {
                        decl.behaviors.push_back(*id);
                    }
                }
            }
        }

        return std::move(decl);
    }

    parse_result<ast::behavior_decl> parser::parse_behavior() {
        const auto start = advance().pos;   // 'behavior'

        auto name = consume(token_kind::identifier);
        if (!name.ok()) return name.error();

        auto open = consume(token_kind::punctuation, "{");
        if (!open.ok()) return open.error();

        auto props = parse_property_list();
        if (!props.ok()) return props.error();

        auto close = consume(token_kind::punctuation, "}");
        if (!close.ok()) return close.error();

        return ast::behavior_decl{
            {start, close.value().end},
            name.value().value,
            name.value().range(),
            props.take()
        };
    }

    parse_result<ast::scene_decl> parser::parse_scene() {
        const auto start = advance().pos;   // 'scene'

        auto name = consume(token_kind::identifier);
        if (!name.ok()) return name.error();

        auto open = consume(token_kind::punctuation, "{");
        if (!open.ok()) return open.error();

        ast::scene_decl decl;
        decl.name = name.value().value;
        decl.name_range = name.value().range();

        // Properties, spawns and events may be interleaved
        while (!check_punct("}")) {
            if (at_end()) {
                return syntax_error{"Expected '}', got end of input", peek().range()};
            }

            const auto& tok = peek();
            if (tok.is(token_kind::keyword, "spawn")) {
                auto spawn = parse_spawn();
                if (!spawn.ok()) return spawn.error();
                decl.spawns.push_back(spawn.take());
            } else if (tok.is(token_kind::keyword, "when") || tok.is(token_kind::keyword, "on")) {
                auto event = parse_event();
                if (!event.ok()) return event.error();
                decl.events.push_back(event.take());
            } else if (at_property_start()) {
                auto prop = parse_property();
                if (!prop.ok()) return prop.error();
                decl.properties.push_back(prop.take());
                if (!match_punct(",")) {
                    match_punct(";");
                }
            } else if (at_declaration_keyword()) {
                return syntax_error{"Expected '}', got " + describe(tok), tok.range()};
            } else {
                // Local recovery: record and skip the stray token
                errors_.push_back(make_error(
                    diag_codes::E_SYNTAX,
                    "Unexpected token in scene body: " + describe(tok),
                    tok.range()));
                advance();
            }
        }

        const auto end = advance().end;   // '}'
        decl.range = {start, end};
        return std::move(decl);
    }

    // ========================================================================
    // Properties and values
    // ========================================================================

    bool parser::at_property_start() const {
        const auto& tok = peek();
        if (tok.is(token_kind::keyword)) {
            if (tok.value == "spawn" || tok.value == "when" || tok.value == "on") {
                return false;
            }
        } else if (!tok.is(token_kind::identifier)) {
            return false;
        }
        return peek(1).is(token_kind::punctuation, ":");
    }

    parse_result<std::vector<ast::property>> parser::parse_property_list() {
        std::vector<ast::property> props;
        while (at_property_start()) {
            auto prop = parse_property();
            if (!prop.ok()) return prop.error();
            props.push_back(prop.take());

            if (!match_punct(",")) {
                match_punct(";");
            }
        }
        return std::move(props);
    }

    parse_result<ast::property> parser::parse_property() {
        const auto& name_tok = peek();
        if (!name_tok.is(token_kind::identifier) && !name_tok.is(token_kind::keyword)) {
            return syntax_error{
                "Expected property name, got " + describe_with_kind(name_tok),
                name_tok.range()
            };
        }
        const token name = advance();

        auto colon = consume(token_kind::punctuation, ":");
        if (!colon.ok()) return colon.error();

        auto value = parse_value();
        if (!value.ok()) return value.error();

        const auto value_range = ast::range_of(value.value());
        return ast::property{
            {name.pos, value_range.end},
            name.value,
            name.range(),
            value.take()
        };
    }

    parse_result<ast::expr> parser::parse_value() {
        const auto& tok = peek();

        nesting_scope scope(depth_);
        if (!scope.enter()) {
            return too_deep(tok);
        }

        switch (tok.kind) {
            case token_kind::string: {
                const token t = advance();
                return ast::expr{ast::string_literal{t.range(), t.value}};
            }
            case token_kind::number: {
                const token t = advance();
                return ast::expr{ast::number_literal{t.range(), parse_number(t.value), t.value}};
            }
            case token_kind::boolean: {
                const token t = advance();
                return ast::expr{ast::boolean_literal{t.range(), t.value == "true"}};
            }
            case token_kind::identifier: {
                const token t = advance();
                if (!check_punct("(")) {
                    return ast::expr{ast::identifier{t.range(), t.value}};
                }
                // Call-like value: follow(player)
                advance();
                auto args = parse_value_list(")");
                if (!args.ok()) return args.error();
                return ast::expr{ast::call_expr{{t.pos, previous().end}, t.value, args.take()}};
            }
            case token_kind::punctuation: {
                if (tok.value == "[" || tok.value == "(") {
                    // Tuples are arrays
                    const auto start = tok.pos;
                    const std::string close = tok.value == "[" ? "]" : ")";
                    advance();
                    auto elements = parse_value_list(close);
                    if (!elements.ok()) return elements.error();
                    return ast::expr{ast::array_literal{{start, previous().end}, elements.take()}};
                }
                if (tok.value == "{") {
                    return parse_object();
                }
                break;
            }
            default:
                break;
        }

        return syntax_error{"Expected value, got " + describe_with_kind(tok), tok.range()};
    }

    parse_result<std::vector<ast::expr>> parser::parse_value_list(std::string_view close) {
        std::vector<ast::expr> items;

        while (!check_punct(close)) {
            auto item = parse_value();
            if (!item.ok()) return item.error();
            items.push_back(item.take());

            if (!match_punct(",")) {
                break;
            }
        }

        auto end = consume(token_kind::punctuation, close);
        if (!end.ok()) return end.error();
        return std::move(items);
    }

    parse_result<ast::expr> parser::parse_object() {
        const auto start = advance().pos;   // '{'
        std::vector<ast::property> props;

        while (!check_punct("}")) {
            if (at_end()) {
                break;
            }
            auto prop = parse_property();
            if (!prop.ok()) return prop.error();
            props.push_back(prop.take());

            if (!match_punct(",")) {
                match_punct(";");
            }
        }

        auto close = consume(token_kind::punctuation, "}");
        if (!close.ok()) return close.error();
        return ast::expr{ast::object_literal{{start, close.value().end}, std::move(props)}};
    }

    // ========================================================================
    // Scene statements
    // ========================================================================

    parse_result<ast::spawn_stmt> parser::parse_spawn() {
        const auto start = advance().pos;   // 'spawn'

        auto type = consume(token_kind::identifier);
        if (!type.ok()) return type.error();

        auto at = consume(token_kind::keyword, "at");
        if (!at.ok()) return at.error();

        auto position = parse_additive();
        if (!position.ok()) return position.error();

        std::optional<std::string> name;
        if (peek().is(token_kind::keyword, "as")) {
            advance();
            auto name_tok = consume(token_kind::identifier);
            if (!name_tok.ok()) return name_tok.error();
            name = name_tok.value().value;
        }

        return ast::spawn_stmt{
            {start, previous().end},
            type.value().value,
            type.value().range(),
            position.take(),
            std::move(name)
        };
    }

    parse_result<ast::event_stmt> parser::parse_event() {
        const token keyword = advance();   // 'when' or 'on'

        std::string trigger;
        const auto trigger_start = peek().pos;
        auto trigger_end = trigger_start;

        while (!check_punct(":")) {
            const auto& tok = peek();
            if (at_end() || tok.is(token_kind::punctuation, "{") ||
                tok.is(token_kind::punctuation, "}") || tok.is(token_kind::punctuation, ";")) {
                return syntax_error{
                    "Expected ':' after event trigger, got " + describe(tok),
                    tok.range()
                };
            }
            if (!trigger.empty()) {
                trigger += ' ';
            }
            trigger += tok.is(token_kind::string) ? "\"" + tok.value + "\"" : tok.value;
            trigger_end = tok.end;
            advance();
        }

        if (trigger.empty()) {
            return syntax_error{"Expected event trigger, got ':'", peek().range()};
        }

        advance();   // ':'

        auto handler = parse_handler();
        if (!handler.ok()) return handler.error();

        return ast::event_stmt{
            {keyword.pos, handler.value().end},
            keyword.value,
            std::move(trigger),
            {trigger_start, trigger_end},
            handler.value()
        };
    }

    parse_result<source_range> parser::parse_handler() {
        if (check_punct("{")) {
            const token open = advance();
            int depth = 1;
            while (depth > 0) {
                if (at_end()) {
                    return syntax_error{"Unterminated event handler block", open.range()};
                }
                const auto& tok = advance();
                if (tok.is(token_kind::punctuation, "{")) {
                    depth++;
                } else if (tok.is(token_kind::punctuation, "}")) {
                    depth--;
                }
            }
            return source_range{open.pos, previous().end};
        }

        // Single-line handler: runs to ';', to the enclosing '}' or to the end of the line
        const auto line = previous().pos.line;
        const auto colon_end = previous().end;
        const auto start = peek().pos;
        auto end = colon_end;
        int depth = 0;

        while (!at_end() && peek().pos.line == line) {
            const auto& tok = peek();
            if (depth == 0 && tok.is(token_kind::punctuation, ";")) {
                end = advance().end;
                break;
            }
            if (tok.is(token_kind::punctuation, "}")) {
                if (depth == 0) {
                    break;
                }
                depth--;
            } else if (tok.is(token_kind::punctuation, "{")) {
                depth++;
            }
            end = advance().end;
        }

        if (end.offset == colon_end.offset) {
            return source_range{colon_end, colon_end};
        }
        return source_range{start, end};
    }

    // ========================================================================
    // Position expressions
    // ========================================================================

    parse_result<ast::expr> parser::parse_additive() {
        nesting_scope scope(depth_);
        auto left = parse_multiplicative();
        if (!left.ok()) return left;

        while (peek().is(token_kind::op, "+") || peek().is(token_kind::op, "-")) {
            if (!scope.enter()) {
                return too_deep(peek());
            }
            const std::string op = advance().value;
            auto right = parse_multiplicative();
            if (!right.ok()) return right;

            const source_range range{ast::range_of(left.value()).start, ast::range_of(right.value()).end};
            left = ast::expr{ast::binary_expr{
                range, op,
                std::make_unique<ast::expr>(left.take()),
                std::make_unique<ast::expr>(right.take())
            }};
        }
        return left;
    }

    parse_result<ast::expr> parser::parse_multiplicative() {
        nesting_scope scope(depth_);
        auto left = parse_unary();
        if (!left.ok()) return left;

        while (peek().is(token_kind::op, "*") || peek().is(token_kind::op, "/")) {
            if (!scope.enter()) {
                return too_deep(peek());
            }
            const std::string op = advance().value;
            auto right = parse_unary();
            if (!right.ok()) return right;

            const source_range range{ast::range_of(left.value()).start, ast::range_of(right.value()).end};
            left = ast::expr{ast::binary_expr{
                range, op,
                std::make_unique<ast::expr>(left.take()),
                std::make_unique<ast::expr>(right.take())
            }};
        }
        return left;
    }

    parse_result<ast::expr> parser::parse_unary() {
        nesting_scope scope(depth_);
        if (!scope.enter()) {
            return too_deep(peek());
        }

        if (peek().is(token_kind::op, "-") || peek().is(token_kind::op, "!")) {
            const token op = advance();
            auto operand = parse_unary();
            if (!operand.ok()) return operand;

            const source_range range{op.pos, ast::range_of(operand.value()).end};
            return ast::expr{ast::unary_expr{range, op.value, std::make_unique<ast::expr>(operand.take())}};
        }
        return parse_postfix();
    }

    parse_result<ast::expr> parser::parse_postfix() {
        nesting_scope scope(depth_);
        auto object = parse_primary();
        if (!object.ok()) return object;

        while (check_punct(".")) {
            if (!scope.enter()) {
                return too_deep(peek());
            }
            advance();
            auto member = consume(token_kind::identifier);
            if (!member.ok()) return member.error();

            const source_range range{ast::range_of(object.value()).start, member.value().end};
            object = ast::expr{ast::member_expr{
                range,
                std::make_unique<ast::expr>(object.take()),
                member.value().value
            }};
        }
        return object;
    }

    parse_result<ast::expr> parser::parse_primary() {
        const auto& tok = peek();

        if (tok.is(token_kind::punctuation, "[") || tok.is(token_kind::punctuation, "(")) {
            const bool is_paren = tok.value == "(";
            const auto start = tok.pos;
            advance();
            auto elements = parse_expression_list(is_paren ? ")" : "]");
            if (!elements.ok()) return elements.error();

            auto items = elements.take();
            const bool trailing_comma = previous().is(token_kind::punctuation, ")") &&
                                        current_ >= 2 && tokens_[current_ - 2].is(token_kind::punctuation, ",");
            if (is_paren && items.size() == 1 && !trailing_comma) {
                // Plain grouping: (x + 1)
                return std::move(items.front());
            }
            return ast::expr{ast::call_expr{{start, previous().end}, "Vector2", std::move(items)}};
        }

        switch (tok.kind) {
            case token_kind::identifier: {
                const token t = advance();
                if (check_punct("(")) {
                    advance();
                    auto args = parse_expression_list(")");
                    if (!args.ok()) return args.error();
                    return ast::expr{ast::call_expr{{t.pos, previous().end}, t.value, args.take()}};
                }
                return ast::expr{ast::identifier{t.range(), t.value}};
            }
            case token_kind::number: {
                const token t = advance();
                return ast::expr{ast::number_literal{t.range(), parse_number(t.value), t.value}};
            }
            case token_kind::string: {
                const token t = advance();
                return ast::expr{ast::string_literal{t.range(), t.value}};
            }
            case token_kind::boolean: {
                const token t = advance();
                return ast::expr{ast::boolean_literal{t.range(), t.value == "true"}};
            }
            default:
                break;
        }

        return syntax_error{"Expected position expression, got " + describe_with_kind(tok), tok.range()};
    }

    parse_result<std::vector<ast::expr>> parser::parse_expression_list(std::string_view close) {
        std::vector<ast::expr> items;

        while (!check_punct(close)) {
            auto item = parse_additive();
            if (!item.ok()) return item.error();
            items.push_back(item.take());

            if (!match_punct(",")) {
                break;
            }
        }

        auto end = consume(token_kind::punctuation, close);
        if (!end.ok()) return end.error();
        return std::move(items);
    }
}

// ============================================================================
// Public API
// ============================================================================

parse_output parse(std::vector<token> tokens) {
    parser p(std::move(tokens));
    return p.run();
}

parse_output parse_gdl(std::string_view source) {
    return parse(tokenize(source));
}

} // namespace gdl
