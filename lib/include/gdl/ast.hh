//
// Abstract syntax tree for GDL programs
//
// The tree is a strict ownership hierarchy rooted at ast::program. Nodes
// are move-only; nothing is shared and there are no parent links.
//

#pragma once

#include <gdl/token.hh>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gdl::ast {
    // Forward declarations for recursive types
    struct expr;
    struct property;

    // -----------------------------
    // Values
    // -----------------------------
    struct string_literal {
        source_range range;
        std::string value;
    };

    struct number_literal {
        source_range range;
        double value;
        std::string text;   // source spelling, emitted verbatim
    };

    struct boolean_literal {
        source_range range;
        bool value;
    };

    struct identifier {
        source_range range;
        std::string name;
    };

    struct array_literal {
        source_range range;
        std::vector<expr> elements;
    };

    struct object_literal {
        source_range range;
        std::vector<property> properties;
    };

    // -----------------------------
    // Position expressions
    // -----------------------------
    struct call_expr {
        source_range range;
        std::string callee;
        std::vector<expr> arguments;
    };

    struct member_expr {
        source_range range;
        std::unique_ptr<expr> object;
        std::string member;
    };

    struct unary_expr {
        source_range range;
        std::string op;
        std::unique_ptr<expr> operand;
    };

    struct binary_expr {
        source_range range;
        std::string op;
        std::unique_ptr<expr> left;
        std::unique_ptr<expr> right;
    };

    using expr_node = std::variant<
        string_literal,
        number_literal,
        boolean_literal,
        identifier,
        array_literal,
        object_literal,
        call_expr,
        member_expr,
        unary_expr,
        binary_expr
    >;

    struct expr {
        expr_node node;
    };

    struct property {
        source_range range;
        std::string name;
        source_range name_range;
        expr value;
    };

    // -----------------------------
    // Scene statements
    // -----------------------------
    struct spawn_stmt {
        source_range range;
        std::string entity_type;
        source_range type_range;
        expr position;
        std::optional<std::string> name;   // `as <name>`
    };

    /// `when <trigger>: <handler>` or `on <trigger>: <handler>`.
    /// Handler bodies are not interpreted; only their extent is kept.
    struct event_stmt {
        source_range range;
        std::string keyword;
        std::string trigger;
        source_range trigger_range;
        source_range handler_range;
    };

    // -----------------------------
    // Declarations
    // -----------------------------
    struct game_decl {
        source_range range;
        std::vector<property> properties;
    };

    struct entity_decl {
        source_range range;
        std::string name;
        source_range name_range;
        std::vector<property> properties;
        std::vector<identifier> behaviors;  // identifiers from the `behaviors` property
    };

    struct behavior_decl {
        source_range range;
        std::string name;
        source_range name_range;
        std::vector<property> properties;
    };

    struct scene_decl {
        source_range range;
        std::string name;
        source_range name_range;
        std::vector<property> properties;
        std::vector<spawn_stmt> spawns;
        std::vector<event_stmt> events;
    };

    using declaration = std::variant<game_decl, entity_decl, behavior_decl, scene_decl>;

    struct program {
        source_range range;
        std::vector<declaration> body;
    };

    // -----------------------------
    // Helpers
    // -----------------------------

    /// False for every node type; a static_assert on it rejects a node kind
    /// that a visitor forgot to handle.
    template<typename T>
    inline constexpr bool unhandled_node = false;

    /// First property with the given name, or nullptr.
    const property* find_property(const std::vector<property>& props, std::string_view name);

    /// Source range of any expression node.
    source_range range_of(const expr& e);

    /// Source range of any declaration.
    source_range range_of(const declaration& d);

    /// Kind of an expression as used in diagnostics ("string", "array", ...).
    const char* kind_name(const expr& e);

    /// "game", "entity", "behavior" or "scene".
    const char* kind_name(const declaration& d);

    /// Declared name; empty for the game block.
    std::string_view name_of(const declaration& d);

    /// Symbolic text of an identifier or string value, or nullptr for any
    /// other kind of expression.
    const std::string* symbolic_value(const expr& e);
}
