//
// AST helper functions
//

#include <gdl/ast.hh>
#include <type_traits>

namespace gdl::ast {

const property* find_property(const std::vector<property>& props, std::string_view name) {
    for (const auto& p : props) {
        if (p.name == name) {
            return &p;
        }
    }
    return nullptr;
}

source_range range_of(const expr& e) {
    return std::visit([](const auto& node) { return node.range; }, e.node);
}

source_range range_of(const declaration& d) {
    return std::visit([](const auto& decl) { return decl.range; }, d);
}

const char* kind_name(const expr& e) {
    return std::visit([](const auto& node) -> const char* {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, string_literal>) {
            return "string";
        } else if constexpr (std::is_same_v<T, number_literal>) {
            return "number";
        } else if constexpr (std::is_same_v<T, boolean_literal>) {
            return "boolean";
        } else if constexpr (std::is_same_v<T, identifier>) {
            return "identifier";
        } else if constexpr (std::is_same_v<T, array_literal>) {
            return "array";
        } else if constexpr (std::is_same_v<T, object_literal>) {
            return "object";
        } else if constexpr (std::is_same_v<T, call_expr>) {
            return "call";
        } else if constexpr (std::is_same_v<T, member_expr>) {
            return "member access";
        } else if constexpr (std::is_same_v<T, unary_expr>) {
            return "unary expression";
        } else if constexpr (std::is_same_v<T, binary_expr>) {
            return "binary expression";
        } else {
            static_assert(unhandled_node<T>, "expression kind has no name");
        }
    }, e.node);
}

const char* kind_name(const declaration& d) {
    return std::visit([](const auto& decl) -> const char* {
        using T = std::decay_t<decltype(decl)>;
        if constexpr (std::is_same_v<T, game_decl>) {
            return "game";
        } else if constexpr (std::is_same_v<T, entity_decl>) {
            return "entity";
        } else if constexpr (std::is_same_v<T, behavior_decl>) {
            return "behavior";
        } else if constexpr (std::is_same_v<T, scene_decl>) {
            return "scene";
        } else {
            static_assert(unhandled_node<T>, "declaration kind has no name");
        }
    }, d);
}

std::string_view name_of(const declaration& d) {
    return std::visit([](const auto& decl) -> std::string_view {
        using T = std::decay_t<decltype(decl)>;
        if constexpr (std::is_same_v<T, game_decl>) {
            return {};
        } else {
            return decl.name;
        }
    }, d);
}

const std::string* symbolic_value(const expr& e) {
    if (const auto* id = std::get_if<identifier>(&e.node)) {
        return &id->name;
    }
    if (const auto* str = std::get_if<string_literal>(&e.node)) {
        return &str->value;
    }
    return nullptr;
}

} // namespace gdl::ast
