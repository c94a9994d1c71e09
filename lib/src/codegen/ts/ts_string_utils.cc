//
// TypeScript String Utilities
//

#include <gdl/codegen/ts/ts_string_utils.hh>
#include <cstdio>
#include <set>

namespace gdl::codegen {

namespace {
    const std::set<std::string_view>& reserved_identifiers() {
        static const std::set<std::string_view> names = {
            // Reserved words
            "break", "case", "catch", "class", "const", "continue", "debugger",
            "default", "delete", "do", "else", "enum", "export", "extends",
            "false", "finally", "for", "function", "if", "import", "in",
            "instanceof", "new", "null", "return", "super", "switch", "this",
            "throw", "true", "try", "typeof", "var", "void", "while", "with",
            // Strict mode and contextual keywords
            "as", "implements", "interface", "let", "package", "private",
            "protected", "public", "static", "yield", "any", "boolean",
            "constructor", "declare", "get", "module", "require", "number",
            "set", "string", "symbol", "type", "from", "of", "async", "await",
            "undefined", "arguments", "eval",
            // Runtime imports
            "Entity", "GameEngine", "ComponentType", "Vector2",
            // Declared by the generated module
            "gameConfig", "initializeGame", "loadScene", "Constructor",
            "EntityRegistry", "BehaviorRegistry", "SceneRegistry",
            // Globals used by the generated module
            "Map", "Error", "console", "Object", "Array", "String", "Number",
            "Boolean", "Symbol", "Promise", "NaN", "Infinity"
        };
        return names;
    }
}

std::string quote_ts_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 2);
    result += '"';

    for (char c : str) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }

    result += '"';
    return result;
}

bool is_reserved_ts_identifier(std::string_view name) {
    return reserved_identifiers().contains(name);
}

std::string sanitize_ts_identifier(const std::string& name) {
    if (is_reserved_ts_identifier(name)) {
        return name + "_";
    }
    return name;
}

std::string entity_class_name(const std::string& name) {
    return sanitize_ts_identifier(name);
}

std::string behavior_class_name(const std::string& name) {
    return name + "Behavior";
}

std::string scene_class_name(const std::string& name) {
    return name + "Scene";
}

}  // namespace gdl::codegen
