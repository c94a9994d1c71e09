//
// Diagnostics shared by every stage of the pipeline
//
// The library never prints or logs. Parse, semantic and pipeline problems
// are all returned as gdl::diagnostic values; formatting for humans is the
// caller's business (see diagnostic::format()).
//

#pragma once

#include <gdl/token.hh>
#include <optional>
#include <string>
#include <vector>

namespace gdl {

/// Severity level for diagnostic messages.
/// Errors prevent successful compilation; warnings never do.
enum class diagnostic_level {
    error,
    warning
};

/// Diagnostic codes for documentation and selective disabling.
///
/// Code format:
/// - E### for errors
/// - W### for warnings
///
/// Categories:
/// - E001:      Syntax errors
/// - E002-E009: Symbol errors (undefined, duplicate, colliding)
/// - E010-E019: Property schema errors
/// - W001-W009: Unused or ignored declarations
/// - W010-W019: Naming warnings
namespace diag_codes {
    // Syntax
    constexpr const char* E_SYNTAX = "E001";                    ///< Token sequence does not match the grammar

    // Symbols
    constexpr const char* E_UNDEFINED_BEHAVIOR = "E002";        ///< Entity lists a behavior that is not declared
    constexpr const char* E_UNDEFINED_ENTITY = "E003";          ///< Scene spawns an entity type that is not declared
    constexpr const char* E_UNDEFINED_SCENE = "E004";           ///< Game defaultScene names an undeclared scene
    constexpr const char* E_DUPLICATE_DEFINITION = "E005";      ///< Name declared twice in the same table
    constexpr const char* E_DUPLICATE_GAME = "E006";            ///< More than one game block
    constexpr const char* E_CLASS_NAME_COLLISION = "E009";      ///< Two declarations generate the same class name

    // Property schema
    constexpr const char* E_INVALID_PHYSICS_MODE = "E010";      ///< Entity physics outside the allowed modes
    constexpr const char* E_INVALID_SIZE = "E011";              ///< size is not a 2-element array
    constexpr const char* E_INVALID_SCALE_MODE = "E012";        ///< Game scale outside the allowed modes
    constexpr const char* E_INVALID_PHYSICS_ENGINE = "E013";    ///< Game physics outside the allowed engines
    constexpr const char* E_INVALID_PIXEL_ART = "E014";         ///< Game pixelArt is not a boolean literal
    constexpr const char* E_INVALID_BEHAVIOR_LIST = "E015";     ///< Entity behaviors is not an array
    constexpr const char* E_DUPLICATE_SPAWN_NAME = "E016";      ///< Two spawns in one scene share an `as` name
    constexpr const char* E_INVALID_SPAWN_POSITION = "E017";    ///< Spawn position or Vector2 value that is not a 2-number vector

    // Warnings
    constexpr const char* W_UNUSED_BEHAVIOR = "W001";           ///< Behavior never referenced by an entity
    constexpr const char* W_IGNORED_BEHAVIOR_REF = "W002";      ///< Non-identifier element in a behaviors list
    constexpr const char* W_KEYWORD_COLLISION = "W013";         ///< Name collides with a target language keyword

    // Pipeline
    constexpr const char* UNEXPECTED_ERROR = "UNEXPECTED_ERROR"; ///< Exception escaped a pipeline stage
}

/// A single diagnostic message.
///
/// Example output of format("level.gdl"):
///   level.gdl:4:17: error: Behavior 'Jmp' is not defined [E002]
///     suggestion: Jump
///
/// and for a diagnostic with a secondary location:
///   level.gdl:9:8: error: Entity 'A' is already defined [E005]
///   level.gdl:1:8: note: Entity 'A' first declared here
struct diagnostic {
    diagnostic_level level;
    std::string code;
    std::string message;
    std::optional<source_range> range;

    // Secondary location (e.g. "first declared here")
    std::optional<source_range> related_range;
    std::optional<std::string> related_message;

    std::vector<std::string> suggestions;

    [[nodiscard]] bool is_error() const { return level == diagnostic_level::error; }

    /// Format as "file:line:column: level: message [code]" followed by an
    /// optional note line and an optional suggestion line.
    std::string format(const std::string& file = "<input>") const;
};

/// Build an error diagnostic.
diagnostic make_error(const char* code, std::string message, std::optional<source_range> range);

/// Build a warning diagnostic.
diagnostic make_warning(const char* code, std::string message, std::optional<source_range> range);

} // namespace gdl
