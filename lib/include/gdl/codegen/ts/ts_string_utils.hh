//
// TypeScript String Utilities for Code Generation
//
// - String literal escaping
// - Reserved identifier detection and sanitization
//

#pragma once

#include <string>
#include <string_view>

namespace gdl::codegen {

/**
 * Quote and escape a string for use as a TypeScript string literal.
 *
 * Handles: newlines, carriage returns, tabs, backslashes, double quotes
 * and the remaining ASCII control characters (as \u00XX).
 */
std::string quote_ts_string(const std::string& str);

/**
 * True if `name` cannot be used as a class or local name in the generated
 * module: TypeScript reserved words, the runtime types the module imports,
 * the names the module itself declares, and the globals it relies on.
 */
bool is_reserved_ts_identifier(std::string_view name);

/// `name` with a trailing underscore when it is reserved, otherwise unchanged.
std::string sanitize_ts_identifier(const std::string& name);

/// Generated class names for each declaration kind.
std::string entity_class_name(const std::string& name);
std::string behavior_class_name(const std::string& name);
std::string scene_class_name(const std::string& name);

}  // namespace gdl::codegen
