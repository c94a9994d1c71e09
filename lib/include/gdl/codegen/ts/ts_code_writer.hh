//
// TypeScript Code Writer
//
// Extends the generic CodeWriter with TypeScript constructs:
// - Import statements
// - Class, method and function blocks
// - Multi-line object literals (`{ ... }` closed by `};` or `});`)
// - Type aliases
//

#pragma once

#include <gdl/codegen/code_writer.hh>
#include <string>

namespace gdl::codegen {

// Forward declarations
class ClassBlock;
class FunctionBlock;
class ObjectBlock;

// ============================================================================
// TsCodeWriter - TypeScript-Specific Code Generation
// ============================================================================

class TsCodeWriter : public CodeWriter {
public:
    explicit TsCodeWriter(std::ostream& output);

    // ========================================================================
    // TypeScript Blocks
    // ========================================================================

    // `export class <name> [extends <base>] {`
    ClassBlock write_class(const std::string& name, const std::string& base = "");

    // `<signature> {` for methods, constructors and functions
    FunctionBlock write_function(const std::string& signature);

    // `<opener>` ... `<closer>`, where opener ends with `{`
    ObjectBlock write_object(const std::string& opener, const std::string& closer = "};");

    // ========================================================================
    // TypeScript Output Helpers
    // ========================================================================

    // import { <symbol> } from "<module>";
    void write_import(const std::string& symbol, const std::string& module);

    // type <name> = <type>;
    void write_type_alias(const std::string& name, const std::string& type);
};

// ============================================================================
// ClassBlock - RAII guard for class definitions
// ============================================================================

class ClassBlock : public StreamableBlock<ClassBlock> {
public:
    ClassBlock(TsCodeWriter* writer, const std::string& name, const std::string& base);
    ~ClassBlock();

    // Non-copyable, movable
    ClassBlock(const ClassBlock&) = delete;
    ClassBlock& operator=(const ClassBlock&) = delete;
    ClassBlock(ClassBlock&& other) noexcept;
    ClassBlock& operator=(ClassBlock&& other) = delete;

    // Writes `<declaration>;` as a class field
    void write_field(const std::string& declaration);
};

// ============================================================================
// FunctionBlock - RAII guard for function and method bodies
// ============================================================================

class FunctionBlock : public StreamableBlock<FunctionBlock> {
public:
    FunctionBlock(TsCodeWriter* writer, const std::string& signature);
    ~FunctionBlock();

    // Non-copyable, movable
    FunctionBlock(const FunctionBlock&) = delete;
    FunctionBlock& operator=(const FunctionBlock&) = delete;
    FunctionBlock(FunctionBlock&& other) noexcept;
    FunctionBlock& operator=(FunctionBlock&& other) = delete;
};

// ============================================================================
// ObjectBlock - RAII guard for multi-line object literals
// ============================================================================

class ObjectBlock : public StreamableBlock<ObjectBlock> {
public:
    ObjectBlock(TsCodeWriter* writer, const std::string& opener, const std::string& closer);
    ~ObjectBlock();

    // Non-copyable, movable
    ObjectBlock(const ObjectBlock&) = delete;
    ObjectBlock& operator=(const ObjectBlock&) = delete;
    ObjectBlock(ObjectBlock&& other) noexcept;
    ObjectBlock& operator=(ObjectBlock&& other) = delete;

    // Writes `<key>: <value>,`
    void write_entry(const std::string& key, const std::string& value);

private:
    std::string closer_;
};

}  // namespace gdl::codegen
