//
// Generic Code Writer - RAII-Based Code Generation
//
// Base class for emitting brace-structured source text with automatic
// indentation. Blocks are RAII guards: the closing brace is written when
// the guard goes out of scope, so generated code is always balanced.
// The writer also counts emitted lines for source maps.
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace gdl::codegen {

// Forward declarations for RAII block classes
class IfBlock;
class ElseBlock;

// ============================================================================
// CodeWriter - Base class for code generation
// ============================================================================

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output);
    virtual ~CodeWriter() = default;

    // Non-copyable (output stream reference)
    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    // ========================================================================
    // Basic Output Methods
    // ========================================================================

    // Write a line with current indentation
    virtual void write_line(const std::string& line);

    // Write a blank line
    virtual void write_blank_line();

    // Write "// comment" with current indentation
    void write_comment(const std::string& comment);

    // ========================================================================
    // RAII Block Generators - Return guard objects
    // ========================================================================

    // Create an if-block with automatic brace/indent management
    IfBlock write_if(const std::string& condition);

    // ========================================================================
    // Indentation Management (for RAII blocks)
    // ========================================================================

    void indent();
    void unindent();
    std::size_t current_indent_level() const { return indent_level_; }

    /// 1-based number of the line the next write_line() will produce.
    std::size_t current_line() const { return lines_written_ + 1; }

    // ========================================================================
    // Streaming Operators
    // ========================================================================

    // Stream text (accumulated until endl)
    CodeWriter& operator<<(const std::string& text);
    CodeWriter& operator<<(const char* text);
    CodeWriter& operator<<(std::size_t value);

    // Stream manipulator support (endl, blank)
    CodeWriter& operator<<(CodeWriter& (*manip)(CodeWriter&));

    friend CodeWriter& endl(CodeWriter& writer);

protected:
    std::ostream& output_;

    std::size_t indent_level_;
    std::string indent_string_;  // four spaces
    std::string cached_indent_;

    // Line buffer for streaming operator
    std::string line_buffer_;

    std::size_t lines_written_;

    void update_cached_indent();
};

// ============================================================================
// Custom Stream Manipulators
// ============================================================================

// Write buffered line with indentation and newline
CodeWriter& endl(CodeWriter& writer);

// Write a blank line
CodeWriter& blank(CodeWriter& writer);

// ============================================================================
// StreamableBlock - CRTP base for blocks with streaming operators
// ============================================================================

template<typename Derived>
class StreamableBlock {
public:
    Derived& operator<<(const std::string& text) {
        writer_->operator<<(text);
        return static_cast<Derived&>(*this);
    }

    Derived& operator<<(const char* text) {
        writer_->operator<<(text);
        return static_cast<Derived&>(*this);
    }

    Derived& operator<<(CodeWriter& (*manip)(CodeWriter&)) {
        writer_->operator<<(manip);
        return static_cast<Derived&>(*this);
    }

protected:
    CodeWriter* writer_;

    explicit StreamableBlock(CodeWriter* writer) : writer_(writer) {}
};

// ============================================================================
// IfBlock - RAII guard for if-statements
// ============================================================================

class IfBlock : public StreamableBlock<IfBlock> {
public:
    IfBlock(CodeWriter* writer, const std::string& condition);
    ~IfBlock();

    // Non-copyable, movable
    IfBlock(const IfBlock&) = delete;
    IfBlock& operator=(const IfBlock&) = delete;
    IfBlock(IfBlock&& other) noexcept;
    IfBlock& operator=(IfBlock&& other) = delete;

    // Chain an else block; the if-block no longer closes itself
    ElseBlock write_else();

private:
    bool has_else_;
};

// ============================================================================
// ElseBlock - RAII guard for else-statements
// ============================================================================

class ElseBlock : public StreamableBlock<ElseBlock> {
public:
    explicit ElseBlock(CodeWriter* writer);
    ~ElseBlock();

    // Non-copyable, movable
    ElseBlock(const ElseBlock&) = delete;
    ElseBlock& operator=(const ElseBlock&) = delete;
    ElseBlock(ElseBlock&& other) noexcept;
    ElseBlock& operator=(ElseBlock&& other) = delete;
};

}  // namespace gdl::codegen
