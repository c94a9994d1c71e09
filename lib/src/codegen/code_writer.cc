//
// Generic Code Writer Implementation
//

#include <gdl/codegen/code_writer.hh>
#include <algorithm>

namespace gdl::codegen {

// ============================================================================
// CodeWriter Implementation
// ============================================================================

CodeWriter::CodeWriter(std::ostream& output)
    : output_(output),
      indent_level_(0),
      indent_string_("    "),
      cached_indent_(),
      line_buffer_(),
      lines_written_(0)
{
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        output_ << cached_indent_ << line;
    }
    output_ << '\n';
    lines_written_ += 1 + static_cast<std::size_t>(std::count(line.begin(), line.end(), '\n'));
}

void CodeWriter::write_blank_line() {
    output_ << '\n';
    lines_written_++;
}

void CodeWriter::write_comment(const std::string& comment) {
    write_line("// " + comment);
}

void CodeWriter::indent() {
    indent_level_++;
    update_cached_indent();
}

void CodeWriter::unindent() {
    if (indent_level_ > 0) {
        indent_level_--;
        update_cached_indent();
    }
}

void CodeWriter::update_cached_indent() {
    cached_indent_.clear();
    for (std::size_t i = 0; i < indent_level_; ++i) {
        cached_indent_ += indent_string_;
    }
}

IfBlock CodeWriter::write_if(const std::string& condition) {
    return IfBlock(this, condition);
}

// ============================================================================
// Streaming Operators Implementation
// ============================================================================

CodeWriter& CodeWriter::operator<<(const std::string& text) {
    line_buffer_ += text;
    return *this;
}

CodeWriter& CodeWriter::operator<<(const char* text) {
    if (text) {
        line_buffer_ += text;
    }
    return *this;
}

CodeWriter& CodeWriter::operator<<(std::size_t value) {
    line_buffer_ += std::to_string(value);
    return *this;
}

CodeWriter& CodeWriter::operator<<(CodeWriter& (*manip)(CodeWriter&)) {
    return manip(*this);
}

// ============================================================================
// Custom Manipulators Implementation
// ============================================================================

CodeWriter& endl(CodeWriter& writer) {
    writer.write_line(writer.line_buffer_);
    writer.line_buffer_.clear();
    return writer;
}

CodeWriter& blank(CodeWriter& writer) {
    writer.write_blank_line();
    return writer;
}

// ============================================================================
// IfBlock Implementation
// ============================================================================

IfBlock::IfBlock(CodeWriter* writer, const std::string& condition)
    : StreamableBlock<IfBlock>(writer),
      has_else_(false)
{
    writer_->write_line("if (" + condition + ") {");
    writer_->indent();
}

IfBlock::~IfBlock() {
    if (writer_ && !has_else_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

IfBlock::IfBlock(IfBlock&& other) noexcept
    : StreamableBlock<IfBlock>(other.writer_),
      has_else_(other.has_else_)
{
    other.writer_ = nullptr;
}

ElseBlock IfBlock::write_else() {
    writer_->unindent();
    writer_->write_line("} else {");
    writer_->indent();
    has_else_ = true;
    return ElseBlock(writer_);
}

// ============================================================================
// ElseBlock Implementation
// ============================================================================

ElseBlock::ElseBlock(CodeWriter* writer)
    : StreamableBlock<ElseBlock>(writer)
{
}

ElseBlock::~ElseBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

ElseBlock::ElseBlock(ElseBlock&& other) noexcept
    : StreamableBlock<ElseBlock>(other.writer_)
{
    other.writer_ = nullptr;
}

}  // namespace gdl::codegen
