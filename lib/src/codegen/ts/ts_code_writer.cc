//
// TypeScript Code Writer Implementation
//

#include <gdl/codegen/ts/ts_code_writer.hh>
#include <utility>

namespace gdl::codegen {

// ============================================================================
// TsCodeWriter Implementation
// ============================================================================

TsCodeWriter::TsCodeWriter(std::ostream& output)
    : CodeWriter(output)
{
}

ClassBlock TsCodeWriter::write_class(const std::string& name, const std::string& base) {
    return ClassBlock(this, name, base);
}

FunctionBlock TsCodeWriter::write_function(const std::string& signature) {
    return FunctionBlock(this, signature);
}

ObjectBlock TsCodeWriter::write_object(const std::string& opener, const std::string& closer) {
    return ObjectBlock(this, opener, closer);
}

void TsCodeWriter::write_import(const std::string& symbol, const std::string& module) {
    write_line("import { " + symbol + " } from \"" + module + "\";");
}

void TsCodeWriter::write_type_alias(const std::string& name, const std::string& type) {
    write_line("type " + name + " = " + type + ";");
}

// ============================================================================
// ClassBlock Implementation
// ============================================================================

ClassBlock::ClassBlock(TsCodeWriter* writer, const std::string& name, const std::string& base)
    : StreamableBlock<ClassBlock>(writer)
{
    std::string header = "export class " + name;
    if (!base.empty()) {
        header += " extends " + base;
    }
    writer_->write_line(header + " {");
    writer_->indent();
}

ClassBlock::~ClassBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

ClassBlock::ClassBlock(ClassBlock&& other) noexcept
    : StreamableBlock<ClassBlock>(other.writer_)
{
    other.writer_ = nullptr;
}

void ClassBlock::write_field(const std::string& declaration) {
    writer_->write_line(declaration + ";");
}

// ============================================================================
// FunctionBlock Implementation
// ============================================================================

FunctionBlock::FunctionBlock(TsCodeWriter* writer, const std::string& signature)
    : StreamableBlock<FunctionBlock>(writer)
{
    writer_->write_line(signature + " {");
    writer_->indent();
}

FunctionBlock::~FunctionBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

FunctionBlock::FunctionBlock(FunctionBlock&& other) noexcept
    : StreamableBlock<FunctionBlock>(other.writer_)
{
    other.writer_ = nullptr;
}

// ============================================================================
// ObjectBlock Implementation
// ============================================================================

ObjectBlock::ObjectBlock(TsCodeWriter* writer, const std::string& opener, const std::string& closer)
    : StreamableBlock<ObjectBlock>(writer),
      closer_(closer)
{
    writer_->write_line(opener);
    writer_->indent();
}

ObjectBlock::~ObjectBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line(closer_);
    }
}

ObjectBlock::ObjectBlock(ObjectBlock&& other) noexcept
    : StreamableBlock<ObjectBlock>(other.writer_),
      closer_(std::move(other.closer_))
{
    other.writer_ = nullptr;
}

void ObjectBlock::write_entry(const std::string& key, const std::string& value) {
    writer_->write_line(key + ": " + value + ",");
}

}  // namespace gdl::codegen
