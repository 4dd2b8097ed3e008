// contrtl/basic/source_manager.cpp - Line table of a source file
#include "contrtl/basic/source_manager.hpp"

#include <algorithm>

namespace contrtl
{

SourceFile::SourceFile(std::filesystem::path path, std::string text)
: path_(std::move(path)), text_(std::move(text))
{
  lineStarts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      lineStarts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

std::string SourceFile::display_name() const
{
  if (path_.empty()) {
    return "<input>";
  }
  std::error_code ec;
  const auto rel = std::filesystem::relative(path_, std::filesystem::current_path(), ec);
  return (ec || rel.empty()) ? path_.string() : rel.string();
}

LineColumn SourceFile::position_of(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));
  const auto next = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
  const auto line = static_cast<uint32_t>(next - lineStarts_.begin());
  return {line, offset - lineStarts_[line - 1] + 1};
}

LineSpan SourceFile::locate(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  return {position_of(range.get_begin().get_offset()), position_of(range.get_end().get_offset())};
}

std::string_view SourceFile::line_text(uint32_t line) const noexcept
{
  if (line == 0 || line > lineStarts_.size()) {
    return {};
  }
  const std::string_view text(text_);
  const uint32_t begin = lineStarts_[line - 1];
  uint32_t end = line < lineStarts_.size() ? lineStarts_[line] : static_cast<uint32_t>(text.size());

  while (end > begin && (text[end - 1] == '\n' || text[end - 1] == '\r')) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string_view SourceFile::text_of(SourceRange range) const noexcept
{
  const uint32_t size = static_cast<uint32_t>(text_.size());
  if (range.is_invalid() || range.get_begin().get_offset() >= size) {
    return {};
  }
  const uint32_t begin = range.get_begin().get_offset();
  const uint32_t end = std::min(range.get_end().get_offset(), size);
  return std::string_view(text_).substr(begin, end - begin);
}

}  // namespace contrtl
