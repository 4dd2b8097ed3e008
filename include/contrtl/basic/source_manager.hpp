// contrtl/basic/source_manager.hpp - Byte ranges and the source files they point into
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace contrtl
{

/// Byte offset into a source text. Default-constructed locations are invalid.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  friend constexpr bool operator==(SourceLocation a, SourceLocation b) noexcept
  {
    return a.offset_ == b.offset_;
  }
  friend constexpr bool operator!=(SourceLocation a, SourceLocation b) noexcept
  {
    return !(a == b);
  }
  friend constexpr bool operator<(SourceLocation a, SourceLocation b) noexcept
  {
    return a.offset_ < b.offset_;
  }

private:
  uint32_t offset_ = k_invalid_offset;
};

/// Half-open byte range [begin, end). Every AST and parse-tree node carries one.
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept
  : begin_(SourceLocation(begin)), end_(SourceLocation(end))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.get_offset() - begin_.get_offset() : 0;
  }

  /// Smallest range covering both. A production's range is the join of its children.
  [[nodiscard]] constexpr SourceRange join(SourceRange other) const noexcept
  {
    if (is_invalid()) return other;
    if (other.is_invalid()) return *this;
    return {
      other.begin_ < begin_ ? other.begin_ : begin_, end_ < other.end_ ? other.end_ : end_};
  }

  friend constexpr bool operator==(SourceRange a, SourceRange b) noexcept
  {
    return a.begin_ == b.begin_ && a.end_ == b.end_;
  }
  friend constexpr bool operator!=(SourceRange a, SourceRange b) noexcept { return !(a == b); }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// 1-based line and column; zero means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/// A SourceRange resolved against a file's line table.
struct LineSpan
{
  LineColumn begin;
  LineColumn end;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return begin.is_valid(); }
  [[nodiscard]] constexpr bool single_line() const noexcept { return begin.line == end.line; }
};

/**
 * One `.crtl` text and where it came from. Sources built from strings have
 * no path and display as `<input>`.
 */
class SourceFile
{
public:
  SourceFile() : SourceFile({}, std::string{}) {}
  explicit SourceFile(std::string text) : SourceFile({}, std::move(text)) {}
  SourceFile(std::filesystem::path path, std::string text);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string display_name() const;

  [[nodiscard]] std::string_view content() const noexcept { return text_; }
  [[nodiscard]] size_t line_count() const noexcept { return lineStarts_.size(); }

  [[nodiscard]] LineColumn position_of(uint32_t offset) const noexcept;
  [[nodiscard]] LineSpan locate(SourceRange range) const noexcept;

  /// Text of the 1-based line `line`, without its line terminator.
  [[nodiscard]] std::string_view line_text(uint32_t line) const noexcept;

  /// Text covered by `range`, clamped to the file.
  [[nodiscard]] std::string_view text_of(SourceRange range) const noexcept;

private:
  std::filesystem::path path_;
  std::string text_;
  std::vector<uint32_t> lineStarts_;
};

}  // namespace contrtl
