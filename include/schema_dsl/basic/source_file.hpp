// schema_dsl/basic/source_file.hpp - Source positions and the schema source buffer
//
// Positions are byte offsets into one schema source. Line/column are derived
// from a line table built once per buffer.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace schema_dsl
{

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end) into a SourceFile.
 *
 * A default-constructed range is invalid; nodes reconstructed from a live
 * database catalog carry invalid ranges.
 */
class SourceRange
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_invalid_offset && end_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_ - begin_ : 0;
  }

  /// Smallest range covering both operands. Invalid operands are ignored.
  [[nodiscard]] constexpr SourceRange merge(SourceRange other) const noexcept
  {
    if (!is_valid()) return other;
    if (!other.is_valid()) return *this;
    return {begin_ < other.begin_ ? begin_ : other.begin_, end_ > other.end_ ? end_ : other.end_};
  }

  [[nodiscard]] constexpr bool operator==(const SourceRange & other) const noexcept = default;

private:
  uint32_t begin_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

// ============================================================================
// LineColumn
// ============================================================================

/// 1-based line and column. 0 means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }

  [[nodiscard]] constexpr bool operator==(const LineColumn & other) const noexcept = default;
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Owns the text of one schema source and answers line/column queries.
 */
class SourceFile
{
public:
  SourceFile() { build_line_table(); }

  explicit SourceFile(std::string content) : content_(std::move(content)) { build_line_table(); }

  SourceFile(std::filesystem::path path, std::string content)
  : path_(std::move(path)), content_(std::move(content))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Path for diagnostics, relative to the working directory where possible.
  [[nodiscard]] std::string display_name() const;

  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn line_column(uint32_t offset) const noexcept;

  /// Text of a 0-based line without its terminator.
  [[nodiscard]] std::string_view line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace schema_dsl
