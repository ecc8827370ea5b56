// schema_dsl/basic/source_file.cpp - Line table for schema sources
#include "schema_dsl/basic/source_file.hpp"

#include <algorithm>
#include <system_error>

namespace schema_dsl
{

std::string SourceFile::display_name() const
{
  if (path_.empty()) {
    return "<input>";
  }
  std::error_code ec;
  auto rel = std::filesystem::relative(path_, std::filesystem::current_path(), ec);
  if (ec || rel.empty()) {
    return path_.string();
  }
  return rel.string();
}

LineColumn SourceFile::line_column(uint32_t offset) const noexcept
{
  if (offset == SourceRange::k_invalid_offset) {
    return {};
  }
  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;  // line_offsets_[0] == 0, so upper_bound never returns begin()

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  return {line, offset - *it + 1};
}

std::string_view SourceFile::line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::slice(SourceRange range) const noexcept
{
  if (!range.is_valid() || range.begin() >= content_.size()) {
    return {};
  }
  const uint32_t end = std::min<uint32_t>(range.end(), static_cast<uint32_t>(content_.size()));
  return std::string_view(content_).substr(range.begin(), end - range.begin());
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace schema_dsl
