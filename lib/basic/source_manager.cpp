// bff/basic/source_manager.cpp - Source file and registry implementation
#include "bff/basic/source_manager.hpp"

#include <algorithm>

#include "bff/basic/uri.hpp"

namespace bff
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string uri, std::string content)
: path_(std::move(path)), uri_(std::move(uri)), content_(std::move(content))
{
  build_line_table();
}

void SourceFile::set_content(std::string new_content)
{
  content_ = std::move(new_content);
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  const Position p = get_position(offset);
  return {p.line + 1, p.character + 1};
}

Position SourceFile::get_position(uint32_t offset) const noexcept
{
  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {0, offset};
  }
  --it;

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin());
  return {line, offset - *it};
}

uint32_t SourceFile::get_offset(Position position) const noexcept
{
  if (position.line >= line_offsets_.size()) {
    return static_cast<uint32_t>(content_.size());
  }
  const uint32_t start = line_offsets_[position.line];
  const auto line_len = static_cast<uint32_t>(get_line(position.line).size());
  return start + std::min(position.character, line_len);
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const auto start = range.get_begin().offset();
  auto end = range.get_end().offset();
  if (start >= content_.size()) {
    return {};
  }
  if (end > content_.size()) {
    end = static_cast<uint32_t>(content_.size());
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().offset();
  result.end_byte = range.get_end().offset();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
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

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::register_file(const std::string & uri, std::string content)
{
  if (const auto it = uri_to_id_.find(uri); it != uri_to_id_.end()) {
    return it->second;
  }

  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  fs::path path;
  if (auto p = file_uri_to_path(uri)) {
    path = *p;
  } else {
    path = uri;
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), uri, std::move(content)));
  uri_to_id_.emplace(uri, id);
  return id;
}

void SourceRegistry::update_content(FileId id, std::string new_content)
{
  if (!id.is_valid()) {
    return;
  }
  const auto idx = static_cast<size_t>(id.value);
  if (idx >= files_.size() || files_[idx] == nullptr) {
    return;
  }
  files_[idx]->set_content(std::move(new_content));
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid()) {
    return nullptr;
  }
  const auto idx = static_cast<size_t>(id.value);
  if (idx >= files_.size()) {
    return nullptr;
  }
  return files_[idx].get();
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_empty;
  const auto * f = get_file(id);
  return f ? f->path() : k_empty;
}

std::optional<FileId> SourceRegistry::find_by_uri(std::string_view uri) const
{
  if (const auto it = uri_to_id_.find(std::string(uri)); it != uri_to_id_.end()) {
    return it->second;
  }
  return std::nullopt;
}

LineColumn SourceRegistry::get_line_column(SourceLocation loc) const noexcept
{
  const auto * f = get_file(loc.file_id());
  if (f == nullptr || !loc.is_valid()) {
    return {};
  }
  return f->get_line_column(loc.offset());
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const auto * f = get_file(range.file_id());
  if (f == nullptr) {
    return {};
  }
  return f->get_full_range(range);
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const auto * f = get_file(range.file_id());
  if (f == nullptr) {
    return {};
  }
  return f->get_slice(range);
}

FileRange SourceRegistry::to_file_range(SourceRange range) const
{
  const auto * f = get_file(range.file_id());
  if (f == nullptr || range.is_invalid()) {
    return {};
  }
  return FileRange{
    f->uri(), f->get_position(range.get_begin().offset()),
    f->get_position(range.get_end().offset())};
}

}  // namespace bff
