// bff/basic/source_manager.hpp - Source location, range and file registry
//
// This header provides types for tracking source code locations and ranges
// across the set of BFF files touched by one evaluation.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bff
{

namespace fs = std::filesystem;

// ============================================================================
// FileId - Handle of a registered source file
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Stores the owning file and a byte offset into it. Line and column
 * information is computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file_id, uint32_t offset) noexcept
  : file_id_(file_id), offset_(offset)
  {
  }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_id_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_id_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_id_ == other.file_id_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }
  /// Orders by file first, then by offset.
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_id_.value != other.file_id_.value) {
      return file_id_.value < other.file_id_.value;
    }
    return offset_ < other.offset_;
  }

private:
  FileId file_id_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A half-open byte range [begin, end) inside one file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }

  constexpr SourceRange(FileId file_id, uint32_t begin_offset, uint32_t end_offset) noexcept
  : begin_(file_id, begin_offset), end_(file_id, end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.offset() - begin_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// Range spanning from the start of `a` to the end of `b` (same file).
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions (1-indexed)
// ============================================================================

struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// Position / FileRange - Editor positions (0-indexed), file addressed by URI
// ============================================================================

/**
 * Zero-based line and character. `character` counts bytes within the line.
 */
struct Position
{
  uint32_t line = 0;
  uint32_t character = 0;

  [[nodiscard]] constexpr bool operator==(const Position & other) const noexcept
  {
    return line == other.line && character == other.character;
  }
  [[nodiscard]] constexpr bool operator!=(const Position & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(const Position & other) const noexcept
  {
    return line < other.line || (line == other.line && character < other.character);
  }
  [[nodiscard]] constexpr bool operator<=(const Position & other) const noexcept
  {
    return !(other < *this);
  }
};

/**
 * A range in a file identified by URI.
 *
 * Unlike SourceRange this does not depend on a SourceRegistry, so evaluation
 * results that store it stay meaningful after the parse trees are released.
 */
struct FileRange
{
  std::string uri;
  Position start;
  Position end;

  [[nodiscard]] bool contains(const Position & p) const noexcept
  {
    if (start == end) {
      return p == start;
    }
    return start <= p && p < end;
  }

  [[nodiscard]] bool operator==(const FileRange & other) const noexcept
  {
    return uri == other.uri && start == other.start && end == other.end;
  }
  [[nodiscard]] bool operator!=(const FileRange & other) const noexcept
  {
    return !(*this == other);
  }
};

// ============================================================================
// SourceFile - Content and line table of one file
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string uri, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] const std::string & uri() const noexcept { return uri_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  void set_content(std::string new_content);

  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert a byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Convert a byte offset to an editor position (0-indexed)
  [[nodiscard]] Position get_position(uint32_t offset) const noexcept;

  /// Convert an editor position back to a byte offset (clamped to the line)
  [[nodiscard]] uint32_t get_offset(Position position) const noexcept;

  /// Get the content of a specific line (0-indexed), without the newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string uri_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - All files of a session
// ============================================================================

/**
 * Owns every SourceFile seen during parsing and hands out FileIds.
 *
 * Files are keyed by URI; re-registering a known URI returns its existing id
 * (callers replace the content through update_content()).
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  FileId register_file(const std::string & uri, std::string content);

  void update_content(FileId id, std::string new_content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_uri(std::string_view uri) const;

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  /// Resolve a byte range to a URI-addressed editor range.
  [[nodiscard]] FileRange to_file_range(SourceRange range) const;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> uri_to_id_;
};

}  // namespace bff
