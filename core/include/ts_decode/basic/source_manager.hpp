// ts_decode/basic/source_manager.hpp - Source buffer, offsets and ranges
//
// The decode engine borrows node text from the buffer held here, so a
// SourceManager must outlive every node handle and every borrowed value
// produced from it.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ts_decode
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into a source buffer.
 *
 * Line and column information is computed on demand via SourceManager.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }
  [[nodiscard]] constexpr bool operator>(SourceLocation other) const noexcept
  {
    return offset_ > other.offset_;
  }
  [[nodiscard]] constexpr bool operator>=(SourceLocation other) const noexcept
  {
    return offset_ >= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A half-open byte range [start, end) of a source buffer.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept
  {
    return start_.is_invalid() || end_.is_invalid();
  }

  /// Check if another range is fully contained within this range
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return other.start_ >= start_ && other.end_ <= end_;
  }

  /// Size in bytes (0 for invalid ranges)
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Source range with pre-computed line/column information.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] SourceRange to_source_range() const noexcept { return {start_byte, end_byte}; }

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager - Owns the buffer a tree was parsed from
// ============================================================================

class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  // Node handles keep a pointer to this object; moving it would dangle them.
  SourceManager(const SourceManager &) = delete;
  SourceManager & operator=(const SourceManager &) = delete;

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }
  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without its terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Get a slice of source by range; out-of-bounds ranges are clamped
  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept
  {
    if (range.is_invalid()) return {};
    auto start = range.get_begin().get_offset();
    auto end = range.get_end().get_offset();
    if (start >= source_.size()) return {};
    if (end > source_.size()) end = static_cast<uint32_t>(source_.size());
    return std::string_view(source_).substr(start, end - start);
  }

  /// Expand a SourceRange to include full line/column info
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace ts_decode
