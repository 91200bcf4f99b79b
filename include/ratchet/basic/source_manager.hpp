// ratchet/basic/source_manager.hpp - Byte ranges and line/column lookup
//
// Every range handed out by the parser is a byte range into a single file.
// SourceManager owns that file's text and turns offsets into the 1-indexed
// positions that references and diagnostics report.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ratchet
{

/// Byte offset into one source buffer. Default-constructed locations are invalid.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
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

private:
  uint32_t offset_ = k_invalid_offset;
};

/// Half-open byte range [begin, end).
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t begin_offset, uint32_t end_offset) noexcept
  : begin_(begin_offset), end_(end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

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

/// 1-indexed position; zero means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;
};

/// A byte range with its line/column endpoints already computed, so a
/// reference can be reported after the source buffer is gone.
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }

  [[nodiscard]] bool operator==(const FullSourceRange & other) const noexcept
  {
    return start_byte == other.start_byte && end_byte == other.end_byte &&
           start_line == other.start_line && start_column == other.start_column &&
           end_line == other.end_line && end_column == other.end_column;
  }
  [[nodiscard]] bool operator!=(const FullSourceRange & other) const noexcept
  {
    return !(*this == other);
  }
};

/// Owns one source buffer together with its line start table.
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

  /// Path the text was read from; empty for in-memory snippets.
  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }

  /// Offsets past the end clamp to the end of the buffer.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Text of a 0-indexed line without its terminator.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace ratchet
