// gdparse/basic/source_buffer.hpp - Script buffers and byte-offset ranges
//
// Tree nodes borrow their text from the buffers held by SourceBuffers, so
// the set must outlive every tree parsed from it. Positions are stored as
// byte offsets; lines and columns are only worked out for diagnostics.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gdparse
{

/// Index of a script inside a SourceBuffers set
struct FileId
{
  uint16_t value = UINT16_MAX;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != UINT16_MAX; }

  friend constexpr bool operator==(FileId a, FileId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(FileId a, FileId b) noexcept { return a.value != b.value; }
};

class SourceLocation
{
public:
  constexpr SourceLocation() noexcept = default;
  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != UINT32_MAX;
  }

private:
  FileId file_;
  uint32_t offset_ = UINT32_MAX;
};

/// Half-open byte range [begin, end) of one script
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end) noexcept
  : begin_(file, begin), end_(file, end)
  {
  }
  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
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

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// From the start of `a` to the end of `b`
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

/// 1-based line and column; line 0 means unknown
struct TextPosition
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line != 0; }
};

// ============================================================================
// ScriptBuffer - One script's text and line starts
// ============================================================================

class ScriptBuffer
{
public:
  ScriptBuffer(std::filesystem::path path, std::string text);

  ScriptBuffer(const ScriptBuffer &) = delete;
  ScriptBuffer & operator=(const ScriptBuffer &) = delete;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] uint32_t line_count() const noexcept
  {
    return static_cast<uint32_t>(line_starts_.size());
  }

  /// Offsets past the end are clamped to the end of the text
  [[nodiscard]] TextPosition position(uint32_t offset) const noexcept;

  /// 1-based line without its LF or CR LF terminator
  [[nodiscard]] std::string_view line(uint32_t number) const noexcept;

  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

private:
  std::filesystem::path path_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

// ============================================================================
// SourceBuffers - The scripts read by one parse run
// ============================================================================

class SourceBuffers
{
public:
  SourceBuffers() = default;
  SourceBuffers(const SourceBuffers &) = delete;
  SourceBuffers & operator=(const SourceBuffers &) = delete;
  SourceBuffers(SourceBuffers &&) = default;
  SourceBuffers & operator=(SourceBuffers &&) = default;

  /// FileId::invalid() once every id is taken
  [[nodiscard]] FileId add(std::filesystem::path path, std::string text);

  [[nodiscard]] const ScriptBuffer * get(FileId id) const noexcept;
  [[nodiscard]] TextPosition position(SourceLocation loc) const noexcept;
  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return buffers_.size(); }

private:
  // Held by pointer so text views survive later additions
  std::vector<std::unique_ptr<ScriptBuffer>> buffers_;
};

}  // namespace gdparse
