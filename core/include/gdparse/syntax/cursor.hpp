// gdparse/syntax/cursor.hpp - Position over a source buffer
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gdparse::syntax
{

/**
 * Read position inside a source buffer, with its 1-based line and column.
 *
 * Cursors are small values: grammar rules copy one before trying an
 * alternative and assign it back to backtrack.
 */
class Cursor
{
public:
  Cursor() = default;
  explicit Cursor(std::string_view src) noexcept : src_(src) {}

  [[nodiscard]] bool at_end() const noexcept { return pos_ >= src_.size(); }

  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  [[nodiscard]] bool starts_with(std::string_view s) const noexcept
  {
    return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
  }

  /// Unconsumed input
  [[nodiscard]] std::string_view rest() const noexcept
  {
    return pos_ < src_.size() ? src_.substr(pos_) : std::string_view{};
  }

  [[nodiscard]] std::string_view source() const noexcept { return src_; }

  /// Text between `start` and this cursor
  [[nodiscard]] std::string_view slice_from(const Cursor & start) const noexcept
  {
    return src_.substr(start.pos_, pos_ - start.pos_);
  }

  [[nodiscard]] uint32_t offset() const noexcept { return pos_; }
  [[nodiscard]] uint32_t line() const noexcept { return line_; }
  [[nodiscard]] uint32_t column() const noexcept { return column_; }

  void advance(size_t n = 1) noexcept
  {
    for (; n > 0 && pos_ < src_.size(); --n) {
      if (src_[pos_] == '\n') {
        ++line_;
        column_ = 1;
      } else {
        ++column_;
      }
      ++pos_;
    }
  }

  bool consume(char c) noexcept
  {
    if (peek() != c || at_end()) return false;
    advance(1);
    return true;
  }

  bool consume(std::string_view s) noexcept
  {
    if (!starts_with(s)) return false;
    advance(s.size());
    return true;
  }

private:
  std::string_view src_;
  uint32_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
};

}  // namespace gdparse::syntax
