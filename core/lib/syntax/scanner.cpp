#include "gdparse/syntax/scanner.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace gdparse::syntax
{
namespace
{

std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && (is_inline_space(s.front()) || s.front() == '\r')) s.remove_prefix(1);
  while (!s.empty() && (is_inline_space(s.back()) || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

void skip_ident_chars(Cursor & c) noexcept
{
  while (!c.at_end() && is_ident_char(c.peek())) {
    c.advance(1);
  }
}

}  // namespace

// ============================================================================
// Whitespace, line endings and comments
// ============================================================================

void skip_spaces(Cursor & c) noexcept
{
  while (!c.at_end() && is_inline_space(c.peek())) {
    c.advance(1);
  }
}

bool at_line_end(const Cursor & c) noexcept
{
  return c.at_end() || c.peek() == '\n' || (c.peek() == '\r' && c.peek(1) == '\n');
}

bool skip_line_ending(Cursor & c) noexcept
{
  if (c.consume('\n')) return true;
  return c.consume("\r\n");
}

std::optional<std::string_view> scan_comment(Cursor & c) noexcept
{
  Cursor probe = c;
  skip_spaces(probe);
  if (!probe.consume('#')) {
    return std::nullopt;
  }

  const Cursor text_start = probe;
  while (!probe.at_end() && probe.peek() != '\n') {
    probe.advance(1);
  }
  const std::string_view text = trim(probe.slice_from(text_start));

  // Leave a trailing '\r' of "\r\n" for skip_line_ending
  c = text_start;
  while (c.offset() < probe.offset() && !(c.peek() == '\r' && c.peek(1) == '\n')) {
    c.advance(1);
  }
  return text;
}

bool skip_blank_line(Cursor & c) noexcept
{
  Cursor probe = c;
  skip_spaces(probe);
  if (!skip_line_ending(probe)) {
    return false;
  }
  c = probe;
  return true;
}

void skip_trivia(Cursor & c) noexcept
{
  while (true) {
    skip_spaces(c);
    if (skip_line_ending(c)) continue;
    if (scan_comment(c)) continue;
    break;
  }
}

// ============================================================================
// Indentation
// ============================================================================

uint32_t scan_indentation(const Cursor & c) noexcept
{
  uint32_t n = 0;
  while (c.peek(n) == ' ') {
    ++n;
  }
  return n;
}

bool same_indent(Cursor & c, uint32_t indent) noexcept
{
  if (scan_indentation(c) != indent) {
    return false;
  }
  c.advance(indent);
  return true;
}

std::optional<uint32_t> more_indent(const Cursor & c, uint32_t indent) noexcept
{
  const uint32_t measured = scan_indentation(c);
  if (measured > indent) {
    return measured;
  }
  return std::nullopt;
}

bool has_tab_in_indentation(const Cursor & c) noexcept
{
  for (size_t i = 0; is_inline_space(c.peek(i)); ++i) {
    if (c.peek(i) == '\t') return true;
  }
  return false;
}

// ============================================================================
// Words
// ============================================================================

std::optional<std::string_view> scan_identifier(Cursor & c) noexcept
{
  if (c.at_end() || !is_ident_start(c.peek())) {
    return std::nullopt;
  }
  const Cursor start = c;
  c.advance(1);
  skip_ident_chars(c);
  return c.slice_from(start);
}

std::optional<std::string_view> scan_dotted_identifier(Cursor & c) noexcept
{
  const Cursor start = c;
  if (!scan_identifier(c)) {
    return std::nullopt;
  }
  while (c.peek() == '.' && is_ident_start(c.peek(1))) {
    c.advance(1);
    (void)scan_identifier(c);
  }
  return c.slice_from(start);
}

bool at_keyword(const Cursor & c, std::string_view word) noexcept
{
  return c.starts_with(word) && !is_ident_char(c.peek(word.size()));
}

bool scan_keyword(Cursor & c, std::string_view word) noexcept
{
  if (!at_keyword(c, word)) {
    return false;
  }
  c.advance(word.size());
  return true;
}

// ============================================================================
// Literals
// ============================================================================

std::optional<std::string_view> scan_int(Cursor & c) noexcept
{
  const Cursor start = c;
  if (c.starts_with("0x") && is_hex_digit(c.peek(2))) {
    c.advance(2);
    while (is_hex_digit(c.peek())) c.advance(1);
    return c.slice_from(start);
  }
  if (!is_digit(c.peek())) {
    return std::nullopt;
  }
  while (is_digit(c.peek())) c.advance(1);
  return c.slice_from(start);
}

std::optional<std::string_view> scan_float(Cursor & c) noexcept
{
  Cursor probe = c;
  if (!is_digit(probe.peek())) return std::nullopt;
  while (is_digit(probe.peek())) probe.advance(1);
  if (probe.peek() != '.' || !is_digit(probe.peek(1))) return std::nullopt;
  probe.advance(1);
  while (is_digit(probe.peek())) probe.advance(1);

  const std::string_view text = probe.slice_from(c);
  c = probe;
  return text;
}

std::optional<StringSpelling> scan_string(Cursor & c) noexcept
{
  const char quote = c.peek();
  if (c.at_end() || (quote != '"' && quote != '\'')) {
    return std::nullopt;
  }

  Cursor probe = c;
  probe.advance(1);
  const Cursor body_start = probe;
  while (!probe.at_end()) {
    const char ch = probe.peek();
    if (ch == '\\') {
      const char next = probe.peek(1);
      if (next != quote && next != 'n' && next != '\\') {
        return std::nullopt;
      }
      probe.advance(2);
      continue;
    }
    if (ch == quote) {
      StringSpelling out{probe.slice_from(body_start), quote};
      probe.advance(1);
      c = probe;
      return out;
    }
    probe.advance(1);
  }
  return std::nullopt;  // unterminated
}

std::optional<std::string_view> scan_node_path(Cursor & c) noexcept
{
  if (c.peek() != '$') {
    return std::nullopt;
  }
  Cursor probe = c;
  probe.advance(1);

  if (scan_identifier(probe)) {
    while (probe.peek() == '/' && is_ident_start(probe.peek(1))) {
      probe.advance(1);
      (void)scan_identifier(probe);
    }
  } else if (!scan_string(probe)) {
    return std::nullopt;
  }

  const std::string_view text = probe.slice_from(c);
  c = probe;
  return text;
}

std::optional<int64_t> int_value(std::string_view spelling) noexcept
{
  int base = 10;
  if (spelling.size() > 2 && spelling[0] == '0' && spelling[1] == 'x') {
    base = 16;
    spelling.remove_prefix(2);
  }
  int64_t v = 0;
  const char * const end = spelling.data() + spelling.size();
  const auto [ptr, ec] = std::from_chars(spelling.data(), end, v, base);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return v;
}

std::optional<double> float_value(std::string_view spelling)
{
  const std::string tmp(spelling);
  char * end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size() || errno == ERANGE) {
    return std::nullopt;
  }
  return v;
}

}  // namespace gdparse::syntax
