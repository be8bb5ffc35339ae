// gdparse/syntax/scanner.hpp - Lexical primitives over a Cursor
//
// Whitespace, comments, indentation, identifiers and literal spellings.
// Every scan_* function either consumes the text it recognises and returns
// it, or returns std::nullopt and leaves the cursor untouched. Conversion of
// a spelling into a value (int_value, float_value) is separate so the parser
// can report overflow at the literal's position.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "gdparse/syntax/cursor.hpp"

namespace gdparse::syntax
{

// ============================================================================
// Character classes
// ============================================================================

[[nodiscard]] constexpr bool is_ident_start(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

[[nodiscard]] constexpr bool is_ident_char(char c) noexcept
{
  return is_ident_start(c) || (c >= '0' && c <= '9');
}

[[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] constexpr bool is_hex_digit(char c) noexcept
{
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

[[nodiscard]] constexpr bool is_inline_space(char c) noexcept { return c == ' ' || c == '\t'; }

// ============================================================================
// Whitespace, line endings and comments
// ============================================================================

/// Skip spaces and tabs on the current line.
void skip_spaces(Cursor & c) noexcept;

/// True at "\n", "\r\n" or the end of input.
[[nodiscard]] bool at_line_end(const Cursor & c) noexcept;

/// Consume "\n" or "\r\n".
bool skip_line_ending(Cursor & c) noexcept;

/**
 * Consume an optional run of spaces followed by a `#` comment, up to but not
 * including the line ending.
 *
 * @return The comment text without `#`, trimmed of surrounding whitespace
 */
[[nodiscard]] std::optional<std::string_view> scan_comment(Cursor & c) noexcept;

/// Consume a line that holds only spaces, plus its line ending.
bool skip_blank_line(Cursor & c) noexcept;

/// Skip any mix of whitespace, line endings and comments.
void skip_trivia(Cursor & c) noexcept;

// ============================================================================
// Indentation
// ============================================================================

/// Number of leading space characters at the cursor. Tabs do not count.
[[nodiscard]] uint32_t scan_indentation(const Cursor & c) noexcept;

/// Consume exactly `indent` spaces when the measured indentation equals it.
bool same_indent(Cursor & c, uint32_t indent) noexcept;

/// Indentation at the cursor when it is strictly greater than `indent`.
[[nodiscard]] std::optional<uint32_t> more_indent(const Cursor & c, uint32_t indent) noexcept;

/// True when the leading whitespace of the line at the cursor contains a tab.
[[nodiscard]] bool has_tab_in_indentation(const Cursor & c) noexcept;

// ============================================================================
// Words
// ============================================================================

/// `[A-Za-z_][A-Za-z0-9_]*`, reserved words included.
[[nodiscard]] std::optional<std::string_view> scan_identifier(Cursor & c) noexcept;

/// Identifiers joined by `.` without spaces, e.g. `Foo.Bar`.
[[nodiscard]] std::optional<std::string_view> scan_dotted_identifier(Cursor & c) noexcept;

/// True when `word` starts at the cursor and is not followed by an
/// identifier character.
[[nodiscard]] bool at_keyword(const Cursor & c, std::string_view word) noexcept;

/// Consume `word` when at_keyword() holds.
bool scan_keyword(Cursor & c, std::string_view word) noexcept;

// ============================================================================
// Literals
// ============================================================================

/**
 * `0x` followed by hex digits, or decimal digits. Scanning stops at the
 * first character that cannot continue the number, so "0foo" yields "0".
 * When `0x` is not followed by a hex digit only the "0" is taken.
 */
[[nodiscard]] std::optional<std::string_view> scan_int(Cursor & c) noexcept;

/// `digits '.' digits`; no exponent form.
[[nodiscard]] std::optional<std::string_view> scan_float(Cursor & c) noexcept;

struct StringSpelling
{
  std::string_view body;  ///< Between the quotes, escapes left as written
  char quote = '"';
};

/**
 * Single- or double-quoted string. Inside, a backslash may only escape the
 * delimiter, another backslash, or `n`.
 */
[[nodiscard]] std::optional<StringSpelling> scan_string(Cursor & c) noexcept;

/// `$` followed by a `/`-separated identifier path or a quoted string. The
/// returned text includes the `$`.
[[nodiscard]] std::optional<std::string_view> scan_node_path(Cursor & c) noexcept;

/// Value of a scan_int() spelling; std::nullopt when it overflows int64_t.
[[nodiscard]] std::optional<int64_t> int_value(std::string_view spelling) noexcept;

/// Value of a scan_float() spelling.
[[nodiscard]] std::optional<double> float_value(std::string_view spelling);

}  // namespace gdparse::syntax
