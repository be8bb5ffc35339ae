// gdparse/syntax/parse_failure.hpp - Grammar failure with its context trace
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gdparse/basic/diagnostic.hpp"
#include "gdparse/basic/source_buffer.hpp"

namespace gdparse::syntax
{

/// Diagnostic codes emitted for grammar failures
inline constexpr std::string_view k_syntax_error_code = "E0001";
inline constexpr std::string_view k_nesting_limit_code = "E0002";

/// A grammar rule that was being parsed when the failure happened.
struct ContextFrame
{
  std::string_view label;  ///< e.g. "if_stmt", "function_decl"
  uint32_t offset = 0;     ///< Where the rule started
  uint32_t line = 1;
  uint32_t column = 1;
};

enum class FailureKind : uint8_t {
  Syntax,
  NestingLimit,
};

/**
 * The furthest point the parser reached before every alternative failed.
 *
 * Failures recorded at the same offset are merged: their expectations are
 * combined and the context of the first (deepest) one is kept.
 */
struct ParseFailure
{
  FailureKind kind = FailureKind::Syntax;
  uint32_t offset = 0;
  uint32_t line = 1;
  uint32_t column = 1;

  std::vector<std::string> expected;  ///< e.g. "':'", "expression"
  std::string message;                ///< Replaces the expected list when set
  std::string found;                  ///< Description of the text at the failure

  std::vector<ContextFrame> context;  ///< Outermost rule first

  /// "expected ':' or expression, found newline"
  [[nodiscard]] std::string headline() const;

  /**
   * Multi-line trace, innermost rule first:
   * @code
   *   3:9: expected ':', found newline
   *     while parsing condition at 3:4
   *     while parsing if_stmt at 3:1
   * @endcode
   */
  [[nodiscard]] std::string render() const;

  /// Single-line form used by directory mode:
  /// "3:9: expected ':', found newline (while parsing condition < if_stmt < ...)"
  [[nodiscard]] std::string summary() const;

  /// Add the failure to `diags` as an error labelled with its innermost rules.
  void report(DiagnosticBag & diags, FileId file_id) const;
};

}  // namespace gdparse::syntax
