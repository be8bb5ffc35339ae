// gdparse/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>

#include "gdparse/basic/diagnostic.hpp"
#include "gdparse/basic/source_buffer.hpp"

namespace gdparse
{

/**
 * Prints diagnostics with the offending script line underneath:
 *
 * @code
 *   error[E0001]: syntax error
 *     --> player.gd:3:14
 *      |
 *    3 |     if is_alive
 *      |                ^ expected ':' or operator, found newline
 *    2 | func _process(delta):
 *      | - while parsing function_decl
 *      |
 *      = note: while parsing if_stmt < block < function_decl < file
 * @endcode
 *
 * Tabs in a script line are shown as four spaces.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceBuffers & sources);

  /// Prints the bag in source order
  void print_all(const DiagnosticBag & diags, const SourceBuffers & sources);

private:
  enum class Marker : uint8_t {
    Primary,
    Context,
  };

  void print_header(const Diagnostic & diag);
  void print_location(SourceRange range, const SourceBuffers & sources);
  void print_snippet(
    SourceRange range, std::string_view message, Marker marker, const SourceBuffers & sources);
  void print_footer(std::string_view kind, std::string_view text);

  void print_gutter();

  std::ostream & os_;
  bool use_color_;
};

}  // namespace gdparse
