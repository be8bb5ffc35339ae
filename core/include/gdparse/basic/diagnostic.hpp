// gdparse/basic/diagnostic.hpp - Parser and driver diagnostics
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gdparse/basic/source_buffer.hpp"

namespace gdparse
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

/// A secondary position shown with `-` markers under the primary one
struct ContextLabel
{
  SourceRange range;
  std::string message;
};

/**
 * One reported problem: a coded headline, the position it points at with a
 * short label, and optional context positions, notes and a help line.
 *
 * @code
 *   diags.add(Diagnostic::error("E0001", "syntax error", range, headline)
 *               .with_context(rule_range, "while parsing if_stmt")
 *               .with_note("while parsing if_stmt < block < file"));
 * @endcode
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  ///< "E0001", "W0001", ...
  std::string message;

  SourceRange range;  ///< Invalid when the problem has no position
  std::string label;  ///< Text printed beside the `^` marker

  std::vector<ContextLabel> context;
  std::vector<std::string> notes;
  std::optional<std::string> help;

  [[nodiscard]] static Diagnostic error(
    std::string code, std::string message, SourceRange range = {}, std::string label = {});
  [[nodiscard]] static Diagnostic warning(
    std::string code, std::string message, SourceRange range = {}, std::string label = {});

  Diagnostic & with_context(SourceRange at, std::string message);
  Diagnostic & with_note(std::string note);
  Diagnostic & with_help(std::string text);
};

class DiagnosticBag
{
public:
  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const noexcept;
  [[nodiscard]] bool has_errors() const noexcept { return count(Severity::Error) > 0; }

  /// First diagnostic with the given code, or nullptr
  [[nodiscard]] const Diagnostic * find(std::string_view code) const noexcept;

  /// Stable order by file, then by offset; positionless diagnostics last
  [[nodiscard]] std::vector<const Diagnostic *> in_source_order() const;

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace gdparse
