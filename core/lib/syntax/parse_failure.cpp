#include "gdparse/syntax/parse_failure.hpp"

#include <fmt/core.h>

#include <string>
#include <utility>

namespace gdparse::syntax
{
namespace
{

/// "condition < if_stmt < stmt < line < block < file"
std::string join_trace(const std::vector<ContextFrame> & context)
{
  std::string out;
  for (auto it = context.rbegin(); it != context.rend(); ++it) {
    if (it != context.rbegin()) out += " < ";
    out += it->label;
  }
  return out;
}

}  // namespace

std::string ParseFailure::headline() const
{
  if (!message.empty()) {
    return message;
  }

  std::string out = "expected ";
  if (expected.empty()) {
    out += "valid syntax";
  }
  for (size_t i = 0; i < expected.size(); ++i) {
    if (i > 0) {
      out += (i + 1 == expected.size()) ? " or " : ", ";
    }
    out += expected[i];
  }
  if (!found.empty()) {
    out += ", found ";
    out += found;
  }
  return out;
}

std::string ParseFailure::render() const
{
  std::string out = fmt::format("{}:{}: {}", line, column, headline());
  for (auto it = context.rbegin(); it != context.rend(); ++it) {
    out += fmt::format("\n  while parsing {} at {}:{}", it->label, it->line, it->column);
  }
  return out;
}

std::string ParseFailure::summary() const
{
  std::string out = fmt::format("{}:{}: {}", line, column, headline());
  if (context.empty()) {
    return out;
  }
  return out + " (while parsing " + join_trace(context) + ")";
}

void ParseFailure::report(DiagnosticBag & diags, FileId file_id) const
{
  const bool nesting = kind == FailureKind::NestingLimit;
  Diagnostic diag = Diagnostic::error(
    std::string(nesting ? k_nesting_limit_code : k_syntax_error_code),
    nesting ? "nesting limit exceeded" : "syntax error", SourceRange(file_id, offset, offset),
    headline());

  // Only the innermost frames are labelled; render() carries the full trace
  constexpr size_t max_context_labels = 3;
  size_t labelled = 0;
  for (auto it = context.rbegin(); it != context.rend() && labelled < max_context_labels; ++it) {
    if (it->label == "file" || it->label == "block" || it->label == "line") continue;
    diag.with_context(
      SourceRange(file_id, it->offset, it->offset), fmt::format("while parsing {}", it->label));
    ++labelled;
  }
  if (!context.empty()) {
    diag.with_note("while parsing " + join_trace(context));
  }
  if (nesting) {
    diag.with_help("raise parser.max_nesting_depth in gdparse.yaml or pass --max-depth");
  }
  diags.add(std::move(diag));
}

}  // namespace gdparse::syntax
