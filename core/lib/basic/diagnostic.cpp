// gdparse/basic/diagnostic.cpp - Diagnostic construction and ordering
#include "gdparse/basic/diagnostic.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace gdparse
{

namespace
{

Diagnostic make(
  Severity severity, std::string code, std::string message, SourceRange range,
  std::string label)
{
  Diagnostic d;
  d.severity = severity;
  d.code = std::move(code);
  d.message = std::move(message);
  d.range = range;
  d.label = std::move(label);
  return d;
}

}  // namespace

Diagnostic Diagnostic::error(
  std::string code, std::string message, SourceRange range, std::string label)
{
  return make(Severity::Error, std::move(code), std::move(message), range, std::move(label));
}

Diagnostic Diagnostic::warning(
  std::string code, std::string message, SourceRange range, std::string label)
{
  return make(Severity::Warning, std::move(code), std::move(message), range, std::move(label));
}

Diagnostic & Diagnostic::with_context(SourceRange at, std::string message)
{
  context.push_back(ContextLabel{at, std::move(message)});
  return *this;
}

Diagnostic & Diagnostic::with_note(std::string note)
{
  notes.push_back(std::move(note));
  return *this;
}

Diagnostic & Diagnostic::with_help(std::string text)
{
  help = std::move(text);
  return *this;
}

size_t DiagnosticBag::count(Severity severity) const noexcept
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

const Diagnostic * DiagnosticBag::find(std::string_view code) const noexcept
{
  const auto it = std::find_if(
    diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) { return d.code == code; });
  return it != diagnostics_.end() ? &*it : nullptr;
}

std::vector<const Diagnostic *> DiagnosticBag::in_source_order() const
{
  std::vector<const Diagnostic *> out;
  out.reserve(diagnostics_.size());
  for (const Diagnostic & d : diagnostics_) {
    out.push_back(&d);
  }

  const auto key = [](const Diagnostic * d) {
    const SourceLocation at = d->range.get_begin();
    return std::make_tuple(!at.is_valid(), at.file_id().value, at.offset());
  };
  std::stable_sort(out.begin(), out.end(), [&key](const Diagnostic * a, const Diagnostic * b) {
    return key(a) < key(b);
  });
  return out;
}

}  // namespace gdparse
