// gdparse/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Text goes through fmt; colours come from rang and are switched off
// entirely when the printer is created without colour.
//
#include "gdparse/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <system_error>
#include <utility>

namespace gdparse
{

namespace
{

constexpr uint32_t k_tab_width = 4;

/// Paths under the working directory are shown relative to it
std::string display_path(const std::filesystem::path & path)
{
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return path.string();
  }
  const auto rel = std::filesystem::relative(path, cwd, ec);
  return (ec || rel.empty()) ? path.string() : rel.string();
}

/// Line text and the spaces up to `column`, both with tabs widened
std::pair<std::string, std::string> widen_tabs(std::string_view line, uint32_t column)
{
  std::string text;
  std::string lead;
  for (size_t i = 0; i < line.size(); ++i) {
    const bool tab = line[i] == '\t';
    text.append(tab ? k_tab_width : 1, tab ? ' ' : line[i]);
    if (i + 1 < column) {
      lead.append(tab ? k_tab_width : 1, ' ');
    }
  }
  // Columns past the end of the line, e.g. a missing token before the newline
  for (size_t i = line.size() + 1; i < column; ++i) {
    lead += ' ';
  }
  return {std::move(text), std::move(lead)};
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceBuffers & sources)
{
  print_header(diag);
  print_location(diag.range, sources);
  print_gutter();
  os_ << "\n";

  if (diag.range.is_valid()) {
    print_snippet(diag.range, diag.label, Marker::Primary, sources);
  } else if (!diag.label.empty()) {
    print_footer("note", diag.label);
  }
  for (const ContextLabel & ctx : diag.context) {
    print_snippet(ctx.range, ctx.message, Marker::Context, sources);
  }

  for (const std::string & note : diag.notes) {
    print_footer("note", note);
  }
  if (diag.help) {
    print_footer("help", *diag.help);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceBuffers & sources)
{
  for (const Diagnostic * d : diags.in_source_order()) {
    print(*d, sources);
  }
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const bool error = diag.severity == Severity::Error;
  std::string title = error ? "error" : "warning";
  if (!diag.code.empty()) {
    title += fmt::format("[{}]", diag.code);
  }

  if (use_color_) {
    os_ << rang::style::bold << (error ? rang::fg::red : rang::fg::yellow) << title
        << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", title, diag.message);
  }
}

void DiagnosticPrinter::print_location(SourceRange range, const SourceBuffers & sources)
{
  std::string where = "<unknown>";
  if (const ScriptBuffer * buffer = sources.get(range.file_id())) {
    where = display_path(buffer->path());
    const TextPosition pos = sources.position(range.get_begin());
    if (pos.is_valid()) {
      where += fmt::format(":{}:{}", pos.line, pos.column);
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "  -->" << rang::style::reset
        << rang::fg::reset << " " << where << "\n";
  } else {
    fmt::print(os_, "  --> {}\n", where);
  }
}

void DiagnosticPrinter::print_snippet(
  SourceRange range, std::string_view message, Marker marker, const SourceBuffers & sources)
{
  const ScriptBuffer * buffer = sources.get(range.file_id());
  if (buffer == nullptr || range.is_invalid()) {
    return;
  }
  const TextPosition begin = buffer->position(range.get_begin().offset());
  const TextPosition end = buffer->position(range.get_end().offset());
  const auto [text, lead] = widen_tabs(buffer->line(begin.line), begin.column);

  // Multi-line and empty ranges get a single marker
  const uint32_t width =
    (end.line == begin.line && end.column > begin.column) ? end.column - begin.column : 1;
  const std::string marks(width, marker == Marker::Primary ? '^' : '-');

  if (use_color_) {
    os_ << rang::fg::cyan << fmt::format(" {:>4} ", begin.line) << rang::fg::reset
        << rang::style::bold << "| " << rang::style::reset << text << "\n";
  } else {
    fmt::print(os_, " {:>4} | {}\n", begin.line, text);
  }

  print_gutter();
  os_ << " " << lead;
  if (use_color_) {
    os_ << (marker == Marker::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  }
  os_ << marks;
  if (!message.empty()) {
    os_ << " " << message;
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_footer(std::string_view kind, std::string_view text)
{
  print_gutter();
  os_ << "\n";
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   =" << rang::style::reset
        << rang::fg::reset;
  } else {
    os_ << "   =";
  }
  fmt::print(os_, " {}: {}\n", kind, text);
}

void DiagnosticPrinter::print_gutter()
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      |" << rang::style::reset
        << rang::fg::reset;
  } else {
    os_ << "      |";
  }
}

}  // namespace gdparse
