// gdparse/syntax/frontend.cpp - High-level parse pipeline
#include "gdparse/syntax/frontend.hpp"

#include <utility>

namespace gdparse
{

ParseOutput parse_source(
  SourceBuffers & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, const syntax::ParseOptions & options)
{
  ParseOutput out;
  out.file_id = sources.add(path, std::move(source_text));
  const ScriptBuffer * buffer = sources.get(out.file_id);
  if (buffer == nullptr) {
    diags.add(Diagnostic::error("", "too many scripts in one run"));
    return out;
  }

  syntax::Parser parser(ast, out.file_id, buffer->text(), options);
  out.file = parser.parse_file();

  for (const uint32_t line_start : parser.tab_warnings()) {
    diags.add(Diagnostic::warning(
      std::string(k_tab_indentation_code), "tab character in indentation",
      SourceRange(out.file_id, line_start, line_start), "only spaces count towards indentation"));
  }

  if (out.file == nullptr) {
    if (parser.failure()) {
      out.failure = parser.failure();
    } else {
      // No rule recorded where it stopped
      syntax::ParseFailure unknown;
      unknown.message = "unable to parse input";
      out.failure = std::move(unknown);
    }
    out.failure->report(diags, out.file_id);
  }
  return out;
}

}  // namespace gdparse
