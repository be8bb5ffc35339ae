// gdparse/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "gdparse/ast/ast.hpp"
#include "gdparse/ast/ast_context.hpp"
#include "gdparse/basic/diagnostic.hpp"
#include "gdparse/basic/source_buffer.hpp"
#include "gdparse/syntax/parse_failure.hpp"
#include "gdparse/syntax/parser.hpp"

namespace gdparse
{

/// Warning code for tabs in leading whitespace
inline constexpr std::string_view k_tab_indentation_code = "W0001";

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  ScriptFile * file = nullptr;  ///< nullptr when parsing failed
  std::optional<syntax::ParseFailure> failure;

  [[nodiscard]] bool ok() const noexcept { return file != nullptr; }
};

// Parse pipeline:
// source -> SourceBuffers -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceBuffers & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, const syntax::ParseOptions & options = {});

}  // namespace gdparse
