// gdparse/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parsing pipeline that keeps the buffers, arena and
// diagnostics together so the returned tree stays valid.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "gdparse/ast/ast.hpp"
#include "gdparse/ast/ast_context.hpp"
#include "gdparse/basic/casting.hpp"
#include "gdparse/basic/diagnostic.hpp"
#include "gdparse/basic/source_buffer.hpp"
#include "gdparse/syntax/frontend.hpp"
#include "gdparse/syntax/parser.hpp"

namespace gdparse::test_support
{

struct TestParseUnit
{
  SourceBuffers sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  ScriptFile * file = nullptr;
  std::optional<syntax::ParseFailure> failure;

  [[nodiscard]] bool ok() const noexcept { return file != nullptr; }

  /// Lines of the top-level block
  [[nodiscard]] gsl::span<AstNode *> lines() const noexcept
  {
    return file != nullptr ? file->body->lines : gsl::span<AstNode *>{};
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept { return sources.slice(r); }

  [[nodiscard]] TextPosition position(SourceLocation at) const noexcept
  {
    return sources.position(at);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.gd",
  const syntax::ParseOptions & options = {})
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags, options);
  out.file_id = parsed.file_id;
  out.file = parsed.file;
  out.failure = parsed.failure;
  return out;
}

/// One expression parsed with syntax::Parser::parse_expr().
struct TestExprUnit
{
  std::unique_ptr<std::string> source;  ///< Heap-held so views survive moves
  std::unique_ptr<AstContext> ast;
  Expr * expr = nullptr;
  std::optional<syntax::ParseFailure> failure;
  std::string_view rest;  ///< Input left after the expression

  [[nodiscard]] bool ok() const noexcept { return expr != nullptr; }
};

[[nodiscard]] inline TestExprUnit parse_expr(
  std::string src, const syntax::ParseOptions & options = {})
{
  TestExprUnit out;
  out.source = std::make_unique<std::string>(std::move(src));
  out.ast = std::make_unique<AstContext>();

  syntax::Parser parser(*out.ast, FileId{0}, *out.source, options);
  out.expr = parser.parse_expr();
  out.failure = parser.failure();
  out.rest = parser.cursor().rest();
  return out;
}

// ============================================================================
// Compact expression rendering
// ============================================================================

/**
 * One-line rendering of an expression tree for assertions:
 *
 *   a * (b + c)   ->  (a * (b + c))
 *   a.b[1].c      ->  Attr(a, Attr(Index(b, 1), c))
 *   f(x, "s")     ->  f(x, "s")
 */
[[nodiscard]] inline std::string shape(const AstNode * node)
{
  if (node == nullptr) return "<null>";

  if (isa<NullLiteralExpr>(node)) return "null";
  if (const auto * b = dyn_cast<BoolLiteralExpr>(node)) return b->value ? "true" : "false";
  if (const auto * i = dyn_cast<IntLiteralExpr>(node)) return std::to_string(i->value);
  if (const auto * f = dyn_cast<FloatLiteralExpr>(node)) return std::string(f->spelling);
  if (const auto * s = dyn_cast<StringLiteralExpr>(node)) {
    return s->quote + std::string(s->value) + s->quote;
  }
  if (const auto * np = dyn_cast<NodePathExpr>(node)) return std::string(np->path);
  if (const auto * id = dyn_cast<IdentExpr>(node)) return std::string(id->name);

  const auto join = [](auto items, auto render) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) out += ", ";
      out += render(items[i]);
    }
    return out;
  };

  if (const auto * a = dyn_cast<ArrayLiteralExpr>(node)) {
    return "[" + join(a->elements, [](const Expr * e) { return shape(e); }) + "]";
  }
  if (const auto * o = dyn_cast<ObjectLiteralExpr>(node)) {
    return "{" +
           join(
             o->pairs,
             [](const ObjectPair * p) { return shape(p->key) + ": " + shape(p->value); }) +
           "}";
  }
  if (const auto * c = dyn_cast<CallExpr>(node)) {
    return std::string(c->callee) + "(" +
           join(c->args, [](const Expr * e) { return shape(e); }) + ")";
  }
  if (const auto * u = dyn_cast<UnaryExpr>(node)) {
    return std::string(to_string(u->op)) + shape(u->operand);
  }
  if (const auto * bin = dyn_cast<BinaryExpr>(node)) {
    if (bin->op == BinaryOp::Attr) return "Attr(" + shape(bin->lhs) + ", " + shape(bin->rhs) + ")";
    if (bin->op == BinaryOp::Index) {
      return "Index(" + shape(bin->lhs) + ", " + shape(bin->rhs) + ")";
    }
    return "(" + shape(bin->lhs) + " " + std::string(to_string(bin->op)) + " " +
           shape(bin->rhs) + ")";
  }
  return "<non-expr>";
}

}  // namespace gdparse::test_support
