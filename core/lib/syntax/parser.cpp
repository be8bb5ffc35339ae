#include "gdparse/syntax/parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <string>
#include <utility>

#include "gdparse/basic/casting.hpp"
#include "gdparse/syntax/keywords.hpp"
#include "gdparse/syntax/scanner.hpp"

namespace gdparse::syntax
{
namespace
{

/// Upper bound on merged expectations in one failure
constexpr size_t k_max_expected = 8;

[[nodiscard]] bool ends_with_block(const AstNode * node) noexcept
{
  return isa<IfStmt>(node) || isa<WhileStmt>(node) || isa<ForStmt>(node) ||
         isa<MatchStmt>(node) || isa<FunctionDecl>(node) || isa<ClassDecl>(node);
}

}  // namespace

Parser::Parser(AstContext & ast, FileId file_id, std::string_view source, ParseOptions options)
: ast_(ast), fileId_(file_id), options_(options), cursor_(source)
{
}

// ============================================================================
// Entry points
// ============================================================================

template <typename T>
T * Parser::finish_entry(T * node, const Cursor & c)
{
  if (node == nullptr || fatal_) {
    return nullptr;
  }
  cursor_ = c;
  failure_.reset();
  return node;
}

ScriptFile * Parser::parse_file()
{
  failure_.reset();
  indentFailureAt_.reset();
  fatal_ = false;
  Cursor c = cursor_;
  return finish_entry(parse_file(c), c);
}

Expr * Parser::parse_expr()
{
  failure_.reset();
  indentFailureAt_.reset();
  fatal_ = false;
  Cursor c = cursor_;
  return finish_entry(parse_expr(c), c);
}

Stmt * Parser::parse_stmt()
{
  failure_.reset();
  indentFailureAt_.reset();
  fatal_ = false;
  Cursor c = cursor_;
  Stmt * stmt = parse_stmt(c, 0);
  if (stmt == nullptr && !failure_) {
    fail(c, "statement");
  }
  return finish_entry(stmt, c);
}

Decl * Parser::parse_decl()
{
  failure_.reset();
  indentFailureAt_.reset();
  fatal_ = false;
  Cursor c = cursor_;
  Decl * decl = parse_decl(c, 0);
  if (decl == nullptr && !failure_) {
    fail(c, "declaration");
  }
  return finish_entry(decl, c);
}

// ============================================================================
// Failure tracking
// ============================================================================

Parser::ContextScope::ContextScope(Parser & p, std::string_view label, const Cursor & at)
: parser_(p)
{
  parser_.context_.push_back(ContextFrame{label, at.offset(), at.line(), at.column()});
}

Parser::ContextScope::~ContextScope() { parser_.context_.pop_back(); }

Parser::DepthGuard::DepthGuard(Parser & p, const Cursor & at) : parser_(p), ok_(true)
{
  ++parser_.depth_;
  if (parser_.fatal_) {
    ok_ = false;
  } else if (parser_.depth_ > parser_.options_.max_nesting_depth) {
    parser_.fail_nesting(at);
    ok_ = false;
  }
}

Parser::DepthGuard::~DepthGuard() { --parser_.depth_; }

bool Parser::FoldDepth::deepen(const Cursor & at)
{
  ++folds_;
  ++parser_.depth_;
  if (parser_.fatal_) {
    return false;
  }
  if (parser_.depth_ > parser_.options_.max_nesting_depth) {
    parser_.fail_nesting(at);
    return false;
  }
  return true;
}

ParseFailure & Parser::failure_at(const Cursor & at, bool & is_new)
{
  is_new = !failure_ || at.offset() > failure_->offset;
  if (is_new) {
    ParseFailure f;
    f.offset = at.offset();
    f.line = at.line();
    f.column = at.column();
    f.found = describe(at);
    f.context = context_;
    failure_ = std::move(f);
  }
  return *failure_;
}

void Parser::fail(const Cursor & at, std::string_view expected)
{
  if (fatal_ || (failure_ && at.offset() < failure_->offset)) {
    return;
  }
  bool is_new = false;
  ParseFailure & f = failure_at(at, is_new);
  const auto dup = std::find(f.expected.begin(), f.expected.end(), expected);
  if (dup == f.expected.end() && f.expected.size() < k_max_expected) {
    f.expected.emplace_back(expected);
  }
}

void Parser::fail_message(const Cursor & at, std::string message)
{
  if (fatal_ || (failure_ && at.offset() < failure_->offset)) {
    return;
  }
  bool is_new = false;
  ParseFailure & f = failure_at(at, is_new);
  if (f.message.empty()) {
    f.message = std::move(message);
  }
}

void Parser::fail_indentation(const Cursor & at, uint32_t expected, uint32_t found)
{
  if (fatal_ || (failure_ && at.offset() < failure_->offset)) {
    return;
  }
  bool is_new = false;
  ParseFailure & f = failure_at(at, is_new);
  if (f.message.empty()) {
    f.message = fmt::format("expected indentation of {} spaces, found {}", expected, found);
    indentFailureAt_ = at.offset();
    indentFailureOwned_ = is_new;
  }
}

void Parser::accept_indentation(const Cursor & at)
{
  if (!indentFailureAt_ || *indentFailureAt_ != at.offset()) {
    return;
  }
  indentFailureAt_.reset();
  if (fatal_ || !failure_ || failure_->offset != at.offset()) {
    return;
  }
  // Expectations collected after the dedent belong to the closed block too
  if (indentFailureOwned_) {
    failure_.reset();
  } else {
    failure_->message.clear();
  }
}

void Parser::fail_nesting(const Cursor & at)
{
  ParseFailure f;
  f.kind = FailureKind::NestingLimit;
  f.offset = at.offset();
  f.line = at.line();
  f.column = at.column();
  f.message = fmt::format("nesting depth exceeds the limit of {}", options_.max_nesting_depth);
  f.context = context_;
  failure_ = std::move(f);
  fatal_ = true;
}

std::string Parser::describe(const Cursor & at) const
{
  if (at.at_end()) {
    return "end of input";
  }
  if (at_line_end(at)) {
    return "newline";
  }
  if (at.peek() == '\t') {
    return "tab";
  }
  if (is_ident_start(at.peek())) {
    Cursor probe = at;
    const auto word = scan_identifier(probe);
    return fmt::format("'{}'", word.value_or(""));
  }
  return fmt::format("'{}'", at.peek());
}

void Parser::note_tabs(const Cursor & line_start)
{
  if (has_tab_in_indentation(line_start)) {
    tabLines_.insert(line_start.offset());
  }
}

// ============================================================================
// Shared helpers
// ============================================================================

void Parser::skip_gap(Cursor & c) const
{
  if (bracketDepth_ > 0) {
    skip_trivia(c);
  } else {
    skip_spaces(c);
  }
}

bool Parser::expect_char(Cursor & c, char ch)
{
  if (c.consume(ch)) {
    return true;
  }
  fail(c, fmt::format("'{}'", ch));
  return false;
}

bool Parser::expect_space(Cursor & c)
{
  if (!is_inline_space(c.peek())) {
    fail(c, "whitespace");
    return false;
  }
  skip_spaces(c);
  return true;
}

std::optional<std::string_view> Parser::expect_identifier(Cursor & c)
{
  Cursor probe = c;
  const auto name = scan_identifier(probe);
  if (!name || is_reserved_word(*name)) {
    fail(c, "identifier");
    return std::nullopt;
  }
  c = probe;
  return name;
}

bool Parser::parse_comma_list(
  Cursor & c, char close, const std::function<bool(Cursor &)> & item)
{
  BracketScope brackets(*this);
  Cursor p = c;
  skip_trivia(p);
  if (p.consume(close)) {
    c = p;
    return true;
  }

  while (true) {
    if (!item(p)) {
      return false;
    }
    skip_trivia(p);
    if (p.consume(',')) {
      skip_trivia(p);
      if (p.consume(close)) break;
      continue;
    }
    if (p.consume(close)) break;

    fail(p, "','");
    fail(p, fmt::format("'{}'", close));
    return false;
  }
  c = p;
  return true;
}

// ============================================================================
// File, blocks and lines
// ============================================================================

ScriptFile * Parser::parse_file(Cursor & c)
{
  ContextScope scope(*this, "file", c);
  const Cursor start = c;
  Cursor p = c;

  Block * body = parse_block(p, 0);
  if (fatal_) {
    return nullptr;
  }

  skip_trivia(p);
  if (!p.at_end()) {
    fail(p, "end of input");
    return nullptr;
  }
  c = p;
  return ast_.create<ScriptFile>(body, range_from(start, c));
}

void Parser::skip_ignorable_lines(Cursor & c, uint32_t indent) const
{
  while (!c.at_end()) {
    if (skip_blank_line(c)) continue;

    Cursor p = c;
    skip_spaces(p);
    if (p.at_end()) {
      c = p;
      break;
    }
    // Comment lines at the block's own indentation are kept as Comment nodes
    if (p.peek() == '#' && scan_indentation(c) != indent) {
      (void)scan_comment(p);
      (void)skip_line_ending(p);
      c = p;
      continue;
    }
    break;
  }
}

Block * Parser::parse_block(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "block", c);
  std::vector<AstNode *> lines;
  Cursor end = c;
  Cursor first_line = c;

  while (true) {
    Cursor p = end;
    skip_ignorable_lines(p, indent);
    if (p.at_end()) break;

    note_tabs(p);
    const uint32_t measured = scan_indentation(p);
    if (measured != indent) {
      Cursor at = p;
      at.advance(measured);
      fail_indentation(at, indent, measured);
      break;
    }
    if (lines.empty()) first_line = p;

    p.advance(indent);
    accept_indentation(p);
    if (!parse_line(p, indent, lines)) break;
    end = p;
  }

  // Trailing blank lines and comments up to the end of input belong here
  Cursor tail = end;
  skip_trivia(tail);
  if (tail.at_end()) {
    end = tail;
  }

  c = end;
  const Cursor range_start = lines.empty() ? end : first_line;
  return ast_.create<Block>(ast_.copy_to_arena(lines), indent, range_from(range_start, end));
}

Block * Parser::parse_indented_block(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "indented_block", c);
  DepthGuard guard(*this, c);
  if (!guard.ok()) {
    return nullptr;
  }

  Cursor p = c;
  skip_spaces(p);
  (void)scan_comment(p);
  if (!skip_line_ending(p)) {
    fail(p, "newline");
    return nullptr;
  }

  // The first line holding code decides the block's indentation
  Cursor first = p;
  while (!first.at_end()) {
    if (skip_blank_line(first)) continue;
    Cursor probe = first;
    if (scan_comment(probe) && skip_line_ending(probe)) {
      first = probe;
      continue;
    }
    break;
  }
  note_tabs(first);
  const uint32_t measured = scan_indentation(first);
  Cursor at = first;
  at.advance(measured);
  if (measured <= indent || at_line_end(at) || at.peek() == '#') {
    fail_message(at, "expected an indented block");
    return nullptr;
  }

  Block * body = parse_block(p, measured);
  if (body->lines.empty()) {
    return nullptr;
  }
  c = p;
  return body;
}

bool Parser::parse_line(Cursor & c, uint32_t indent, std::vector<AstNode *> & lines)
{
  ContextScope scope(*this, "line", c);
  std::vector<AstNode *> items;
  Cursor p = c;

  while (true) {
    AstNode * item = parse_line_item(p, indent);
    if (item == nullptr) {
      return false;
    }
    items.push_back(item);
    if (ends_with_block(item)) {
      lines.insert(lines.end(), items.begin(), items.end());
      c = p;
      return true;
    }
    if (isa<Comment>(item)) break;

    skip_spaces(p);
    if (!p.consume(';')) break;
    skip_spaces(p);
    if (at_line_end(p) || p.peek() == '#') break;
  }

  // A trailing comment after code is not kept
  (void)scan_comment(p);
  if (!at_line_end(p)) {
    fail(p, "end of line");
    return false;
  }
  (void)skip_line_ending(p);

  lines.insert(lines.end(), items.begin(), items.end());
  c = p;
  return true;
}

AstNode * Parser::parse_line_item(Cursor & c, uint32_t indent)
{
  if (Decl * decl = parse_decl(c, indent)) {
    return decl;
  }
  if (fatal_) return nullptr;
  if (Stmt * stmt = parse_stmt(c, indent)) {
    return stmt;
  }
  if (fatal_) return nullptr;
  if (Expr * expr = parse_expr(c)) {
    return expr;
  }
  if (fatal_) return nullptr;

  const Cursor start = c;
  Cursor p = c;
  if (const auto text = scan_comment(p)) {
    c = p;
    return ast_.create<Comment>(*text, range_from(start, c));
  }
  return nullptr;
}

}  // namespace gdparse::syntax
