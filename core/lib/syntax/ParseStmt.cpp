// gdparse/syntax/ParseStmt.cpp - Statement grammar (control flow, assignment, return)
#include <cstdint>
#include <vector>

#include "gdparse/basic/casting.hpp"
#include "gdparse/syntax/parser.hpp"
#include "gdparse/syntax/scanner.hpp"

namespace gdparse::syntax
{
namespace
{

[[nodiscard]] std::optional<AssignOp> scan_assign_op(Cursor & c) noexcept
{
  if (c.consume("+=")) return AssignOp::AddAssign;
  if (c.consume("-=")) return AssignOp::SubAssign;
  if (c.consume("*=")) return AssignOp::MulAssign;
  if (c.consume("/=")) return AssignOp::DivAssign;
  if (c.consume("%=")) return AssignOp::ModAssign;
  if (c.peek() == '=' && c.peek(1) != '=') {
    c.advance(1);
    return AssignOp::Assign;
  }
  return std::nullopt;
}

/// Identifiers, attribute chains and index expressions can be assigned to.
[[nodiscard]] bool is_assignable(const Expr * target) noexcept
{
  if (isa<IdentExpr>(target)) {
    return true;
  }
  const auto * bin = dyn_cast<BinaryExpr>(target);
  return bin != nullptr && (bin->op == BinaryOp::Attr || bin->op == BinaryOp::Index);
}

}  // namespace

Stmt * Parser::parse_stmt(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "stmt", c);

  if (at_keyword(c, "if")) return parse_if_stmt(c, indent);
  if (at_keyword(c, "while")) return parse_while_stmt(c, indent);
  if (at_keyword(c, "for")) return parse_for_stmt(c, indent);
  if (at_keyword(c, "match")) return parse_match_stmt(c, indent);
  if (at_keyword(c, "return")) return parse_return_stmt(c);
  if (at_keyword(c, "pass")) return parse_pass_stmt(c);

  if (AssignStmt * assign = parse_assign_stmt(c)) {
    return assign;
  }
  return nullptr;
}

// ============================================================================
// Conditions and control flow
// ============================================================================

Condition * Parser::parse_condition(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "condition", c);
  const Cursor start = c;
  Cursor p = c;

  skip_spaces(p);
  Expr * expr = parse_expr(p);
  if (expr == nullptr) {
    return nullptr;
  }
  skip_spaces(p);
  if (!expect_char(p, ':')) {
    return nullptr;
  }
  Block * body = parse_indented_block(p, indent);
  if (body == nullptr) {
    return nullptr;
  }

  c = p;
  return ast_.create<Condition>(expr, body, range_from(start, c));
}

bool Parser::next_clause(Cursor & c, uint32_t indent, std::string_view keyword) const
{
  Cursor p = c;
  while (!p.at_end()) {
    if (skip_blank_line(p)) continue;
    Cursor probe = p;
    if (scan_comment(probe) && skip_line_ending(probe)) {
      p = probe;
      continue;
    }
    break;
  }
  if (!same_indent(p, indent) || !at_keyword(p, keyword)) {
    return false;
  }
  c = p;
  return true;
}

IfStmt * Parser::parse_if_stmt(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "if_stmt", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "if")) {
    return nullptr;
  }
  Condition * if_branch = parse_condition(p, indent);
  if (if_branch == nullptr) {
    return nullptr;
  }

  std::vector<Condition *> elifs;
  Cursor q = p;
  while (next_clause(q, indent, "elif")) {
    (void)scan_keyword(q, "elif");
    Condition * branch = parse_condition(q, indent);
    if (branch == nullptr) {
      return nullptr;
    }
    elifs.push_back(branch);
    p = q;
  }

  Block * else_block = nullptr;
  q = p;
  if (next_clause(q, indent, "else")) {
    (void)scan_keyword(q, "else");
    skip_spaces(q);
    if (!expect_char(q, ':')) {
      return nullptr;
    }
    else_block = parse_indented_block(q, indent);
    if (else_block == nullptr) {
      return nullptr;
    }
    p = q;
  }

  c = p;
  return ast_.create<IfStmt>(
    if_branch, ast_.copy_to_arena(elifs), else_block, range_from(start, c));
}

WhileStmt * Parser::parse_while_stmt(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "while_stmt", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "while")) {
    return nullptr;
  }
  Condition * cond = parse_condition(p, indent);
  if (cond == nullptr) {
    return nullptr;
  }
  c = p;
  return ast_.create<WhileStmt>(cond, range_from(start, c));
}

ForStmt * Parser::parse_for_stmt(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "for_stmt", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "for") || !expect_space(p)) {
    return nullptr;
  }
  Condition * cond = parse_condition(p, indent);
  if (cond == nullptr) {
    return nullptr;
  }
  c = p;
  return ast_.create<ForStmt>(cond, range_from(start, c));
}

MatchStmt * Parser::parse_match_stmt(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "match_stmt", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "match") || !expect_space(p)) {
    return nullptr;
  }
  Expr * subject = parse_expr(p);
  if (subject == nullptr) {
    return nullptr;
  }
  skip_spaces(p);
  if (!expect_char(p, ':')) {
    return nullptr;
  }
  skip_spaces(p);
  (void)scan_comment(p);
  if (!skip_line_ending(p)) {
    fail(p, "newline");
    return nullptr;
  }

  // Cases share the indentation of the first one
  Cursor first = p;
  skip_ignorable_lines(first, UINT32_MAX);
  const auto case_indent = more_indent(first, indent);
  if (!case_indent || at_line_end(first)) {
    Cursor at = first;
    at.advance(scan_indentation(first));
    fail_message(at, "expected an indented block");
    return nullptr;
  }

  std::vector<Condition *> cases;
  while (true) {
    Cursor q = p;
    skip_ignorable_lines(q, UINT32_MAX);
    if (q.at_end()) break;
    note_tabs(q);
    if (!same_indent(q, *case_indent)) break;

    Condition * arm = parse_condition(q, *case_indent);
    if (arm == nullptr) {
      return nullptr;
    }
    cases.push_back(arm);
    p = q;
  }

  c = p;
  return ast_.create<MatchStmt>(subject, ast_.copy_to_arena(cases), range_from(start, c));
}

// ============================================================================
// Simple statements
// ============================================================================

ReturnStmt * Parser::parse_return_stmt(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "return")) {
    return nullptr;
  }

  Cursor probe = p;
  skip_spaces(probe);
  if (at_line_end(probe) || probe.peek() == ';' || probe.peek() == '#') {
    c = p;
    return ast_.create<ReturnStmt>(nullptr, range_from(start, c));
  }

  ContextScope scope(*this, "return_stmt", start);
  Expr * value = parse_expr(probe);
  if (value == nullptr) {
    return nullptr;
  }
  c = probe;
  return ast_.create<ReturnStmt>(value, range_from(start, c));
}

AssignStmt * Parser::parse_assign_stmt(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  Expr * target = parse_expr(p);
  if (target == nullptr) {
    return nullptr;
  }
  skip_spaces(p);
  const Cursor op_start = p;
  const std::optional<AssignOp> op = scan_assign_op(p);
  if (!op) {
    return nullptr;
  }
  if (!is_assignable(target)) {
    fail_message(op_start, "invalid assignment target");
    return nullptr;
  }

  ContextScope scope(*this, "assign_stmt", start);
  skip_spaces(p);
  Expr * value = parse_expr(p);
  if (value == nullptr) {
    return nullptr;
  }

  c = p;
  return ast_.create<AssignStmt>(target, *op, value, range_from(start, c));
}

PassStmt * Parser::parse_pass_stmt(Cursor & c)
{
  const Cursor start = c;
  if (!scan_keyword(c, "pass")) {
    return nullptr;
  }
  return ast_.create<PassStmt>(range_from(start, c));
}

}  // namespace gdparse::syntax
