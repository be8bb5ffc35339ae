// gdparse/syntax/ParseExpr.cpp - Expression grammar (precedence levels, chains, literals)
#include <fmt/core.h>

#include <vector>

#include "gdparse/basic/casting.hpp"
#include "gdparse/syntax/keywords.hpp"
#include "gdparse/syntax/parser.hpp"
#include "gdparse/syntax/scanner.hpp"

namespace gdparse::syntax
{
namespace
{

/// Single-character operator that must not be followed by any of `reject`
[[nodiscard]] bool scan_symbol(Cursor & c, char op, std::string_view reject = "=") noexcept
{
  if (c.peek() != op || reject.find(c.peek(1)) != std::string_view::npos) {
    return false;
  }
  c.advance(1);
  return true;
}

/// Two-character operator that must not be followed by `=`
[[nodiscard]] bool scan_pair(Cursor & c, std::string_view op) noexcept
{
  if (!c.starts_with(op) || c.peek(op.size()) == '=') {
    return false;
  }
  c.advance(op.size());
  return true;
}

[[nodiscard]] bool is_chain_head(const Expr * e) noexcept
{
  return isa<IdentExpr>(e) || isa<CallExpr>(e) || isa<StringLiteralExpr>(e) ||
         isa<NodePathExpr>(e) || isa<ArrayLiteralExpr>(e) || isa<ObjectLiteralExpr>(e);
}

}  // namespace

// ============================================================================
// Precedence levels
// ============================================================================

Expr * Parser::parse_expr(Cursor & c)
{
  ContextScope scope(*this, "expr", c);
  DepthGuard guard(*this, c);
  if (!guard.ok()) {
    return nullptr;
  }
  return parse_binary(c, Precedence::Logical);
}

Expr * Parser::parse_operand(Cursor & c, Precedence level)
{
  switch (level) {
    case Precedence::Logical:
      return parse_binary(c, Precedence::Additive);
    case Precedence::Additive:
      return parse_binary(c, Precedence::Multiplicative);
    case Precedence::Multiplicative:
      return parse_unary(c);
  }
  return nullptr;
}

std::optional<BinaryOp> Parser::scan_binary_op(Cursor & c, Precedence level)
{
  switch (level) {
    case Precedence::Logical:
      // Logical and relational operators share the loosest level
      if (scan_pair(c, "||") || scan_keyword(c, "or")) return BinaryOp::Or;
      if (scan_pair(c, "&&") || scan_keyword(c, "and")) return BinaryOp::And;
      if (c.consume("==")) return BinaryOp::Eq;
      if (c.consume("!=")) return BinaryOp::Ne;
      if (c.consume("<=")) return BinaryOp::Le;
      if (c.consume(">=")) return BinaryOp::Ge;
      if (scan_symbol(c, '<', "<=")) return BinaryOp::Lt;
      if (scan_symbol(c, '>', ">=")) return BinaryOp::Gt;
      if (scan_keyword(c, "is")) return BinaryOp::Is;
      if (scan_keyword(c, "in")) return BinaryOp::In;
      if (scan_keyword(c, "as")) return BinaryOp::As;
      break;
    case Precedence::Additive:
      if (scan_symbol(c, '+')) return BinaryOp::Add;
      if (scan_symbol(c, '-', "=>")) return BinaryOp::Sub;
      break;
    case Precedence::Multiplicative:
      if (scan_symbol(c, '*')) return BinaryOp::Mul;
      if (scan_symbol(c, '/')) return BinaryOp::Div;
      if (scan_symbol(c, '%')) return BinaryOp::Mod;
      if (scan_symbol(c, '^')) return BinaryOp::BitXor;
      if (scan_symbol(c, '&', "&=")) return BinaryOp::BitAnd;
      if (scan_symbol(c, '|', "|=")) return BinaryOp::BitOr;
      break;
  }
  return std::nullopt;
}

Expr * Parser::parse_binary(Cursor & c, Precedence level)
{
  Cursor p = c;
  Expr * lhs = parse_operand(p, level);
  if (lhs == nullptr) {
    return nullptr;
  }
  c = p;

  // Left-associative: each operator folds onto what was parsed so far
  FoldDepth folds(*this);
  while (true) {
    Cursor q = c;
    skip_gap(q);
    const std::optional<BinaryOp> op = scan_binary_op(q, level);
    if (!op) break;
    skip_trivia(q);
    if (!folds.deepen(q)) {
      return nullptr;
    }

    Expr * rhs = parse_operand(q, level);
    if (rhs == nullptr) break;

    const SourceRange range = join_ranges(lhs->get_range(), rhs->get_range());
    lhs = ast_.create<BinaryExpr>(lhs, *op, rhs, range);
    c = q;
  }
  return lhs;
}

Expr * Parser::parse_unary(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  std::optional<UnaryOp> op;
  if (scan_symbol(p, '-')) {
    op = UnaryOp::Neg;
  } else if (scan_symbol(p, '+')) {
    op = UnaryOp::Plus;
  } else if (scan_symbol(p, '!') || scan_keyword(p, "not")) {
    op = UnaryOp::Not;
  }
  if (!op) {
    return parse_postfix(c);
  }

  skip_gap(p);
  Expr * operand = parse_postfix(p);
  if (operand == nullptr) {
    return nullptr;
  }
  c = p;
  return ast_.create<UnaryExpr>(*op, operand, range_from(start, c));
}

Expr * Parser::parse_postfix(Cursor & c)
{
  Cursor p = c;
  Expr * atom = parse_atom(p);
  if (atom == nullptr) {
    return nullptr;
  }
  c = p;
  return parse_index_suffixes(c, atom);
}

// ============================================================================
// Atoms and attribute chains
// ============================================================================

Expr * Parser::parse_atom(Cursor & c)
{
  Cursor p = c;
  Expr * head = nullptr;
  bool chainable = false;

  if (p.peek() == '(') {
    head = parse_paren_expr(p);
    chainable = head != nullptr;
  } else {
    head = parse_value(p);
    chainable = head != nullptr && is_chain_head(head);
  }
  if (head == nullptr) {
    return nullptr;
  }

  if (chainable) {
    head = parse_attribute_chain(p, head);
  }
  c = p;
  return head;
}

Expr * Parser::parse_paren_expr(Cursor & c)
{
  ContextScope scope(*this, "paren_expr", c);
  BracketScope brackets(*this);
  Cursor p = c;
  if (!expect_char(p, '(')) {
    return nullptr;
  }
  skip_trivia(p);
  Expr * inner = parse_expr(p);
  if (inner == nullptr) {
    return nullptr;
  }
  skip_trivia(p);
  if (!expect_char(p, ')')) {
    return nullptr;
  }
  c = p;
  return inner;
}

Expr * Parser::parse_attribute_chain(Cursor & c, Expr * head)
{
  std::vector<Expr *> segments;
  segments.push_back(parse_index_suffixes(c, head));
  if (fatal_) {
    return nullptr;
  }

  FoldDepth folds(*this);
  while (true) {
    Cursor p = c;
    skip_gap(p);
    if (!p.consume('.')) break;
    skip_gap(p);
    if (!folds.deepen(p)) {
      return nullptr;
    }

    // Member names may be reserved words: `x.class`, `node.get_name()`
    Expr * member = nullptr;
    if (CallExpr * call = parse_call(p, true)) {
      member = call;
    } else if (fatal_) {
      return nullptr;
    } else {
      const Cursor name_start = p;
      if (const auto name = scan_identifier(p)) {
        member = ast_.create<IdentExpr>(*name, range_from(name_start, p));
      } else {
        fail(p, "attribute name");
        break;
      }
    }
    segments.push_back(parse_index_suffixes(p, member));
    if (fatal_) {
      return nullptr;
    }
    c = p;
  }

  // a.b.c nests to the right: Attr(a, Attr(b, c))
  Expr * result = segments.back();
  for (size_t i = segments.size() - 1; i > 0; --i) {
    Expr * lhs = segments[i - 1];
    result = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Attr, result, join_ranges(lhs->get_range(), result->get_range()));
  }
  return result;
}

Expr * Parser::parse_index_suffixes(Cursor & c, Expr * base)
{
  FoldDepth folds(*this);
  while (true) {
    Cursor p = c;
    skip_gap(p);
    if (!p.consume('[')) break;
    if (!folds.deepen(p)) break;

    BracketScope brackets(*this);
    skip_trivia(p);
    Expr * index = parse_expr(p);
    if (index == nullptr) break;
    skip_trivia(p);
    if (!expect_char(p, ']')) break;

    const SourceRange range(base->get_range().get_begin(), SourceLocation(fileId_, p.offset()));
    base = ast_.create<BinaryExpr>(base, BinaryOp::Index, index, range);
    c = p;
  }
  return base;
}

// ============================================================================
// Values
// ============================================================================

Expr * Parser::parse_value(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  if (scan_keyword(p, "null")) {
    c = p;
    return ast_.create<NullLiteralExpr>(range_from(start, c));
  }
  if (scan_keyword(p, "true") || scan_keyword(p, "True")) {
    c = p;
    return ast_.create<BoolLiteralExpr>(true, range_from(start, c));
  }
  if (scan_keyword(p, "false") || scan_keyword(p, "False")) {
    c = p;
    return ast_.create<BoolLiteralExpr>(false, range_from(start, c));
  }

  switch (p.peek()) {
    case '[':
      return parse_array(c);
    case '{':
      return parse_object(c);
    case '$':
      if (const auto path = scan_node_path(p)) {
        c = p;
        return ast_.create<NodePathExpr>(*path, range_from(start, c));
      }
      fail(c, "node path");
      return nullptr;
    default:
      break;
  }

  if (CallExpr * call = parse_call(p, false)) {
    c = p;
    return call;
  }
  if (fatal_) {
    return nullptr;
  }

  Cursor word = c;
  if (const auto name = scan_identifier(word)) {
    if (!is_reserved_word(*name)) {
      c = word;
      return ast_.create<IdentExpr>(*name, range_from(start, c));
    }
    fail(c, "expression");
    return nullptr;
  }

  if (const auto str = scan_string(p)) {
    c = p;
    return ast_.create<StringLiteralExpr>(str->body, str->quote, range_from(start, c));
  }
  if (p.peek() == '"' || p.peek() == '\'') {
    fail_message(c, "unterminated string literal or invalid escape sequence");
    return nullptr;
  }

  if (is_digit(p.peek())) {
    return parse_number(c);
  }

  fail(c, "expression");
  return nullptr;
}

Expr * Parser::parse_number(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  if (const auto spelling = scan_float(p)) {
    const auto value = float_value(*spelling);
    if (!value) {
      fail_message(start, fmt::format("float literal '{}' is out of range", *spelling));
      return nullptr;
    }
    c = p;
    return ast_.create<FloatLiteralExpr>(*value, *spelling, range_from(start, c));
  }

  if (const auto spelling = scan_int(p)) {
    const auto value = int_value(*spelling);
    if (!value) {
      fail_message(start, fmt::format("integer literal '{}' is out of range", *spelling));
      return nullptr;
    }
    c = p;
    return ast_.create<IntLiteralExpr>(*value, *spelling, range_from(start, c));
  }

  fail(c, "number");
  return nullptr;
}

ArrayLiteralExpr * Parser::parse_array(Cursor & c)
{
  ContextScope scope(*this, "array", c);
  DepthGuard guard(*this, c);
  if (!guard.ok()) {
    return nullptr;
  }

  const Cursor start = c;
  Cursor p = c;
  if (!expect_char(p, '[')) {
    return nullptr;
  }

  std::vector<Expr *> elements;
  const bool closed = parse_comma_list(p, ']', [&](Cursor & item) {
    Expr * e = parse_expr(item);
    if (e == nullptr) return false;
    elements.push_back(e);
    return true;
  });
  if (!closed) {
    return nullptr;
  }

  c = p;
  return ast_.create<ArrayLiteralExpr>(ast_.copy_to_arena(elements), range_from(start, c));
}

ObjectLiteralExpr * Parser::parse_object(Cursor & c)
{
  ContextScope scope(*this, "object", c);
  DepthGuard guard(*this, c);
  if (!guard.ok()) {
    return nullptr;
  }

  const Cursor start = c;
  Cursor p = c;
  if (!expect_char(p, '{')) {
    return nullptr;
  }

  std::vector<ObjectPair *> pairs;
  const bool closed = parse_comma_list(p, '}', [&](Cursor & item) {
    ObjectPair * pair = parse_pair(item);
    if (pair == nullptr) return false;
    pairs.push_back(pair);
    return true;
  });
  if (!closed) {
    return nullptr;
  }

  c = p;
  return ast_.create<ObjectLiteralExpr>(ast_.copy_to_arena(pairs), range_from(start, c));
}

ObjectPair * Parser::parse_pair(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  Expr * key = parse_expr(p);
  if (key == nullptr) {
    return nullptr;
  }
  skip_trivia(p);
  if (!expect_char(p, ':')) {
    return nullptr;
  }
  skip_trivia(p);
  Expr * value = parse_expr(p);
  if (value == nullptr) {
    return nullptr;
  }

  c = p;
  return ast_.create<ObjectPair>(key, value, range_from(start, c));
}

CallExpr * Parser::parse_call(Cursor & c, bool allow_reserved)
{
  const Cursor start = c;
  Cursor p = c;

  const auto callee = scan_identifier(p);
  if (!callee || p.peek() != '(' || (!allow_reserved && is_reserved_word(*callee))) {
    return nullptr;
  }

  ContextScope scope(*this, "call", start);
  p.advance(1);

  std::vector<Expr *> args;
  const bool closed = parse_comma_list(p, ')', [&](Cursor & item) {
    Expr * e = parse_expr(item);
    if (e == nullptr) return false;
    args.push_back(e);
    return true;
  });
  if (!closed) {
    return nullptr;
  }

  c = p;
  return ast_.create<CallExpr>(*callee, ast_.copy_to_arena(args), range_from(start, c));
}

TypeRef * Parser::parse_type_ref(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;
  const auto name = scan_dotted_identifier(p);
  if (!name) {
    fail(c, "type name");
    return nullptr;
  }
  c = p;
  return ast_.create<TypeRef>(*name, range_from(start, c));
}

}  // namespace gdparse::syntax
