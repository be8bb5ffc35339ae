// gdparse/syntax/ParseDecl.cpp - Declaration grammar (header, members, functions, classes)
#include <array>
#include <utility>
#include <vector>

#include "gdparse/syntax/keywords.hpp"
#include "gdparse/syntax/parser.hpp"
#include "gdparse/syntax/scanner.hpp"

namespace gdparse::syntax
{
namespace
{

constexpr std::array<std::pair<std::string_view, FunctionModifier>, 7> k_modifier_table = {{
  {"static", FunctionModifier::Static},
  {"remotesync", FunctionModifier::RemoteSync},
  {"mastersync", FunctionModifier::MasterSync},
  {"puppetsync", FunctionModifier::PuppetSync},
  {"remote", FunctionModifier::Remote},
  {"master", FunctionModifier::Master},
  {"puppet", FunctionModifier::Puppet},
}};

static_assert(k_modifier_table.size() == k_function_modifiers.size());

/// Modifier keyword followed by `func`; the cursor is left on `func`.
[[nodiscard]] std::optional<FunctionModifier> scan_function_modifier(Cursor & c) noexcept
{
  for (const auto & [word, modifier] : k_modifier_table) {
    Cursor p = c;
    if (!scan_keyword(p, word) || !is_inline_space(p.peek())) continue;
    skip_spaces(p);
    if (!at_keyword(p, "func")) continue;
    c = p;
    return modifier;
  }
  return std::nullopt;
}

[[nodiscard]] std::optional<VarModifier> scan_var_modifier(Cursor & c) noexcept
{
  Cursor p = c;
  VarModifier modifier = VarModifier::None;
  if (scan_keyword(p, "onready")) {
    modifier = VarModifier::Onready;
  } else if (scan_keyword(p, "export")) {
    modifier = VarModifier::Export;
  } else {
    return std::nullopt;
  }
  skip_spaces(p);
  if (!at_keyword(p, "var")) {
    return std::nullopt;
  }
  c = p;
  return modifier;
}

}  // namespace

Decl * Parser::parse_decl(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "decl", c);

  if (at_keyword(c, "class_name")) return parse_class_name_decl(c);
  if (at_keyword(c, "extends")) return parse_extends_decl(c);
  if (at_keyword(c, "signal")) return parse_signal_decl(c);
  if (at_keyword(c, "enum")) return parse_enum_decl(c);
  if (at_keyword(c, "class")) return parse_class_decl(c, indent);
  if (at_keyword(c, "func")) return parse_function_decl(c, indent);
  {
    Cursor probe = c;
    if (scan_function_modifier(probe)) return parse_function_decl(c, indent);
  }
  if (at_keyword(c, "const")) return parse_const_decl(c);
  if (at_keyword(c, "var") || at_keyword(c, "onready") || at_keyword(c, "export")) {
    return parse_var_decl(c);
  }
  return nullptr;
}

// ============================================================================
// Script header
// ============================================================================

ClassNameDecl * Parser::parse_class_name_decl(Cursor & c)
{
  ContextScope scope(*this, "class_name_decl", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "class_name") || !expect_space(p)) {
    return nullptr;
  }
  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }
  c = p;
  return ast_.create<ClassNameDecl>(*name, range_from(start, c));
}

ExtendsDecl * Parser::parse_extends_decl(Cursor & c)
{
  ContextScope scope(*this, "extends_decl", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "extends") || !expect_space(p)) {
    return nullptr;
  }
  if (const auto path = scan_string(p)) {
    c = p;
    return ast_.create<ExtendsDecl>(path->body, true, range_from(start, c));
  }
  if (const auto name = scan_dotted_identifier(p)) {
    c = p;
    return ast_.create<ExtendsDecl>(*name, false, range_from(start, c));
  }
  fail(p, "class name or script path");
  return nullptr;
}

// ============================================================================
// Signals and enums
// ============================================================================

SignalDecl * Parser::parse_signal_decl(Cursor & c)
{
  ContextScope scope(*this, "signal_decl", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "signal") || !expect_space(p)) {
    return nullptr;
  }
  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }

  std::vector<std::string_view> params;
  Cursor q = p;
  skip_spaces(q);
  if (q.consume('(')) {
    const bool closed = parse_comma_list(q, ')', [&](Cursor & item) {
      const auto param = expect_identifier(item);
      if (!param) return false;
      params.push_back(*param);
      return true;
    });
    if (!closed) {
      return nullptr;
    }
    p = q;
  }

  c = p;
  return ast_.create<SignalDecl>(*name, ast_.copy_to_arena(params), range_from(start, c));
}

EnumDecl * Parser::parse_enum_decl(Cursor & c)
{
  ContextScope scope(*this, "enum_decl", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "enum")) {
    return nullptr;
  }
  skip_spaces(p);

  // Anonymous enums put their variants in the enclosing scope
  std::string_view name;
  if (p.peek() != '{') {
    const auto ident = expect_identifier(p);
    if (!ident) {
      return nullptr;
    }
    name = *ident;
    skip_spaces(p);
  }
  if (!expect_char(p, '{')) {
    return nullptr;
  }

  std::vector<EnumVariant *> variants;
  const bool closed = parse_comma_list(p, '}', [&](Cursor & item) {
    EnumVariant * variant = parse_enum_variant(item);
    if (variant == nullptr) return false;
    variants.push_back(variant);
    return true;
  });
  if (!closed) {
    return nullptr;
  }

  c = p;
  return ast_.create<EnumDecl>(name, ast_.copy_to_arena(variants), range_from(start, c));
}

EnumVariant * Parser::parse_enum_variant(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }

  Expr * value = nullptr;
  Cursor q = p;
  skip_trivia(q);
  if (q.consume('=')) {
    skip_trivia(q);
    value = parse_expr(q);
    if (value == nullptr) {
      return nullptr;
    }
    p = q;
  }

  c = p;
  return ast_.create<EnumVariant>(*name, value, range_from(start, c));
}

// ============================================================================
// Classes and functions
// ============================================================================

ClassDecl * Parser::parse_class_decl(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "class_decl", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "class") || !expect_space(p)) {
    return nullptr;
  }
  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }

  std::optional<std::string_view> base;
  Cursor q = p;
  skip_spaces(q);
  if (scan_keyword(q, "extends")) {
    if (!expect_space(q)) {
      return nullptr;
    }
    base = scan_dotted_identifier(q);
    if (!base) {
      fail(q, "class name");
      return nullptr;
    }
    p = q;
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
  auto * decl = ast_.create<ClassDecl>(*name, body, range_from(start, c));
  decl->base = base;
  return decl;
}

FunctionDecl * Parser::parse_function_decl(Cursor & c, uint32_t indent)
{
  ContextScope scope(*this, "function_decl", c);
  const Cursor start = c;
  Cursor p = c;

  const FunctionModifier modifier = scan_function_modifier(p).value_or(FunctionModifier::None);
  if (!scan_keyword(p, "func") || !expect_space(p)) {
    return nullptr;
  }
  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }
  skip_spaces(p);
  if (!expect_char(p, '(')) {
    return nullptr;
  }

  std::vector<FunctionArg *> args;
  const bool closed = parse_comma_list(p, ')', [&](Cursor & item) {
    FunctionArg * arg = parse_function_arg(item);
    if (arg == nullptr) return false;
    args.push_back(arg);
    return true;
  });
  if (!closed) {
    return nullptr;
  }

  TypeRef * return_type = nullptr;
  Cursor q = p;
  skip_spaces(q);
  if (q.consume("->")) {
    skip_spaces(q);
    return_type = parse_type_ref(q);
    if (return_type == nullptr) {
      return nullptr;
    }
    p = q;
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
  auto * decl = ast_.create<FunctionDecl>(*name, range_from(start, c));
  decl->modifier = modifier;
  decl->args = ast_.copy_to_arena(args);
  decl->returnType = return_type;
  decl->body = body;
  return decl;
}

FunctionArg * Parser::parse_function_arg(Cursor & c)
{
  const Cursor start = c;
  Cursor p = c;

  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }

  TypeRef * type = nullptr;
  Cursor q = p;
  skip_trivia(q);
  if (q.peek() == ':' && q.peek(1) != '=') {
    q.advance(1);
    skip_trivia(q);
    type = parse_type_ref(q);
    if (type == nullptr) {
      return nullptr;
    }
    p = q;
  }

  Expr * default_value = nullptr;
  q = p;
  skip_trivia(q);
  if (q.consume(":=") || q.consume('=')) {
    skip_trivia(q);
    default_value = parse_expr(q);
    if (default_value == nullptr) {
      return nullptr;
    }
    p = q;
  }

  c = p;
  return ast_.create<FunctionArg>(*name, type, default_value, range_from(start, c));
}

// ============================================================================
// Constants and variables
// ============================================================================

ConstDecl * Parser::parse_const_decl(Cursor & c)
{
  ContextScope scope(*this, "const_decl", c);
  const Cursor start = c;
  Cursor p = c;

  if (!scan_keyword(p, "const") || !expect_space(p)) {
    return nullptr;
  }
  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }
  skip_spaces(p);

  bool infer = false;
  TypeRef * type = nullptr;
  if (p.consume(":=")) {
    infer = true;
  } else {
    if (p.consume(':')) {
      skip_spaces(p);
      type = parse_type_ref(p);
      if (type == nullptr) {
        return nullptr;
      }
      skip_spaces(p);
    }
    if (!expect_char(p, '=')) {
      return nullptr;
    }
  }
  skip_spaces(p);
  Expr * value = parse_expr(p);
  if (value == nullptr) {
    return nullptr;
  }

  c = p;
  auto * decl = ast_.create<ConstDecl>(*name, value, range_from(start, c));
  decl->infer = infer;
  decl->type = type;
  return decl;
}

VarDecl * Parser::parse_var_decl(Cursor & c)
{
  ContextScope scope(*this, "var_decl", c);
  const Cursor start = c;
  Cursor p = c;

  const VarModifier modifier = scan_var_modifier(p).value_or(VarModifier::None);
  if (!scan_keyword(p, "var") || !expect_space(p)) {
    return nullptr;
  }
  const auto name = expect_identifier(p);
  if (!name) {
    return nullptr;
  }

  bool infer = false;
  TypeRef * type = nullptr;
  Expr * init = nullptr;

  Cursor q = p;
  skip_spaces(q);
  if (q.consume(":=")) {
    infer = true;
    skip_spaces(q);
    init = parse_expr(q);
    if (init == nullptr) {
      return nullptr;
    }
    p = q;
  } else {
    if (q.consume(':')) {
      skip_spaces(q);
      type = parse_type_ref(q);
      if (type == nullptr) {
        return nullptr;
      }
      p = q;
      skip_spaces(q);
    }
    if (q.peek() == '=' && q.peek(1) != '=') {
      q.advance(1);
      skip_spaces(q);
      init = parse_expr(q);
      if (init == nullptr) {
        return nullptr;
      }
      p = q;
    }
  }

  std::optional<std::string_view> setter;
  std::optional<std::string_view> getter;
  q = p;
  skip_spaces(q);
  if (at_keyword(q, "setget")) {
    if (!parse_setget(q, setter, getter)) {
      return nullptr;
    }
    p = q;
  }

  c = p;
  auto * decl = ast_.create<VarDecl>(*name, range_from(start, c));
  decl->modifier = modifier;
  decl->infer = infer;
  decl->type = type;
  decl->initialValue = init;
  decl->setter = setter;
  decl->getter = getter;
  return decl;
}

bool Parser::parse_setget(
  Cursor & c, std::optional<std::string_view> & setter, std::optional<std::string_view> & getter)
{
  ContextScope scope(*this, "setget", c);
  Cursor p = c;

  if (!scan_keyword(p, "setget")) {
    return false;
  }
  skip_spaces(p);

  // `setget setter`, `setget setter, getter` or `setget , getter`
  Cursor q = p;
  if (const auto ident = scan_identifier(q); ident && !is_reserved_word(*ident)) {
    setter = ident;
    p = q;
  }

  q = p;
  skip_spaces(q);
  if (q.consume(',')) {
    skip_spaces(q);
    getter = expect_identifier(q);
    if (!getter) {
      return false;
    }
    p = q;
  }

  if (!setter && !getter) {
    fail(p, "setter or getter name");
    return false;
  }

  c = p;
  return true;
}

}  // namespace gdparse::syntax
