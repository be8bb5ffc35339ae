// gdparse/ast/json_visitor.cpp - JSON serialization implementation
//
#include "gdparse/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "gdparse/ast/ast.hpp"
#include "gdparse/ast/ast_enums.hpp"
#include "gdparse/basic/casting.hpp"
#include "gdparse/basic/source_buffer.hpp"

namespace gdparse
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

json j_node(const AstNode * n);
json j_expr(const Expr * e);
json j_block(const Block * b);

json j_type(const TypeRef * t)
{
  return json{
    {"type", "TypeRef"}, {"range", j_range(t->get_range())}, {"name", std::string(t->name)}};
}

json j_condition(const Condition * c)
{
  return json{
    {"type", "Condition"},
    {"range", j_range(c->get_range())},
    {"expr", j_expr(c->expr)},
    {"body", j_block(c->body)}};
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  if (isa<NullLiteralExpr>(e)) {
    return json{{"type", "NullLiteralExpr"}, {"range", j_range(e->get_range())}};
  }

  if (const auto * lit = dyn_cast<BoolLiteralExpr>(e)) {
    return json{
      {"type", "BoolLiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", lit->value}};
  }

  if (const auto * lit = dyn_cast<IntLiteralExpr>(e)) {
    return json{
      {"type", "IntLiteralExpr"},
      {"range", j_range(lit->get_range())},
      {"value", lit->value},
      {"spelling", std::string(lit->spelling)}};
  }

  if (const auto * lit = dyn_cast<FloatLiteralExpr>(e)) {
    return json{
      {"type", "FloatLiteralExpr"},
      {"range", j_range(lit->get_range())},
      {"value", lit->value},
      {"spelling", std::string(lit->spelling)}};
  }

  if (const auto * lit = dyn_cast<StringLiteralExpr>(e)) {
    return json{
      {"type", "StringLiteralExpr"},
      {"range", j_range(lit->get_range())},
      {"value", std::string(lit->value)},
      {"quote", std::string(1, lit->quote)}};
  }

  if (const auto * np = dyn_cast<NodePathExpr>(e)) {
    return json{
      {"type", "NodePathExpr"}, {"range", j_range(np->get_range())}, {"path", std::string(np->path)}};
  }

  if (const auto * a = dyn_cast<ArrayLiteralExpr>(e)) {
    json elems = json::array();
    for (auto * el : a->elements) elems.push_back(j_expr(el));
    return json{
      {"type", "ArrayLiteralExpr"}, {"range", j_range(a->get_range())}, {"elements", elems}};
  }

  if (const auto * o = dyn_cast<ObjectLiteralExpr>(e)) {
    json pairs = json::array();
    for (auto * p : o->pairs) {
      pairs.push_back(json{
        {"type", "ObjectPair"},
        {"range", j_range(p->get_range())},
        {"key", j_expr(p->key)},
        {"value", j_expr(p->value)}});
    }
    return json{{"type", "ObjectLiteralExpr"}, {"range", j_range(o->get_range())}, {"pairs", pairs}};
  }

  if (const auto * v = dyn_cast<IdentExpr>(e)) {
    return json{
      {"type", "IdentExpr"}, {"range", j_range(v->get_range())}, {"name", std::string(v->name)}};
  }

  if (const auto * c = dyn_cast<CallExpr>(e)) {
    json args = json::array();
    for (auto * a : c->args) args.push_back(j_expr(a));
    return json{
      {"type", "CallExpr"},
      {"range", j_range(c->get_range())},
      {"callee", std::string(c->callee)},
      {"args", args}};
  }

  if (const auto * u = dyn_cast<UnaryExpr>(e)) {
    return json{
      {"type", "UnaryExpr"},
      {"range", j_range(u->get_range())},
      {"op", std::string(to_string(u->op))},
      {"operand", j_expr(u->operand)}};
  }

  if (const auto * b = dyn_cast<BinaryExpr>(e)) {
    return json{
      {"type", "BinaryExpr"},
      {"range", j_range(b->get_range())},
      {"op", std::string(to_string(b->op))},
      {"lhs", j_expr(b->lhs)},
      {"rhs", j_expr(b->rhs)}};
  }

  return json{{"type", "UnknownExpr"}, {"range", j_range(e->get_range())}};
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (const auto * i = dyn_cast<IfStmt>(s)) {
    json elifs = json::array();
    for (auto * c : i->elifBranches) elifs.push_back(j_condition(c));
    json j{
      {"type", "IfStmt"},
      {"range", j_range(i->get_range())},
      {"if", j_condition(i->ifBranch)},
      {"elif", elifs}};
    if (i->elseBlock) j["else"] = j_block(i->elseBlock);
    return j;
  }

  if (const auto * w = dyn_cast<WhileStmt>(s)) {
    return json{
      {"type", "WhileStmt"}, {"range", j_range(w->get_range())}, {"cond", j_condition(w->cond)}};
  }

  if (const auto * f = dyn_cast<ForStmt>(s)) {
    return json{
      {"type", "ForStmt"}, {"range", j_range(f->get_range())}, {"cond", j_condition(f->cond)}};
  }

  if (const auto * m = dyn_cast<MatchStmt>(s)) {
    json cases = json::array();
    for (auto * c : m->cases) cases.push_back(j_condition(c));
    return json{
      {"type", "MatchStmt"},
      {"range", j_range(m->get_range())},
      {"subject", j_expr(m->subject)},
      {"cases", cases}};
  }

  if (const auto * a = dyn_cast<AssignStmt>(s)) {
    return json{
      {"type", "AssignStmt"},
      {"range", j_range(a->get_range())},
      {"target", j_expr(a->target)},
      {"op", std::string(to_string(a->op))},
      {"value", j_expr(a->value)}};
  }

  if (const auto * r = dyn_cast<ReturnStmt>(s)) {
    json j = {{"type", "ReturnStmt"}, {"range", j_range(r->get_range())}};
    if (r->value) j["value"] = j_expr(r->value);
    return j;
  }

  if (isa<PassStmt>(s)) {
    return json{{"type", "PassStmt"}, {"range", j_range(s->get_range())}};
  }

  return json{{"type", "UnknownStmt"}, {"range", j_range(s->get_range())}};
}

// ============================================================================
// Declaration serialization
// ============================================================================

json j_function_arg(const FunctionArg * a)
{
  json j{{"type", "FunctionArg"}, {"range", j_range(a->get_range())}, {"name", std::string(a->name)}};
  if (a->type) j["typeRef"] = j_type(a->type);
  if (a->defaultValue) j["defaultValue"] = j_expr(a->defaultValue);
  return j;
}

json j_decl(const Decl * d)
{
  if (const auto * v = dyn_cast<VarDecl>(d)) {
    json j{
      {"type", "VarDecl"},
      {"range", j_range(v->get_range())},
      {"name", std::string(v->name)},
      {"infer", v->infer}};
    if (v->modifier != VarModifier::None) j["modifier"] = std::string(to_string(v->modifier));
    if (v->type) j["typeRef"] = j_type(v->type);
    if (v->initialValue) j["initialValue"] = j_expr(v->initialValue);
    if (v->setter) j["setter"] = std::string(*v->setter);
    if (v->getter) j["getter"] = std::string(*v->getter);
    return j;
  }

  if (const auto * c = dyn_cast<ConstDecl>(d)) {
    json j{
      {"type", "ConstDecl"},
      {"range", j_range(c->get_range())},
      {"name", std::string(c->name)},
      {"infer", c->infer},
      {"value", j_expr(c->value)}};
    if (c->type) j["typeRef"] = j_type(c->type);
    return j;
  }

  if (const auto * e = dyn_cast<ExtendsDecl>(d)) {
    return json{
      {"type", "ExtendsDecl"},
      {"range", j_range(e->get_range())},
      {e->isPath ? "path" : "name", std::string(e->target)}};
  }

  if (const auto * cn = dyn_cast<ClassNameDecl>(d)) {
    return json{
      {"type", "ClassNameDecl"}, {"range", j_range(cn->get_range())}, {"name", std::string(cn->name)}};
  }

  if (const auto * en = dyn_cast<EnumDecl>(d)) {
    json variants = json::array();
    for (auto * v : en->variants) {
      json jv{
        {"type", "EnumVariant"}, {"range", j_range(v->get_range())}, {"name", std::string(v->name)}};
      if (v->value) jv["value"] = j_expr(v->value);
      variants.push_back(jv);
    }
    return json{
      {"type", "EnumDecl"},
      {"range", j_range(en->get_range())},
      {"name", std::string(en->name)},
      {"variants", variants}};
  }

  if (const auto * sig = dyn_cast<SignalDecl>(d)) {
    json params = json::array();
    for (auto p : sig->params) params.push_back(std::string(p));
    return json{
      {"type", "SignalDecl"},
      {"range", j_range(sig->get_range())},
      {"name", std::string(sig->name)},
      {"params", params}};
  }

  if (const auto * fn = dyn_cast<FunctionDecl>(d)) {
    json args = json::array();
    for (auto * a : fn->args) args.push_back(j_function_arg(a));
    json j{
      {"type", "FunctionDecl"},
      {"range", j_range(fn->get_range())},
      {"name", std::string(fn->name)},
      {"args", args},
      {"body", j_block(fn->body)}};
    if (fn->modifier != FunctionModifier::None) j["modifier"] = std::string(to_string(fn->modifier));
    if (fn->returnType) j["returnType"] = j_type(fn->returnType);
    return j;
  }

  if (const auto * cls = dyn_cast<ClassDecl>(d)) {
    json j{
      {"type", "ClassDecl"},
      {"range", j_range(cls->get_range())},
      {"name", std::string(cls->name)},
      {"body", j_block(cls->body)}};
    if (cls->base) j["extends"] = std::string(*cls->base);
    return j;
  }

  return json{{"type", "UnknownDecl"}, {"range", j_range(d->get_range())}};
}

// ============================================================================
// Lines and blocks
// ============================================================================

json j_block(const Block * b)
{
  if (!b) return json{{"type", "Block"}, {"range", j_range({})}, {"lines", json::array()}};

  json lines = json::array();
  for (auto * line : b->lines) lines.push_back(j_node(line));
  return json{
    {"type", "Block"}, {"range", j_range(b->get_range())}, {"indent", b->indent}, {"lines", lines}};
}

json j_node(const AstNode * n)
{
  if (isa<Decl>(n)) return j_decl(cast<Decl>(n));
  if (isa<Stmt>(n)) return j_stmt(cast<Stmt>(n));
  if (isa<Expr>(n)) return j_expr(cast<Expr>(n));
  if (const auto * c = dyn_cast<Comment>(n)) {
    return json{
      {"type", "Comment"}, {"range", j_range(c->get_range())}, {"text", std::string(c->text)}};
  }
  return to_json(n);
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<ScriptFile>(node)) return to_json(cast<ScriptFile>(node));
  if (isa<Block>(node)) return j_block(cast<Block>(node));
  if (isa<Condition>(node)) return j_condition(cast<Condition>(node));
  if (isa<TypeRef>(node)) return j_type(cast<TypeRef>(node));
  if (isa<FunctionArg>(node)) return j_function_arg(cast<FunctionArg>(node));
  if (const auto * p = dyn_cast<ObjectPair>(node)) {
    return nlohmann::json{
      {"type", "ObjectPair"},
      {"range", j_range(p->get_range())},
      {"key", j_expr(p->key)},
      {"value", j_expr(p->value)}};
  }
  if (const auto * v = dyn_cast<EnumVariant>(node)) {
    nlohmann::json j{
      {"type", "EnumVariant"}, {"range", j_range(v->get_range())}, {"name", std::string(v->name)}};
    if (v->value) j["value"] = j_expr(v->value);
    return j;
  }
  if (isa<Decl>(node) || isa<Stmt>(node) || isa<Expr>(node) || isa<Comment>(node)) {
    return j_node(node);
  }

  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const ScriptFile * file)
{
  if (!file) {
    return nlohmann::json{{"type", "ScriptFile"}, {"range", j_range({})}, {"body", j_block(nullptr)}};
  }
  return nlohmann::json{
    {"type", "ScriptFile"}, {"range", j_range(file->get_range())}, {"body", j_block(file->body)}};
}

}  // namespace gdparse
