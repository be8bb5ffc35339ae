// gdparse/ast/ast.hpp - Syntax tree node class definitions
//
// Nodes follow the LLVM/Clang style with classof() for RTTI support. They
// are created by AstContext, never copied, and borrow every piece of text
// (names, string bodies, number spellings) from the source buffer.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "gdparse/ast/ast_enums.hpp"
#include "gdparse/basic/casting.hpp"
#include "gdparse/basic/source_buffer.hpp"

namespace gdparse
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all syntax tree nodes.
 *
 * Every node has a NodeKind for RTTI and the SourceRange it was parsed
 * from. Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * @tparam Derived The concrete node class
 * @tparam Base The category class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Block;

// ============================================================================
// Expression Nodes
// ============================================================================

/// `null`
class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// `true` / `True` / `false` / `False`
class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Decimal or `0x` hexadecimal integer.
class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;
  std::string_view spelling;  ///< Exactly as written, e.g. "0x0f"

  IntLiteralExpr(int64_t v, std::string_view text, SourceRange r = {})
  : NodeBase(r), value(v), spelling(text)
  {
  }
};

/// `digits.digits`
class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;
  std::string_view spelling;

  FloatLiteralExpr(double v, std::string_view text, SourceRange r = {})
  : NodeBase(r), value(v), spelling(text)
  {
  }
};

/// Quoted string. `value` is the raw body between the quotes; escapes are
/// left as written.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;
  char quote;  ///< '"' or '\''

  StringLiteralExpr(std::string_view v, char q, SourceRange r = {})
  : NodeBase(r), value(v), quote(q)
  {
  }
};

/// `$Path/To/Node` or `$"Path"`; `path` keeps the leading `$`.
class NodePathExpr : public NodeBase<NodePathExpr, Expr, NodeKind::NodePath>
{
public:
  std::string_view path;

  explicit NodePathExpr(std::string_view p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

/// `[a, b, c]`
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

class ObjectPair;

/// `{key: value, ...}`
class ObjectLiteralExpr : public NodeBase<ObjectLiteralExpr, Expr, NodeKind::ObjectLiteral>
{
public:
  gsl::span<ObjectPair *> pairs;

  explicit ObjectLiteralExpr(gsl::span<ObjectPair *> p, SourceRange r = {})
  : NodeBase(r), pairs(p)
  {
  }
};

class IdentExpr : public NodeBase<IdentExpr, Expr, NodeKind::Ident>
{
public:
  std::string_view name;

  explicit IdentExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `name(args...)`
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  std::string_view callee;
  gsl::span<Expr *> args;

  CallExpr(std::string_view c, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), callee(c), args(a)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

// ============================================================================
// Type Nodes
// ============================================================================

/// Dotted type name used by annotations: `int`, `Foo.Bar`.
class TypeRef : public NodeBase<TypeRef, TypeNode, NodeKind::TypeRef>
{
public:
  std::string_view name;

  explicit TypeRef(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class ObjectPair : public NodeBase<ObjectPair, AstNode, NodeKind::ObjectPair>
{
public:
  Expr * key;
  Expr * value;

  ObjectPair(Expr * k, Expr * v, SourceRange r = {}) : NodeBase(r), key(k), value(v) {}
};

class EnumVariant : public NodeBase<EnumVariant, AstNode, NodeKind::EnumVariant>
{
public:
  std::string_view name;
  Expr * value = nullptr;  ///< Explicit `= value`, if any

  EnumVariant(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

class FunctionArg : public NodeBase<FunctionArg, AstNode, NodeKind::FunctionArg>
{
public:
  std::string_view name;
  TypeRef * type = nullptr;
  Expr * defaultValue = nullptr;

  FunctionArg(std::string_view n, TypeRef * t, Expr * d, SourceRange r = {})
  : NodeBase(r), name(n), type(t), defaultValue(d)
  {
  }
};

/// Expression plus the indented block it guards (if/elif/while/for/match case).
class Condition : public NodeBase<Condition, AstNode, NodeKind::Condition>
{
public:
  Expr * expr;
  Block * body;

  Condition(Expr * e, Block * b, SourceRange r = {}) : NodeBase(r), expr(e), body(b) {}
};

/// `# text`; `text` is trimmed and excludes the `#`.
class Comment : public NodeBase<Comment, AstNode, NodeKind::Comment>
{
public:
  std::string_view text;

  explicit Comment(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/**
 * Ordered run of lines sharing one indentation level.
 *
 * Every entry satisfies is_line_kind(); blank lines never appear.
 */
class Block : public NodeBase<Block, AstNode, NodeKind::Block>
{
public:
  gsl::span<AstNode *> lines;
  uint32_t indent;  ///< Width in spaces fixed by the first line

  Block(gsl::span<AstNode *> l, uint32_t ind, SourceRange r = {})
  : NodeBase(r), lines(l), indent(ind)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Condition * ifBranch;
  gsl::span<Condition *> elifBranches;
  Block * elseBlock = nullptr;

  IfStmt(Condition * c, gsl::span<Condition *> elifs, Block * else_block, SourceRange r = {})
  : NodeBase(r), ifBranch(c), elifBranches(elifs), elseBlock(else_block)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Condition * cond;

  explicit WhileStmt(Condition * c, SourceRange r = {}) : NodeBase(r), cond(c) {}
};

/// `for x in xs:`; the header is kept as the expression `x in xs`.
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  Condition * cond;

  explicit ForStmt(Condition * c, SourceRange r = {}) : NodeBase(r), cond(c) {}
};

class MatchStmt : public NodeBase<MatchStmt, Stmt, NodeKind::MatchStmt>
{
public:
  Expr * subject;
  gsl::span<Condition *> cases;

  MatchStmt(Expr * s, gsl::span<Condition *> c, SourceRange r = {})
  : NodeBase(r), subject(s), cases(c)
  {
  }
};

class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::AssignStmt>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  AssignStmt(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value;  ///< nullptr for a bare `return`

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class PassStmt : public NodeBase<PassStmt, Stmt, NodeKind::PassStmt>
{
public:
  explicit PassStmt(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

class VarDecl : public NodeBase<VarDecl, Decl, NodeKind::VarDecl>
{
public:
  VarModifier modifier = VarModifier::None;
  std::string_view name;
  bool infer = false;  ///< Declared with `:=`
  TypeRef * type = nullptr;
  Expr * initialValue = nullptr;
  std::optional<std::string_view> setter;
  std::optional<std::string_view> getter;

  explicit VarDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class ConstDecl : public NodeBase<ConstDecl, Decl, NodeKind::ConstDecl>
{
public:
  std::string_view name;
  bool infer = false;
  TypeRef * type = nullptr;
  Expr * value;

  ConstDecl(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/// `extends Node2D` or `extends "res://base.gd"`
class ExtendsDecl : public NodeBase<ExtendsDecl, Decl, NodeKind::ExtendsDecl>
{
public:
  std::string_view target;  ///< Identifier, or the string body for paths
  bool isPath;

  ExtendsDecl(std::string_view t, bool path, SourceRange r = {})
  : NodeBase(r), target(t), isPath(path)
  {
  }
};

class ClassNameDecl : public NodeBase<ClassNameDecl, Decl, NodeKind::ClassNameDecl>
{
public:
  std::string_view name;

  explicit ClassNameDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class EnumDecl : public NodeBase<EnumDecl, Decl, NodeKind::EnumDecl>
{
public:
  std::string_view name;
  gsl::span<EnumVariant *> variants;

  EnumDecl(std::string_view n, gsl::span<EnumVariant *> v, SourceRange r = {})
  : NodeBase(r), name(n), variants(v)
  {
  }
};

class SignalDecl : public NodeBase<SignalDecl, Decl, NodeKind::SignalDecl>
{
public:
  std::string_view name;
  gsl::span<std::string_view> params;

  SignalDecl(std::string_view n, gsl::span<std::string_view> p, SourceRange r = {})
  : NodeBase(r), name(n), params(p)
  {
  }
};

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  FunctionModifier modifier = FunctionModifier::None;
  std::string_view name;
  gsl::span<FunctionArg *> args;
  TypeRef * returnType = nullptr;
  Block * body = nullptr;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Inner class: `class Name [extends Base]:` plus an indented body.
class ClassDecl : public NodeBase<ClassDecl, Decl, NodeKind::ClassDecl>
{
public:
  std::string_view name;
  std::optional<std::string_view> base;
  Block * body;

  ClassDecl(std::string_view n, Block * b, SourceRange r = {}) : NodeBase(r), name(n), body(b) {}
};

// ============================================================================
// Script File (Root Node)
// ============================================================================

class ScriptFile : public NodeBase<ScriptFile, AstNode, NodeKind::ScriptFile>
{
public:
  Block * body;

  explicit ScriptFile(Block * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

[[nodiscard]] inline bool is_line_node(const AstNode * node) noexcept
{
  return node != nullptr && is_line_kind(node->kind);
}

}  // namespace gdparse
