// gdparse/ast/ast_enums.hpp - Syntax tree enumerations
//
// Node kinds, operators and declaration modifiers.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace gdparse
{

// ============================================================================
// NodeKind - Identifies all syntax tree node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Kinds are grouped by category so classof checks are range comparisons.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "gdparse/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "gdparse/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "gdparse/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "gdparse/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "gdparse/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "gdparse/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators.
 *
 * Attr and Index are produced by postfix chains (`a.b`, `a[i]`) rather than
 * by an infix level of the precedence table.
 */
enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Bitwise
  BitAnd,  ///< &
  BitOr,   ///< |
  BitXor,  ///< ^
  // Access
  Attr,   ///< a.b
  Index,  ///< a[b]
  // Logical
  And,  ///< && / and
  Or,   ///< || / or
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Membership / type
  Is,  ///< is
  In,  ///< in
  As,  ///< as
};

enum class UnaryOp : uint8_t {
  Plus,  ///< +
  Neg,   ///< -
  Not,   ///< ! / not
};

enum class AssignOp : uint8_t {
  Assign,     ///< =
  AddAssign,  ///< +=
  SubAssign,  ///< -=
  MulAssign,  ///< *=
  DivAssign,  ///< /=
  ModAssign,  ///< %=
};

// ============================================================================
// Declaration modifiers
// ============================================================================

enum class VarModifier : uint8_t {
  None,
  Onready,  ///< onready var
  Export,   ///< export var
};

/// Function modifiers: `static` and the networking (RPC) modes.
enum class FunctionModifier : uint8_t {
  None,
  Static,
  Remote,
  Master,
  Puppet,
  RemoteSync,
  MasterSync,
  PuppetSync,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::Attr:
      return ".";
    case BinaryOp::Index:
      return "[]";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Is:
      return "is";
    case BinaryOp::In:
      return "in";
    case BinaryOp::As:
      return "as";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "!";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
    case AssignOp::ModAssign:
      return "%=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(VarModifier modifier) noexcept
{
  switch (modifier) {
    case VarModifier::None:
      return "";
    case VarModifier::Onready:
      return "onready";
    case VarModifier::Export:
      return "export";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(FunctionModifier modifier) noexcept
{
  switch (modifier) {
    case FunctionModifier::None:
      return "";
    case FunctionModifier::Static:
      return "static";
    case FunctionModifier::Remote:
      return "remote";
    case FunctionModifier::Master:
      return "master";
    case FunctionModifier::Puppet:
      return "puppet";
    case FunctionModifier::RemoteSync:
      return "remotesync";
    case FunctionModifier::MasterSync:
      return "mastersync";
    case FunctionModifier::PuppetSync:
      return "puppetsync";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NullLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::UnaryExpr;

inline constexpr NodeKind k_first_type_kind = NodeKind::TypeRef;
inline constexpr NodeKind k_last_type_kind = NodeKind::TypeRef;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::IfStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::PassStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::VarDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::ClassDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

/// A block line is a declaration, a statement, a bare expression or a comment.
[[nodiscard]] constexpr bool is_line_kind(NodeKind kind) noexcept
{
  return is_decl_kind(kind) || is_stmt_kind(kind) || is_expr_kind(kind) ||
         kind == NodeKind::Comment;
}

}  // namespace gdparse
