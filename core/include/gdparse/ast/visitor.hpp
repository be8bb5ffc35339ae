// gdparse/ast/visitor.hpp - CRTP visitors for syntax tree traversal
//
// Dispatch is generated from ast_nodes.def, so adding a node kind only
// requires a new entry there plus traversal in RecursiveAstVisitor.
//
#pragma once

#include <type_traits>

#include "gdparse/ast/ast.hpp"
#include "gdparse/ast/ast_enums.hpp"
#include "gdparse/basic/casting.hpp"

namespace gdparse
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

namespace detail
{

/// Propagate const from NodePtrT to the derived node pointer
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP visitor without virtual dispatch.
 *
 * Each concrete node kind is routed to `visit_<snake>()`. Unhandled kinds
 * fall back to the category method (visit_expr, visit_stmt, visit_decl,
 * visit_type_node) and finally to visit_node().
 *
 * @code
 *   class CallCounter : public ConstAstVisitor<CallCounter, void> {
 *   public:
 *     void visit_call_expr(const CallExpr *) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  // ===========================================================================
  // Main dispatch method
  // ===========================================================================

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define GDPARSE_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                         \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR GDPARSE_VISIT_CASE
#define AST_NODE_TYPE GDPARSE_VISIT_CASE
#define AST_NODE_STMT GDPARSE_VISIT_CASE
#define AST_NODE_DECL GDPARSE_VISIT_CASE
#define AST_NODE_SUPPORT GDPARSE_VISIT_CASE
#define AST_NODE_TOP GDPARSE_VISIT_CASE
#include "gdparse/ast/ast_nodes.def"
#undef GDPARSE_VISIT_CASE
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from ast_nodes.def)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return visit_expr(node);                                                \
  }
#include "gdparse/ast/ast_nodes.def"

#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return visit_type_node(node);                                           \
  }
#include "gdparse/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return visit_stmt(node);                                                \
  }
#include "gdparse/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return visit_decl(node);                                                \
  }
#include "gdparse/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return visit_node(node);                                                \
  }
#include "gdparse/ast/ast_nodes.def"

#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return visit_node(node);                                                \
  }
#include "gdparse/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node) { return visit_node(node); }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node) { return visit_node(node); }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node) { return visit_node(node); }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

}  // namespace gdparse
