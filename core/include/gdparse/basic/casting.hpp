// gdparse/basic/casting.hpp - Kind-checked casts between syntax tree nodes
//
// Every node class answers `static bool classof(const AstNode *)`, so a Line
// can be narrowed to a Decl, a Stmt or an Expr and from there to the concrete
// node:
//
//   if (isa<PassStmt>(line)) { ... }
//   if (const auto * call = dyn_cast<CallExpr>(expr)) { ... }
//
// The result keeps the constness of the argument.
//
#pragma once

#include <cassert>
#include <type_traits>

namespace gdparse
{

template <typename To, typename From>
using cast_result_t = std::conditional_t<std::is_const_v<From>, const To, To>;

/// False for nullptr
template <typename To, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return node != nullptr && To::classof(node);
}

/// The node must be non-null and of kind To
template <typename To, typename From>
[[nodiscard]] inline cast_result_t<To, From> * cast(From * node) noexcept
{
  assert(isa<To>(node) && "cast<To>() on a node of another kind");
  return static_cast<cast_result_t<To, From> *>(node);
}

/// nullptr for nullptr or a node of another kind
template <typename To, typename From>
[[nodiscard]] inline cast_result_t<To, From> * dyn_cast(From * node) noexcept
{
  return isa<To>(node) ? static_cast<cast_result_t<To, From> *>(node) : nullptr;
}

}  // namespace gdparse
