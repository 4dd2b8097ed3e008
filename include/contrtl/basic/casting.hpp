// contrtl/basic/casting.hpp - Kind-checked downcasts for AST nodes
//
// A node class opts in by providing `static bool classof(const AstNode *)`,
// which compares the node's NodeKind tag (see ast_nodes.def).
//
//   if (isa<MuxExpr>(e)) { ... }
//   const auto * reg = cast<RegStmt>(stmt);      // kind must match
//   if (auto * bind = dyn_cast<BindStmt>(stmt))  // nullptr otherwise
//
#pragma once

#include <cassert>
#include <type_traits>

namespace contrtl
{

template <typename To, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  return node != nullptr && To::classof(node);
}

template <typename To, typename From>
[[nodiscard]] inline auto * cast(From * node) noexcept
{
  using Result = std::conditional_t<std::is_const_v<From>, const To, To>;
  assert(isa<To>(node) && "cast<> to the wrong node kind");
  return static_cast<Result *>(node);
}

template <typename To, typename From>
[[nodiscard]] inline auto * dyn_cast(From * node) noexcept
{
  using Result = std::conditional_t<std::is_const_v<From>, const To, To>;
  return isa<To>(node) ? static_cast<Result *>(node) : nullptr;
}

}  // namespace contrtl
