// contrtl/ast/visitor.hpp - CRTP visitor over the closed set of AST nodes
#pragma once

#include <type_traits>

#include "contrtl/ast/ast.hpp"
#include "contrtl/ast/ast_enums.hpp"
#include "contrtl/basic/casting.hpp"

namespace contrtl
{

/**
 * CRTP visitor. `visit` switches on NodeKind (one case per entry of
 * ast_nodes.def) and calls the derived `visit_<snake>` overload.
 *
 * A derived class overrides only the nodes it handles. The rest fall back
 * to their category hook (`visit_expr`, `visit_arith`, `visit_stmt`) and
 * then to `visit_node`, which returns a value-initialized ReturnType.
 *
 * @tparam NodePtrT `AstNode *` or `const AstNode *`; constness carries over
 *                  to the typed overloads.
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
  static constexpr bool k_const = std::is_const_v<std::remove_pointer_t<NodePtrT>>;

public:
  template <typename T>
  using Ptr = std::conditional_t<k_const, const T *, T *>;

  ReturnType visit(NodePtrT node)
  {
    if (!node) return ReturnType();

    switch (node->kind) {
#define CONTRTL_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                         \
    return self().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR CONTRTL_VISIT_CASE
#define AST_NODE_ARITH CONTRTL_VISIT_CASE
#define AST_NODE_STMT CONTRTL_VISIT_CASE
#define AST_NODE_SUPPORT CONTRTL_VISIT_CASE
#define AST_NODE_TOP CONTRTL_VISIT_CASE
#include "contrtl/ast/ast_nodes.def"
#undef CONTRTL_VISIT_CASE
    }
    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake) \
  ReturnType visit_##Snake(Ptr<Class> node) { return self().visit_expr(node); }
#define AST_NODE_ARITH(Class, Kind, Snake) \
  ReturnType visit_##Snake(Ptr<Class> node) { return self().visit_arith(node); }
#define AST_NODE_STMT(Class, Kind, Snake) \
  ReturnType visit_##Snake(Ptr<Class> node) { return self().visit_stmt(node); }
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  ReturnType visit_##Snake(Ptr<Class> node) { return self().visit_node(node); }
#define AST_NODE_TOP(Class, Kind, Snake) \
  ReturnType visit_##Snake(Ptr<Class> node) { return self().visit_node(node); }
#include "contrtl/ast/ast_nodes.def"

  ReturnType visit_expr(Ptr<Expr> node) { return self().visit_node(node); }
  ReturnType visit_arith(Ptr<Arith> node) { return self().visit_node(node); }
  ReturnType visit_stmt(Ptr<Stmt> node) { return self().visit_node(node); }
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }

protected:
  Derived & self() { return static_cast<Derived &>(*this); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

}  // namespace contrtl
