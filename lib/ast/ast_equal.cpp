// contrtl/ast/ast_equal.cpp - Structural equality of AST trees
#include "contrtl/ast/ast_equal.hpp"

#include <gsl/span>

namespace contrtl
{

namespace
{

template <typename T>
bool equal_all(gsl::span<T *> a, gsl::span<T *> b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!structurally_equal(a[i], b[i])) return false;
  }
  return true;
}

bool equal_symbols(gsl::span<const Symbol *> a, gsl::span<const Symbol *> b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (*a[i] != *b[i]) return false;
  }
  return true;
}

}  // namespace

bool structurally_equal(const AstNode * a, const AstNode * b)
{
  if (a == b) return true;
  if (!a || !b || a->kind != b->kind) return false;

  switch (a->kind) {
    case NodeKind::Value:
      return cast<ValueExpr>(a)->value == cast<ValueExpr>(b)->value;

    case NodeKind::SymbolRef:
      return cast<SymbolRefExpr>(a)->name == cast<SymbolRefExpr>(b)->name;

    case NodeKind::Binary: {
      const auto * x = cast<BinaryExpr>(a);
      const auto * y = cast<BinaryExpr>(b);
      return x->op == y->op && equal_all(x->operands, y->operands);
    }

    case NodeKind::Mux:
      return equal_all(cast<MuxExpr>(a)->operands, cast<MuxExpr>(b)->operands);

    case NodeKind::Instance: {
      const auto * x = cast<InstanceExpr>(a);
      const auto * y = cast<InstanceExpr>(b);
      return x->callee == y->callee && equal_all(x->args, y->args);
    }

    case NodeKind::ArithBinary: {
      const auto * x = cast<ArithBinaryExpr>(a);
      const auto * y = cast<ArithBinaryExpr>(b);
      return x->op == y->op && equal_all(x->operands, y->operands);
    }

    case NodeKind::ArithNot:
      return structurally_equal(cast<ArithNotExpr>(a)->operand, cast<ArithNotExpr>(b)->operand);

    case NodeKind::Result:
      return true;

    case NodeKind::ArithTerm:
      return structurally_equal(cast<ArithTermExpr>(a)->expr, cast<ArithTermExpr>(b)->expr);

    case NodeKind::Reg: {
      const auto * x = cast<RegStmt>(a);
      const auto * y = cast<RegStmt>(b);
      return x->name == y->name && x->init == y->init && structurally_equal(x->next, y->next);
    }

    case NodeKind::Bind: {
      const auto * x = cast<BindStmt>(a);
      const auto * y = cast<BindStmt>(b);
      return x->name == y->name && structurally_equal(x->value, y->value);
    }

    case NodeKind::Assert:
      return structurally_equal(cast<AssertStmt>(a)->condition, cast<AssertStmt>(b)->condition);

    case NodeKind::Assume:
      return structurally_equal(cast<AssumeStmt>(a)->condition, cast<AssumeStmt>(b)->condition);

    case NodeKind::Module: {
      const auto * x = cast<ModuleStmt>(a);
      const auto * y = cast<ModuleStmt>(b);
      return equal_symbols(x->params, y->params) && structurally_equal(x->contract, y->contract) &&
             equal_all(x->body, y->body) && structurally_equal(x->out, y->out);
    }

    case NodeKind::PreCond:
      return structurally_equal(cast<PreCondition>(a)->condition, cast<PreCondition>(b)->condition);

    case NodeKind::PostCond:
      return structurally_equal(
        cast<PostCondition>(a)->condition, cast<PostCondition>(b)->condition);

    case NodeKind::Contract: {
      const auto * x = cast<ContractClause>(a);
      const auto * y = cast<ContractClause>(b);
      return structurally_equal(x->pre, y->pre) && structurally_equal(x->post, y->post);
    }

    case NodeKind::Out:
      return structurally_equal(cast<OutClause>(a)->value, cast<OutClause>(b)->value);

    case NodeKind::Body: {
      const auto * x = cast<ModuleBody>(a);
      const auto * y = cast<ModuleBody>(b);
      return equal_all(x->statements, y->statements) && structurally_equal(x->out, y->out);
    }

    case NodeKind::Circuit:
      return equal_all(cast<Circuit>(a)->statements, cast<Circuit>(b)->statements);
  }
  return false;
}

}  // namespace contrtl
