// contrtl/ast/denotation.cpp - Reference Bit semantics for closed terms
#include "contrtl/ast/denotation.hpp"

namespace contrtl
{

std::optional<Bit> evaluate_constant(const Expr * expr)
{
  if (!expr) return std::nullopt;

  switch (expr->kind) {
    case NodeKind::Value:
      return cast<ValueExpr>(expr)->value;

    case NodeKind::Binary: {
      const auto * node = cast<BinaryExpr>(expr);
      const auto lhs = evaluate_constant(node->lhs);
      const auto rhs = evaluate_constant(node->rhs);
      if (!lhs || !rhs) return std::nullopt;
      return apply(node->op, *lhs, *rhs);
    }

    case NodeKind::Mux: {
      const auto * node = cast<MuxExpr>(expr);
      const auto s = evaluate_constant(node->selector);
      const auto t = evaluate_constant(node->whenTrue);
      const auto f = evaluate_constant(node->whenFalse);
      if (!s || !t || !f) return std::nullopt;
      return bit_mux(*s, *t, *f);
    }

    default:
      return std::nullopt;
  }
}

std::optional<Bit> evaluate_constant(const Arith * arith)
{
  if (!arith) return std::nullopt;

  switch (arith->kind) {
    case NodeKind::ArithTerm:
      return evaluate_constant(cast<ArithTermExpr>(arith)->expr);

    case NodeKind::ArithNot: {
      const auto operand = evaluate_constant(cast<ArithNotExpr>(arith)->operand);
      if (!operand) return std::nullopt;
      return bit_not(*operand);
    }

    case NodeKind::ArithBinary: {
      const auto * node = cast<ArithBinaryExpr>(arith);
      const auto lhs = evaluate_constant(node->lhs);
      const auto rhs = evaluate_constant(node->rhs);
      if (!lhs || !rhs) return std::nullopt;
      switch (node->op) {
        case ArithOp::Impl:
          return bit_impl(*lhs, *rhs);
        case ArithOp::Eq:
          return bit_eq(*lhs, *rhs);
        case ArithOp::Xor:
          return bit_xor(*lhs, *rhs);
        case ArithOp::And:
          return bit_and(*lhs, *rhs);
        case ArithOp::Or:
          return bit_or(*lhs, *rhs);
        case ArithOp::Add:
        case ArithOp::Sub:
          return std::nullopt;
      }
      return std::nullopt;
    }

    default:
      return std::nullopt;
  }
}

std::optional<Order> evaluate_assertion(const Arith * condition)
{
  const auto value = evaluate_constant(condition);
  if (!value) return std::nullopt;
  return *value == Bit::One ? Order::Skip : Order::Fail;
}

}  // namespace contrtl
