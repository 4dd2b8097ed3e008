// contrtl/syntax/TransformExpr.cpp - Parse tree -> AST for expressions and arithmetic terms
#include <string>
#include <utility>

#include "contrtl/syntax/tree_transformer.hpp"

namespace contrtl
{

namespace
{

std::string expects(std::string_view label, size_t count, std::string_view what)
{
  return "`" + std::string(label) + "` expects " + std::to_string(count) + " " +
         std::string(what);
}

}  // namespace

TreeTransformer::Result TreeTransformer::build_bit(const Node & node, Bit value)
{
  return Item{static_cast<AstNode *>(ast_.create<ValueExpr>(value, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_identifier(const Node & node, Items & children)
{
  const auto * text = children.size() == 1 ? std::get_if<std::string_view>(&children[0]) : nullptr;
  if (!text || text->empty()) {
    return malformed(node, "`identifier` expects a single token");
  }

  const Symbol * sym = symbols_.lookup(*text);
  if (!sym) {
    sym = symbols_.make_free(*text, node.range());
  }
  return Item{static_cast<AstNode *>(ast_.create<SymbolRefExpr>(sym->name, sym, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_binary(
  const Node & node, BinaryOp op, Items & children)
{
  Expr * lhs = children.size() == 2 ? as_expr(children[0]) : nullptr;
  Expr * rhs = children.size() == 2 ? as_expr(children[1]) : nullptr;
  if (!lhs || !rhs) {
    return malformed(node, expects(node.label(), 2, "expression operands"));
  }

  auto operands = ast_.allocate_array<Expr *>(2);
  operands[0] = lhs;
  operands[1] = rhs;
  return Item{static_cast<AstNode *>(ast_.create<BinaryExpr>(op, operands, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_mux(const Node & node, Items & children)
{
  if (children.size() != 3) {
    return malformed(node, expects(node.label(), 3, "expression operands"));
  }

  auto operands = ast_.allocate_array<Expr *>(3);
  for (size_t i = 0; i < 3; ++i) {
    operands[i] = as_expr(children[i]);
    if (!operands[i]) {
      return malformed(node, expects(node.label(), 3, "expression operands"));
    }
  }
  return Item{static_cast<AstNode *>(ast_.create<MuxExpr>(operands, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_list_of_expr(const Node & node, Items & children)
{
  std::vector<AstNode *> args;
  args.reserve(children.size());
  for (const Item & item : children) {
    Expr * arg = as_expr(item);
    if (!arg) {
      return malformed(node, "`list_of_expr` expects expression elements");
    }
    args.push_back(arg);
  }
  return Item{std::move(args)};
}

TreeTransformer::Result TreeTransformer::build_call(const Node & node, Items & children)
{
  auto name = identifier_text(node.child(0));
  const auto * list =
    children.size() == 1 ? std::get_if<std::vector<AstNode *>>(&children[0]) : nullptr;
  if (!name || !list) {
    return malformed(node, "`call` expects a callee identifier and an argument list");
  }

  std::vector<Expr *> args;
  args.reserve(list->size());
  for (AstNode * arg : *list) {
    auto * expr = dyn_cast<Expr>(arg);
    if (!expr) {
      return malformed(node, "`call` arguments must be expressions");
    }
    args.push_back(expr);
  }

  const Symbol * sym = symbols_.lookup(*name);
  auto * inst =
    ast_.create<InstanceExpr>(ast_.intern(*name), sym, ast_.copy_to_arena(args), node.range());

  if (!sym || sym->kind == SymbolKind::Free || sym->kind == SymbolKind::Parameter ||
      sym->kind == SymbolKind::Register) {
    report_unknown_module(*inst, sym);
    return std::nullopt;
  }

  if (symbols_.is_defined(*sym)) {
    if (!check_instance(*inst, *sym)) {
      return std::nullopt;
    }
  } else {
    pendingCalls_[sym].push_back(inst);
  }
  return Item{static_cast<AstNode *>(inst)};
}

TreeTransformer::Result TreeTransformer::pass_through(const Node & node, Items & children)
{
  if (children.size() != 1 || !node_of(children[0])) {
    return malformed(node, expects(node.label(), 1, "operand"));
  }
  AstNode * inner = node_of(children[0]);
  if (!isa<Expr>(inner) && !isa<Arith>(inner)) {
    return malformed(node, expects(node.label(), 1, "expression operand"));
  }
  return Item{inner};
}

// ============================================================================
// Arithmetic terms
// ============================================================================

TreeTransformer::Result TreeTransformer::build_arith_binary(
  const Node & node, ArithOp op, Items & children)
{
  if (children.size() != 2) {
    return malformed(node, expects(node.label(), 2, "operands"));
  }

  // xor/and/or over two synthesizable operands is itself synthesizable.
  if (is_prefix_op(op)) {
    Expr * lhs = expr_like(children[0]);
    Expr * rhs = expr_like(children[1]);
    if (lhs && rhs) {
      const BinaryOp bop =
        op == ArithOp::Xor ? BinaryOp::Xor : (op == ArithOp::And ? BinaryOp::And : BinaryOp::Or);
      auto operands = ast_.allocate_array<Expr *>(2);
      operands[0] = lhs;
      operands[1] = rhs;
      auto * expr = ast_.create<BinaryExpr>(bop, operands, node.range());
      return Item{static_cast<AstNode *>(ast_.create<ArithTermExpr>(expr, node.range()))};
    }
  }

  Arith * lhs = as_arith(children[0]);
  Arith * rhs = as_arith(children[1]);
  if (!lhs || !rhs) {
    return malformed(node, expects(node.label(), 2, "arithmetic operands"));
  }

  auto operands = ast_.allocate_array<Arith *>(2);
  operands[0] = lhs;
  operands[1] = rhs;
  return Item{static_cast<AstNode *>(ast_.create<ArithBinaryExpr>(op, operands, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_arith_not(const Node & node, Items & children)
{
  Arith * operand = children.size() == 1 ? as_arith(children[0]) : nullptr;
  if (!operand) {
    return malformed(node, expects(node.label(), 1, "arithmetic operand"));
  }
  return Item{static_cast<AstNode *>(ast_.create<ArithNotExpr>(operand, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_result(const Node & node)
{
  if (!inPostcond_) {
    diags_
      .report(
        DiagCode::MisplacedResult, node.range(), "`res` used outside a post-condition",
        "not allowed here")
      .with_help("`res` refers to a module's output and is only valid after `ens`");
    return std::nullopt;
  }
  return Item{static_cast<AstNode *>(ast_.create<ResultExpr>(node.range()))};
}

}  // namespace contrtl
