// contrtl/syntax/TreeTransformer.cpp - Walk, dispatch and circuit assembly
#include <string>
#include <utility>

#include "contrtl/syntax/productions.hpp"
#include "contrtl/syntax/tree_transformer.hpp"

namespace contrtl
{

namespace prod = syntax::production;

Circuit * TreeTransformer::transform(const cst::ParseTree & tree)
{
  if (!tree.root()) {
    diags_.report(DiagCode::MalformedTree, {}, "parse tree has no root");
    return nullptr;
  }
  return transform(*tree.root());
}

Circuit * TreeTransformer::transform(const cst::ParseNode & root)
{
  if (!root.is(prod::k_start)) {
    malformed(root, "expected `start` at the root, found `" + std::string(root.label()) + "`");
    return nullptr;
  }

  Result result = walk(root);
  if (!result) {
    return nullptr;
  }
  return dyn_cast<Circuit>(node_of(*result));
}

// ============================================================================
// Walk
// ============================================================================

TreeTransformer::Result TreeTransformer::walk(const Node & node)
{
  if (node.is_token()) {
    return Item{ast_.intern(node.text())};
  }
  if (!enter(node)) {
    return std::nullopt;
  }

  Items children;
  children.reserve(node.child_count());
  for (size_t i = first_walked_child(node); i < node.child_count(); ++i) {
    Result child = walk(*node.child(i));
    if (!child) {
      return std::nullopt;
    }
    children.push_back(std::move(*child));
  }
  return reduce(node, children);
}

bool TreeTransformer::enter(const Node & node)
{
  if (node.is(prod::k_start)) {
    symbols_.push_scope();
    declare_statements(node);
    return true;
  }
  if (node.is(prod::k_module)) {
    return enter_module(node);
  }
  if (node.is(prod::k_postcond)) {
    inPostcond_ = true;
  }
  return true;
}

size_t TreeTransformer::first_walked_child(const Node & node) noexcept
{
  // Names being defined or called, and module parameters, are read directly
  // from the tree instead of being resolved as references.
  if (
    node.is(prod::k_reg) || node.is(prod::k_bind) || node.is(prod::k_call) ||
    node.is(prod::k_module)) {
    return 1;
  }
  return 0;
}

void TreeTransformer::declare_statements(const Node & container)
{
  for (const Node * child : container.children()) {
    if (child->is(prod::k_body) || child->is(prod::k_stmt_seq)) {
      declare_statements(*child);
      continue;
    }

    SymbolKind kind = SymbolKind::Free;
    if (child->is(prod::k_reg)) {
      kind = SymbolKind::Register;
    } else if (child->is(prod::k_bind)) {
      kind = SymbolKind::Binding;
    } else {
      continue;
    }

    // Malformed names are reported when the statement itself is reduced.
    if (auto name = identifier_text(child->child(0))) {
      (void)symbols_.declare(*name, kind, child->child(0)->range());
    }
  }
}

TreeTransformer::Result TreeTransformer::reduce(const Node & node, Items & children)
{
  const std::string_view k = node.label();

  // Expressions
  if (k == prod::k_zero) return build_bit(node, Bit::Zero);
  if (k == prod::k_one) return build_bit(node, Bit::One);
  if (k == prod::k_identifier) return build_identifier(node, children);
  if (k == prod::k_expr_xor) return build_binary(node, BinaryOp::Xor, children);
  if (k == prod::k_expr_and) return build_binary(node, BinaryOp::And, children);
  if (k == prod::k_expr_or) return build_binary(node, BinaryOp::Or, children);
  if (k == prod::k_mux) return build_mux(node, children);
  if (k == prod::k_call) return build_call(node, children);
  if (k == prod::k_list_of_expr) return build_list_of_expr(node, children);
  if (k == prod::k_scoped_expr) return pass_through(node, children);

  // Arithmetic terms
  if (k == prod::k_impl) return build_arith_binary(node, ArithOp::Impl, children);
  if (k == prod::k_add) return build_arith_binary(node, ArithOp::Add, children);
  if (k == prod::k_sub) return build_arith_binary(node, ArithOp::Sub, children);
  if (k == prod::k_eq) return build_arith_binary(node, ArithOp::Eq, children);
  if (k == prod::k_arith_xor) return build_arith_binary(node, ArithOp::Xor, children);
  if (k == prod::k_arith_and) return build_arith_binary(node, ArithOp::And, children);
  if (k == prod::k_arith_or) return build_arith_binary(node, ArithOp::Or, children);
  if (k == prod::k_arith_not) return build_arith_not(node, children);
  if (k == prod::k_res) return build_result(node);
  if (k == prod::k_scoped_arith) return pass_through(node, children);

  // Statements
  if (k == prod::k_reg) return build_reg(node, children);
  if (k == prod::k_bind) return build_bind(node, children);
  if (k == prod::k_stmt_assert) return build_assert(node, children);
  if (k == prod::k_stmt_assume) return build_assume(node, children);
  if (k == prod::k_stmt_seq) return build_stmt_seq(node, children);
  if (k == prod::k_ano_module) return build_ano_module(node, children);

  // Modules and clauses
  if (k == prod::k_module) return build_module(node, children);
  if (k == prod::k_contract) return build_contract(node, children);
  if (k == prod::k_precond) return build_precond(node, children);
  if (k == prod::k_postcond) return build_postcond(node, children);
  if (k == prod::k_body) return build_body(node, children);
  if (k == prod::k_out) return build_out(node, children);

  if (k == prod::k_start) return build_start(node, children);

  return malformed(node, "unknown production `" + std::string(k) + "`");
}

TreeTransformer::Result TreeTransformer::build_start(const Node & node, Items & children)
{
  std::vector<Stmt *> statements;
  for (const Item & item : children) {
    if (!append_statements(node, item, statements)) {
      return std::nullopt;
    }
  }

  // Every declared callee is defined by now; anything left never became a module.
  // The earliest such call in the source is reported.
  const InstanceExpr * first_call = nullptr;
  const Symbol * first_callee = nullptr;
  for (const auto & [sym, calls] : pendingCalls_) {
    for (const InstanceExpr * inst : calls) {
      if (!first_call || inst->get_range().get_begin() < first_call->get_range().get_begin()) {
        first_call = inst;
        first_callee = sym;
      }
    }
  }
  if (first_call) {
    report_unknown_module(*first_call, first_callee);
    return std::nullopt;
  }

  auto * circuit = ast_.create<Circuit>(ast_.copy_to_arena(statements), node.range());
  circuit->context = ast_.copy_to_arena(symbols_.pop_scope());
  circuit->inputs = ast_.copy_to_arena(symbols_.inputs());
  circuit->definitions = ast_.copy_to_arena(symbols_.definitions());
  return Item{static_cast<AstNode *>(circuit)};
}

// ============================================================================
// Item helpers
// ============================================================================

AstNode * TreeTransformer::node_of(const Item & item) noexcept
{
  if (const auto * node = std::get_if<AstNode *>(&item)) {
    return *node;
  }
  return nullptr;
}

Expr * TreeTransformer::as_expr(const Item & item) noexcept
{
  return dyn_cast<Expr>(node_of(item));
}

Expr * TreeTransformer::expr_like(const Item & item) noexcept
{
  AstNode * node = node_of(item);
  if (auto * expr = dyn_cast<Expr>(node)) {
    return expr;
  }
  if (auto * term = dyn_cast<ArithTermExpr>(node)) {
    return term->expr;
  }
  return nullptr;
}

Arith * TreeTransformer::as_arith(const Item & item)
{
  AstNode * node = node_of(item);
  if (auto * arith = dyn_cast<Arith>(node)) {
    return arith;
  }
  if (auto * expr = dyn_cast<Expr>(node)) {
    return ast_.create<ArithTermExpr>(expr, expr->get_range());
  }
  return nullptr;
}

std::optional<std::string_view> TreeTransformer::identifier_text(const Node * node)
{
  if (!node || !node->is(prod::k_identifier) || node->child_count() != 1) {
    return std::nullopt;
  }
  const Node * token = node->child(0);
  if (!token->is_token() || token->text().empty()) {
    return std::nullopt;
  }
  return token->text();
}

bool TreeTransformer::append_statements(
  const Node & node, const Item & item, std::vector<Stmt *> & out)
{
  if (const auto * list = std::get_if<std::vector<AstNode *>>(&item)) {
    for (AstNode * child : *list) {
      auto * stmt = dyn_cast<Stmt>(child);
      if (!stmt) {
        malformed(node, "statement sequence contains a non-statement");
        return false;
      }
      out.push_back(stmt);
    }
    return true;
  }

  auto * stmt = dyn_cast<Stmt>(node_of(item));
  if (!stmt) {
    malformed(node, "expected a statement in `" + std::string(node.label()) + "`");
    return false;
  }
  out.push_back(stmt);
  return true;
}

// ============================================================================
// Diagnostics
// ============================================================================

std::nullopt_t TreeTransformer::malformed(const Node & node, std::string message)
{
  diags_
    .report(DiagCode::MalformedTree, node.range(), "malformed parse tree: " + std::move(message))
    .with_help("the parse tree does not match the contRTL grammar");
  return std::nullopt;
}

std::nullopt_t TreeTransformer::missing_output(const Node & node, std::string_view what)
{
  diags_
    .report(
      DiagCode::MissingOutput, node.range(), std::string(what) + " has no `out` clause",
      "missing `out`")
    .with_help("only anonymous top-level modules may omit `out`");
  return std::nullopt;
}

void TreeTransformer::report_duplicate(
  SourceRange range, std::string_view name, const Symbol & previous)
{
  diags_
    .report(
      DiagCode::DuplicateDefinition, range, "duplicate definition of `" + std::string(name) + "`",
      "redefined here")
    .with_secondary_label(previous.range, "first defined here");
}

void TreeTransformer::report_unknown_module(const InstanceExpr & inst, const Symbol * sym)
{
  auto builder = diags_.report(
    DiagCode::UnknownModule, inst.get_range(), "unknown module `" + std::string(inst.callee) + "`",
    "not a module in scope");
  if (sym && !sym->is_free()) {
    builder.with_secondary_label(
      sym->range, "`" + std::string(sym->name) + "` is a " + std::string(to_string(sym->kind)));
  }
}

}  // namespace contrtl
