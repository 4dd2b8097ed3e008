// contrtl/syntax/TransformStmt.cpp - Parse tree -> AST for statements
#include <string>
#include <utility>

#include "contrtl/syntax/tree_transformer.hpp"

namespace contrtl
{

TreeTransformer::Result TreeTransformer::build_reg(const Node & node, Items & children)
{
  auto name = identifier_text(node.child(0));
  auto * init = children.size() == 2 ? dyn_cast<ValueExpr>(node_of(children[0])) : nullptr;
  Expr * next = children.size() == 2 ? as_expr(children[1]) : nullptr;
  if (!name || !init || !next) {
    return malformed(node, "`reg` expects a name, an initial bit and a next-state expression");
  }

  const SourceRange name_range = node.child(0)->range();
  auto * reg = ast_.create<RegStmt>(ast_.intern(*name), nullptr, init->value, next, node.range());
  const DefineResult defined = symbols_.define(*name, SymbolKind::Register, reg, name_range);
  if (!defined.ok()) {
    report_duplicate(name_range, *name, *defined.previous);
    return std::nullopt;
  }
  reg->symbol = defined.symbol;

  if (!resolve_pending_calls(*defined.symbol)) {
    return std::nullopt;
  }
  return Item{static_cast<AstNode *>(reg)};
}

TreeTransformer::Result TreeTransformer::build_bind(const Node & node, Items & children)
{
  auto name = identifier_text(node.child(0));
  AstNode * value = children.size() == 1 ? node_of(children[0]) : nullptr;
  if (!name || !(isa<Expr>(value) || isa<ModuleStmt>(value))) {
    return malformed(node, "`bind` expects a name and an expression or module");
  }

  if (const auto * module = dyn_cast<ModuleStmt>(value); module && !module->out) {
    return missing_output(node, "module `" + std::string(*name) + "`");
  }

  const SourceRange name_range = node.child(0)->range();
  auto * bind = ast_.create<BindStmt>(ast_.intern(*name), nullptr, value, node.range());
  const DefineResult defined = symbols_.define(*name, SymbolKind::Binding, bind, name_range);
  if (!defined.ok()) {
    report_duplicate(name_range, *name, *defined.previous);
    return std::nullopt;
  }
  bind->symbol = defined.symbol;

  if (!resolve_pending_calls(*defined.symbol)) {
    return std::nullopt;
  }
  return Item{static_cast<AstNode *>(bind)};
}

TreeTransformer::Result TreeTransformer::build_assert(const Node & node, Items & children)
{
  Arith * cond = children.size() == 1 ? as_arith(children[0]) : nullptr;
  if (!cond) {
    return malformed(node, "`stmt_assert` expects one arithmetic term");
  }
  return Item{static_cast<AstNode *>(ast_.create<AssertStmt>(cond, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_assume(const Node & node, Items & children)
{
  Arith * cond = children.size() == 1 ? as_arith(children[0]) : nullptr;
  if (!cond) {
    return malformed(node, "`stmt_assume` expects one arithmetic term");
  }
  return Item{static_cast<AstNode *>(ast_.create<AssumeStmt>(cond, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_stmt_seq(const Node & node, Items & children)
{
  std::vector<Stmt *> statements;
  for (const Item & item : children) {
    if (!append_statements(node, item, statements)) {
      return std::nullopt;
    }
  }
  return Item{std::vector<AstNode *>(statements.begin(), statements.end())};
}

TreeTransformer::Result TreeTransformer::build_ano_module(const Node & node, Items & children)
{
  auto * module = children.size() == 1 ? dyn_cast<ModuleStmt>(node_of(children[0])) : nullptr;
  if (!module) {
    return malformed(node, "`ano_module` expects one module");
  }
  return Item{static_cast<AstNode *>(module)};
}

// ============================================================================
// Module instances
// ============================================================================

bool TreeTransformer::check_instance(InstanceExpr & inst, const Symbol & callee)
{
  const ModuleStmt * module = symbols_.module_of(callee);
  if (!module) {
    report_unknown_module(inst, &callee);
    return false;
  }

  if (module->arity() != inst.args.size()) {
    const auto plural = [](size_t n) { return n == 1 ? "" : "s"; };
    diags_
      .report(
        DiagCode::ArityMismatch, inst.get_range(),
        "module `" + std::string(inst.callee) + "` expects " + std::to_string(module->arity()) +
          " argument" + plural(module->arity()) + ", found " + std::to_string(inst.args.size()),
        "expected " + std::to_string(module->arity()) + " argument" + plural(module->arity()))
      .with_secondary_label(module->get_range(), "module defined here");
    return false;
  }

  inst.module = module;
  return true;
}

bool TreeTransformer::resolve_pending_calls(const Symbol & sym)
{
  auto it = pendingCalls_.find(&sym);
  if (it == pendingCalls_.end()) {
    return true;
  }

  std::vector<InstanceExpr *> calls = std::move(it->second);
  pendingCalls_.erase(it);
  for (InstanceExpr * inst : calls) {
    if (!check_instance(*inst, sym)) {
      return false;
    }
  }
  return true;
}

}  // namespace contrtl
