// contrtl/syntax/TransformSupport.cpp - Parse tree -> AST for modules and their clauses
#include <string>
#include <utility>

#include "contrtl/syntax/productions.hpp"
#include "contrtl/syntax/tree_transformer.hpp"

namespace contrtl
{

namespace prod = syntax::production;

bool TreeTransformer::enter_module(const Node & node)
{
  const Node * params = node.child(0);
  if (!params || !params->is(prod::k_list_of_variables)) {
    malformed(node, "`module` expects a parameter list as its first child");
    return false;
  }

  symbols_.push_scope();
  ModuleFrame frame{symbols_.reserve_slot(), {}};
  for (const Node * param : params->children()) {
    auto name = identifier_text(param);
    if (!name) {
      malformed(*param, "module parameters must be identifiers");
      return false;
    }
    const DefineResult defined = symbols_.define_parameter(*name, frame.slot, param->range());
    if (!defined.ok()) {
      report_duplicate(param->range(), *name, *defined.previous);
      return false;
    }
    frame.params.push_back(defined.symbol);
  }
  modules_.push_back(std::move(frame));

  declare_statements(node);
  return true;
}

TreeTransformer::Result TreeTransformer::build_module(const Node & node, Items & children)
{
  ModuleFrame frame = std::move(modules_.back());
  modules_.pop_back();

  size_t i = 0;
  ContractClause * contract = nullptr;
  if (i < children.size()) {
    if (auto * clause = dyn_cast<ContractClause>(node_of(children[i]))) {
      contract = clause;
      ++i;
    }
  }

  // Either a single `body` child or, in the collapsed form, the body's
  // statements and output as direct children of the module.
  std::vector<Stmt *> statements;
  OutClause * out = nullptr;
  auto * body = (i + 1 == children.size()) ? dyn_cast<ModuleBody>(node_of(children[i])) : nullptr;
  if (body) {
    statements.assign(body->statements.begin(), body->statements.end());
    out = body->out;
  } else if (!collect_body(node, children, i, statements, out)) {
    return std::nullopt;
  }

  auto * module = ast_.create<ModuleStmt>(
    ast_.copy_to_arena(frame.params), contract, ast_.copy_to_arena(statements), out,
    node.range());
  symbols_.fill_slot(frame.slot, module);
  module->locals = ast_.copy_to_arena(symbols_.pop_scope());
  return Item{static_cast<AstNode *>(module)};
}

TreeTransformer::Result TreeTransformer::build_contract(const Node & node, Items & children)
{
  auto * pre = children.size() == 2 ? dyn_cast<PreCondition>(node_of(children[0])) : nullptr;
  auto * post = children.size() == 2 ? dyn_cast<PostCondition>(node_of(children[1])) : nullptr;
  if (!pre || !post) {
    return malformed(node, "`contract` expects a pre-condition followed by a post-condition");
  }
  return Item{static_cast<AstNode *>(ast_.create<ContractClause>(pre, post, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_precond(const Node & node, Items & children)
{
  Arith * cond = children.size() == 1 ? as_arith(children[0]) : nullptr;
  if (!cond) {
    return malformed(node, "`precond` expects one arithmetic term");
  }
  return Item{static_cast<AstNode *>(ast_.create<PreCondition>(cond, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_postcond(const Node & node, Items & children)
{
  inPostcond_ = false;
  Arith * cond = children.size() == 1 ? as_arith(children[0]) : nullptr;
  if (!cond) {
    return malformed(node, "`postcond` expects one arithmetic term");
  }
  return Item{static_cast<AstNode *>(ast_.create<PostCondition>(cond, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_body(const Node & node, Items & children)
{
  std::vector<Stmt *> statements;
  OutClause * out = nullptr;
  if (!collect_body(node, children, 0, statements, out)) {
    return std::nullopt;
  }
  return Item{static_cast<AstNode *>(
    ast_.create<ModuleBody>(ast_.copy_to_arena(statements), out, node.range()))};
}

TreeTransformer::Result TreeTransformer::build_out(const Node & node, Items & children)
{
  Expr * value = children.size() == 1 ? as_expr(children[0]) : nullptr;
  if (!value) {
    return malformed(node, "`out` expects one expression");
  }
  return Item{static_cast<AstNode *>(ast_.create<OutClause>(value, node.range()))};
}

bool TreeTransformer::collect_body(
  const Node & node, Items & children, size_t begin, std::vector<Stmt *> & statements,
  OutClause *& out)
{
  for (size_t i = begin; i < children.size(); ++i) {
    const bool last = i + 1 == children.size();
    AstNode * child = node_of(children[i]);

    if (auto * clause = dyn_cast<OutClause>(child)) {
      if (!last) {
        malformed(node, "`out` must be the last element of a module body");
        return false;
      }
      out = clause;
      continue;
    }

    // A trailing bare expression is the module's output.
    if (auto * expr = dyn_cast<Expr>(child)) {
      if (!last) {
        malformed(node, "only the last element of a module body may be an expression");
        return false;
      }
      out = ast_.create<OutClause>(expr, expr->get_range());
      continue;
    }

    const size_t before = statements.size();
    if (!append_statements(node, children[i], statements)) {
      return false;
    }
    for (size_t s = before; s < statements.size(); ++s) {
      if (const auto * nested = dyn_cast<ModuleStmt>(statements[s]); nested && !nested->out) {
        diags_
          .report(
            DiagCode::MissingOutput, nested->get_range(), "nested module has no `out` clause",
            "missing `out`")
          .with_help("only anonymous top-level modules may omit `out`");
        return false;
      }
    }
  }
  return true;
}

}  // namespace contrtl
