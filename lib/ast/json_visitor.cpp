// contrtl/ast/json_visitor.cpp - JSON serialization implementation
//
#include "contrtl/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "contrtl/ast/ast.hpp"
#include "contrtl/ast/ast_enums.hpp"
#include "contrtl/basic/casting.hpp"
#include "contrtl/basic/source_manager.hpp"

namespace contrtl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

json j_node(const AstNode * n, json fields)
{
  fields["type"] = std::string(to_string(n->kind));
  fields["range"] = j_range(n->get_range());
  return fields;
}

json j_symbol(const Symbol * sym)
{
  json j{{"name", std::string(sym->name)}, {"kind", std::string(to_string(sym->kind))}};
  if (sym->definition.is_valid()) {
    j["definition"] = sym->definition.value;
  } else {
    j["definition"] = nullptr;
  }
  return j;
}

json j_symbols(gsl::span<const Symbol *> symbols)
{
  json arr = json::array();
  for (const Symbol * sym : symbols) arr.push_back(j_symbol(sym));
  return arr;
}

json j_any(const AstNode * n);

template <typename T>
json j_list(gsl::span<T *> nodes)
{
  json arr = json::array();
  for (const AstNode * n : nodes) arr.push_back(j_any(n));
  return arr;
}

json j_opt(const AstNode * n) { return n ? j_any(n) : json(nullptr); }

// ============================================================================
// Expressions and arithmetic terms
// ============================================================================

json j_expr(const Expr * e)
{
  if (const auto * v = dyn_cast<ValueExpr>(e)) {
    return j_node(v, {{"value", to_int(v->value)}});
  }
  if (const auto * s = dyn_cast<SymbolRefExpr>(e)) {
    return j_node(s, {{"name", std::string(s->name)}});
  }
  if (const auto * b = dyn_cast<BinaryExpr>(e)) {
    return j_node(b, {{"op", std::string(to_string(b->op))}, {"operands", j_list(b->operands)}});
  }
  if (const auto * m = dyn_cast<MuxExpr>(e)) {
    return j_node(
      m, {{"selector", j_any(m->selector)},
          {"whenTrue", j_any(m->whenTrue)},
          {"whenFalse", j_any(m->whenFalse)}});
  }
  const auto * inst = cast<InstanceExpr>(e);
  return j_node(inst, {{"callee", std::string(inst->callee)}, {"args", j_list(inst->args)}});
}

json j_arith(const Arith * a)
{
  if (const auto * b = dyn_cast<ArithBinaryExpr>(a)) {
    return j_node(b, {{"op", std::string(to_string(b->op))}, {"operands", j_list(b->operands)}});
  }
  if (const auto * n = dyn_cast<ArithNotExpr>(a)) {
    return j_node(n, {{"operand", j_any(n->operand)}});
  }
  if (const auto * t = dyn_cast<ArithTermExpr>(a)) {
    return j_node(t, {{"expr", j_any(t->expr)}});
  }
  return j_node(a, json::object());
}

// ============================================================================
// Statements
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (const auto * r = dyn_cast<RegStmt>(s)) {
    return j_node(
      r, {{"name", std::string(r->name)}, {"init", to_int(r->init)}, {"next", j_any(r->next)}});
  }
  if (const auto * b = dyn_cast<BindStmt>(s)) {
    return j_node(b, {{"name", std::string(b->name)}, {"value", j_any(b->value)}});
  }
  if (const auto * a = dyn_cast<AssertStmt>(s)) {
    return j_node(a, {{"condition", j_any(a->condition)}});
  }
  if (const auto * a = dyn_cast<AssumeStmt>(s)) {
    return j_node(a, {{"condition", j_any(a->condition)}});
  }

  const auto * m = cast<ModuleStmt>(s);
  return j_node(
    m, {{"params", j_symbols(m->params)},
        {"contract", j_opt(m->contract)},
        {"body", j_list(m->body)},
        {"out", j_opt(m->out)},
        {"locals", j_symbols(m->locals)}});
}

// ============================================================================
// Supporting nodes
// ============================================================================

json j_support(const AstNode * n)
{
  switch (n->kind) {
    case NodeKind::PreCond:
      return j_node(n, {{"condition", j_any(cast<PreCondition>(n)->condition)}});
    case NodeKind::PostCond:
      return j_node(n, {{"condition", j_any(cast<PostCondition>(n)->condition)}});
    case NodeKind::Contract: {
      const auto * c = cast<ContractClause>(n);
      return j_node(n, {{"pre", j_any(c->pre)}, {"post", j_any(c->post)}});
    }
    case NodeKind::Out:
      return j_node(n, {{"value", j_any(cast<OutClause>(n)->value)}});
    case NodeKind::Body: {
      const auto * b = cast<ModuleBody>(n);
      return j_node(n, {{"statements", j_list(b->statements)}, {"out", j_opt(b->out)}});
    }
    default:
      return j_node(n, json::object());
  }
}

json j_any(const AstNode * n)
{
  if (!n) return json{{"type", "Missing"}, {"range", j_range({})}};
  if (isa<Circuit>(n)) return to_json(cast<Circuit>(n));
  if (isa<Expr>(n)) return j_expr(cast<Expr>(n));
  if (isa<Arith>(n)) return j_arith(cast<Arith>(n));
  if (isa<Stmt>(n)) return j_stmt(cast<Stmt>(n));
  return j_support(n);
}

}  // namespace

nlohmann::json to_json(const AstNode * node) { return j_any(node); }

nlohmann::json to_json(const Circuit * circuit)
{
  if (!circuit)
    return nlohmann::json{
      {"type", "Circuit"}, {"range", j_range({})}, {"statements", nlohmann::json::array()}};

  return nlohmann::json{
    {"type", "Circuit"},
    {"range", j_range(circuit->get_range())},
    {"statements", j_list(circuit->statements)},
    {"context", j_symbols(circuit->context)},
    {"inputs", j_symbols(circuit->inputs)}};
}

}  // namespace contrtl
