// contrtl/ast/serializer.cpp - Canonical surface syntax for AST nodes
#include "contrtl/ast/serializer.hpp"

#include <string_view>

#include "contrtl/ast/visitor.hpp"

namespace contrtl
{

namespace
{

class Serializer : public ConstAstVisitor<Serializer, void>
{
public:
  explicit Serializer(std::string & out) : out_(out) {}

  // Expressions
  void visit_value_expr(const ValueExpr * node) { out_ += to_string(node->value); }

  void visit_symbol_ref_expr(const SymbolRefExpr * node) { out_ += node->name; }

  void visit_binary_expr(const BinaryExpr * node)
  {
    out_ += to_string(node->op);
    for (const Expr * operand : node->operands) {
      out_ += ' ';
      visit(operand);
    }
  }

  void visit_mux_expr(const MuxExpr * node)
  {
    out_ += "mux";
    for (const Expr * operand : node->operands) {
      out_ += ' ';
      visit(operand);
    }
  }

  void visit_instance_expr(const InstanceExpr * node)
  {
    out_ += node->callee;
    out_ += '(';
    join(node->args, ", ");
    out_ += ')';
  }

  // Arithmetic terms
  void visit_arith_binary_expr(const ArithBinaryExpr * node)
  {
    if (is_prefix_op(node->op)) {
      out_ += to_string(node->op);
      for (const Arith * operand : node->operands) {
        out_ += ' ';
        visit(operand);
      }
      return;
    }

    out_ += '(';
    visit(node->lhs);
    out_ += ' ';
    out_ += to_string(node->op);
    out_ += ' ';
    visit(node->rhs);
    out_ += ')';
  }

  void visit_arith_not_expr(const ArithNotExpr * node)
  {
    out_ += "not ";
    visit(node->operand);
  }

  void visit_result_expr(const ResultExpr * /*node*/) { out_ += "res"; }

  void visit_arith_term_expr(const ArithTermExpr * node) { visit(node->expr); }

  // Statements
  void visit_reg_stmt(const RegStmt * node)
  {
    out_ += node->name;
    out_ += " -> ";
    out_ += to_string(node->init);
    out_ += ", ";
    visit(node->next);
  }

  void visit_bind_stmt(const BindStmt * node)
  {
    out_ += node->name;
    out_ += " = ";
    visit(node->value);
  }

  void visit_assert_stmt(const AssertStmt * node)
  {
    out_ += "assert ";
    visit(node->condition);
  }

  void visit_assume_stmt(const AssumeStmt * node)
  {
    out_ += "assume ";
    visit(node->condition);
  }

  void visit_module_stmt(const ModuleStmt * node)
  {
    out_ += "mod(";
    bool first = true;
    for (const Symbol * param : node->params) {
      if (!first) out_ += ", ";
      first = false;
      out_ += param->name;
    }
    out_ += ')';

    if (node->contract) {
      out_ += ' ';
      visit(node->contract);
    }

    out_ += " { ";
    for (const Stmt * stmt : node->body) {
      visit(stmt);
      out_ += "; ";
    }
    if (node->out) {
      visit(node->out);
      out_ += ' ';
    }
    out_ += '}';
  }

  // Supporting nodes
  void visit_pre_condition(const PreCondition * node)
  {
    out_ += "req ";
    visit(node->condition);
  }

  void visit_post_condition(const PostCondition * node)
  {
    out_ += "ens ";
    visit(node->condition);
  }

  void visit_contract_clause(const ContractClause * node)
  {
    out_ += '[';
    visit(node->pre);
    out_ += "; ";
    visit(node->post);
    out_ += ']';
  }

  void visit_out_clause(const OutClause * node)
  {
    out_ += "out ";
    visit(node->value);
  }

  void visit_module_body(const ModuleBody * node)
  {
    for (const Stmt * stmt : node->statements) {
      visit(stmt);
      out_ += "; ";
    }
    if (node->out) {
      visit(node->out);
    }
  }

  void visit_circuit(const Circuit * node)
  {
    for (const Stmt * stmt : node->statements) {
      visit(stmt);
      out_ += '\n';
    }
  }

private:
  template <typename Span>
  void join(const Span & nodes, std::string_view sep)
  {
    bool first = true;
    for (const AstNode * node : nodes) {
      if (!first) out_ += sep;
      first = false;
      visit(node);
    }
  }

  std::string & out_;
};

}  // namespace

std::string serialize(const AstNode * node)
{
  std::string out;
  Serializer serializer(out);
  serializer.visit(node);
  return out;
}

}  // namespace contrtl
