// contrtl/ast/ast.hpp - AST node class definitions for contRTL
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
// Grammar summary:
//   Value v       ::= 0 | 1
//   Expression e  ::= e xor e | e and e | e or e | mux e e e | v | r | x | x(e, ...)
//   Arithmetic a  ::= a impl a | a + a | a - a | a eq a | a xor a | a and a | a or a
//                   | not a | res | e
//   Module m      ::= mod(x, ...)[req a; ens a]{b} | mod(x, ...){b}
//   Statement s   ::= r -> v, e | x = e | x = m | assert a | assume a | m
//   Body b        ::= [s]* ; out e
//   Circuit c     ::= [s]*
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "contrtl/ast/ast_enums.hpp"
#include "contrtl/basic/casting.hpp"
#include "contrtl/basic/source_manager.hpp"
#include "contrtl/sema/symbol.hpp"

namespace contrtl
{

class ModuleStmt;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Synthesizable expression.
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Arithmetic term of the assertion language.
class Arith : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_arith_kind(node->kind); }

protected:
  explicit Arith(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Bit literal.
class ValueExpr : public NodeBase<ValueExpr, Expr, NodeKind::Value>
{
public:
  Bit value;

  explicit ValueExpr(Bit v, SourceRange r = {}) : NodeBase(r), value(v) {}

  [[nodiscard]] int to_int() const noexcept { return contrtl::to_int(value); }
};

/// Reference to a register, binding, parameter or free input.
class SymbolRefExpr : public NodeBase<SymbolRefExpr, Expr, NodeKind::SymbolRef>
{
public:
  std::string_view name;
  const Symbol * symbol;

  SymbolRefExpr(std::string_view n, const Symbol * s, SourceRange r = {})
  : NodeBase(r), name(n), symbol(s)
  {
  }
};

/// xor/and/or over synthesizable operands. `operands` holds {lhs, rhs}.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  BinaryOp op;
  gsl::span<Expr *> operands;
  Expr * lhs;
  Expr * rhs;

  BinaryExpr(BinaryOp o, gsl::span<Expr *> ops, SourceRange r = {})
  : NodeBase(r), op(o), operands(ops), lhs(ops[0]), rhs(ops[1])
  {
  }
};

/// mux selector whenTrue whenFalse. `operands` holds all three.
class MuxExpr : public NodeBase<MuxExpr, Expr, NodeKind::Mux>
{
public:
  gsl::span<Expr *> operands;
  Expr * selector;
  Expr * whenTrue;
  Expr * whenFalse;

  explicit MuxExpr(gsl::span<Expr *> ops, SourceRange r = {})
  : NodeBase(r), operands(ops), selector(ops[0]), whenTrue(ops[1]), whenFalse(ops[2])
  {
  }
};

/// Module instantiation: callee(arg, ...).
class InstanceExpr : public NodeBase<InstanceExpr, Expr, NodeKind::Instance>
{
public:
  std::string_view callee;
  const Symbol * calleeSymbol;
  gsl::span<Expr *> args;

  /// Resolved module (set once the callee is known to be bound)
  const ModuleStmt * module = nullptr;

  InstanceExpr(
    std::string_view c, const Symbol * sym, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), callee(c), calleeSymbol(sym), args(a)
  {
  }
};

// ============================================================================
// Arithmetic Nodes
// ============================================================================

/// impl, +, -, eq, xor, and, or over arithmetic operands.
class ArithBinaryExpr : public NodeBase<ArithBinaryExpr, Arith, NodeKind::ArithBinary>
{
public:
  ArithOp op;
  gsl::span<Arith *> operands;
  Arith * lhs;
  Arith * rhs;

  ArithBinaryExpr(ArithOp o, gsl::span<Arith *> ops, SourceRange r = {})
  : NodeBase(r), op(o), operands(ops), lhs(ops[0]), rhs(ops[1])
  {
  }
};

/// Logical negation; denotes xor(operand, 1).
class ArithNotExpr : public NodeBase<ArithNotExpr, Arith, NodeKind::ArithNot>
{
public:
  Arith * operand;

  explicit ArithNotExpr(Arith * o, SourceRange r = {}) : NodeBase(r), operand(o) {}
};

/// `res`: the enclosing module's output, valid only in a post-condition.
class ResultExpr : public NodeBase<ResultExpr, Arith, NodeKind::Result>
{
public:
  explicit ResultExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// A synthesizable expression used as an arithmetic term.
class ArithTermExpr : public NodeBase<ArithTermExpr, Arith, NodeKind::ArithTerm>
{
public:
  Expr * expr;

  explicit ArithTermExpr(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class PreCondition : public NodeBase<PreCondition, AstNode, NodeKind::PreCond>
{
public:
  Arith * condition;

  explicit PreCondition(Arith * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class PostCondition : public NodeBase<PostCondition, AstNode, NodeKind::PostCond>
{
public:
  Arith * condition;

  explicit PostCondition(Arith * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

/// [req pre; ens post]
class ContractClause : public NodeBase<ContractClause, AstNode, NodeKind::Contract>
{
public:
  PreCondition * pre;
  PostCondition * post;

  ContractClause(PreCondition * p, PostCondition * q, SourceRange r = {})
  : NodeBase(r), pre(p), post(q)
  {
  }
};

class OutClause : public NodeBase<OutClause, AstNode, NodeKind::Out>
{
public:
  Expr * value;

  explicit OutClause(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Statements of a module followed by its optional output.
class ModuleBody : public NodeBase<ModuleBody, AstNode, NodeKind::Body>
{
public:
  gsl::span<Stmt *> statements;
  OutClause * out;

  ModuleBody(gsl::span<Stmt *> s, OutClause * o, SourceRange r = {})
  : NodeBase(r), statements(s), out(o)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// r -> init, next
class RegStmt : public NodeBase<RegStmt, Stmt, NodeKind::Reg>
{
public:
  std::string_view name;
  const Symbol * symbol;
  Bit init;
  Expr * next;

  RegStmt(std::string_view n, const Symbol * s, Bit i, Expr * e, SourceRange r = {})
  : NodeBase(r), name(n), symbol(s), init(i), next(e)
  {
  }
};

/// x = e | x = mod(...)
class BindStmt : public NodeBase<BindStmt, Stmt, NodeKind::Bind>
{
public:
  std::string_view name;
  const Symbol * symbol;
  AstNode * value;  ///< Expr or ModuleStmt

  BindStmt(std::string_view n, const Symbol * s, AstNode * v, SourceRange r = {})
  : NodeBase(r), name(n), symbol(s), value(v)
  {
  }

  [[nodiscard]] const Expr * value_expr() const noexcept;
  [[nodiscard]] const ModuleStmt * value_module() const noexcept;
};

class AssertStmt : public NodeBase<AssertStmt, Stmt, NodeKind::Assert>
{
public:
  Arith * condition;

  explicit AssertStmt(Arith * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class AssumeStmt : public NodeBase<AssumeStmt, Stmt, NodeKind::Assume>
{
public:
  Arith * condition;

  explicit AssumeStmt(Arith * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

/**
 * mod(params)[req a; ens a]{body; out e}
 *
 * `out` is null only for anonymous top-level modules. `locals` lists the
 * names defined in the body, in definition order.
 */
class ModuleStmt : public NodeBase<ModuleStmt, Stmt, NodeKind::Module>
{
public:
  gsl::span<const Symbol *> params;
  ContractClause * contract;
  gsl::span<Stmt *> body;
  OutClause * out;
  gsl::span<const Symbol *> locals;

  ModuleStmt(
    gsl::span<const Symbol *> p, ContractClause * c, gsl::span<Stmt *> b, OutClause * o,
    SourceRange r = {})
  : NodeBase(r), params(p), contract(c), body(b), out(o)
  {
  }

  [[nodiscard]] size_t arity() const noexcept { return params.size(); }
  [[nodiscard]] bool has_contract() const noexcept { return contract != nullptr; }
};

// ============================================================================
// Top-level
// ============================================================================

/**
 * Root artifact of a transform pass.
 *
 * - `statements`: top-level statements in textual order
 * - `context`: top-level names in definition order (unique)
 * - `inputs`: free names, in first-use order
 * - `definitions`: table indexed by Symbol::definition
 */
class Circuit : public NodeBase<Circuit, AstNode, NodeKind::Circuit>
{
public:
  gsl::span<Stmt *> statements;
  gsl::span<const Symbol *> context;
  gsl::span<const Symbol *> inputs;
  gsl::span<const Stmt *> definitions;

  explicit Circuit(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}

  /// Statement that defines `sym` (the owning module for parameters).
  [[nodiscard]] const Stmt * definition_of(const Symbol & sym) const noexcept
  {
    if (!sym.definition.is_valid() || sym.definition.value >= definitions.size()) {
      return nullptr;
    }
    return definitions[sym.definition.value];
  }

  /// Top-level symbol named `name`, or nullptr.
  [[nodiscard]] const Symbol * find(std::string_view name) const noexcept
  {
    for (const Symbol * sym : context) {
      if (sym->name == name) return sym;
    }
    return nullptr;
  }
};

// ============================================================================
// Helper Functions
// ============================================================================

inline const Expr * BindStmt::value_expr() const noexcept { return dyn_cast<Expr>(value); }

inline const ModuleStmt * BindStmt::value_module() const noexcept
{
  return dyn_cast<ModuleStmt>(value);
}

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace contrtl
