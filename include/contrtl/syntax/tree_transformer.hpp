// contrtl/syntax/tree_transformer.hpp - Parse tree -> AST with symbol resolution
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "contrtl/ast/ast.hpp"
#include "contrtl/ast/ast_context.hpp"
#include "contrtl/basic/diagnostic.hpp"
#include "contrtl/sema/symbol_context.hpp"
#include "contrtl/syntax/parse_tree.hpp"

namespace contrtl
{

/**
 * Bottom-up transformer from a labeled parse tree to a Circuit.
 *
 * Children are transformed before their parent, one handler per production.
 * The first violation is reported to the DiagnosticBag and aborts the pass;
 * transform() then returns nullptr and no partial circuit is exposed.
 *
 * A transformer owns its SymbolContext and runs a single pass.
 */
class TreeTransformer
{
public:
  TreeTransformer(AstContext & ast, DiagnosticBag & diags)
  : ast_(ast), diags_(diags), symbols_(ast)
  {
  }

  TreeTransformer(const TreeTransformer &) = delete;
  TreeTransformer & operator=(const TreeTransformer &) = delete;

  [[nodiscard]] Circuit * transform(const cst::ParseTree & tree);
  [[nodiscard]] Circuit * transform(const cst::ParseNode & root);

  [[nodiscard]] const SymbolContext & symbols() const noexcept { return symbols_; }

private:
  using Node = cst::ParseNode;
  /// Token text, a single node, or a flattened list (stmt_seq, list_of_expr)
  using Item = std::variant<std::string_view, AstNode *, std::vector<AstNode *>>;
  using Items = std::vector<Item>;
  using Result = std::optional<Item>;

  struct ModuleFrame
  {
    DefinitionId slot;
    std::vector<const Symbol *> params;
  };

  // Walk (TreeTransformer.cpp)
  Result walk(const Node & node);
  bool enter(const Node & node);
  [[nodiscard]] static size_t first_walked_child(const Node & node) noexcept;
  Result reduce(const Node & node, Items & children);
  void declare_statements(const Node & container);
  Result build_start(const Node & node, Items & children);

  // Expressions and arithmetic terms (TransformExpr.cpp)
  Result build_bit(const Node & node, Bit value);
  Result build_identifier(const Node & node, Items & children);
  Result build_binary(const Node & node, BinaryOp op, Items & children);
  Result build_mux(const Node & node, Items & children);
  Result build_call(const Node & node, Items & children);
  Result build_list_of_expr(const Node & node, Items & children);
  Result build_arith_binary(const Node & node, ArithOp op, Items & children);
  Result build_arith_not(const Node & node, Items & children);
  Result build_result(const Node & node);
  Result pass_through(const Node & node, Items & children);

  // Statements (TransformStmt.cpp)
  Result build_reg(const Node & node, Items & children);
  Result build_bind(const Node & node, Items & children);
  Result build_assert(const Node & node, Items & children);
  Result build_assume(const Node & node, Items & children);
  Result build_stmt_seq(const Node & node, Items & children);
  Result build_ano_module(const Node & node, Items & children);
  bool check_instance(InstanceExpr & inst, const Symbol & callee);
  bool resolve_pending_calls(const Symbol & sym);

  // Modules and clauses (TransformSupport.cpp)
  bool enter_module(const Node & node);
  Result build_module(const Node & node, Items & children);
  Result build_contract(const Node & node, Items & children);
  Result build_precond(const Node & node, Items & children);
  Result build_postcond(const Node & node, Items & children);
  Result build_body(const Node & node, Items & children);
  Result build_out(const Node & node, Items & children);
  bool collect_body(
    const Node & node, Items & children, size_t begin, std::vector<Stmt *> & statements,
    OutClause *& out);

  // Item helpers
  [[nodiscard]] static AstNode * node_of(const Item & item) noexcept;
  [[nodiscard]] static Expr * as_expr(const Item & item) noexcept;
  [[nodiscard]] static Expr * expr_like(const Item & item) noexcept;
  [[nodiscard]] Arith * as_arith(const Item & item);
  [[nodiscard]] static std::optional<std::string_view> identifier_text(const Node * node);
  bool append_statements(const Node & node, const Item & item, std::vector<Stmt *> & out);

  // Diagnostics
  std::nullopt_t malformed(const Node & node, std::string message);
  std::nullopt_t missing_output(const Node & node, std::string_view what);
  void report_duplicate(SourceRange range, std::string_view name, const Symbol & previous);
  void report_unknown_module(const InstanceExpr & inst, const Symbol * sym);

  AstContext & ast_;
  DiagnosticBag & diags_;
  SymbolContext symbols_;
  std::vector<ModuleFrame> modules_;
  /// Calls whose callee was declared but not yet defined
  std::unordered_map<const Symbol *, std::vector<InstanceExpr *>> pendingCalls_;
  bool inPostcond_ = false;
};

}  // namespace contrtl
