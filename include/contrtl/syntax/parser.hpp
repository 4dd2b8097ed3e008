// contrtl/syntax/parser.hpp - Recursive-descent parser producing a cst::ParseTree
#pragma once

#include <string_view>
#include <vector>

#include "contrtl/basic/diagnostic.hpp"
#include "contrtl/syntax/parse_tree.hpp"
#include "contrtl/syntax/token.hpp"

namespace contrtl::syntax
{

/**
 * Reference grammar for contRTL.
 *
 * Builds the labeled tree consumed by the tree transformer; it performs no
 * name resolution. Parsing stops at the first syntax error, which is
 * reported to the DiagnosticBag, and parse_circuit() then returns nullptr.
 */
class Parser
{
public:
  Parser(cst::ParseTree & tree, DiagnosticBag & diags, std::vector<Token> tokens);

  [[nodiscard]] cst::ParseNode * parse_circuit();

private:
  using Node = cst::ParseNode;

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);
  bool expect_kw(std::string_view kw);

  void error_at(const Token & t, std::string_view msg);
  void invalid_literal(const Token & t);

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] bool at_plain_identifier(size_t lookahead = 0) const;
  [[nodiscard]] bool at_statement_start() const;

  Node * make(std::string_view label, const Token & from);
  Node * wrap(std::string_view label, Node * a, Node * b);

  // Statements
  [[nodiscard]] Node * parse_stmt();
  [[nodiscard]] Node * parse_reg();
  [[nodiscard]] Node * parse_bind();
  [[nodiscard]] Node * parse_verification(std::string_view label);

  // Modules
  [[nodiscard]] Node * parse_module();
  [[nodiscard]] Node * parse_params();
  [[nodiscard]] Node * parse_contract();
  [[nodiscard]] Node * parse_body();

  // Leaves
  [[nodiscard]] Node * parse_identifier();
  [[nodiscard]] Node * parse_bit();

  // Synthesizable expressions
  [[nodiscard]] Node * parse_expr();
  [[nodiscard]] Node * parse_expr_xor();
  [[nodiscard]] Node * parse_expr_and();
  [[nodiscard]] Node * parse_expr_primary();
  [[nodiscard]] Node * parse_call();

  // Arithmetic terms
  [[nodiscard]] Node * parse_arith();
  [[nodiscard]] Node * parse_arith_or();
  [[nodiscard]] Node * parse_arith_xor();
  [[nodiscard]] Node * parse_arith_and();
  [[nodiscard]] Node * parse_arith_eq();
  [[nodiscard]] Node * parse_arith_additive();
  [[nodiscard]] Node * parse_arith_unary();
  [[nodiscard]] Node * parse_arith_primary();

  cst::ParseTree & tree_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  bool failed_ = false;
};

}  // namespace contrtl::syntax
