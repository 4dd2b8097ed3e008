// contrtl/syntax/parser.cpp - Recursive-descent parser producing a cst::ParseTree
#include "contrtl/syntax/parser.hpp"

#include <string>
#include <utility>

#include "contrtl/syntax/productions.hpp"

namespace contrtl::syntax
{

namespace prod = production;

namespace
{

std::string describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return "end of input";
  }
  return "`" + std::string(t.text) + "`";
}

}  // namespace

Parser::Parser(cst::ParseTree & tree, DiagnosticBag & diags, std::vector<Token> tokens)
: tree_(tree), diags_(diags)
{
  tokens_.reserve(tokens.size());
  for (Token & t : tokens) {
    if (t.kind == TokenKind::LineComment || t.kind == TokenKind::BlockComment) {
      continue;
    }
    tokens_.push_back(t);
  }
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    const uint32_t at = tokens_.empty() ? 0 : tokens_.back().end();
    tokens_.push_back({TokenKind::Eof, SourceRange(at, at), {}});
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::at_kw(std::string_view kw, size_t lookahead) const
{
  return is_kw(kw, cur(lookahead));
}

bool Parser::at_plain_identifier(size_t lookahead) const
{
  const Token & t = cur(lookahead);
  return t.kind == TokenKind::Identifier && !is_keyword(t.text);
}

bool Parser::at_statement_start() const
{
  if (at_plain_identifier()) {
    const TokenKind next = cur(1).kind;
    return next == TokenKind::Arrow || next == TokenKind::Eq;
  }
  return at_kw("assert") || at_kw("assume") || at_kw("mod");
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), "expected " + std::string(what) + ", found " + describe(cur()));
  return false;
}

bool Parser::expect_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  error_at(cur(), "expected `" + std::string(kw) + "`, found " + describe(cur()));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  // Only the first syntax error is reported; everything after it is noise.
  if (failed_) return;
  failed_ = true;
  diags_.report(DiagCode::SyntaxError, t.range, std::string(msg));
}

void Parser::invalid_literal(const Token & t)
{
  if (failed_) return;
  failed_ = true;
  diags_
    .report(DiagCode::InvalidLiteral, t.range, "invalid bit literal " + describe(t), "not a bit")
    .with_help("bit literals are `0` or `1`");
}

cst::ParseNode * Parser::make(std::string_view label, const Token & from)
{
  return tree_.make_node(label, from.range);
}

cst::ParseNode * Parser::wrap(std::string_view label, Node * a, Node * b)
{
  Node * node = tree_.make_node(label);
  tree_.add_child(node, a);
  tree_.add_child(node, b);
  return node;
}

// ============================================================================
// Top level
// ============================================================================

cst::ParseNode * Parser::parse_circuit()
{
  Node * root = tree_.make_node(prod::k_start);
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    Node * stmt = parse_stmt();
    if (!stmt) {
      return nullptr;
    }
    tree_.add_child(root, stmt);
  }
  if (failed_) {
    return nullptr;
  }
  tree_.set_root(root);
  return root;
}

// ============================================================================
// Statements
// ============================================================================

cst::ParseNode * Parser::parse_stmt()
{
  if (at_plain_identifier()) {
    if (cur(1).kind == TokenKind::Arrow) return parse_reg();
    if (cur(1).kind == TokenKind::Eq) return parse_bind();
  }
  if (at_kw("assert")) return parse_verification(prod::k_stmt_assert);
  if (at_kw("assume")) return parse_verification(prod::k_stmt_assume);
  if (at_kw("mod")) {
    Node * module = parse_module();
    if (!module) return nullptr;
    Node * node = tree_.make_node(prod::k_ano_module);
    tree_.add_child(node, module);
    return node;
  }

  error_at(cur(), "expected statement, found " + describe(cur()));
  return nullptr;
}

cst::ParseNode * Parser::parse_reg()
{
  Node * name = parse_identifier();
  if (!name || !expect(TokenKind::Arrow, "`->`")) return nullptr;
  Node * init = parse_bit();
  if (!init || !expect(TokenKind::Comma, "`,`")) return nullptr;
  Node * next = parse_expr();
  if (!next) return nullptr;

  Node * node = tree_.make_node(prod::k_reg);
  tree_.add_child(node, name);
  tree_.add_child(node, init);
  tree_.add_child(node, next);
  return node;
}

cst::ParseNode * Parser::parse_bind()
{
  Node * name = parse_identifier();
  if (!name || !expect(TokenKind::Eq, "`=`")) return nullptr;
  Node * value = at_kw("mod") ? parse_module() : parse_expr();
  if (!value) return nullptr;
  return wrap(prod::k_bind, name, value);
}

cst::ParseNode * Parser::parse_verification(std::string_view label)
{
  Node * node = make(label, advance());
  Node * cond = parse_arith();
  if (!cond) return nullptr;
  tree_.add_child(node, cond);
  return node;
}

// ============================================================================
// Modules
// ============================================================================

cst::ParseNode * Parser::parse_module()
{
  Node * node = make(prod::k_module, advance());  // mod

  Node * params = parse_params();
  if (!params) return nullptr;
  tree_.add_child(node, params);

  if (at(TokenKind::LBracket)) {
    Node * contract = parse_contract();
    if (!contract) return nullptr;
    tree_.add_child(node, contract);
  }

  if (!expect(TokenKind::LBrace, "`{`")) return nullptr;
  Node * body = parse_body();
  if (!body) return nullptr;
  tree_.add_child(node, body);

  const SourceRange close = cur().range;
  if (!expect(TokenKind::RBrace, "`}`")) return nullptr;
  tree_.extend(node, close);
  return node;
}

cst::ParseNode * Parser::parse_params()
{
  Node * list = make(prod::k_list_of_variables, cur());
  if (!expect(TokenKind::LParen, "`(`")) return nullptr;
  if (!at(TokenKind::RParen)) {
    do {
      Node * param = parse_identifier();
      if (!param) return nullptr;
      tree_.add_child(list, param);
    } while (match(TokenKind::Comma));
  }
  const SourceRange close = cur().range;
  if (!expect(TokenKind::RParen, "`)`")) return nullptr;
  tree_.extend(list, close);
  return list;
}

cst::ParseNode * Parser::parse_contract()
{
  Node * contract = make(prod::k_contract, advance());  // [

  Node * pre = make(prod::k_precond, cur());
  if (!expect_kw("req")) return nullptr;
  Node * pre_cond = parse_arith();
  if (!pre_cond) return nullptr;
  tree_.add_child(pre, pre_cond);

  if (!expect(TokenKind::Semicolon, "`;`")) return nullptr;

  Node * post = make(prod::k_postcond, cur());
  if (!expect_kw("ens")) return nullptr;
  Node * post_cond = parse_arith();
  if (!post_cond) return nullptr;
  tree_.add_child(post, post_cond);

  const SourceRange close = cur().range;
  if (!expect(TokenKind::RBracket, "`]`")) return nullptr;

  tree_.add_child(contract, pre);
  tree_.add_child(contract, post);
  tree_.extend(contract, close);
  return contract;
}

cst::ParseNode * Parser::parse_body()
{
  Node * body = tree_.make_node(prod::k_body);
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }

    if (at_statement_start()) {
      Node * stmt = parse_stmt();
      if (!stmt) return nullptr;
      tree_.add_child(body, stmt);
      continue;
    }

    // Output clause: `out e` or a bare trailing expression.
    Node * out = make(prod::k_out, cur());
    if (at_kw("out")) {
      advance();
    }
    Node * value = parse_expr();
    if (!value) return nullptr;
    tree_.add_child(out, value);
    tree_.add_child(body, out);
    match(TokenKind::Semicolon);
    break;
  }
  return body;
}

// ============================================================================
// Leaves
// ============================================================================

cst::ParseNode * Parser::parse_identifier()
{
  if (at_plain_identifier()) {
    const Token & t = advance();
    return tree_.make_identifier(t.text, t.range);
  }
  if (at(TokenKind::Identifier)) {
    error_at(cur(), "expected identifier, found keyword " + describe(cur()));
    return nullptr;
  }
  error_at(cur(), "expected identifier, found " + describe(cur()));
  return nullptr;
}

cst::ParseNode * Parser::parse_bit()
{
  if (!at(TokenKind::Number)) {
    error_at(cur(), "expected `0` or `1`, found " + describe(cur()));
    return nullptr;
  }
  const Token & t = advance();
  if (t.text == "0") return tree_.make_bit(false, t.range);
  if (t.text == "1") return tree_.make_bit(true, t.range);
  invalid_literal(t);
  return nullptr;
}

// ============================================================================
// Synthesizable expressions
// ============================================================================

cst::ParseNode * Parser::parse_expr()
{
  Node * lhs = parse_expr_xor();
  while (lhs && at_kw("or")) {
    advance();
    Node * rhs = parse_expr_xor();
    if (!rhs) return nullptr;
    lhs = wrap(prod::k_expr_or, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_expr_xor()
{
  Node * lhs = parse_expr_and();
  while (lhs && at_kw("xor")) {
    advance();
    Node * rhs = parse_expr_and();
    if (!rhs) return nullptr;
    lhs = wrap(prod::k_expr_xor, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_expr_and()
{
  Node * lhs = parse_expr_primary();
  while (lhs && at_kw("and")) {
    advance();
    Node * rhs = parse_expr_primary();
    if (!rhs) return nullptr;
    lhs = wrap(prod::k_expr_and, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_expr_primary()
{
  if (at(TokenKind::Number)) {
    return parse_bit();
  }

  if (at(TokenKind::LParen)) {
    Node * node = make(prod::k_scoped_expr, advance());
    Node * inner = parse_expr();
    if (!inner) return nullptr;
    tree_.add_child(node, inner);
    const SourceRange close = cur().range;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    tree_.extend(node, close);
    return node;
  }

  if (at_kw("mux")) {
    Node * node = make(prod::k_mux, advance());
    for (int i = 0; i < 3; ++i) {
      Node * operand = parse_expr_primary();
      if (!operand) return nullptr;
      tree_.add_child(node, operand);
    }
    return node;
  }

  // Prefix spelling: xor a b
  std::string_view prefix_label;
  if (at_kw("xor")) prefix_label = prod::k_expr_xor;
  if (at_kw("and")) prefix_label = prod::k_expr_and;
  if (at_kw("or")) prefix_label = prod::k_expr_or;
  if (!prefix_label.empty()) {
    Node * node = make(prefix_label, advance());
    for (int i = 0; i < 2; ++i) {
      Node * operand = parse_expr_primary();
      if (!operand) return nullptr;
      tree_.add_child(node, operand);
    }
    return node;
  }

  if (at_plain_identifier()) {
    // `f(x)` is a call; `f (x)` is an identifier followed by another operand.
    if (cur(1).kind == TokenKind::LParen && cur(1).begin() == cur().end()) {
      return parse_call();
    }
    return parse_identifier();
  }

  error_at(cur(), "expected expression, found " + describe(cur()));
  return nullptr;
}

cst::ParseNode * Parser::parse_call()
{
  Node * callee = parse_identifier();
  if (!callee) return nullptr;

  Node * args = make(prod::k_list_of_expr, cur());
  if (!expect(TokenKind::LParen, "`(`")) return nullptr;
  if (!at(TokenKind::RParen)) {
    do {
      Node * arg = parse_expr();
      if (!arg) return nullptr;
      tree_.add_child(args, arg);
    } while (match(TokenKind::Comma));
  }
  const SourceRange close = cur().range;
  if (!expect(TokenKind::RParen, "`)`")) return nullptr;
  tree_.extend(args, close);

  return wrap(prod::k_call, callee, args);
}

// ============================================================================
// Arithmetic terms
// ============================================================================

cst::ParseNode * Parser::parse_arith()
{
  Node * lhs = parse_arith_or();
  if (lhs && at_kw("impl")) {
    advance();
    Node * rhs = parse_arith();  // right-associative
    if (!rhs) return nullptr;
    return wrap(prod::k_impl, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_arith_or()
{
  Node * lhs = parse_arith_xor();
  while (lhs && at_kw("or")) {
    advance();
    Node * rhs = parse_arith_xor();
    if (!rhs) return nullptr;
    lhs = wrap(prod::k_arith_or, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_arith_xor()
{
  Node * lhs = parse_arith_and();
  while (lhs && at_kw("xor")) {
    advance();
    Node * rhs = parse_arith_and();
    if (!rhs) return nullptr;
    lhs = wrap(prod::k_arith_xor, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_arith_and()
{
  Node * lhs = parse_arith_eq();
  while (lhs && at_kw("and")) {
    advance();
    Node * rhs = parse_arith_eq();
    if (!rhs) return nullptr;
    lhs = wrap(prod::k_arith_and, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_arith_eq()
{
  Node * lhs = parse_arith_additive();
  while (lhs && at_kw("eq")) {
    advance();
    Node * rhs = parse_arith_additive();
    if (!rhs) return nullptr;
    lhs = wrap(prod::k_eq, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_arith_additive()
{
  Node * lhs = parse_arith_unary();
  while (lhs && (at(TokenKind::Plus) || at(TokenKind::Minus))) {
    const std::string_view label = at(TokenKind::Plus) ? prod::k_add : prod::k_sub;
    advance();
    Node * rhs = parse_arith_unary();
    if (!rhs) return nullptr;
    lhs = wrap(label, lhs, rhs);
  }
  return lhs;
}

cst::ParseNode * Parser::parse_arith_unary()
{
  if (at_kw("not")) {
    Node * node = make(prod::k_arith_not, advance());
    Node * operand = parse_arith_unary();
    if (!operand) return nullptr;
    tree_.add_child(node, operand);
    return node;
  }
  return parse_arith_primary();
}

cst::ParseNode * Parser::parse_arith_primary()
{
  if (at(TokenKind::LParen)) {
    Node * node = make(prod::k_scoped_arith, advance());
    Node * inner = parse_arith();
    if (!inner) return nullptr;
    tree_.add_child(node, inner);
    const SourceRange close = cur().range;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    tree_.extend(node, close);
    return node;
  }

  if (at_kw("res")) {
    return make(prod::k_res, advance());
  }

  std::string_view prefix_label;
  if (at_kw("xor")) prefix_label = prod::k_arith_xor;
  if (at_kw("and")) prefix_label = prod::k_arith_and;
  if (at_kw("or")) prefix_label = prod::k_arith_or;
  if (!prefix_label.empty()) {
    Node * node = make(prefix_label, advance());
    for (int i = 0; i < 2; ++i) {
      Node * operand = parse_arith_unary();
      if (!operand) return nullptr;
      tree_.add_child(node, operand);
    }
    return node;
  }

  return parse_expr_primary();
}

}  // namespace contrtl::syntax
