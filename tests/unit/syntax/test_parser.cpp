// tests/unit/syntax/test_parser.cpp - Grammar -> cst::ParseTree shape
#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "contrtl/basic/diagnostic.hpp"
#include "contrtl/syntax/frontend.hpp"
#include "contrtl/syntax/parse_tree.hpp"

using namespace contrtl;

namespace
{

struct Parsed
{
  cst::ParseTree tree;
  DiagnosticBag diags;
  const cst::ParseNode * root = nullptr;
};

std::string sexpr(std::string_view src)
{
  Parsed p;
  p.root = parse_tree(src, p.tree, p.diags);
  EXPECT_TRUE(p.diags.empty()) << "unexpected diagnostics for: " << src;
  return cst::to_sexpr(p.root);
}

std::string error_code_of(std::string_view src)
{
  Parsed p;
  p.root = parse_tree(src, p.tree, p.diags);
  EXPECT_EQ(p.root, nullptr);
  EXPECT_EQ(p.diags.size(), 1U);
  return p.diags.empty() ? std::string() : p.diags.all().front().code;
}

}  // namespace

TEST(SyntaxParser, RegisterStatement)
{
  EXPECT_EQ(
    sexpr("c -> 0, a and b"),
    "(start (reg (identifier \"c\") (zero \"0\") (expr_and (identifier \"a\") (identifier "
    "\"b\"))))");
}

TEST(SyntaxParser, InfixPrecedenceOrXorAnd)
{
  EXPECT_EQ(
    sexpr("x = a or b xor c and d"),
    "(start (bind (identifier \"x\") (expr_or (identifier \"a\") (expr_xor (identifier \"b\") "
    "(expr_and (identifier \"c\") (identifier \"d\"))))))");
}

TEST(SyntaxParser, PrefixOperatorsTakePrimaries)
{
  EXPECT_EQ(
    sexpr("x = xor a and b c"),
    "(start (bind (identifier \"x\") (expr_xor (identifier \"a\") (expr_and (identifier \"b\") "
    "(identifier \"c\")))))");
}

TEST(SyntaxParser, MuxAndScopedExpression)
{
  EXPECT_EQ(
    sexpr("x = mux s (a or b) 1"),
    "(start (bind (identifier \"x\") (mux (identifier \"s\") (scoped_expr (expr_or (identifier "
    "\"a\") (identifier \"b\"))) (one \"1\"))))");
}

TEST(SyntaxParser, SpacedParenthesisIsAnOperand)
{
  EXPECT_EQ(
    sexpr("x = mux a (b) c"),
    "(start (bind (identifier \"x\") (mux (identifier \"a\") (scoped_expr (identifier \"b\")) "
    "(identifier \"c\"))))");
  EXPECT_EQ(
    sexpr("y = f(a)"),
    "(start (bind (identifier \"y\") (call (identifier \"f\") (list_of_expr (identifier "
    "\"a\")))))");
}

TEST(SyntaxParser, CallWithArguments)
{
  EXPECT_EQ(
    sexpr("y = f(0, a)"),
    "(start (bind (identifier \"y\") (call (identifier \"f\") (list_of_expr (zero \"0\") "
    "(identifier \"a\")))))");
}

TEST(SyntaxParser, ImplIsRightAssociative)
{
  EXPECT_EQ(
    sexpr("assert a impl b impl c"),
    "(start (stmt_assert (impl (identifier \"a\") (impl (identifier \"b\") (identifier "
    "\"c\")))))");
}

TEST(SyntaxParser, ArithmeticLevels)
{
  EXPECT_EQ(
    sexpr("assume not a eq b + c"),
    "(start (stmt_assume (eq (arith_not (identifier \"a\")) (add (identifier \"b\") (identifier "
    "\"c\")))))");
}

TEST(SyntaxParser, ModuleWithBareOutput)
{
  EXPECT_EQ(
    sexpr("f = mod(a, b) { a xor b }"),
    "(start (bind (identifier \"f\") (module (list_of_variables (identifier \"a\") (identifier "
    "\"b\")) (body (out (expr_xor (identifier \"a\") (identifier \"b\")))))))");
}

TEST(SyntaxParser, ModuleWithContractAndStatements)
{
  EXPECT_EQ(
    sexpr("f = mod(a) [req a; ens res] { t = a; out t }"),
    "(start (bind (identifier \"f\") (module (list_of_variables (identifier \"a\")) (contract "
    "(precond (identifier \"a\")) (postcond (res))) (body (bind (identifier \"t\") (identifier "
    "\"a\")) (out (identifier \"t\"))))))");
}

TEST(SyntaxParser, AnonymousModuleWithoutOutput)
{
  EXPECT_EQ(
    sexpr("mod() { r -> 1, r }"),
    "(start (ano_module (module (list_of_variables) (body (reg (identifier \"r\") (one \"1\") "
    "(identifier \"r\"))))))");
}

TEST(SyntaxParser, SemicolonsAndCommentsAreOptional)
{
  EXPECT_EQ(
    sexpr("// registers\nA -> 0, A ;; /* next */ B -> 1, B"),
    "(start (reg (identifier \"A\") (zero \"0\") (identifier \"A\")) (reg (identifier \"B\") "
    "(one \"1\") (identifier \"B\")))");
}

TEST(SyntaxParser, EmptySourceIsEmptyCircuit) { EXPECT_EQ(sexpr("  // nothing\n"), "(start)"); }

TEST(SyntaxParser, RangesCoverWholeConstruct)
{
  Parsed p;
  p.root = parse_tree("f = mod(a) { a }", p.tree, p.diags);
  ASSERT_NE(p.root, nullptr);
  const cst::ParseNode * bind = p.root->child(0);
  const cst::ParseNode * module = bind->child(1);
  EXPECT_EQ(module->range().get_begin().get_offset(), 4U);
  EXPECT_EQ(module->range().get_end().get_offset(), 16U);
  EXPECT_EQ(bind->range().get_begin().get_offset(), 0U);
}

TEST(SyntaxParserErrors, InvalidBitLiteral) { EXPECT_EQ(error_code_of("A -> 2, A"), "E1002"); }

TEST(SyntaxParserErrors, MissingExpression)
{
  Parsed p;
  p.root = parse_tree("x = ", p.tree, p.diags);
  EXPECT_EQ(p.root, nullptr);
  ASSERT_EQ(p.diags.size(), 1U);
  EXPECT_EQ(p.diags.all().front().code, "E1001");
  EXPECT_EQ(p.diags.all().front().message, "expected expression, found end of input");
}

TEST(SyntaxParserErrors, KeywordIsNotAnIdentifier)
{
  Parsed p;
  p.root = parse_tree("f = mod(out) { 1 }", p.tree, p.diags);
  EXPECT_EQ(p.root, nullptr);
  ASSERT_EQ(p.diags.size(), 1U);
  EXPECT_EQ(p.diags.all().front().message, "expected identifier, found keyword `out`");
}

TEST(SyntaxParserErrors, OnlyFirstErrorIsReported)
{
  EXPECT_EQ(error_code_of("x = ) y = ) z = )"), "E1001");
}

TEST(SyntaxParserErrors, UnclosedContract)
{
  EXPECT_EQ(error_code_of("f = mod(a) [req a; ens a { a }"), "E1001");
}

TEST(SyntaxParserErrors, StrayCharacter) { EXPECT_EQ(error_code_of("x = a $"), "E1001"); }
