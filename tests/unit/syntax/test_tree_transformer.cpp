// tests/unit/syntax/test_tree_transformer.cpp - Parse tree -> AST with symbol resolution
#include <gtest/gtest.h>

#include <string>

#include "contrtl/ast/ast.hpp"
#include "contrtl/ast/ast_context.hpp"
#include "contrtl/basic/casting.hpp"
#include "contrtl/syntax/frontend.hpp"
#include "contrtl/syntax/productions.hpp"
#include "contrtl/syntax/tree_transformer.hpp"
#include "contrtl/test_support/parse_helpers.hpp"

using namespace contrtl;
using contrtl::test_support::first_error_code;
using contrtl::test_support::parse;

namespace prod = contrtl::syntax::production;

namespace
{

std::string code_of(DiagCode c) { return code_name(c); }

}  // namespace

// ============================================================================
// Statements and symbols
// ============================================================================

TEST(TreeTransformer, SelfReferencingRegister)
{
  auto unit = parse("A -> 0, A");
  ASSERT_TRUE(unit->ok());
  ASSERT_EQ(unit->circuit->statements.size(), 1U);

  const auto * reg = dyn_cast<RegStmt>(unit->circuit->statements[0]);
  ASSERT_NE(reg, nullptr);
  EXPECT_EQ(reg->name, "A");
  EXPECT_EQ(reg->init, Bit::Zero);

  const auto * next = dyn_cast<SymbolRefExpr>(reg->next);
  ASSERT_NE(next, nullptr);
  EXPECT_EQ(next->symbol, reg->symbol);
  EXPECT_EQ(reg->symbol->kind, SymbolKind::Register);
  EXPECT_EQ(unit->circuit->definition_of(*reg->symbol), reg);
}

TEST(TreeTransformer, FreeVariablesBecomeInputsInFirstUseOrder)
{
  auto unit = parse("c -> 0, y and x\ns = x xor y");
  ASSERT_TRUE(unit->ok());

  const auto inputs = unit->circuit->inputs;
  ASSERT_EQ(inputs.size(), 2U);
  EXPECT_EQ(inputs[0]->name, "y");
  EXPECT_EQ(inputs[1]->name, "x");
  EXPECT_TRUE(inputs[0]->is_free());

  // Both uses of `x` share one symbol.
  const auto * s = cast<BindStmt>(unit->circuit->statements[1]);
  const auto * bin = cast<BinaryExpr>(s->value);
  EXPECT_EQ(cast<SymbolRefExpr>(bin->lhs)->symbol, inputs[1]);
}

TEST(TreeTransformer, ContextIsOrderedAndUnique)
{
  auto unit = parse("b = 1\na -> 0, b\nassert a\nc = a or b");
  ASSERT_TRUE(unit->ok());

  const auto context = unit->circuit->context;
  ASSERT_EQ(context.size(), 3U);
  EXPECT_EQ(context[0]->name, "b");
  EXPECT_EQ(context[1]->name, "a");
  EXPECT_EQ(context[2]->name, "c");
  EXPECT_EQ(unit->circuit->find("a"), context[1]);
  EXPECT_EQ(unit->circuit->find("zzz"), nullptr);
}

TEST(TreeTransformer, UseBeforeDefinitionResolvesToLaterStatement)
{
  auto unit = parse("y = x and 1\nx = 0");
  ASSERT_TRUE(unit->ok());
  EXPECT_TRUE(unit->circuit->inputs.empty());

  const auto * y = cast<BindStmt>(unit->circuit->statements[0]);
  const auto * ref = cast<SymbolRefExpr>(cast<BinaryExpr>(y->value)->lhs);
  const auto * x = cast<BindStmt>(unit->circuit->statements[1]);
  EXPECT_EQ(ref->symbol, x->symbol);
}

TEST(TreeTransformer, VerificationConditionsFoldToSynthesizableTerms)
{
  auto unit = parse("assert a xor b\nassume a eq b");
  ASSERT_TRUE(unit->ok());

  const auto * as = cast<AssertStmt>(unit->circuit->statements[0]);
  const auto * term = dyn_cast<ArithTermExpr>(as->condition);
  ASSERT_NE(term, nullptr);
  EXPECT_EQ(cast<BinaryExpr>(term->expr)->op, BinaryOp::Xor);

  const auto * am = cast<AssumeStmt>(unit->circuit->statements[1]);
  const auto * eq = dyn_cast<ArithBinaryExpr>(am->condition);
  ASSERT_NE(eq, nullptr);
  EXPECT_EQ(eq->op, ArithOp::Eq);
  EXPECT_TRUE(isa<ArithTermExpr>(eq->lhs));
}

TEST(TreeTransformer, ArithNotIsItsOwnNode)
{
  auto unit = parse("assert not a");
  ASSERT_TRUE(unit->ok());
  const auto * as = cast<AssertStmt>(unit->circuit->statements[0]);
  EXPECT_TRUE(isa<ArithNotExpr>(as->condition));
}

// ============================================================================
// Modules
// ============================================================================

TEST(TreeTransformer, ModuleWithContract)
{
  auto unit = parse("f = mod(a, b) [req a; ens res eq (a + b)] { out a xor b }");
  ASSERT_TRUE(unit->ok()) << first_error_code(*unit);

  const auto * bind = cast<BindStmt>(unit->circuit->statements[0]);
  const auto * module = bind->value_module();
  ASSERT_NE(module, nullptr);
  EXPECT_EQ(module->arity(), 2U);
  ASSERT_TRUE(module->has_contract());
  EXPECT_TRUE(isa<ArithTermExpr>(module->contract->pre->condition));

  const auto * post = dyn_cast<ArithBinaryExpr>(module->contract->post->condition);
  ASSERT_NE(post, nullptr);
  EXPECT_EQ(post->op, ArithOp::Eq);
  EXPECT_TRUE(isa<ResultExpr>(post->lhs));
  EXPECT_EQ(cast<ArithBinaryExpr>(post->rhs)->op, ArithOp::Add);

  ASSERT_NE(module->out, nullptr);
  EXPECT_TRUE(isa<BinaryExpr>(module->out->value));
}

TEST(TreeTransformer, ModuleWithoutContractHasNoContractNode)
{
  auto unit = parse("f = mod(a) { a }");
  ASSERT_TRUE(unit->ok());
  const auto * module = cast<BindStmt>(unit->circuit->statements[0])->value_module();
  ASSERT_NE(module, nullptr);
  EXPECT_FALSE(module->has_contract());
  EXPECT_EQ(module->contract, nullptr);
}

TEST(TreeTransformer, ParametersReferToOwningModule)
{
  auto unit = parse("f = mod(a) { t = a; out t }");
  ASSERT_TRUE(unit->ok());

  const auto * module = cast<BindStmt>(unit->circuit->statements[0])->value_module();
  ASSERT_EQ(module->params.size(), 1U);
  EXPECT_EQ(module->params[0]->kind, SymbolKind::Parameter);
  EXPECT_EQ(unit->circuit->definition_of(*module->params[0]), module);

  ASSERT_EQ(module->locals.size(), 1U);
  EXPECT_EQ(module->locals[0]->name, "t");

  // Locals stay out of the circuit context.
  ASSERT_EQ(unit->circuit->context.size(), 1U);
  EXPECT_EQ(unit->circuit->context[0]->name, "f");
}

TEST(TreeTransformer, InstanceLinksToModule)
{
  auto unit = parse("add2 = mod(a, b) { a xor b }\ns = add2(x, 1)");
  ASSERT_TRUE(unit->ok());

  const auto * module = cast<BindStmt>(unit->circuit->statements[0])->value_module();
  const auto * inst = dyn_cast<InstanceExpr>(cast<BindStmt>(unit->circuit->statements[1])->value);
  ASSERT_NE(inst, nullptr);
  EXPECT_EQ(inst->module, module);
  EXPECT_EQ(inst->args.size(), module->arity());
}

TEST(TreeTransformer, ForwardCallIsCheckedWhenCalleeIsDefined)
{
  auto unit = parse("s = add2(x, 1)\nadd2 = mod(a, b) { a xor b }");
  ASSERT_TRUE(unit->ok());

  const auto * inst = cast<InstanceExpr>(cast<BindStmt>(unit->circuit->statements[0])->value);
  const auto * module = cast<BindStmt>(unit->circuit->statements[1])->value_module();
  EXPECT_EQ(inst->module, module);
}

TEST(TreeTransformer, NestedModuleSeesEnclosingParameters)
{
  auto unit = parse("f = mod(a) { g = mod(b) { a and b }; out g(a) }");
  ASSERT_TRUE(unit->ok()) << first_error_code(*unit);
  EXPECT_TRUE(unit->circuit->inputs.empty());
}

TEST(TreeTransformer, ParameterShadowsOuterBinding)
{
  auto unit = parse("a = 1\nf = mod(a) { a }");
  ASSERT_TRUE(unit->ok());

  const auto * module = cast<BindStmt>(unit->circuit->statements[1])->value_module();
  const auto * ref = cast<SymbolRefExpr>(module->out->value);
  EXPECT_EQ(ref->symbol, module->params[0]);
}

TEST(TreeTransformer, RecursiveInstantiationIsStructurallyAllowed)
{
  auto unit = parse("f = mod(a) { out f(a) }");
  ASSERT_TRUE(unit->ok()) << first_error_code(*unit);
}

TEST(TreeTransformer, TopLevelAnonymousModuleMayOmitOutput)
{
  auto unit = parse("mod(a) { r -> 0, r xor a }");
  ASSERT_TRUE(unit->ok());
  const auto * module = dyn_cast<ModuleStmt>(unit->circuit->statements[0]);
  ASSERT_NE(module, nullptr);
  EXPECT_EQ(module->out, nullptr);
  EXPECT_TRUE(unit->circuit->context.empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST(TreeTransformerErrors, DuplicateRegister)
{
  auto unit = parse("A -> 0, A ; A -> 1, A");
  EXPECT_EQ(unit->circuit, nullptr);
  EXPECT_EQ(first_error_code(*unit), code_of(DiagCode::DuplicateDefinition));

  const Diagnostic * d = unit->diags.find("E2001");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->message, "duplicate definition of `A`");
  ASSERT_EQ(d->labels.size(), 2U);
  EXPECT_EQ(d->labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d->labels[1].message, "first defined here");
  EXPECT_EQ(d->labels[1].range.get_begin().get_offset(), 0U);
}

TEST(TreeTransformerErrors, DuplicateAcrossStatementKinds)
{
  auto unit = parse("x = 1\nx -> 0, x");
  EXPECT_EQ(first_error_code(*unit), "E2001");
}

TEST(TreeTransformerErrors, DuplicateParameter)
{
  auto unit = parse("f = mod(a, a) { a }");
  EXPECT_EQ(first_error_code(*unit), "E2001");
}

TEST(TreeTransformerErrors, UnknownModule)
{
  auto unit = parse("x = foo(0, 1)");
  EXPECT_EQ(unit->circuit, nullptr);
  EXPECT_EQ(first_error_code(*unit), code_of(DiagCode::UnknownModule));
  EXPECT_EQ(unit->diags.all().front().message, "unknown module `foo`");
}

TEST(TreeTransformerErrors, CallingARegister)
{
  auto unit = parse("r -> 0, r\ny = r(0)");
  EXPECT_EQ(first_error_code(*unit), "E2002");
  const auto & labels = unit->diags.all().front().labels;
  ASSERT_EQ(labels.size(), 2U);
  EXPECT_EQ(labels[1].message, "`r` is a register");
}

TEST(TreeTransformerErrors, CallingAParameter)
{
  auto unit = parse("f = mod(a) { a(0) }");
  EXPECT_EQ(first_error_code(*unit), "E2002");
}

TEST(TreeTransformerErrors, ForwardCallToExpressionBinding)
{
  auto unit = parse("y = g(0)\ng = 1");
  EXPECT_EQ(first_error_code(*unit), "E2002");
}

TEST(TreeTransformerErrors, ArityMismatch)
{
  auto unit = parse("add2 = mod(a, b) { a xor b }\ny = add2(0)");
  EXPECT_EQ(unit->circuit, nullptr);
  EXPECT_EQ(first_error_code(*unit), code_of(DiagCode::ArityMismatch));
  EXPECT_EQ(unit->diags.all().front().message, "module `add2` expects 2 arguments, found 1");
}

TEST(TreeTransformerErrors, ForwardArityMismatch)
{
  auto unit = parse("y = add2(0, 1, 1)\nadd2 = mod(a, b) { a xor b }");
  EXPECT_EQ(first_error_code(*unit), "E2003");
}

TEST(TreeTransformerErrors, NamedModuleWithoutOutput)
{
  auto unit = parse("f = mod(a) { t = a }");
  EXPECT_EQ(first_error_code(*unit), code_of(DiagCode::MissingOutput));
}

TEST(TreeTransformerErrors, NestedAnonymousModuleWithoutOutput)
{
  auto unit = parse("f = mod(a) { mod() { r -> 0, r }; out a }");
  EXPECT_EQ(first_error_code(*unit), "E2005");
}

TEST(TreeTransformerErrors, ResultOutsidePostCondition)
{
  EXPECT_EQ(first_error_code(*parse("assert res")), code_of(DiagCode::MisplacedResult));
  EXPECT_EQ(first_error_code(*parse("f = mod(a) [req res; ens 1] { a }")), "E2006");
  EXPECT_EQ(first_error_code(*parse("f = mod(a) [req 1; ens res] { a }")), "");
}

TEST(TreeTransformerErrors, FirstViolationStopsThePass)
{
  auto unit = parse("x = foo(0)\nA -> 0, A\nA -> 1, A");
  EXPECT_EQ(unit->diags.size(), 1U);
  EXPECT_EQ(first_error_code(*unit), "E2002");
}

TEST(TreeTransformerErrors, ForwardCallsToNonModulesFailAtFirstDefinition)
{
  auto unit = parse("y = b(1)\nz = c(1)\nc = 0\nb = 0");
  ASSERT_EQ(unit->diags.size(), 1U);
  const Diagnostic & d = unit->diags.all().front();
  EXPECT_EQ(d.code, code_of(DiagCode::UnknownModule));
  EXPECT_EQ(d.message, "unknown module `c`");
}

// ============================================================================
// Hand-built trees
// ============================================================================

TEST(TreeTransformerTrees, RootMustBeStart)
{
  cst::ParseTree tree;
  auto * reg = tree.make_node(prod::k_reg);
  tree.add_child(reg, tree.make_identifier("A"));
  tree.add_child(reg, tree.make_bit(false));
  tree.add_child(reg, tree.make_identifier("A"));
  tree.set_root(reg);

  AstContext ast;
  DiagnosticBag diags;
  TreeTransformer transformer(ast, diags);
  EXPECT_EQ(transformer.transform(tree), nullptr);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all().front().code, code_of(DiagCode::MalformedTree));
}

TEST(TreeTransformerTrees, RegisterMissingNextState)
{
  cst::ParseTree tree;
  auto * root = tree.make_node(prod::k_start);
  auto * reg = tree.make_node(prod::k_reg);
  tree.add_child(reg, tree.make_identifier("A"));
  tree.add_child(reg, tree.make_bit(true));
  tree.add_child(root, reg);
  tree.set_root(root);

  AstContext ast;
  DiagnosticBag diags;
  TreeTransformer transformer(ast, diags);
  EXPECT_EQ(transformer.transform(tree), nullptr);
  EXPECT_NE(diags.find("E2004"), nullptr);
}

TEST(TreeTransformerTrees, UnknownProduction)
{
  cst::ParseTree tree;
  auto * root = tree.make_node(prod::k_start);
  tree.add_child(root, tree.make_node("while_loop"));
  tree.set_root(root);

  AstContext ast;
  DiagnosticBag diags;
  TreeTransformer transformer(ast, diags);
  EXPECT_EQ(transformer.transform(tree), nullptr);
  ASSERT_NE(diags.find("E2004"), nullptr);
  EXPECT_EQ(
    diags.find("E2004")->message, "malformed parse tree: unknown production `while_loop`");
}

TEST(TreeTransformerTrees, CallArgumentsMustBeExpressions)
{
  // (start (bind y (call f (stmt_seq (reg r 0 r)))))
  cst::ParseTree tree;
  auto * root = tree.make_node(prod::k_start);
  auto * bind = tree.make_node(prod::k_bind);
  auto * call = tree.make_node(prod::k_call);
  auto * seq = tree.make_node(prod::k_stmt_seq);

  auto * reg = tree.make_node(prod::k_reg);
  tree.add_child(reg, tree.make_identifier("r"));
  tree.add_child(reg, tree.make_bit(false));
  tree.add_child(reg, tree.make_identifier("r"));

  tree.add_child(seq, reg);
  tree.add_child(call, tree.make_identifier("f"));
  tree.add_child(call, seq);
  tree.add_child(bind, tree.make_identifier("y"));
  tree.add_child(bind, call);
  tree.add_child(root, bind);
  tree.set_root(root);

  AstContext ast;
  DiagnosticBag diags;
  EXPECT_EQ(transform_tree(tree, ast, diags), nullptr);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(
    diags.find(DiagCode::MalformedTree)->message,
    "malformed parse tree: `call` arguments must be expressions");
}

TEST(TreeTransformerTrees, EmptyTree)
{
  cst::ParseTree tree;
  AstContext ast;
  DiagnosticBag diags;
  TreeTransformer transformer(ast, diags);
  EXPECT_EQ(transformer.transform(tree), nullptr);
  EXPECT_NE(diags.find("E2004"), nullptr);
}

TEST(TreeTransformerTrees, StatementSequenceIsFlattened)
{
  cst::ParseTree tree;
  auto * root = tree.make_node(prod::k_start);
  auto * seq = tree.make_node(prod::k_stmt_seq);

  auto * reg = tree.make_node(prod::k_reg);
  tree.add_child(reg, tree.make_identifier("A"));
  tree.add_child(reg, tree.make_bit(false));
  tree.add_child(reg, tree.make_identifier("B"));

  auto * bind = tree.make_node(prod::k_bind);
  tree.add_child(bind, tree.make_identifier("B"));
  tree.add_child(bind, tree.make_identifier("A"));

  tree.add_child(seq, reg);
  tree.add_child(seq, bind);
  tree.add_child(root, seq);
  tree.set_root(root);

  AstContext ast;
  DiagnosticBag diags;
  TreeTransformer transformer(ast, diags);
  Circuit * circuit = transformer.transform(tree);
  ASSERT_NE(circuit, nullptr);
  ASSERT_EQ(circuit->statements.size(), 2U);
  EXPECT_TRUE(circuit->inputs.empty());
  EXPECT_EQ(transformer.symbols().definitions().size(), 2U);
}

TEST(TreeTransformerTrees, CollapsedModuleBody)
{
  // module -> [list_of_variables, bind, out] without a `body` wrapper
  cst::ParseTree tree;
  auto * root = tree.make_node(prod::k_start);
  auto * bind_f = tree.make_node(prod::k_bind);
  auto * module = tree.make_node(prod::k_module);

  auto * params = tree.make_node(prod::k_list_of_variables);
  tree.add_child(params, tree.make_identifier("a"));

  auto * bind_t = tree.make_node(prod::k_bind);
  tree.add_child(bind_t, tree.make_identifier("t"));
  tree.add_child(bind_t, tree.make_identifier("a"));

  auto * out = tree.make_node(prod::k_out);
  tree.add_child(out, tree.make_identifier("t"));

  tree.add_child(module, params);
  tree.add_child(module, bind_t);
  tree.add_child(module, out);
  tree.add_child(bind_f, tree.make_identifier("f"));
  tree.add_child(bind_f, module);
  tree.add_child(root, bind_f);
  tree.set_root(root);

  AstContext ast;
  DiagnosticBag diags;
  TreeTransformer transformer(ast, diags);
  Circuit * circuit = transformer.transform(tree);
  ASSERT_NE(circuit, nullptr) << (diags.empty() ? "" : diags.all().front().message);

  const auto * m = cast<BindStmt>(circuit->statements[0])->value_module();
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(m->body.size(), 1U);
  ASSERT_NE(m->out, nullptr);
}
