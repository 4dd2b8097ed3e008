// contrtl/syntax/frontend.cpp - High-level parse pipeline
#include "contrtl/syntax/frontend.hpp"

#include <utility>

#include "contrtl/syntax/lexer.hpp"
#include "contrtl/syntax/parser.hpp"
#include "contrtl/syntax/tree_transformer.hpp"

namespace contrtl
{

const cst::ParseNode * parse_tree(
  std::string_view source_text, cst::ParseTree & tree, DiagnosticBag & diags)
{
  syntax::Lexer lexer(source_text);
  syntax::Parser parser(tree, diags, lexer.lex_all());
  return parser.parse_circuit();
}

Circuit * transform_tree(const cst::ParseTree & tree, AstContext & ast, DiagnosticBag & diags)
{
  TreeTransformer transformer(ast, diags);
  return transformer.transform(tree);
}

std::unique_ptr<ParsedUnit> parse_source(std::string source_text, std::filesystem::path path)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceFile(std::move(path), std::move(source_text));

  if (!parse_tree(unit->source.content(), unit->tree, unit->diags)) {
    return unit;
  }

  unit->circuit = transform_tree(unit->tree, *unit->ast, unit->diags);
  return unit;
}

}  // namespace contrtl
