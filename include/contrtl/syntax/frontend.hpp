// contrtl/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "contrtl/ast/ast.hpp"
#include "contrtl/ast/ast_context.hpp"
#include "contrtl/basic/diagnostic.hpp"
#include "contrtl/basic/source_manager.hpp"
#include "contrtl/syntax/parse_tree.hpp"

namespace contrtl
{

/// Everything one pass over one source produces. Not movable once filled.
struct ParsedUnit
{
  SourceFile source;
  std::unique_ptr<AstContext> ast = std::make_unique<AstContext>();
  cst::ParseTree tree;
  DiagnosticBag diags;
  Circuit * circuit = nullptr;

  [[nodiscard]] bool ok() const noexcept { return circuit != nullptr && !diags.has_errors(); }
};

// Parse pipeline:
// source -> lexer (tokens) -> parser (cst::ParseTree) -> TreeTransformer (Circuit)
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, std::filesystem::path path = {});

/// Grammar only: fills `tree` and returns its root, or nullptr on a syntax error.
const cst::ParseNode * parse_tree(
  std::string_view source_text, cst::ParseTree & tree, DiagnosticBag & diags);

/// Transformer only, for trees produced by another grammar.
[[nodiscard]] Circuit * transform_tree(
  const cst::ParseTree & tree, AstContext & ast, DiagnosticBag & diags);

}  // namespace contrtl
