// contrtl/syntax/parse_tree.cpp - Labeled concrete parse tree
#include "contrtl/syntax/parse_tree.hpp"

#include "contrtl/syntax/productions.hpp"

namespace contrtl::cst
{

ParseNode * ParseTree::make_node(std::string_view label, SourceRange range)
{
  nodes_.push_back(
    std::unique_ptr<ParseNode>(new ParseNode(false, std::string(label), std::string(), range)));
  return nodes_.back().get();
}

ParseNode * ParseTree::make_token(std::string_view text, SourceRange range)
{
  nodes_.push_back(
    std::unique_ptr<ParseNode>(new ParseNode(true, std::string(), std::string(text), range)));
  return nodes_.back().get();
}

ParseNode * ParseTree::make_identifier(std::string_view name, SourceRange range)
{
  ParseNode * node = make_node(syntax::production::k_identifier, range);
  add_child(node, make_token(name, range));
  return node;
}

ParseNode * ParseTree::make_bit(bool one, SourceRange range)
{
  ParseNode * node =
    make_node(one ? syntax::production::k_one : syntax::production::k_zero, range);
  add_child(node, make_token(one ? "1" : "0", range));
  return node;
}

void ParseTree::add_child(ParseNode * parent, ParseNode * child)
{
  if (!parent || !child) return;
  parent->children_.push_back(child);
  parent->range_ = parent->range_.join(child->range_);
}

std::string to_sexpr(const ParseNode * node)
{
  if (!node) return "<null>";
  if (node->is_token()) {
    return "\"" + std::string(node->text()) + "\"";
  }

  std::string out = "(" + std::string(node->label());
  for (const ParseNode * child : node->children()) {
    out += ' ';
    out += to_sexpr(child);
  }
  out += ')';
  return out;
}

}  // namespace contrtl::cst
