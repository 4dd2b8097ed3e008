// contrtl/syntax/parse_tree.hpp - Labeled concrete parse tree
//
// The tree transformer reads nothing but labels, ordered children and raw
// token text, so any grammar that can emit this shape can feed it.
//
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "contrtl/basic/source_manager.hpp"

namespace contrtl::cst
{

/**
 * A production node (label + children) or a raw text token (leaf).
 */
class ParseNode
{
public:
  [[nodiscard]] bool is_token() const noexcept { return isToken_; }

  /// Production label; empty for tokens
  [[nodiscard]] std::string_view label() const noexcept { return label_; }

  /// Raw token text; empty for productions
  [[nodiscard]] std::string_view text() const noexcept { return text_; }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }

  [[nodiscard]] size_t child_count() const noexcept { return children_.size(); }

  [[nodiscard]] const ParseNode * child(size_t i) const noexcept
  {
    return i < children_.size() ? children_[i] : nullptr;
  }

  [[nodiscard]] const std::vector<ParseNode *> & children() const noexcept { return children_; }

  [[nodiscard]] bool is(std::string_view label) const noexcept
  {
    return !isToken_ && label_ == label;
  }

private:
  friend class ParseTree;

  ParseNode(bool is_token, std::string label, std::string text, SourceRange range)
  : isToken_(is_token), label_(std::move(label)), text_(std::move(text)), range_(range)
  {
  }

  bool isToken_;
  std::string label_;
  std::string text_;
  SourceRange range_;
  std::vector<ParseNode *> children_;
};

/**
 * Owns every node of one parse tree.
 *
 * @code
 *   cst::ParseTree tree;
 *   auto* reg = tree.make_node("reg");
 *   tree.add_child(reg, tree.make_identifier("A"));
 *   tree.add_child(reg, tree.make_bit(false));
 * @endcode
 */
class ParseTree
{
public:
  ParseTree() = default;

  ParseTree(const ParseTree &) = delete;
  ParseTree & operator=(const ParseTree &) = delete;
  ParseTree(ParseTree &&) = default;
  ParseTree & operator=(ParseTree &&) = default;

  ParseNode * make_node(std::string_view label, SourceRange range = {});
  ParseNode * make_token(std::string_view text, SourceRange range = {});

  /// `identifier` production wrapping a single token.
  ParseNode * make_identifier(std::string_view name, SourceRange range = {});

  /// `zero` / `one` production wrapping a single token.
  ParseNode * make_bit(bool one, SourceRange range = {});

  /// Append `child` to `parent`, widening the parent's range to cover it.
  void add_child(ParseNode * parent, ParseNode * child);

  /// Widen a node's range (e.g. to cover a closing delimiter).
  void extend(ParseNode * node, SourceRange range) noexcept
  {
    if (node) node->range_ = node->range_.join(range);
  }

  void set_root(ParseNode * root) noexcept { root_ = root; }
  [[nodiscard]] const ParseNode * root() const noexcept { return root_; }

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

private:
  std::vector<std::unique_ptr<ParseNode>> nodes_;
  ParseNode * root_ = nullptr;
};

/// Debug rendering: `(label child ...)` with tokens quoted.
[[nodiscard]] std::string to_sexpr(const ParseNode * node);

}  // namespace contrtl::cst
