// contrtl/ast/ast_equal.hpp - Structural equality of AST trees
#pragma once

#include "contrtl/ast/ast.hpp"

namespace contrtl
{

/**
 * True when both trees have the same node kinds, operators, values, names
 * and operand order. Source ranges and symbol identity are ignored; symbols
 * compare by name.
 */
[[nodiscard]] bool structurally_equal(const AstNode * a, const AstNode * b);

}  // namespace contrtl
