// contrtl/ast/serializer.hpp - Canonical surface syntax for AST nodes
//
// Re-parsing the output yields a structurally equal AST.
//
#pragma once

#include <string>

#include "contrtl/ast/ast.hpp"

namespace contrtl
{

/**
 * Render any node back to contRTL source.
 *
 * - xor/and/or (both levels) and mux are written prefix: `xor a b`
 * - impl, +, -, eq are written parenthesized infix: `(a impl b)`
 * - a Circuit is one statement per line
 */
[[nodiscard]] std::string serialize(const AstNode * node);

}  // namespace contrtl
