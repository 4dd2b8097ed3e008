// contrtl/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Returns nlohmann::json objects for any AST node. Every object carries
// a "type" (the node class) and a "range" of byte offsets.
//
#pragma once

#include <nlohmann/json.hpp>

#include "contrtl/ast/ast.hpp"

namespace contrtl
{

/// Serialize an AST node to JSON.
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Circuit including its statements, its ordered context and
 * the free inputs collected by the transform.
 */
[[nodiscard]] nlohmann::json to_json(const Circuit * circuit);

}  // namespace contrtl
