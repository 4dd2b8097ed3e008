// contrtl/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, bit values, operators and verification orders.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace contrtl
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "contrtl/ast/ast_nodes.def"

// === Arithmetic terms ===
#define AST_NODE_ARITH(Class, Kind, Snake) Kind,
#include "contrtl/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "contrtl/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "contrtl/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "contrtl/ast/ast_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_ARITH(Class, Kind, Snake) \
  case NodeKind::Kind:                     \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "contrtl/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Values
// ============================================================================

/// Single-bit value: v ::= 0 | 1
enum class Bit : uint8_t {
  Zero,
  One,
};

[[nodiscard]] constexpr int to_int(Bit b) noexcept { return b == Bit::One ? 1 : 0; }

[[nodiscard]] constexpr Bit to_bit(bool b) noexcept { return b ? Bit::One : Bit::Zero; }

/**
 * Outcome of evaluating a verification statement: o ::= skip | fail.
 * Produced by downstream checkers; the front end only defines it.
 */
enum class Order : uint8_t {
  Skip,
  Fail,
};

// ============================================================================
// Operators
// ============================================================================

/// Synthesizable binary operators.
enum class BinaryOp : uint8_t {
  Xor,
  And,
  Or,
};

/// Arithmetic (assertion language) binary operators.
enum class ArithOp : uint8_t {
  Impl,
  Add,
  Sub,
  Eq,
  Xor,
  And,
  Or,
};

/// Operators spelled in prefix form by the serializer.
[[nodiscard]] constexpr bool is_prefix_op(ArithOp op) noexcept
{
  return op == ArithOp::Xor || op == ArithOp::And || op == ArithOp::Or;
}

[[nodiscard]] constexpr std::string_view to_string(Bit b) noexcept
{
  return b == Bit::One ? "1" : "0";
}

[[nodiscard]] constexpr std::string_view to_string(Order o) noexcept
{
  switch (o) {
    case Order::Skip:
      return "skip";
    case Order::Fail:
      return "fail";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Xor:
      return "xor";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Or:
      return "or";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ArithOp op) noexcept
{
  switch (op) {
    case ArithOp::Impl:
      return "impl";
    case ArithOp::Add:
      return "+";
    case ArithOp::Sub:
      return "-";
    case ArithOp::Eq:
      return "eq";
    case ArithOp::Xor:
      return "xor";
    case ArithOp::And:
      return "and";
    case ArithOp::Or:
      return "or";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Value;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Instance;

inline constexpr NodeKind k_first_arith_kind = NodeKind::ArithBinary;
inline constexpr NodeKind k_last_arith_kind = NodeKind::ArithTerm;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Reg;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Module;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_arith_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_arith_kind && kind <= detail::k_last_arith_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace contrtl
