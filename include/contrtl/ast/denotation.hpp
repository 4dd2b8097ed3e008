// contrtl/ast/denotation.hpp - Reference Bit semantics for closed terms
#pragma once

#include <optional>

#include "contrtl/ast/ast.hpp"

namespace contrtl
{

// ============================================================================
// Bit operators
// ============================================================================

[[nodiscard]] constexpr Bit bit_xor(Bit a, Bit b) noexcept { return to_bit(a != b); }

[[nodiscard]] constexpr Bit bit_and(Bit a, Bit b) noexcept
{
  return to_bit(a == Bit::One && b == Bit::One);
}

[[nodiscard]] constexpr Bit bit_or(Bit a, Bit b) noexcept
{
  return to_bit(a == Bit::One || b == Bit::One);
}

[[nodiscard]] constexpr Bit bit_not(Bit a) noexcept { return bit_xor(a, Bit::One); }

[[nodiscard]] constexpr Bit bit_eq(Bit a, Bit b) noexcept { return bit_not(bit_xor(a, b)); }

[[nodiscard]] constexpr Bit bit_impl(Bit a, Bit b) noexcept { return bit_or(bit_not(a), b); }

[[nodiscard]] constexpr Bit bit_mux(Bit s, Bit t, Bit f) noexcept
{
  return bit_or(bit_and(s, t), bit_and(bit_not(s), f));
}

[[nodiscard]] constexpr Bit apply(BinaryOp op, Bit a, Bit b) noexcept
{
  switch (op) {
    case BinaryOp::Xor:
      return bit_xor(a, b);
    case BinaryOp::And:
      return bit_and(a, b);
    case BinaryOp::Or:
      return bit_or(a, b);
  }
  return Bit::Zero;
}

// ============================================================================
// Evaluation
// ============================================================================

/**
 * Value of a closed expression.
 * Returns nullopt if the term references a symbol or instantiates a module.
 */
[[nodiscard]] std::optional<Bit> evaluate_constant(const Expr * expr);

/**
 * Value of a closed arithmetic term.
 * Add, Sub and Res have no Bit denotation and yield nullopt.
 */
[[nodiscard]] std::optional<Bit> evaluate_constant(const Arith * arith);

/// Skip when a closed assertion holds, Fail when it does not.
[[nodiscard]] std::optional<Order> evaluate_assertion(const Arith * condition);

}  // namespace contrtl
