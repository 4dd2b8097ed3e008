// contrtl/syntax/productions.hpp - Parse tree production labels and keywords
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace contrtl::syntax
{

namespace production
{

// Top level and statements
inline constexpr std::string_view k_start = "start";
inline constexpr std::string_view k_reg = "reg";
inline constexpr std::string_view k_bind = "bind";
inline constexpr std::string_view k_stmt_assert = "stmt_assert";
inline constexpr std::string_view k_stmt_assume = "stmt_assume";
inline constexpr std::string_view k_stmt_seq = "stmt_seq";
inline constexpr std::string_view k_ano_module = "ano_module";

// Modules
inline constexpr std::string_view k_module = "module";
inline constexpr std::string_view k_list_of_variables = "list_of_variables";
inline constexpr std::string_view k_contract = "contract";
inline constexpr std::string_view k_precond = "precond";
inline constexpr std::string_view k_postcond = "postcond";
inline constexpr std::string_view k_body = "body";
inline constexpr std::string_view k_out = "out";

// Synthesizable expressions
inline constexpr std::string_view k_identifier = "identifier";
inline constexpr std::string_view k_zero = "zero";
inline constexpr std::string_view k_one = "one";
inline constexpr std::string_view k_call = "call";
inline constexpr std::string_view k_list_of_expr = "list_of_expr";
inline constexpr std::string_view k_expr_xor = "expr_xor";
inline constexpr std::string_view k_expr_and = "expr_and";
inline constexpr std::string_view k_expr_or = "expr_or";
inline constexpr std::string_view k_mux = "mux";
inline constexpr std::string_view k_scoped_expr = "scoped_expr";

// Arithmetic terms
inline constexpr std::string_view k_impl = "impl";
inline constexpr std::string_view k_add = "add";
inline constexpr std::string_view k_sub = "sub";
inline constexpr std::string_view k_eq = "eq";
inline constexpr std::string_view k_arith_xor = "arith_xor";
inline constexpr std::string_view k_arith_and = "arith_and";
inline constexpr std::string_view k_arith_or = "arith_or";
inline constexpr std::string_view k_arith_not = "arith_not";
inline constexpr std::string_view k_scoped_arith = "scoped_arith";
inline constexpr std::string_view k_res = "res";

}  // namespace production

inline constexpr std::array<std::string_view, 14> k_keywords = {
  "mod", "out", "req", "ens", "assert", "assume", "mux",
  "xor", "and", "or",  "not", "impl", "eq",     "res",
};

[[nodiscard]] inline bool is_keyword(std::string_view ident) noexcept
{
  return std::find(k_keywords.begin(), k_keywords.end(), ident) != k_keywords.end();
}

}  // namespace contrtl::syntax
