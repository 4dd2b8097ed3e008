// contrtl/syntax/token.hpp - Token kinds of the reference grammar
#pragma once

#include <cstdint>
#include <string_view>

#include "contrtl/basic/source_manager.hpp"

namespace contrtl::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  // Kept in the stream for tools; the parser skips them
  LineComment,   // // ...
  BlockComment,  // /* ... */

  Identifier,  // keywords are identifiers; see productions.hpp
  Number,

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Semicolon,

  Arrow,  // ->
  Eq,     // =
  Plus,
  Minus,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Number:
      return "number";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
  }
  return "";
}

}  // namespace contrtl::syntax
