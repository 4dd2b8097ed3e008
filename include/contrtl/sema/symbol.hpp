// contrtl/sema/symbol.hpp - Names bound by registers, bindings and module parameters
#pragma once

#include <cstdint>
#include <string_view>

#include "contrtl/basic/source_manager.hpp"

namespace contrtl
{

/**
 * Index of a defining statement in a pass's definition table.
 *
 * Symbols refer to their definition through this index instead of a pointer
 * so that statements and symbols never own each other.
 */
struct DefinitionId
{
  static constexpr uint32_t k_none = UINT32_MAX;

  uint32_t value = k_none;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_none; }

  [[nodiscard]] constexpr bool operator==(DefinitionId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(DefinitionId other) const noexcept
  {
    return value != other.value;
  }
};

enum class SymbolKind : uint8_t {
  Register,   ///< r -> v, e
  Binding,    ///< x = e | x = mod(...)
  Parameter,  ///< module parameter
  Free,       ///< referenced but never defined (circuit input)
};

[[nodiscard]] constexpr std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Register:
      return "register";
    case SymbolKind::Binding:
      return "binding";
    case SymbolKind::Parameter:
      return "parameter";
    case SymbolKind::Free:
      return "free";
  }
  return "";
}

/**
 * A name paired with the statement that introduced it.
 *
 * Symbols live in the AstContext arena. A Free symbol has no definition;
 * a Parameter refers to its owning module's slot.
 */
struct Symbol
{
  std::string_view name;
  SymbolKind kind = SymbolKind::Free;
  DefinitionId definition;
  SourceRange range;  ///< Name token at the defining site

  [[nodiscard]] bool is_free() const noexcept { return kind == SymbolKind::Free; }
};

/// Symbols compare by name only.
[[nodiscard]] inline bool operator==(const Symbol & a, const Symbol & b) noexcept
{
  return a.name == b.name;
}

[[nodiscard]] inline bool operator!=(const Symbol & a, const Symbol & b) noexcept
{
  return !(a == b);
}

}  // namespace contrtl
