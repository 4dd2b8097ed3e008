// contrtl/sema/symbol_context.hpp - Scoped name binding for one transform pass
//
// The context is append-only: bindings are never removed or rolled back.
// A pass owns exactly one context; nothing here is shared between passes.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <vector>

#include "contrtl/ast/ast.hpp"
#include "contrtl/ast/ast_context.hpp"
#include "contrtl/sema/symbol.hpp"

namespace contrtl
{

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Outcome of SymbolContext::define.
struct DefineResult
{
  /// The bound symbol, or nullptr when the name was already bound
  const Symbol * symbol = nullptr;
  /// Earlier binding of the same name in the current scope (duplicates only)
  const Symbol * previous = nullptr;

  [[nodiscard]] bool ok() const noexcept { return symbol != nullptr; }
};

/**
 * Ordered, scoped table of names and the statements that define them.
 *
 * Scopes nest: the circuit opens the outermost one and every module opens
 * its own. Lookups search innermost first, so module locals may shadow
 * outer names. Names must be unique within one scope.
 *
 * Binding happens in two steps so that a name can be referenced before the
 * statement defining it is reached:
 *   - declare() announces a name in the current scope with an empty
 *     definition slot;
 *   - define() fills that slot once the defining statement exists.
 */
class SymbolContext
{
public:
  explicit SymbolContext(AstContext & ast) : ast_(ast) {}

  SymbolContext(const SymbolContext &) = delete;
  SymbolContext & operator=(const SymbolContext &) = delete;

  // ===========================================================================
  // Scopes
  // ===========================================================================

  void push_scope();

  /// Close the innermost scope; returns its defined symbols in definition order.
  std::vector<const Symbol *> pop_scope();

  [[nodiscard]] size_t depth() const noexcept { return scopes_.size(); }

  // ===========================================================================
  // Binding
  // ===========================================================================

  /**
   * Announce `name` in the current scope without defining it.
   * Returns the existing symbol when the name is already known here.
   */
  const Symbol * declare(std::string_view name, SymbolKind kind, SourceRange range);

  /**
   * Bind `name` to `stmt` in the current scope.
   * Fails when the name is already defined (not merely declared) here.
   */
  DefineResult define(std::string_view name, SymbolKind kind, const Stmt * stmt, SourceRange range);

  /// Bind a module parameter; `owner` is the module's reserved slot.
  DefineResult define_parameter(std::string_view name, DefinitionId owner, SourceRange range);

  /// Reserve an empty definition slot (used for modules before they exist).
  DefinitionId reserve_slot();

  void fill_slot(DefinitionId id, const Stmt * stmt);

  /**
   * The unbound symbol for `name`. One free symbol exists per distinct
   * name; they are recorded in first-use order.
   */
  const Symbol * make_free(std::string_view name, SourceRange range);

  // ===========================================================================
  // Queries
  // ===========================================================================

  /// Innermost binding or declaration of `name`, or nullptr.
  [[nodiscard]] const Symbol * lookup(std::string_view name) const;

  /// Binding or declaration of `name` in the current scope only.
  [[nodiscard]] const Symbol * lookup_local(std::string_view name) const;

  /// True once the symbol's defining statement has been recorded.
  [[nodiscard]] bool is_defined(const Symbol & sym) const noexcept;

  /// True when `sym` is bound to a module (directly or through a Bind).
  [[nodiscard]] bool is_module(const Symbol & sym) const noexcept;

  [[nodiscard]] const ModuleStmt * module_of(const Symbol & sym) const noexcept;

  [[nodiscard]] const Stmt * definition_of(const Symbol & sym) const noexcept;

  [[nodiscard]] const std::vector<const Stmt *> & definitions() const noexcept
  {
    return definitions_;
  }

  [[nodiscard]] const std::vector<const Symbol *> & inputs() const noexcept { return inputs_; }

private:
  struct Scope
  {
    std::unordered_map<std::string_view, Symbol *, StringViewHash> symbols;
    std::vector<const Symbol *> ordered;  ///< defined symbols, in definition order
  };

  Symbol * find_local(std::string_view name) const;
  Symbol * insert(std::string_view name, SymbolKind kind, DefinitionId id, SourceRange range);

  AstContext & ast_;
  std::vector<Scope> scopes_;
  std::vector<const Stmt *> definitions_;
  std::unordered_map<std::string_view, const Symbol *, StringViewHash> free_;
  std::vector<const Symbol *> inputs_;
};

}  // namespace contrtl
