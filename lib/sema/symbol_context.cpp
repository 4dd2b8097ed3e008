// contrtl/sema/symbol_context.cpp - Scoped name binding for one transform pass
#include "contrtl/sema/symbol_context.hpp"

#include <utility>

namespace contrtl
{

void SymbolContext::push_scope() { scopes_.emplace_back(); }

std::vector<const Symbol *> SymbolContext::pop_scope()
{
  if (scopes_.empty()) {
    return {};
  }
  std::vector<const Symbol *> ordered = std::move(scopes_.back().ordered);
  scopes_.pop_back();
  return ordered;
}

Symbol * SymbolContext::find_local(std::string_view name) const
{
  if (scopes_.empty()) {
    return nullptr;
  }
  const auto & symbols = scopes_.back().symbols;
  auto it = symbols.find(name);
  return it != symbols.end() ? it->second : nullptr;
}

const Symbol * SymbolContext::declare(std::string_view name, SymbolKind kind, SourceRange range)
{
  if (scopes_.empty()) {
    push_scope();
  }
  if (Symbol * existing = find_local(name)) {
    return existing;
  }
  return insert(name, kind, reserve_slot(), range);
}

Symbol * SymbolContext::insert(
  std::string_view name, SymbolKind kind, DefinitionId id, SourceRange range)
{
  const std::string_view stored = ast_.intern(name);
  Symbol * sym = ast_.allocate_object<Symbol>(Symbol{stored, kind, id, range});
  scopes_.back().symbols.emplace(stored, sym);
  return sym;
}

DefineResult SymbolContext::define(
  std::string_view name, SymbolKind kind, const Stmt * stmt, SourceRange range)
{
  if (scopes_.empty()) {
    push_scope();
  }

  Symbol * sym = find_local(name);
  if (sym && is_defined(*sym)) {
    return {nullptr, sym};
  }
  if (!sym) {
    sym = insert(name, kind, reserve_slot(), range);
  }

  sym->kind = kind;
  sym->range = range;
  fill_slot(sym->definition, stmt);
  scopes_.back().ordered.push_back(sym);
  return {sym, nullptr};
}

DefineResult SymbolContext::define_parameter(
  std::string_view name, DefinitionId owner, SourceRange range)
{
  if (scopes_.empty()) {
    push_scope();
  }
  if (Symbol * existing = find_local(name)) {
    return {nullptr, existing};
  }

  return {insert(name, SymbolKind::Parameter, owner, range), nullptr};
}

DefinitionId SymbolContext::reserve_slot()
{
  definitions_.push_back(nullptr);
  return DefinitionId{static_cast<uint32_t>(definitions_.size() - 1)};
}

void SymbolContext::fill_slot(DefinitionId id, const Stmt * stmt)
{
  if (id.is_valid() && id.value < definitions_.size()) {
    definitions_[id.value] = stmt;
  }
}

const Symbol * SymbolContext::make_free(std::string_view name, SourceRange range)
{
  auto it = free_.find(name);
  if (it != free_.end()) {
    return it->second;
  }

  const std::string_view stored = ast_.intern(name);
  const Symbol * sym =
    ast_.allocate_object<Symbol>(Symbol{stored, SymbolKind::Free, DefinitionId{}, range});
  free_.emplace(stored, sym);
  inputs_.push_back(sym);
  return sym;
}

const Symbol * SymbolContext::lookup(std::string_view name) const
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    auto found = it->symbols.find(name);
    if (found != it->symbols.end()) {
      return found->second;
    }
  }
  return nullptr;
}

const Symbol * SymbolContext::lookup_local(std::string_view name) const { return find_local(name); }

bool SymbolContext::is_defined(const Symbol & sym) const noexcept
{
  if (sym.kind == SymbolKind::Parameter) {
    return true;
  }
  return definition_of(sym) != nullptr;
}

const Stmt * SymbolContext::definition_of(const Symbol & sym) const noexcept
{
  if (!sym.definition.is_valid() || sym.definition.value >= definitions_.size()) {
    return nullptr;
  }
  return definitions_[sym.definition.value];
}

const ModuleStmt * SymbolContext::module_of(const Symbol & sym) const noexcept
{
  if (sym.kind != SymbolKind::Binding) {
    return nullptr;
  }
  const Stmt * def = definition_of(sym);
  if (const auto * bind = dyn_cast<BindStmt>(def)) {
    return bind->value_module();
  }
  return dyn_cast<ModuleStmt>(def);
}

bool SymbolContext::is_module(const Symbol & sym) const noexcept
{
  return module_of(sym) != nullptr;
}

}  // namespace contrtl
