// contrtl/ast/ast_context.hpp - Arena for the nodes, symbols and names of one pass
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace contrtl
{

class AstNode;

/**
 * Backing store of one transform pass.
 *
 * AST nodes, symbols, child arrays and identifier text all live in a
 * monotonic arena and stay valid until the context dies. Nothing placed here
 * is ever destroyed, so only trivially destructible types are accepted; nodes
 * hold gsl::span and std::string_view rather than owning containers.
 */
class AstContext
{
public:
  AstContext() : arena_(k_initial_block), names_(&arena_) {}

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "create<> builds AST nodes");
    ++nodeCount_;
    return place<T>(std::forward<Args>(args)...);
  }

  /// Arena record that is not a node, e.g. a Symbol.
  template <typename T, typename... Args>
  T * allocate_object(Args &&... args)
  {
    static_assert(!std::is_base_of_v<AstNode, T>, "AST nodes go through create<>");
    return place<T>(std::forward<Args>(args)...);
  }

  /// Stable view of `name`; each distinct spelling is stored once.
  [[nodiscard]] std::string_view intern(std::string_view name)
  {
    if (const auto it = names_.find(name); it != names_.end()) {
      return *it;
    }
    auto * text = static_cast<char *>(arena_.allocate(std::max<size_t>(name.size(), 1), 1));
    std::memcpy(text, name.data(), name.size());
    return *names_.emplace(text, name.size()).first;
  }

  /// `n` value-initialized slots, e.g. the operands of a binary node.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t n)
  {
    if (n == 0) return {};
    auto * first = static_cast<T *>(arena_.allocate(sizeof(T) * n, alignof(T)));
    std::uninitialized_value_construct_n(first, n);
    return {first, n};
  }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & items)
  {
    auto out = allocate_array<T>(items.size());
    std::copy(items.begin(), items.end(), out.begin());
    return out;
  }

  [[nodiscard]] size_t node_count() const noexcept { return nodeCount_; }
  [[nodiscard]] size_t name_count() const noexcept { return names_.size(); }

private:
  static constexpr size_t k_initial_block = 16 * 1024;

  template <typename T, typename... Args>
  T * place(Args &&... args)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena objects are never destroyed");
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
  size_t nodeCount_ = 0;
};

}  // namespace contrtl
