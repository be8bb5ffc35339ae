// gdparse/ast/ast_context.hpp - Arena that owns syntax tree nodes
#pragma once

#include <cstddef>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <type_traits>
#include <utility>
#include <vector>

namespace gdparse
{

class AstNode;

/**
 * Owner of every node produced by one parse.
 *
 * Nodes and their child arrays sit in one monotonic arena and are released
 * together. Text is not copied: a tree stays valid while both its
 * AstContext and the SourceBuffers holding the script are alive.
 */
class AstContext
{
public:
  /// A typical script fits in the first block
  static constexpr size_t k_initial_arena_size = size_t{32} * size_t{1024};

  explicit AstContext(size_t initial_size = k_initial_arena_size) : arena_(initial_size) {}

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;

  /// Nodes are never destroyed one by one, so they must not own anything
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "arena holds syntax tree nodes only");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "nodes keep text as std::string_view and children as gsl::span");
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /// Freezes the children the parser collected for one node
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & items)
  {
    if (items.empty()) {
      return {};
    }
    static_assert(std::is_trivially_copyable_v<T>, "child arrays hold node pointers");
    auto * const first = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::uninitialized_copy(items.begin(), items.end(), first);
    return gsl::span<T>(first, items.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
};

}  // namespace gdparse
