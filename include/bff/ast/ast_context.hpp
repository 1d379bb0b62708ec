// bff/ast/ast_context.hpp - AST arena allocator and string pool
//
// This header provides the AstContext class which owns the nodes and the
// unescaped string data of one parsed BFF file.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
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

namespace bff
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Owns all AST nodes and interned strings of one parse.
 *
 * Nodes created through the context live until the context is destroyed;
 * there is no individual deallocation. Evaluation keeps the context of every
 * file alive (see ParseDataProvider) because user-function bodies are stored
 * as spans into it.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * lit = ctx.create<IntLiteral>(42, range);
 *   std::string_view name = ctx.intern("Targets");
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), allocator_(&arena_), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new AST node of type T in the arena.
   *
   * @return Non-owning pointer, valid for the lifetime of the context
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a view that stays valid as long as the
   * context is alive. Equal strings share storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.empty() ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return string_pool_.find(s) != string_pool_.end();
  }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate a value-initialized array of type T from the arena.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /**
   * Copy the elements of a parser-side vector into the arena.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "Arena arrays are never destroyed");
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

  [[nodiscard]] std::pmr::polymorphic_allocator<std::byte> get_allocator() const noexcept
  {
    return allocator_;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::polymorphic_allocator<std::byte> allocator_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace bff
