#ifndef ARENA_HPP
#define ARENA_HPP

#include <cstddef>
#include <limits>
#include <memory>
#include <mutex>
#include <span>
#include <type_traits>

#include "mem_utils.hpp"

namespace genomemem {

/**
 * Bump allocator over one fixed-size byte buffer.
 *
 * Hands out spans sequentially and never frees them individually; reset()
 * rewinds the whole arena. Every reservation is rounded up to 8 bytes, while
 * the returned span is exactly the requested size.
 *
 * All operations take the arena's own mutex, so a single Arena is a
 * contention point. Give each worker its own Arena in hot loops.
 */
class Arena {
 public:
  explicit Arena(size_t capacity);

  Arena(const Arena&) = delete;
  Arena& operator=(const Arena&) = delete;

  /**
   * Reserve `size` bytes.
   * @return span of exactly `size` bytes, or a span with data() == nullptr
   *         when align8(size) does not fit in the remaining capacity
   */
  std::span<std::byte> alloc(size_t size);

  /**
   * Reserve room for `n` objects of type T.
   * @return span of `n` elements, or a null span when the arena is full
   */
  template <typename T>
  std::span<T> alloc_array(size_t n) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "arena storage is reinterpreted as raw bytes");
    static_assert(alignof(T) <= ALLOC_ALIGNMENT);
    if (n > std::numeric_limits<size_t>::max() / sizeof(T)) {
      return {};
    }
    std::span<std::byte> bytes = alloc(n * sizeof(T));
    if (bytes.data() == nullptr) {
      return {};
    }
    return {reinterpret_cast<T*>(bytes.data()), n};
  }

  /**
   * Rewind to the start of the buffer. Memory is not zeroed, so previously
   * handed-out bytes are visible to the next borrower.
   */
  void reset();

  size_t used() const;
  size_t available() const;
  size_t capacity() const { return capacity_; }

 private:
  std::unique_ptr<std::byte[]> buffer_;
  const size_t capacity_;
  size_t offset_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace genomemem

#endif  // ARENA_HPP
