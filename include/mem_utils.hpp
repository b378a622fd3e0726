#ifndef MEM_UTILS_HPP
#define MEM_UTILS_HPP

#include <cstddef>
#include <cstdint>

namespace genomemem {

// Every arena reservation starts on this boundary
constexpr size_t ALLOC_ALIGNMENT = 8;

/**
 * Align a size_t value up to the next boundary (power of 2)
 */
constexpr size_t align_up(size_t value, size_t alignment) {
  return (value + alignment - 1) & ~(alignment - 1);
}

/**
 * Size actually reserved in an arena for a request of `size` bytes
 */
constexpr size_t align8(size_t size) {
  return align_up(size, ALLOC_ALIGNMENT);
}

/**
 * Check if a pointer is properly aligned
 */
inline bool is_aligned(const void* ptr, size_t alignment) {
  return (reinterpret_cast<uintptr_t>(ptr) % alignment) == 0;
}

constexpr size_t KiB = 1024;
constexpr size_t MiB = 1024 * KiB;

}  // namespace genomemem

#endif  // MEM_UTILS_HPP
