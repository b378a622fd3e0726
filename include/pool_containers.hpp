#ifndef POOL_CONTAINERS_HPP
#define POOL_CONTAINERS_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "records.hpp"

namespace genomemem {

/**
 * Anything an ObjectPool can recycle: built from a capacity, tagged with
 * that capacity, and able to drop its logical contents without releasing
 * storage.
 */
template <typename C>
concept Poolable = std::constructible_from<C, size_t> && requires(C c) {
  { c.capacity } -> std::convertible_to<size_t>;
  { c.reset() };
};

/**
 * Fixed-capacity slice of T. `data` always holds `capacity` elements;
 * `length` is how many of them the borrower filled.
 */
template <typename T>
struct PooledSlice {
  using element_type = T;

  explicit PooledSlice(size_t cap) : data(cap), capacity(cap) {}

  // Stale elements stay in `data`
  void reset() { length = 0; }

  std::span<T> filled() { return {data.data(), length}; }
  std::span<const T> filled() const { return {data.data(), length}; }

  std::vector<T> data;
  size_t capacity;
  size_t length = 0;
};

using ParticleSlice = PooledSlice<Particle>;
using CoordinateSlice = PooledSlice<Coordinate>;
using RawBuffer = PooledSlice<std::byte>;

/**
 * Particle indices belonging to one voxel.
 */
struct VoxelData {
  explicit VoxelData(size_t cap) : capacity(cap) {
    particle_indices.reserve(cap);
  }

  // Truncate without giving back storage
  void reset() {
    particle_indices.clear();
    count = 0;
  }

  /**
   * Append an index if it fits in the reserved storage.
   * @return false when the voxel is full
   */
  bool add(uint32_t particle_index) {
    if (particle_indices.size() >= capacity) {
      return false;
    }
    particle_indices.push_back(particle_index);
    ++count;
    return true;
  }

  std::vector<uint32_t> particle_indices;
  size_t count = 0;
  size_t capacity;
};

static_assert(Poolable<ParticleSlice>);
static_assert(Poolable<VoxelData>);

}  // namespace genomemem

#endif  // POOL_CONTAINERS_HPP
