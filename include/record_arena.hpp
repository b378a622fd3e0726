#ifndef RECORD_ARENA_HPP
#define RECORD_ARENA_HPP

#include <cstddef>
#include <span>
#include <type_traits>

#include "arena.hpp"
#include "records.hpp"

namespace genomemem {

/**
 * Fixed-record-size view over an Arena.
 *
 * Holds only a reference to the wrapped arena and the record size; the
 * arena must outlive the view. Record counts are the arena's byte counters
 * divided by the record size.
 */
template <typename Record>
class RecordArena {
  static_assert(std::is_trivially_copyable_v<Record>);

 public:
  static constexpr size_t record_size = sizeof(Record);

  explicit RecordArena(Arena& arena) : arena_(arena) {}

  // Bytes a backing Arena needs to hold `records` records
  static constexpr size_t bytes_for(size_t records) {
    return records * record_size;
  }

  /**
   * Allocate raw storage for `n` records.
   * @return span of n * record_size bytes, or a null span when full
   */
  std::span<std::byte> alloc_records(size_t n) {
    return std::as_writable_bytes(alloc_typed(n));
  }

  /**
   * Same reservation as alloc_records(), viewed as records.
   */
  std::span<Record> alloc_typed(size_t n) {
    return arena_.alloc_array<Record>(n);
  }

  void reset() { arena_.reset(); }

  size_t used_records() const { return arena_.used() / record_size; }
  size_t available_records() const { return arena_.available() / record_size; }
  size_t capacity_records() const { return arena_.capacity() / record_size; }

  Arena& arena() { return arena_; }

 private:
  Arena& arena_;
};

using ParticleArena = RecordArena<Particle>;
using VoxelArena = RecordArena<VoxelRecord>;

}  // namespace genomemem

#endif  // RECORD_ARENA_HPP
