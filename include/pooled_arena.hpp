#ifndef POOLED_ARENA_HPP
#define POOLED_ARENA_HPP

#include <tbb/concurrent_queue.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "arena.hpp"
#include "logger.hpp"
#include "pool_lease.hpp"

namespace genomemem {

struct ArenaPoolStats {
  uint64_t allocations = 0;  // arenas constructed
  uint64_t reuses = 0;       // checkouts, including the first one

  bool operator==(const ArenaPoolStats&) const = default;
};

/**
 * Pool of same-sized Arenas.
 *
 * Every checkout is reset before it is handed out. Arenas of any other
 * capacity are refused on return and freed.
 */
class PooledArena {
 public:
  using value_type = Arena;

  explicit PooledArena(size_t arena_size);

  PooledArena(const PooledArena&) = delete;
  PooledArena& operator=(const PooledArena&) = delete;

  std::unique_ptr<Arena> get_arena();
  void put_arena(std::unique_ptr<Arena> arena);

  // Pool interface used by PoolLease
  std::unique_ptr<Arena> get() { return get_arena(); }
  void put(std::unique_ptr<Arena> arena) { put_arena(std::move(arena)); }

  PoolLease<PooledArena> lease();

  ArenaPoolStats stats() const;

  size_t arena_size() const { return arena_size_; }
  size_t idle_count() const { return idle_.unsafe_size(); }

 private:
  const size_t arena_size_;
  tbb::concurrent_queue<std::unique_ptr<Arena>> idle_;

  mutable std::mutex stats_mutex_;
  ArenaPoolStats stats_;

  ContextLogger logger_;
};

}  // namespace genomemem

#endif  // POOLED_ARENA_HPP
