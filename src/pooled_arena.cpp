#include "../include/pooled_arena.hpp"

#include <string>

namespace genomemem {

PooledArena::PooledArena(size_t arena_size)
    : arena_size_(arena_size),
      logger_("PooledArena[" + std::to_string(arena_size) + "]") {}

std::unique_ptr<Arena> PooledArena::get_arena() {
  std::unique_ptr<Arena> arena;
  const bool reused = idle_.try_pop(arena);
  if (!reused) {
    arena = std::make_unique<Arena>(arena_size_);
  }
  arena->reset();

  std::lock_guard<std::mutex> lock(stats_mutex_);
  if (!reused) {
    ++stats_.allocations;
  }
  ++stats_.reuses;
  return arena;
}

void PooledArena::put_arena(std::unique_ptr<Arena> arena) {
  if (!arena) {
    return;
  }
  if (arena->capacity() != arena_size_) {
    logger_.debug("dropping arena with capacity {}", arena->capacity());
    return;
  }
  idle_.push(std::move(arena));
}

PoolLease<PooledArena> PooledArena::lease() {
  return PoolLease<PooledArena>(*this);
}

ArenaPoolStats PooledArena::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

}  // namespace genomemem
