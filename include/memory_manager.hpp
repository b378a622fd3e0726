#ifndef MEMORY_MANAGER_HPP
#define MEMORY_MANAGER_HPP

#include <arrow/result.h>

#include <cstddef>
#include <memory>
#include <string>

#include "arena.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "monitored_pool.hpp"
#include "object_pool.hpp"
#include "pooled_arena.hpp"

namespace genomemem {

/**
 * Snapshot of every counter a MemoryManager owns.
 * Idle counts are only exact while no thread is using the manager.
 */
struct MemoryStats {
  PoolStatistics particle_pool;
  ArenaPoolStats stream_arena;
  ArenaPoolStats particle_arena;

  size_t idle_particle_slices = 0;
  size_t idle_voxel_data = 0;
  size_t idle_buffers = 0;
  size_t idle_coordinate_slices = 0;
  size_t idle_stream_arenas = 0;
  size_t idle_particle_arenas = 0;

  std::string to_string() const;
};

/**
 * Owns one pool of each kind, sized from a MemoryConfig, behind a single
 * get/put API for parsers and the streaming grid.
 *
 * Prefer constructing an instance (or create() for a validated config) and
 * passing it to consumers. global() exists for code that cannot be handed
 * one; it is built once on first use and never destroyed.
 */
class MemoryManager {
 public:
  explicit MemoryManager(const MemoryConfig& config = MemoryConfig{});

  MemoryManager(const MemoryManager&) = delete;
  MemoryManager& operator=(const MemoryManager&) = delete;

  /**
   * Validate `config` and build a manager from it.
   * @return the manager, or Invalid naming the offending field
   */
  static arrow::Result<std::unique_ptr<MemoryManager>> create(
      const MemoryConfig& config);

  /**
   * Process-wide manager with default presets. Concurrent first callers all
   * receive the same instance.
   */
  static MemoryManager& global();

  std::unique_ptr<ParticleSlice> get_particle_slice();
  void put_particle_slice(std::unique_ptr<ParticleSlice> slice);

  std::unique_ptr<VoxelData> get_voxel_data();
  void put_voxel_data(std::unique_ptr<VoxelData> voxel);

  std::unique_ptr<RawBuffer> get_buffer();
  void put_buffer(std::unique_ptr<RawBuffer> buffer);

  std::unique_ptr<CoordinateSlice> get_coordinates();
  void put_coordinates(std::unique_ptr<CoordinateSlice> coords);

  std::unique_ptr<Arena> get_stream_arena();
  void put_stream_arena(std::unique_ptr<Arena> arena);

  std::unique_ptr<Arena> get_particle_arena();
  void put_particle_arena(std::unique_ptr<Arena> arena);

  MemoryStats stats() const;
  void log_stats() const;

  const MemoryConfig& config() const { return config_; }

  // Direct access for scoped leases and per-pool inspection
  MonitoredParticlePool& particle_pool() { return particle_pool_; }
  VoxelPool& voxel_pool() { return voxel_pool_; }
  BufferPool& buffer_pool() { return buffer_pool_; }
  CoordinatePool& coordinate_pool() { return coordinate_pool_; }
  PooledArena& stream_arenas() { return stream_arenas_; }
  PooledArena& particle_arenas() { return particle_arenas_; }

 private:
  const MemoryConfig config_;

  MonitoredParticlePool particle_pool_;
  VoxelPool voxel_pool_;
  BufferPool buffer_pool_;
  CoordinatePool coordinate_pool_;
  PooledArena stream_arenas_;
  PooledArena particle_arenas_;

  ContextLogger logger_{"MemoryManager"};
};

}  // namespace genomemem

#endif  // MEMORY_MANAGER_HPP
