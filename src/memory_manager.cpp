#include "../include/memory_manager.hpp"

#include <arrow/status.h>

namespace genomemem {

std::string MemoryStats::to_string() const {
  return spdlog::fmt_lib::format(
      "particle_pool{{gets={}, puts={}, reuses={}, idle={}}} "
      "stream_arena{{allocations={}, reuses={}, idle={}}} "
      "particle_arena{{allocations={}, reuses={}, idle={}}} "
      "idle{{voxel_data={}, buffers={}, coordinates={}}}",
      particle_pool.gets, particle_pool.puts, particle_pool.reuses,
      idle_particle_slices, stream_arena.allocations, stream_arena.reuses,
      idle_stream_arenas, particle_arena.allocations, particle_arena.reuses,
      idle_particle_arenas, idle_voxel_data, idle_buffers,
      idle_coordinate_slices);
}

MemoryManager::MemoryManager(const MemoryConfig& config)
    : config_(config),
      particle_pool_(config.get_particle_slice_capacity(), "ParticlePool"),
      voxel_pool_(config.get_voxel_index_capacity(), "VoxelPool"),
      buffer_pool_(config.get_raw_buffer_size(), "BufferPool"),
      coordinate_pool_(config.get_coordinate_slice_capacity(),
                       "CoordinatePool"),
      stream_arenas_(config.get_stream_arena_size()),
      particle_arenas_(config.get_particle_arena_size()) {
  logger_.debug(
      "created: particles={} voxel_indices={} buffer_bytes={} "
      "coordinates={} stream_arena_bytes={} particle_arena_bytes={}",
      config.get_particle_slice_capacity(), config.get_voxel_index_capacity(),
      config.get_raw_buffer_size(), config.get_coordinate_slice_capacity(),
      config.get_stream_arena_size(), config.get_particle_arena_size());
}

arrow::Result<std::unique_ptr<MemoryManager>> MemoryManager::create(
    const MemoryConfig& config) {
  ARROW_RETURN_NOT_OK(config.validate());
  return std::make_unique<MemoryManager>(config);
}

namespace {

// Holds the process-wide manager; the empty destructor means the manager's
// own destructor never runs
union GlobalManagerStorage {
  GlobalManagerStorage() : manager() {}
  ~GlobalManagerStorage() {}

  MemoryManager manager;
};

}  // namespace

MemoryManager& MemoryManager::global() {
  // Constructed on first use, never destroyed
  static GlobalManagerStorage storage;
  return storage.manager;
}

std::unique_ptr<ParticleSlice> MemoryManager::get_particle_slice() {
  return particle_pool_.get();
}

void MemoryManager::put_particle_slice(std::unique_ptr<ParticleSlice> slice) {
  particle_pool_.put(std::move(slice));
}

std::unique_ptr<VoxelData> MemoryManager::get_voxel_data() {
  return voxel_pool_.get();
}

void MemoryManager::put_voxel_data(std::unique_ptr<VoxelData> voxel) {
  voxel_pool_.put(std::move(voxel));
}

std::unique_ptr<RawBuffer> MemoryManager::get_buffer() {
  return buffer_pool_.get();
}

void MemoryManager::put_buffer(std::unique_ptr<RawBuffer> buffer) {
  buffer_pool_.put(std::move(buffer));
}

std::unique_ptr<CoordinateSlice> MemoryManager::get_coordinates() {
  return coordinate_pool_.get();
}

void MemoryManager::put_coordinates(std::unique_ptr<CoordinateSlice> coords) {
  coordinate_pool_.put(std::move(coords));
}

std::unique_ptr<Arena> MemoryManager::get_stream_arena() {
  return stream_arenas_.get_arena();
}

void MemoryManager::put_stream_arena(std::unique_ptr<Arena> arena) {
  stream_arenas_.put_arena(std::move(arena));
}

std::unique_ptr<Arena> MemoryManager::get_particle_arena() {
  return particle_arenas_.get_arena();
}

void MemoryManager::put_particle_arena(std::unique_ptr<Arena> arena) {
  particle_arenas_.put_arena(std::move(arena));
}

MemoryStats MemoryManager::stats() const {
  MemoryStats stats;
  stats.particle_pool = particle_pool_.stats();
  stats.stream_arena = stream_arenas_.stats();
  stats.particle_arena = particle_arenas_.stats();

  stats.idle_particle_slices = particle_pool_.pool().idle_count();
  stats.idle_voxel_data = voxel_pool_.idle_count();
  stats.idle_buffers = buffer_pool_.idle_count();
  stats.idle_coordinate_slices = coordinate_pool_.idle_count();
  stats.idle_stream_arenas = stream_arenas_.idle_count();
  stats.idle_particle_arenas = particle_arenas_.idle_count();
  return stats;
}

void MemoryManager::log_stats() const {
  logger_.info("{}", stats().to_string());
}

}  // namespace genomemem
