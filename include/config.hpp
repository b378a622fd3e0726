#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <arrow/status.h>

#include <cmath>
#include <cstddef>
#include <limits>

#include "mem_utils.hpp"
#include "records.hpp"

namespace genomemem {

// Preset capacities used by MemoryManager
namespace defaults {
constexpr size_t PARTICLE_SLICE_CAPACITY = 50000;    // particles per slice
constexpr size_t VOXEL_INDEX_CAPACITY = 1000;        // indices per voxel
constexpr size_t RAW_BUFFER_SIZE = 1 * MiB;          // disk -> GPU buffers
constexpr size_t COORDINATE_SLICE_CAPACITY = 50000;  // xyz triples per slice
constexpr size_t STREAM_ARENA_SIZE = 100 * MiB;
constexpr size_t PARTICLE_ARENA_RECORDS = 50000;
}  // namespace defaults

// Sizes of every pool and arena owned by a MemoryManager
class MemoryConfig {
 private:
  size_t particle_slice_capacity = defaults::PARTICLE_SLICE_CAPACITY;
  size_t voxel_index_capacity = defaults::VOXEL_INDEX_CAPACITY;
  size_t raw_buffer_size = defaults::RAW_BUFFER_SIZE;
  size_t coordinate_slice_capacity = defaults::COORDINATE_SLICE_CAPACITY;
  size_t stream_arena_size = defaults::STREAM_ARENA_SIZE;

  // Counted in Particle records, not bytes
  size_t particle_arena_records = defaults::PARTICLE_ARENA_RECORDS;

  friend class MemoryConfigBuilder;

 public:
  size_t get_particle_slice_capacity() const {
    return particle_slice_capacity;
  }
  size_t get_voxel_index_capacity() const { return voxel_index_capacity; }
  size_t get_raw_buffer_size() const { return raw_buffer_size; }
  size_t get_coordinate_slice_capacity() const {
    return coordinate_slice_capacity;
  }
  size_t get_stream_arena_size() const { return stream_arena_size; }
  size_t get_particle_arena_records() const { return particle_arena_records; }
  size_t get_particle_arena_size() const {
    return particle_arena_records * sizeof(Particle);
  }

  /**
   * Every pool needs a non-zero capacity; a zero-sized pool would hand out
   * containers that can never hold a record.
   */
  arrow::Status validate() const {
    if (particle_slice_capacity == 0) {
      return arrow::Status::Invalid("particle_slice_capacity must be > 0");
    }
    if (voxel_index_capacity == 0) {
      return arrow::Status::Invalid("voxel_index_capacity must be > 0");
    }
    if (raw_buffer_size == 0) {
      return arrow::Status::Invalid("raw_buffer_size must be > 0");
    }
    if (coordinate_slice_capacity == 0) {
      return arrow::Status::Invalid("coordinate_slice_capacity must be > 0");
    }
    if (stream_arena_size == 0) {
      return arrow::Status::Invalid("stream_arena_size must be > 0");
    }
    if (particle_arena_records == 0) {
      return arrow::Status::Invalid("particle_arena_records must be > 0");
    }
    // get_particle_arena_size() must not wrap
    if (particle_arena_records >
        std::numeric_limits<size_t>::max() / sizeof(Particle)) {
      return arrow::Status::Invalid("particle_arena_records too large");
    }
    return arrow::Status::OK();
  }
};

class MemoryConfigBuilder {
 private:
  MemoryConfig config;

 public:
  MemoryConfigBuilder() = default;

  MemoryConfigBuilder &with_particle_slice_capacity(size_t capacity) {
    config.particle_slice_capacity = capacity;
    return *this;
  }

  MemoryConfigBuilder &with_voxel_index_capacity(size_t capacity) {
    config.voxel_index_capacity = capacity;
    return *this;
  }

  MemoryConfigBuilder &with_raw_buffer_size(size_t size) {
    config.raw_buffer_size = size;
    return *this;
  }

  MemoryConfigBuilder &with_coordinate_slice_capacity(size_t capacity) {
    config.coordinate_slice_capacity = capacity;
    return *this;
  }

  MemoryConfigBuilder &with_stream_arena_size(size_t size) {
    config.stream_arena_size = size;
    return *this;
  }

  MemoryConfigBuilder &with_particle_arena_records(size_t records) {
    config.particle_arena_records = records;
    return *this;
  }

  /**
   * Scale every preset at once, e.g. 0.01 for unit tests. A factor that is
   * not a finite positive number leaves the presets unscaled; results are
   * clamped to [1, SIZE_MAX].
   */
  MemoryConfigBuilder &with_scale_factor(double factor) {
    if (!std::isfinite(factor) || !(factor > 0.0)) {
      factor = 1.0;
    }
    auto scaled = [factor](size_t value) {
      constexpr size_t max_size = std::numeric_limits<size_t>::max();
      double product = static_cast<double>(value) * factor;
      if (product >= static_cast<double>(max_size)) {
        return max_size;
      }
      auto result = static_cast<size_t>(product);
      return result == 0 ? size_t{1} : result;
    };
    config.particle_slice_capacity =
        scaled(defaults::PARTICLE_SLICE_CAPACITY);
    config.voxel_index_capacity = scaled(defaults::VOXEL_INDEX_CAPACITY);
    config.raw_buffer_size = scaled(defaults::RAW_BUFFER_SIZE);
    config.coordinate_slice_capacity =
        scaled(defaults::COORDINATE_SLICE_CAPACITY);
    config.stream_arena_size = scaled(defaults::STREAM_ARENA_SIZE);
    config.particle_arena_records = scaled(defaults::PARTICLE_ARENA_RECORDS);
    return *this;
  }

  [[nodiscard]] MemoryConfig build() const { return config; }
};

inline MemoryConfigBuilder make_config() { return {}; }

}  // namespace genomemem

#endif  // CONFIG_HPP
