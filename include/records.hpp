#ifndef RECORDS_HPP
#define RECORDS_HPP

#include <array>
#include <cstdint>
#include <type_traits>

namespace genomemem {

/**
 * One genomic data point staged for rendering.
 *
 * Layout: position (12) + color (16) + size (4) + metadata (8) = 40 bytes.
 * Parsers write these straight into arena spans, so the layout is fixed.
 */
struct Particle {
  std::array<float, 3> position;  // x, y, z
  std::array<float, 4> color;     // r, g, b, a
  float size;
  uint64_t metadata;  // genomic position or other tag
};

static_assert(sizeof(Particle) == 40, "Particle record must be 40 bytes");
static_assert(alignof(Particle) == 8);
static_assert(std::is_trivially_copyable_v<Particle>);

/**
 * Spatial index entry for one voxel of the streaming grid.
 */
struct VoxelRecord {
  std::array<float, 3> bounds_min;
  std::array<float, 3> bounds_max;
  uint32_t particle_offset;  // index into the particle array
  uint16_t particle_count;
  uint8_t flags;
  uint8_t padding;
};

static_assert(sizeof(VoxelRecord) == 32, "VoxelRecord must be 32 bytes");
static_assert(std::is_trivially_copyable_v<VoxelRecord>);

// Voxel flag bits
namespace voxel_flags {
constexpr uint8_t VISIBLE = 1 << 0;
constexpr uint8_t DIRTY = 1 << 1;
constexpr uint8_t STREAMING = 1 << 4;
constexpr uint8_t EVICTED = 1 << 5;
}  // namespace voxel_flags

using Coordinate = std::array<float, 3>;

}  // namespace genomemem

#endif  // RECORDS_HPP
