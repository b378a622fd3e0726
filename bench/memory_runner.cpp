#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../include/arena.hpp"
#include "../include/logger.hpp"
#include "../include/memory_manager.hpp"
#include "../include/object_pool.hpp"
#include "../include/record_arena.hpp"

using namespace genomemem;

namespace {

constexpr size_t BATCH = 1000;
constexpr size_t STREAM_CHUNK_SIZE = 100 * KiB;
constexpr int CHUNKS_PER_FILE = 10;

struct RunResult {
  std::string name;
  int iterations = 0;
  std::chrono::microseconds duration{0};
};

void fill_particles(Particle* particles, size_t count) {
  for (size_t j = 0; j < count; ++j) {
    auto f = static_cast<float>(j);
    particles[j].position = {f, f, f};
    particles[j].color = {1.0f, 0.0f, 0.0f, 1.0f};
    particles[j].size = 1.0f;
    particles[j].metadata = j;
  }
}

template <typename Body>
RunResult timed(const std::string& name, int iterations, Body&& body) {
  auto start = std::chrono::high_resolution_clock::now();
  for (int i = 0; i < iterations; ++i) {
    body(i);
  }
  auto end = std::chrono::high_resolution_clock::now();
  return {name, iterations,
          std::chrono::duration_cast<std::chrono::microseconds>(end - start)};
}

void print_result(const RunResult& result) {
  std::cout << "\n=== " << result.name << " ===\n"
            << "Iterations: " << result.iterations << "\n"
            << "Duration:   " << result.duration.count() << " us\n";
}

void compare(const RunResult& naive, const RunResult& optimized) {
  if (optimized.duration.count() == 0) {
    std::cout << "Speedup " << naive.name << " -> " << optimized.name
              << ": n/a\n";
    return;
  }
  double speedup = static_cast<double>(naive.duration.count()) /
                   static_cast<double>(optimized.duration.count());
  std::cout << "Speedup " << naive.name << " -> " << optimized.name << ": "
            << std::fixed << std::setprecision(2) << speedup << "x\n";
}

RunResult run_naive(int iterations) {
  // Keep up to 100 batches alive, as a parser holding recent blocks would
  std::vector<std::vector<Particle>> recent;
  return timed("Naive Allocation", iterations, [&](int i) {
    if (i % 100 == 0) {
      recent.clear();
    }
    std::vector<Particle> particles(BATCH);
    fill_particles(particles.data(), BATCH);
    recent.push_back(std::move(particles));
  });
}

RunResult run_pooled(int iterations) {
  ParticlePool pool(BATCH);
  return timed("Pooled Allocation", iterations, [&](int) {
    auto slice = pool.get();
    fill_particles(slice->data.data(), BATCH);
    slice->length = BATCH;
    pool.put(std::move(slice));
  });
}

RunResult run_arena(int iterations) {
  Arena arena(ParticleArena::bytes_for(BATCH));
  ParticleArena particles(arena);
  return timed("Arena Allocation", iterations, [&](int) {
    auto span = particles.alloc_typed(BATCH);
    if (span.data() == nullptr) {
      particles.reset();
      span = particles.alloc_typed(BATCH);
    }
    fill_particles(span.data(), span.size());
  });
}

RunResult run_manager(MemoryManager& manager, int iterations) {
  auto result = timed("Memory Manager", iterations, [&](int) {
    auto particles = manager.get_particle_slice();
    auto voxel = manager.get_voxel_data();
    auto buffer = manager.get_buffer();
    auto coords = manager.get_coordinates();

    fill_particles(particles->data.data(),
                   std::min(BATCH, particles->capacity));

    manager.put_particle_slice(std::move(particles));
    manager.put_voxel_data(std::move(voxel));
    manager.put_buffer(std::move(buffer));
    manager.put_coordinates(std::move(coords));
  });
  std::cout << "\nMemory Manager statistics:\n"
            << manager.stats().to_string() << "\n";
  return result;
}

RunResult run_streaming(MemoryManager& manager, int files) {
  return timed("Streaming Scenario", files, [&](int) {
    auto arena = manager.get_stream_arena();
    for (int chunk = 0; chunk < CHUNKS_PER_FILE; ++chunk) {
      auto data = arena->alloc(STREAM_CHUNK_SIZE);
      if (data.data() == nullptr) {
        manager.put_stream_arena(std::move(arena));
        arena = manager.get_stream_arena();
        data = arena->alloc(STREAM_CHUNK_SIZE);
      }

      auto lease = manager.particle_pool().lease();
      fill_particles(lease->data.data(), std::min(BATCH, lease->capacity));
      lease->length = std::min(BATCH, lease->capacity);
    }
    manager.put_stream_arena(std::move(arena));
  });
}

}  // namespace

int main(int argc, char** argv) {
  int iterations = (argc >= 2) ? std::atoi(argv[1]) : 10000;
  int files = (argc >= 3) ? std::atoi(argv[2]) : 1000;
  if (iterations <= 0 || files <= 0) {
    std::cerr << "Usage: " << argv[0] << " [iterations] [streamed_files]\n";
    return 1;
  }

  log_info("running allocation scenarios: iterations={} files={}", iterations,
           files);

  auto naive = run_naive(iterations);
  print_result(naive);

  auto pooled = run_pooled(iterations);
  print_result(pooled);
  compare(naive, pooled);

  auto arena = run_arena(iterations);
  print_result(arena);
  compare(naive, arena);

  MemoryManager& manager = MemoryManager::global();
  auto managed = run_manager(manager, iterations);
  print_result(managed);
  compare(naive, managed);

  auto streaming = run_streaming(manager, files);
  print_result(streaming);

  manager.log_stats();
  return 0;
}
