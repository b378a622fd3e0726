#include "../include/memory_manager.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <set>
#include <thread>
#include <vector>

#include "../include/record_arena.hpp"

using namespace genomemem;

class MemoryManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Small presets keep the test footprint low
    auto config = make_config()
                      .with_particle_slice_capacity(500)
                      .with_voxel_index_capacity(10)
                      .with_raw_buffer_size(4096)
                      .with_coordinate_slice_capacity(500)
                      .with_stream_arena_size(64 * 1024)
                      .with_particle_arena_records(100)
                      .build();
    manager = std::make_unique<MemoryManager>(config);
  }

  std::unique_ptr<MemoryManager> manager;
};

TEST(MemoryConfigTest, DefaultsMatchPresets) {
  MemoryConfig config;
  EXPECT_EQ(config.get_particle_slice_capacity(), 50000u);
  EXPECT_EQ(config.get_voxel_index_capacity(), 1000u);
  EXPECT_EQ(config.get_raw_buffer_size(), 1024u * 1024u);
  EXPECT_EQ(config.get_coordinate_slice_capacity(), 50000u);
  EXPECT_EQ(config.get_stream_arena_size(), 100u * 1024u * 1024u);
  EXPECT_EQ(config.get_particle_arena_records(), 50000u);
  EXPECT_EQ(config.get_particle_arena_size(), 50000u * sizeof(Particle));
  EXPECT_TRUE(config.validate().ok());
}

TEST(MemoryConfigTest, ValidateRejectsZeroCapacity) {
  auto status = make_config().with_voxel_index_capacity(0).build().validate();
  ASSERT_FALSE(status.ok());
  EXPECT_TRUE(status.IsInvalid());
  EXPECT_NE(status.message().find("voxel_index_capacity"), std::string::npos);

  EXPECT_TRUE(
      make_config().with_stream_arena_size(0).build().validate().IsInvalid());
  EXPECT_TRUE(make_config()
                  .with_particle_arena_records(0)
                  .build()
                  .validate()
                  .IsInvalid());
}

TEST(MemoryConfigTest, ValidateRejectsParticleArenaOverflow) {
  constexpr size_t max_records =
      std::numeric_limits<size_t>::max() / sizeof(Particle);

  // One record more would wrap the byte size around to 24
  auto status = make_config()
                    .with_particle_arena_records(max_records + 1)
                    .build()
                    .validate();
  ASSERT_TRUE(status.IsInvalid());
  EXPECT_NE(status.message().find("particle_arena_records too large"),
            std::string::npos);

  EXPECT_TRUE(make_config()
                  .with_particle_arena_records(max_records)
                  .build()
                  .validate()
                  .ok());

  auto result = MemoryManager::create(
      make_config().with_particle_arena_records(max_records + 1).build());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.status().IsInvalid());
}

TEST(MemoryConfigTest, ScaleFactorShrinksEveryPreset) {
  auto config = make_config().with_scale_factor(0.01).build();
  EXPECT_EQ(config.get_particle_slice_capacity(), 500u);
  EXPECT_EQ(config.get_voxel_index_capacity(), 10u);
  EXPECT_EQ(config.get_stream_arena_size(), 1048576u);
  EXPECT_TRUE(config.validate().ok());

  // Never scales to zero
  auto tiny = make_config().with_scale_factor(1e-9).build();
  EXPECT_EQ(tiny.get_voxel_index_capacity(), 1u);
  EXPECT_TRUE(tiny.validate().ok());
}

TEST(MemoryConfigTest, UnusableScaleFactorKeepsPresets) {
  MemoryConfig presets;
  for (double factor : {-1.0, 0.0, std::nan(""),
                        std::numeric_limits<double>::infinity()}) {
    auto config = make_config().with_scale_factor(factor).build();
    EXPECT_EQ(config.get_particle_slice_capacity(),
              presets.get_particle_slice_capacity())
        << "factor " << factor;
    EXPECT_EQ(config.get_stream_arena_size(), presets.get_stream_arena_size())
        << "factor " << factor;
    EXPECT_TRUE(config.validate().ok()) << "factor " << factor;
  }
}

TEST(MemoryConfigTest, HugeScaleFactorSaturates) {
  auto config = make_config().with_scale_factor(1e30).build();
  EXPECT_EQ(config.get_stream_arena_size(),
            std::numeric_limits<size_t>::max());
  EXPECT_EQ(config.get_particle_arena_records(),
            std::numeric_limits<size_t>::max());
  // Saturated record count cannot be turned into a byte size
  EXPECT_TRUE(config.validate().IsInvalid());
}

TEST(MemoryManagerCreateTest, CreatePropagatesInvalidConfig) {
  auto result =
      MemoryManager::create(make_config().with_raw_buffer_size(0).build());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(result.status().IsInvalid());
}

TEST(MemoryManagerCreateTest, CreateBuildsFromValidConfig) {
  auto result = MemoryManager::create(
      make_config().with_scale_factor(0.001).build());
  ASSERT_TRUE(result.ok()) << result.status().ToString();
  auto manager = std::move(result).ValueOrDie();
  EXPECT_EQ(manager->config().get_particle_slice_capacity(), 50u);
  EXPECT_EQ(manager->get_particle_slice()->capacity, 50u);
}

TEST_F(MemoryManagerTest, ContainersUseConfiguredCapacities) {
  auto particles = manager->get_particle_slice();
  auto voxel = manager->get_voxel_data();
  auto buffer = manager->get_buffer();
  auto coords = manager->get_coordinates();
  auto stream = manager->get_stream_arena();
  auto particle_arena = manager->get_particle_arena();

  EXPECT_EQ(particles->capacity, 500u);
  EXPECT_EQ(voxel->capacity, 10u);
  EXPECT_EQ(buffer->data.size(), 4096u);
  EXPECT_EQ(coords->data.size(), 500u);
  EXPECT_EQ(stream->capacity(), 64u * 1024u);
  EXPECT_EQ(particle_arena->capacity(), 100u * 40u);

  manager->put_particle_slice(std::move(particles));
  manager->put_voxel_data(std::move(voxel));
  manager->put_buffer(std::move(buffer));
  manager->put_coordinates(std::move(coords));
  manager->put_stream_arena(std::move(stream));
  manager->put_particle_arena(std::move(particle_arena));

  MemoryStats stats = manager->stats();
  EXPECT_EQ(stats.idle_particle_slices, 1u);
  EXPECT_EQ(stats.idle_voxel_data, 1u);
  EXPECT_EQ(stats.idle_buffers, 1u);
  EXPECT_EQ(stats.idle_coordinate_slices, 1u);
  EXPECT_EQ(stats.idle_stream_arenas, 1u);
  EXPECT_EQ(stats.idle_particle_arenas, 1u);
}

TEST_F(MemoryManagerTest, StatsAggregateSubComponents) {
  for (int i = 0; i < 5; ++i) {
    manager->put_particle_slice(manager->get_particle_slice());
    manager->put_stream_arena(manager->get_stream_arena());
  }
  manager->put_particle_arena(manager->get_particle_arena());

  MemoryStats stats = manager->stats();
  EXPECT_EQ(stats.particle_pool.gets, 5u);
  EXPECT_EQ(stats.particle_pool.puts, 5u);
  EXPECT_EQ(stats.particle_pool.reuses, 5u);
  EXPECT_EQ(stats.stream_arena.allocations, 1u);
  EXPECT_EQ(stats.stream_arena.reuses, 5u);
  EXPECT_EQ(stats.particle_arena.allocations, 1u);
  EXPECT_EQ(stats.particle_arena.reuses, 1u);

  std::string text = stats.to_string();
  EXPECT_NE(text.find("particle_pool{gets=5, puts=5, reuses=5"),
            std::string::npos);
  EXPECT_NE(text.find("stream_arena{allocations=1, reuses=5"),
            std::string::npos);
}

TEST_F(MemoryManagerTest, WrongSizedReturnsAreDropped) {
  manager->put_stream_arena(std::make_unique<Arena>(1024));
  manager->put_particle_arena(std::make_unique<Arena>(1024));
  manager->put_buffer(std::make_unique<RawBuffer>(1));
  manager->put_voxel_data(std::make_unique<VoxelData>(11));

  MemoryStats stats = manager->stats();
  EXPECT_EQ(stats.idle_stream_arenas, 0u);
  EXPECT_EQ(stats.idle_particle_arenas, 0u);
  EXPECT_EQ(stats.idle_buffers, 0u);
  EXPECT_EQ(stats.idle_voxel_data, 0u);
}

TEST_F(MemoryManagerTest, ParticleArenaHoldsConfiguredRecords) {
  auto arena = manager->get_particle_arena();
  ParticleArena particles(*arena);
  EXPECT_EQ(particles.capacity_records(), 100u);
  ASSERT_NE(particles.alloc_typed(100).data(), nullptr);
  EXPECT_EQ(particles.alloc_typed(1).data(), nullptr);
  manager->put_particle_arena(std::move(arena));

  // Comes back rewound
  auto again = manager->get_particle_arena();
  EXPECT_EQ(again->used(), 0u);
}

TEST_F(MemoryManagerTest, StreamingWorkload) {
  // Stream fixed-size chunks through pooled arenas, swapping arenas when
  // one fills up, and stage particles for each chunk
  constexpr size_t chunk_bytes = 10 * 1024;
  auto arena = manager->get_stream_arena();
  size_t swaps = 0;
  for (int chunk = 0; chunk < 20; ++chunk) {
    auto data = arena->alloc(chunk_bytes);
    if (data.data() == nullptr) {
      manager->put_stream_arena(std::move(arena));
      arena = manager->get_stream_arena();
      data = arena->alloc(chunk_bytes);
      ++swaps;
    }
    ASSERT_NE(data.data(), nullptr);

    auto lease = manager->particle_pool().lease();
    for (size_t j = 0; j < 100; ++j) {
      lease->data[j].position = {1.0f, 2.0f, 3.0f};
    }
    lease->length = 100;
  }
  manager->put_stream_arena(std::move(arena));

  // 6 chunks fit per 64KB arena
  EXPECT_EQ(swaps, 3u);
  MemoryStats stats = manager->stats();
  EXPECT_EQ(stats.stream_arena.allocations, 1u);
  EXPECT_EQ(stats.stream_arena.reuses, 4u);
  EXPECT_EQ(stats.particle_pool.gets, 20u);
  EXPECT_EQ(stats.idle_particle_slices, 1u);
}

TEST_F(MemoryManagerTest, ConcurrentMixedCheckouts) {
  constexpr int num_threads = 8;
  constexpr int iterations = 300;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < iterations; ++i) {
        auto particles = manager->get_particle_slice();
        auto voxel = manager->get_voxel_data();
        auto buffer = manager->get_buffer();
        auto coords = manager->get_coordinates();
        auto stream = manager->get_stream_arena();
        auto particle_arena = manager->get_particle_arena();

        if (particles->length != 0 || voxel->count != 0 ||
            buffer->length != 0 || coords->length != 0 ||
            stream->used() != 0 || particle_arena->used() != 0) {
          failures.fetch_add(1);
        }

        // Tag everything; a container shared with another thread would
        // lose its tag
        const auto tag = static_cast<uint32_t>(t);
        particles->data[0].metadata = tag;
        particles->length = 1;
        voxel->add(tag);
        buffer->data[0] = static_cast<std::byte>(t);
        buffer->length = 1;
        auto bytes = stream->alloc(1024);
        auto records = ParticleArena(*particle_arena).alloc_typed(10);
        if (bytes.data() == nullptr || records.data() == nullptr) {
          failures.fetch_add(1);
        } else {
          records[0].metadata = tag;
        }

        if (particles->data[0].metadata != tag ||
            voxel->particle_indices[0] != tag ||
            buffer->data[0] != static_cast<std::byte>(t) ||
            (records.data() != nullptr && records[0].metadata != tag)) {
          failures.fetch_add(1);
        }

        manager->put_particle_slice(std::move(particles));
        manager->put_voxel_data(std::move(voxel));
        manager->put_buffer(std::move(buffer));
        manager->put_coordinates(std::move(coords));
        manager->put_stream_arena(std::move(stream));
        manager->put_particle_arena(std::move(particle_arena));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);

  const auto total = static_cast<uint64_t>(num_threads * iterations);
  MemoryStats stats = manager->stats();
  EXPECT_EQ(stats.particle_pool.gets, total);
  EXPECT_EQ(stats.particle_pool.puts, total);
  EXPECT_EQ(stats.stream_arena.reuses, total);
  EXPECT_EQ(stats.particle_arena.reuses, total);
  EXPECT_LE(stats.stream_arena.allocations, static_cast<uint64_t>(num_threads));
  EXPECT_LE(stats.particle_arena.allocations,
            static_cast<uint64_t>(num_threads));

  // Every arena ever built came back, and no pool grew past one container
  // per thread
  EXPECT_EQ(stats.idle_stream_arenas, stats.stream_arena.allocations);
  EXPECT_EQ(stats.idle_particle_arenas, stats.particle_arena.allocations);
  EXPECT_LE(stats.idle_particle_slices, static_cast<size_t>(num_threads));
  EXPECT_LE(stats.idle_voxel_data, static_cast<size_t>(num_threads));
  EXPECT_LE(stats.idle_buffers, static_cast<size_t>(num_threads));
  EXPECT_LE(stats.idle_coordinate_slices, static_cast<size_t>(num_threads));
}

TEST(MemoryManagerGlobalTest, SameInstanceAcrossThreads) {
  constexpr int num_threads = 16;
  std::vector<MemoryManager*> seen(num_threads, nullptr);

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&seen, t] { seen[t] = &MemoryManager::global(); });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<MemoryManager*> distinct(seen.begin(), seen.end());
  EXPECT_EQ(distinct.size(), 1u);
  EXPECT_EQ(*distinct.begin(), &MemoryManager::global());
}

TEST(MemoryManagerGlobalTest, GlobalUsesDefaultPresets) {
  MemoryManager& global = MemoryManager::global();
  EXPECT_EQ(global.config().get_particle_slice_capacity(),
            defaults::PARTICLE_SLICE_CAPACITY);

  auto voxel = global.get_voxel_data();
  EXPECT_EQ(voxel->capacity, defaults::VOXEL_INDEX_CAPACITY);
  global.put_voxel_data(std::move(voxel));
}

void use_global_manager_at_exit() {
  MemoryManager& global = MemoryManager::global();
  global.put_voxel_data(global.get_voxel_data());
  std::fputs("global manager alive at exit\n", stderr);
}

TEST(MemoryManagerGlobalDeathTest, OutlivesStaticDestruction) {
  // Fresh process, so global() is first built after the handler is
  // registered and its teardown, if any, would run before the handler
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_EXIT(
      {
        std::atexit(use_global_manager_at_exit);
        MemoryManager::global();
        std::exit(0);
      },
      ::testing::ExitedWithCode(0), "global manager alive at exit");
}
