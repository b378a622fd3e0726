#ifndef OBJECT_POOL_HPP
#define OBJECT_POOL_HPP

#include <tbb/concurrent_queue.h>

#include <cstddef>
#include <memory>
#include <string>

#include "logger.hpp"
#include "pool_containers.hpp"
#include "pool_lease.hpp"

namespace genomemem {

/**
 * Recycles fixed-capacity containers.
 *
 * get() hands out an idle container, or builds one at the pool capacity when
 * none is idle, with its logical length reset. put() takes it back only if
 * its capacity matches exactly; anything else is freed so that a wrong-sized
 * container never reaches a later borrower.
 *
 * Thread-safe: the idle store is a tbb::concurrent_queue. Any idle container
 * may satisfy any get(), there is no ordering between a put() and the next
 * get().
 */
template <Poolable Container>
class ObjectPool {
 public:
  using value_type = Container;

  explicit ObjectPool(size_t capacity, std::string name = "ObjectPool")
      : capacity_(capacity),
        logger_(std::move(name) + "[" + std::to_string(capacity) + "]") {}

  ObjectPool(const ObjectPool&) = delete;
  ObjectPool& operator=(const ObjectPool&) = delete;

  std::unique_ptr<Container> get() {
    std::unique_ptr<Container> container;
    if (!idle_.try_pop(container)) {
      container = std::make_unique<Container>(capacity_);
    }
    container->reset();
    return container;
  }

  void put(std::unique_ptr<Container> container) {
    if (!container) {
      return;
    }
    if (container->capacity != capacity_) {
      logger_.debug("dropping container with capacity {}",
                    container->capacity);
      return;
    }
    container->reset();
    idle_.push(std::move(container));
  }

  PoolLease<ObjectPool> lease() { return PoolLease<ObjectPool>(*this); }

  size_t capacity() const { return capacity_; }

  // Exact only while no other thread is using the pool
  size_t idle_count() const { return idle_.unsafe_size(); }

 private:
  const size_t capacity_;
  tbb::concurrent_queue<std::unique_ptr<Container>> idle_;
  ContextLogger logger_;
};

using ParticlePool = ObjectPool<ParticleSlice>;
using VoxelPool = ObjectPool<VoxelData>;
using BufferPool = ObjectPool<RawBuffer>;
using CoordinatePool = ObjectPool<CoordinateSlice>;

}  // namespace genomemem

#endif  // OBJECT_POOL_HPP
