#ifndef MONITORED_POOL_HPP
#define MONITORED_POOL_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "object_pool.hpp"
#include "pool_lease.hpp"

namespace genomemem {

struct PoolStatistics {
  uint64_t gets = 0;
  uint64_t puts = 0;
  // Containers handed back, whether or not the pool kept them
  uint64_t reuses = 0;

  bool operator==(const PoolStatistics&) const = default;
};

/**
 * Pool decorator that counts calls.
 *
 * Counters live under their own mutex, which is released before the call is
 * forwarded, so the decorated pool is never entered with it held.
 */
template <typename Pool>
class MonitoredPool {
 public:
  using value_type = typename Pool::value_type;

  template <typename... Args>
  explicit MonitoredPool(Args&&... args) : pool_(std::forward<Args>(args)...) {}

  std::unique_ptr<value_type> get() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.gets;
    }
    return pool_.get();
  }

  void put(std::unique_ptr<value_type> object) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.puts;
      ++stats_.reuses;
    }
    pool_.put(std::move(object));
  }

  PoolLease<MonitoredPool> lease() { return PoolLease<MonitoredPool>(*this); }

  PoolStatistics stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

  // Zero the counters; pooled containers stay where they are
  void reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = PoolStatistics{};
  }

  Pool& pool() { return pool_; }
  const Pool& pool() const { return pool_; }

 private:
  Pool pool_;
  PoolStatistics stats_;
  mutable std::mutex mutex_;
};

using MonitoredParticlePool = MonitoredPool<ParticlePool>;

}  // namespace genomemem

#endif  // MONITORED_POOL_HPP
