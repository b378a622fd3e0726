#ifndef POOL_LEASE_HPP
#define POOL_LEASE_HPP

#include <memory>
#include <utility>

namespace genomemem {

/**
 * Scoped checkout from a pool.
 *
 * Takes an object with pool.get() on construction and hands it back with
 * pool.put() on destruction, so an early return cannot leak it. Works with
 * any pool exposing `value_type`, `get()` and `put(std::unique_ptr<...>)`.
 * The pool must outlive the lease.
 */
template <typename Pool>
class PoolLease {
 public:
  using value_type = typename Pool::value_type;

  explicit PoolLease(Pool& pool) : pool_(&pool), object_(pool.get()) {}

  ~PoolLease() { give_back(); }

  PoolLease(const PoolLease&) = delete;
  PoolLease& operator=(const PoolLease&) = delete;

  PoolLease(PoolLease&& other) noexcept
      : pool_(std::exchange(other.pool_, nullptr)),
        object_(std::move(other.object_)) {}

  PoolLease& operator=(PoolLease&& other) noexcept {
    if (this != &other) {
      give_back();
      pool_ = std::exchange(other.pool_, nullptr);
      object_ = std::move(other.object_);
    }
    return *this;
  }

  value_type* get() const { return object_.get(); }
  value_type* operator->() const { return object_.get(); }
  value_type& operator*() const { return *object_; }
  explicit operator bool() const { return object_ != nullptr; }

  /**
   * Detach the object from the lease. The caller becomes responsible for
   * returning it to the pool.
   */
  std::unique_ptr<value_type> release() { return std::move(object_); }

 private:
  void give_back() {
    if (pool_ && object_) {
      pool_->put(std::move(object_));
    }
  }

  Pool* pool_;
  std::unique_ptr<value_type> object_;
};

}  // namespace genomemem

#endif  // POOL_LEASE_HPP
