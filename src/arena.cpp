#include "../include/arena.hpp"

namespace genomemem {

Arena::Arena(size_t capacity)
    : buffer_(std::make_unique_for_overwrite<std::byte[]>(capacity)),
      capacity_(capacity) {}

std::span<std::byte> Arena::alloc(size_t size) {
  const size_t reserved = align8(size);

  std::lock_guard<std::mutex> lock(mutex_);
  // Compare against the remaining room so a huge `size` cannot overflow
  if (reserved < size || reserved > capacity_ - offset_) {
    return {};
  }

  std::byte* start = buffer_.get() + offset_;
  offset_ += reserved;
  return {start, size};
}

void Arena::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  offset_ = 0;
}

size_t Arena::used() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return offset_;
}

size_t Arena::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_ - offset_;
}

}  // namespace genomemem
