#include "../include/stream_buffer.hpp"

#include <arrow/status.h>

namespace genomemem {

StreamBuffer::StreamBuffer(size_t total_size, size_t chunk_size)
    : arena_(total_size), chunk_size_(chunk_size) {}

arrow::Result<std::span<std::byte>> StreamBuffer::get_chunk() {
  std::span<std::byte> chunk = arena_.alloc(chunk_size_);
  if (chunk.data() == nullptr) {
    return arrow::Status::CapacityError("stream buffer full");
  }
  active_chunk_ = chunk;
  return chunk;
}

void StreamBuffer::reset() {
  arena_.reset();
  active_chunk_ = {};
}

}  // namespace genomemem
