#ifndef STREAM_BUFFER_HPP
#define STREAM_BUFFER_HPP

#include <arrow/result.h>

#include <cstddef>
#include <span>

#include "arena.hpp"

namespace genomemem {

/**
 * Sequential fixed-size chunk consumer for streaming files through memory.
 *
 * Chunks come out of one owned Arena, so reading a file costs no heap
 * allocation per chunk. Once the arena cannot fit another chunk, get_chunk()
 * reports CapacityError until reset() is called.
 */
class StreamBuffer {
 public:
  StreamBuffer(size_t total_size, size_t chunk_size);

  StreamBuffer(const StreamBuffer&) = delete;
  StreamBuffer& operator=(const StreamBuffer&) = delete;

  /**
   * Next chunk of chunk_size() bytes.
   * @return the chunk, or CapacityError("stream buffer full")
   */
  arrow::Result<std::span<std::byte>> get_chunk();

  // Rewind for the next file; the active chunk is cleared
  void reset();

  // Most recent chunk handed out, empty after reset()
  std::span<std::byte> active_chunk() const { return active_chunk_; }

  size_t chunk_size() const { return chunk_size_; }
  size_t used() const { return arena_.used(); }
  size_t available() const { return arena_.available(); }

 private:
  Arena arena_;
  const size_t chunk_size_;
  std::span<std::byte> active_chunk_;
};

}  // namespace genomemem

#endif  // STREAM_BUFFER_HPP
