#pragma once

#include <cstdint>
#include <vector>

#include "upload_types.hpp"

struct ChunkDescriptor {
  uint32_t index = 0;
  uint64_t byte_start = 0;
  uint64_t byte_end = 0; // exclusive

  uint64_t length() const { return byte_end - byte_start; }
};

// Partitions [0, size) into ceil(size / chunk_size) contiguous ranges, never
// fewer than one so empty files still go through upload + merge. Throws
// std::invalid_argument when chunk_size is zero or the count exceeds
// kMaxChunkCount.
std::vector<ChunkDescriptor> plan_chunks(uint64_t size, uint64_t chunk_size);

std::vector<Chunk> make_chunks(const std::vector<ChunkDescriptor>& descriptors);

// Chunk indexes travel as uint32 on the wire.
inline constexpr uint64_t kMaxChunkCount = UINT32_MAX;

inline uint64_t expected_chunk_count(uint64_t size, uint64_t chunk_size) {
  if(chunk_size == 0 || size <= chunk_size) return 1;
  return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}
