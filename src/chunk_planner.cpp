#include "chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

std::vector<ChunkDescriptor> plan_chunks(uint64_t size, uint64_t chunk_size) {
  if(chunk_size == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
  const uint64_t count = expected_chunk_count(size, chunk_size);
  if(count > kMaxChunkCount) {
    throw std::invalid_argument("file of " + std::to_string(size) + " bytes needs " +
                                std::to_string(count) + " chunks of " + std::to_string(chunk_size) +
                                " bytes, more than " + std::to_string(kMaxChunkCount));
  }
  std::vector<ChunkDescriptor> out;
  out.reserve(static_cast<std::size_t>(count));
  for(uint32_t i = 0; i < count; ++i) {
    ChunkDescriptor d;
    d.index = i;
    d.byte_start = std::min<uint64_t>(static_cast<uint64_t>(i) * chunk_size, size);
    d.byte_end = std::min<uint64_t>((static_cast<uint64_t>(i) + 1) * chunk_size, size);
    out.push_back(d);
  }
  return out;
}

std::vector<Chunk> make_chunks(const std::vector<ChunkDescriptor>& descriptors) {
  std::vector<Chunk> chunks;
  chunks.reserve(descriptors.size());
  for(const auto& d : descriptors) {
    Chunk c;
    c.index = d.index;
    c.byte_start = d.byte_start;
    c.byte_end = d.byte_end;
    chunks.push_back(c);
  }
  return chunks;
}
