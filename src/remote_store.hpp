#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "cancellation.hpp"

struct CheckResult {
  bool already_complete = false;
  std::vector<uint32_t> received_chunk_indexes;
  std::string url; // set by stores that expose the finished file
};

struct MergeResult {
  std::string url;
};

// Remote chunk store addressed by fingerprint. Every call honours the owning
// file's CancellationHandle and throws UploadError (NetworkError, Cancelled,
// ServerError) on failure.
class RemoteStore {
public:
  // Bytes acknowledged so far for the chunk being sent, out of its total.
  using ChunkProgress = std::function<void(uint64_t bytes_sent, uint64_t bytes_total)>;

  virtual ~RemoteStore() = default;

  virtual CheckResult check(const std::string& fingerprint,
                            const std::string& filename,
                            uint64_t size,
                            const CancellationHandle& cancel) = 0;

  // Re-sending a chunk the store already holds is not an error.
  virtual void upload_chunk(const std::string& fingerprint,
                            const std::string& filename,
                            uint32_t chunk_index,
                            uint32_t total_chunks,
                            const std::vector<char>& bytes,
                            const ChunkProgress& on_progress,
                            const CancellationHandle& cancel) = 0;

  // Idempotent; only valid once every chunk has been received.
  virtual MergeResult merge(const std::string& fingerprint,
                            const std::string& filename,
                            uint64_t size,
                            uint32_t total_chunks,
                            const CancellationHandle& cancel) = 0;

  // Health check; false when the store is unreachable or unhealthy.
  virtual bool ping(const CancellationHandle& cancel) = 0;
};
