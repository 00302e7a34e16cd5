#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "log.hpp"
#include "remote_store.hpp"
#include "retry_policy.hpp"
#include "upload_error.hpp"
#include "upload_types.hpp"

struct ChunkSchedulerConfig {
  std::size_t max_in_flight = 6;
  RetryPolicy retry;
};

// Called with the full chunk list after every chunk state change.
using ChunkProgressCallback = std::function<void(const std::vector<Chunk>& chunks,
                                                 double overall_progress,
                                                 uint64_t uploaded_bytes)>;

struct ChunkScheduleResult {
  enum class Outcome { Succeeded, Failed, Cancelled };
  Outcome outcome = Outcome::Succeeded;
  std::optional<UploadError> error;
  uint64_t uploaded_bytes = 0;
  std::size_t chunks_sent = 0;
};

// Uploads the chunks of one file that the store does not hold yet, with at
// most `max_in_flight` requests outstanding. Chunks are admitted in index
// order; completion order is arbitrary.
class ChunkUploadScheduler {
public:
  ChunkUploadScheduler(std::shared_ptr<RemoteStore> store,
                       ChunkSchedulerConfig config,
                       std::shared_ptr<Logger> logger = nullptr);

  // Blocks until every chunk succeeded, one failed terminally (in-flight ones
  // are allowed to finish) or `cancel` fired. `chunks` is updated in place.
  ChunkScheduleResult run(const UploadFile& file,
                          const std::string& fingerprint,
                          std::vector<Chunk>& chunks,
                          const std::vector<uint32_t>& received_chunk_indexes,
                          const CancellationHandle& cancel,
                          const ChunkProgressCallback& on_progress = {}) const;

  const ChunkSchedulerConfig& config() const { return config_; }

private:
  std::shared_ptr<RemoteStore> store_;
  ChunkSchedulerConfig config_;
  std::shared_ptr<Logger> logger_;
};
