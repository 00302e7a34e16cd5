#pragma once

#include <functional>
#include <memory>

#include "cancellation.hpp"
#include "chunk_upload_scheduler.hpp"
#include "content_hasher.hpp"
#include "log.hpp"
#include "remote_store.hpp"
#include "upload_config.hpp"
#include "upload_types.hpp"

// Drives one file through hash -> check -> upload -> merge.
class FileUploadOrchestrator {
public:
  using SnapshotCallback = std::function<void(const FileUploadState& state)>;

  FileUploadOrchestrator(std::shared_ptr<RemoteStore> store,
                         const UploadConfig& config,
                         std::shared_ptr<Logger> logger = nullptr);

  // Runs until `state.phase` is terminal. Failures are recorded in `state`
  // (error, error_kind) instead of being thrown. A state left Failed or
  // Cancelled by an earlier run can be passed back in after
  // FileUploadState::reset_for_retry(); a known fingerprint skips hashing and
  // Succeeded chunks are not sent again.
  void run(const UploadFile& file,
           FileUploadState& state,
           const CancellationHandle& cancel,
           const SnapshotCallback& publish = {}) const;

private:
  std::shared_ptr<RemoteStore> store_;
  uint64_t chunk_size_;
  ContentHasher hasher_;
  ChunkUploadScheduler scheduler_;
  std::shared_ptr<Logger> logger_;
};
