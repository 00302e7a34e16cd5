#pragma once

#include <asio.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "cancellation.hpp"
#include "file_upload_orchestrator.hpp"
#include "log.hpp"
#include "remote_store.hpp"
#include "upload_config.hpp"
#include "upload_types.hpp"

// Admits files FIFO and runs at most `max_concurrent_files` of them at once.
// Queue and per-file records belong to a single control thread; callers talk
// to it by posting commands. Published snapshots and counters live behind one
// mutex so they can be read from any thread.
class UploadQueueManager {
public:
  using Observer = std::function<void(const FileSnapshot& snapshot)>;

  struct Counters {
    uint64_t total_bytes_uploaded = 0;
    std::size_t active_file_count = 0;
    std::size_t queued_file_count = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    double aggregate_speed_bytes_per_sec = 0.0;
  };

  UploadQueueManager(std::shared_ptr<RemoteStore> store,
                     UploadConfig config,
                     std::shared_ptr<Logger> logger = nullptr);
  ~UploadQueueManager();

  UploadQueueManager(const UploadQueueManager&) = delete;
  UploadQueueManager& operator=(const UploadQueueManager&) = delete;

  // Throws UploadError (FileTooLarge) for oversized files and
  // std::invalid_argument for a duplicate id or a file without a source.
  std::string enqueue(UploadFile file);

  void cancel_file(const std::string& file_id);
  void cancel_all();

  // Re-queues a Failed or Cancelled file at the tail. The fingerprint and
  // Succeeded chunks carry over. Returns false for any other phase.
  bool retry_file(const std::string& file_id);

  std::optional<FileSnapshot> snapshot(const std::string& file_id) const;
  std::vector<FileSnapshot> snapshots() const;
  Counters counters() const;

  void set_observer(Observer observer);

  // True once nothing is queued or running; false on timeout.
  bool wait_idle(std::chrono::milliseconds timeout);
  void wait_idle();

  void shutdown();

  const UploadConfig& config() const { return config_; }

private:
  struct Record {
    UploadFile file;
    FileUploadState state;
    CancellationHandle cancel;
  };

  struct Entry {
    FileSnapshot snapshot;
    bool queued = false;
    bool running = false;
    uint64_t counted_bytes = 0; // of the current attempt, already in the total
  };

  // control thread only
  void pump();
  void start(const std::shared_ptr<Record>& record);
  void cancel_queued(const std::shared_ptr<Record>& record);

  void publish(const std::string& file_id, const FileUploadState& state);
  bool idle_locked() const;

  std::shared_ptr<RemoteStore> store_;
  UploadConfig config_;
  std::shared_ptr<Logger> logger_;
  FileUploadOrchestrator orchestrator_;

  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread io_thread_;
  asio::thread_pool pool_;

  // owned by the control thread
  std::unordered_map<std::string, std::shared_ptr<Record>> records_;
  std::deque<std::string> queue_;
  std::size_t active_ = 0;

  mutable std::mutex snapshot_mutex_;
  std::condition_variable idle_cv_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, Entry> entries_;
  std::size_t queued_count_ = 0;
  std::size_t running_count_ = 0;
  uint64_t total_bytes_uploaded_ = 0; // never decreases, survives retries
  Observer observer_;
  bool shut_down_ = false;
};
