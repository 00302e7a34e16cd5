#include "upload_queue_manager.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>

#include "utils.hpp"

namespace {

UploadConfig checked(UploadConfig config) {
  config.validate();
  return config;
}

std::string next_file_id() {
  static std::atomic<uint64_t> counter{1};
  return "upload-" + std::to_string(counter.fetch_add(1));
}

}

UploadQueueManager::UploadQueueManager(std::shared_ptr<RemoteStore> store,
                                       UploadConfig config,
                                       std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    config_(checked(std::move(config))),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("queue")),
    orchestrator_(store_, config_, logger_),
    work_(asio::make_work_guard(io_)),
    pool_(config_.max_concurrent_files) {
  if(!store_) throw std::invalid_argument("UploadQueueManager needs a remote store");
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

UploadQueueManager::~UploadQueueManager() {
  shutdown();
}

std::string UploadQueueManager::enqueue(UploadFile file) {
  if(!file.source) {
    throw std::invalid_argument("file '" + file.name + "' has no byte source");
  }
  if(file.size > config_.max_file_size_bytes) {
    logger_->warn("rejecting {}: {} exceeds the {} limit", file.name,
                  format_bytes(file.size), format_bytes(config_.max_file_size_bytes));
    throw UploadError::too_large(file.size, config_.max_file_size_bytes);
  }
  if(file.id.empty()) file.id = next_file_id();
  const std::string id = file.id;

  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if(shut_down_) throw std::runtime_error("upload queue is shut down");
    if(entries_.count(id)) {
      throw std::invalid_argument("file id '" + id + "' is already queued");
    }
    Entry entry;
    entry.snapshot.file_id = id;
    entry.snapshot.file_name = file.name;
    entry.snapshot.file_size = file.size;
    entry.queued = true;
    entries_.emplace(id, std::move(entry));
    order_.push_back(id);
    ++queued_count_;
  }

  logger_->info("queued {} as {} ({})", file.name, id, format_bytes(file.size));
  auto record = std::make_shared<Record>();
  record->file = std::move(file);
  asio::post(io_, [this, record, id](){
    records_[id] = record;
    queue_.push_back(id);
    pump();
  });
  return id;
}

void UploadQueueManager::pump() {
  while(active_ < config_.max_concurrent_files && !queue_.empty()) {
    auto id = queue_.front();
    queue_.pop_front();
    auto it = records_.find(id);
    if(it == records_.end()) continue;
    start(it->second);
  }
}

void UploadQueueManager::start(const std::shared_ptr<Record>& record) {
  ++active_;
  const std::string id = record->file.id;
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    auto& entry = entries_.at(id);
    entry.queued = false;
    entry.running = true;
    --queued_count_;
    ++running_count_;
  }
  logger_->debug("starting {} ({} active)", id, active_);

  asio::post(pool_, [this, record, id](){
    orchestrator_.run(record->file, record->state, record->cancel,
                      [this, id](const FileUploadState& state){
                        publish(id, state);
                      });
    {
      std::lock_guard<std::mutex> lock(snapshot_mutex_);
      entries_.at(id).running = false;
      --running_count_;
    }
    idle_cv_.notify_all();
    asio::post(io_, [this](){
      --active_;
      pump();
    });
  });
}

void UploadQueueManager::cancel_queued(const std::shared_ptr<Record>& record) {
  auto& state = record->state;
  state.phase = UploadPhase::Cancelled;
  state.error = "cancelled";
  state.error_kind = UploadErrorKind::Cancelled;
  state.finished_at = std::chrono::steady_clock::now();
  publish(record->file.id, state);
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    entries_.at(record->file.id).queued = false;
    --queued_count_;
  }
  idle_cv_.notify_all();
  logger_->info("{} cancelled before it started", record->file.name);
}

void UploadQueueManager::cancel_file(const std::string& file_id) {
  asio::post(io_, [this, file_id](){
    auto it = records_.find(file_id);
    if(it == records_.end()) return;
    auto record = it->second;
    record->cancel.cancel();
    auto queued = std::find(queue_.begin(), queue_.end(), file_id);
    if(queued != queue_.end()) {
      queue_.erase(queued);
      cancel_queued(record);
    }
  });
}

void UploadQueueManager::cancel_all() {
  asio::post(io_, [this](){
    for(auto& item : records_) {
      item.second->cancel.cancel();
    }
    while(!queue_.empty()) {
      auto id = queue_.front();
      queue_.pop_front();
      cancel_queued(records_.at(id));
    }
  });
}

bool UploadQueueManager::retry_file(const std::string& file_id) {
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if(shut_down_) return false;
    auto it = entries_.find(file_id);
    if(it == entries_.end()) return false;
    auto& entry = it->second;
    auto phase = entry.snapshot.state.phase;
    if(entry.queued || entry.running) return false;
    if(phase != UploadPhase::Failed && phase != UploadPhase::Cancelled) return false;
    entry.queued = true;
    ++queued_count_;
  }
  logger_->info("retrying {}", file_id);
  asio::post(io_, [this, file_id](){
    auto record = records_.at(file_id);
    record->state.reset_for_retry();
    record->cancel = CancellationHandle();
    publish(file_id, record->state);
    queue_.push_back(file_id);
    pump();
  });
  return true;
}

void UploadQueueManager::publish(const std::string& file_id, const FileUploadState& state) {
  FileSnapshot published;
  Observer observer;
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    auto& entry = entries_.at(file_id);
    // uploaded_bytes restarts from zero on every attempt.
    if(state.uploaded_bytes > entry.counted_bytes) {
      total_bytes_uploaded_ += state.uploaded_bytes - entry.counted_bytes;
    }
    entry.counted_bytes = state.uploaded_bytes;
    entry.snapshot.state = state;
    entry.snapshot.speed_bytes_per_sec = is_terminal(state.phase) ? 0.0 : transfer_rate(state);
    published = entry.snapshot;
    observer = observer_;
  }
  if(!observer) return;
  try {
    observer(published);
  } catch(const std::exception& e) {
    logger_->warn("snapshot observer threw for {}: {}", file_id, e.what());
  }
}

std::optional<FileSnapshot> UploadQueueManager::snapshot(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  auto it = entries_.find(file_id);
  if(it == entries_.end()) return std::nullopt;
  auto result = it->second.snapshot;
  if(it->second.running) result.speed_bytes_per_sec = transfer_rate(result.state);
  return result;
}

std::vector<FileSnapshot> UploadQueueManager::snapshots() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  std::vector<FileSnapshot> result;
  result.reserve(order_.size());
  for(const auto& id : order_) {
    const auto& entry = entries_.at(id);
    result.push_back(entry.snapshot);
    if(entry.running) result.back().speed_bytes_per_sec = transfer_rate(entry.snapshot.state);
  }
  return result;
}

UploadQueueManager::Counters UploadQueueManager::counters() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  Counters counters;
  counters.active_file_count = running_count_;
  counters.queued_file_count = queued_count_;
  counters.total_bytes_uploaded = total_bytes_uploaded_;
  auto now = std::chrono::steady_clock::now();
  for(const auto& item : entries_) {
    const auto& entry = item.second;
    const auto& state = entry.snapshot.state;
    if(entry.running) {
      counters.aggregate_speed_bytes_per_sec += transfer_rate(state, now);
      continue;
    }
    if(entry.queued) continue;
    switch(state.phase) {
      case UploadPhase::Succeeded: ++counters.succeeded; break;
      case UploadPhase::Failed: ++counters.failed; break;
      case UploadPhase::Cancelled: ++counters.cancelled; break;
      default: break;
    }
  }
  return counters;
}

void UploadQueueManager::set_observer(Observer observer) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  observer_ = std::move(observer);
}

bool UploadQueueManager::idle_locked() const {
  return queued_count_ == 0 && running_count_ == 0;
}

bool UploadQueueManager::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(snapshot_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]{ return idle_locked(); });
}

void UploadQueueManager::wait_idle() {
  std::unique_lock<std::mutex> lock(snapshot_mutex_);
  idle_cv_.wait(lock, [this]{ return idle_locked(); });
}

void UploadQueueManager::shutdown() {
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if(shut_down_) return;
    shut_down_ = true;
  }
  cancel_all();
  wait_idle();
  pool_.join();
  work_.reset();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  logger_->debug("upload queue stopped");
}
