#include "chunk_upload_scheduler.hpp"

#include <algorithm>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>

ChunkUploadScheduler::ChunkUploadScheduler(std::shared_ptr<RemoteStore> store,
                                           ChunkSchedulerConfig config,
                                           std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("scheduler")) {
  if(config_.max_in_flight == 0) config_.max_in_flight = 1;
}

ChunkScheduleResult ChunkUploadScheduler::run(const UploadFile& file,
                                              const std::string& fingerprint,
                                              std::vector<Chunk>& chunks,
                                              const std::vector<uint32_t>& received_chunk_indexes,
                                              const CancellationHandle& cancel,
                                              const ChunkProgressCallback& on_progress) const {
  ChunkScheduleResult result;
  const auto total_chunks = static_cast<uint32_t>(chunks.size());

  std::unordered_set<uint32_t> received(received_chunk_indexes.begin(),
                                        received_chunk_indexes.end());
  std::deque<std::size_t> job_queue;
  for(std::size_t i = 0; i < chunks.size(); ++i) {
    auto& chunk = chunks[i];
    if(received.count(chunk.index) || chunk.status == ChunkStatus::Succeeded) {
      chunk.status = ChunkStatus::Succeeded;
      chunk.progress_percent = 100.0;
      continue;
    }
    chunk.status = ChunkStatus::Waiting;
    chunk.progress_percent = 0.0;
    job_queue.push_back(i);
  }

  std::mutex progress_mutex;
  std::vector<uint64_t> chunk_sent(chunks.size(), 0);
  uint64_t uploaded_bytes = 0;
  auto emit_locked = [&](){
    if(on_progress) on_progress(chunks, mean_chunk_progress(chunks), uploaded_bytes);
  };
  {
    std::lock_guard<std::mutex> lock(progress_mutex);
    emit_locked();
  }

  if(job_queue.empty()) {
    logger_->debug("{}: all {} chunks already on the store", file.name, total_chunks);
    return result;
  }
  logger_->debug("{}: {} of {} chunks to send, {} in flight max",
                 file.name, job_queue.size(), total_chunks, config_.max_in_flight);

  std::mutex job_mutex;
  bool failure = false;
  bool cancelled = false;

  auto take_job = [&]() -> std::optional<std::size_t> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(failure || cancelled || cancel.is_cancelled()) return std::nullopt;
    if(job_queue.empty()) return std::nullopt;
    std::size_t job = job_queue.front();
    job_queue.pop_front();
    return job;
  };

  auto upload_one = [&](std::size_t slot){
    const Chunk descriptor = [&]{
      std::lock_guard<std::mutex> lock(progress_mutex);
      chunks[slot].status = ChunkStatus::Uploading;
      emit_locked();
      return chunks[slot];
    }();

    auto on_chunk_progress = [&, slot](uint64_t sent, uint64_t total){
      std::lock_guard<std::mutex> lock(progress_mutex);
      if(sent > chunk_sent[slot]) {
        uploaded_bytes += sent - chunk_sent[slot];
        chunk_sent[slot] = sent;
      }
      double percent = total == 0 ? 100.0
        : static_cast<double>(sent) * 100.0 / static_cast<double>(total);
      chunks[slot].progress_percent = std::min(100.0, percent);
      emit_locked();
    };

    auto on_retry = [&, slot](uint32_t retry_count, const UploadError& error){
      logger_->warn("{}: chunk {} attempt {} failed: {}",
                    file.name, descriptor.index, retry_count, error.what());
      std::lock_guard<std::mutex> lock(progress_mutex);
      chunks[slot].retry_count = retry_count;
      chunks[slot].progress_percent = 0.0;
      chunk_sent[slot] = 0;
      emit_locked();
    };

    try {
      config_.retry.run([&]{
        auto bytes = file.source->read(descriptor.byte_start, descriptor.length());
        store_->upload_chunk(fingerprint, file.name, descriptor.index, total_chunks,
                             bytes, on_chunk_progress, cancel);
      }, descriptor.index, cancel, on_retry);
    } catch(const UploadError& e) {
      {
        std::lock_guard<std::mutex> lock(progress_mutex);
        auto& chunk = chunks[slot];
        if(e.is_cancelled()) {
          chunk.status = ChunkStatus::Waiting;
          chunk.progress_percent = 0.0;
        } else {
          chunk.status = ChunkStatus::Failed;
          chunk.retry_count = e.retry_count();
        }
        emit_locked();
      }
      std::lock_guard<std::mutex> lock(job_mutex);
      if(e.is_cancelled()) {
        cancelled = true;
      } else {
        logger_->error("{}: {}", file.name, e.what());
        if(!failure) result.error = e;
        failure = true;
      }
      return;
    }

    {
      std::lock_guard<std::mutex> lock(progress_mutex);
      chunks[slot].status = ChunkStatus::Succeeded;
      chunks[slot].progress_percent = 100.0;
      emit_locked();
    }
    std::lock_guard<std::mutex> lock(job_mutex);
    ++result.chunks_sent;
  };

  auto worker_fn = [&](){
    while(true) {
      auto job = take_job();
      if(!job) break;
      upload_one(*job);
    }
  };

  const std::size_t worker_count = std::min(config_.max_in_flight, job_queue.size());
  if(total_chunks == 1 || worker_count == 1) {
    worker_fn();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for(std::size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker_fn);
    }
    for(auto& thread : workers) {
      if(thread.joinable()) thread.join();
    }
  }

  {
    std::lock_guard<std::mutex> lock(progress_mutex);
    result.uploaded_bytes = uploaded_bytes;
  }
  if(cancelled || cancel.is_cancelled()) {
    result.outcome = ChunkScheduleResult::Outcome::Cancelled;
    result.error = UploadError::cancelled();
  } else if(failure) {
    result.outcome = ChunkScheduleResult::Outcome::Failed;
  } else {
    bool all_done = std::all_of(chunks.begin(), chunks.end(), [](const Chunk& c){
      return c.status == ChunkStatus::Succeeded;
    });
    if(!all_done) {
      result.outcome = ChunkScheduleResult::Outcome::Failed;
      result.error = UploadError(UploadErrorKind::ChunkUploadFailed, "chunks left unsent");
    }
  }
  return result;
}
