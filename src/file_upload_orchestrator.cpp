#include "file_upload_orchestrator.hpp"

#include <mutex>

#include "chunk_planner.hpp"
#include "utils.hpp"

namespace {

bool plan_matches(const std::vector<Chunk>& chunks, const std::vector<ChunkDescriptor>& plan) {
  if(chunks.size() != plan.size()) return false;
  for(std::size_t i = 0; i < plan.size(); ++i) {
    if(chunks[i].index != plan[i].index ||
       chunks[i].byte_start != plan[i].byte_start ||
       chunks[i].byte_end != plan[i].byte_end) {
      return false;
    }
  }
  return true;
}

}

FileUploadOrchestrator::FileUploadOrchestrator(std::shared_ptr<RemoteStore> store,
                                               const UploadConfig& config,
                                               std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    chunk_size_(config.chunk_size_bytes),
    hasher_(config.hash_algorithm, config.hash_window_bytes),
    scheduler_(store_,
               ChunkSchedulerConfig{config.max_concurrent_chunks, config.retry},
               logger),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("uploader")) {}

void FileUploadOrchestrator::run(const UploadFile& file,
                                 FileUploadState& state,
                                 const CancellationHandle& cancel,
                                 const SnapshotCallback& publish) const {
  auto log = logger_->child(file.id);
  log->forward_to(logger_);

  // Chunk callbacks arrive from scheduler workers; serialize the publishes.
  std::mutex publish_mutex;
  auto emit = [&](){
    std::lock_guard<std::mutex> lock(publish_mutex);
    state.overall_progress = mean_chunk_progress(state.chunks);
    if(publish) publish(state);
  };
  auto enter = [&](UploadPhase phase){
    log->debug("{} -> {}", to_string(state.phase), to_string(phase));
    state.phase = phase;
    emit();
  };

  ++state.attempts;
  state.started_at = std::chrono::steady_clock::now();
  state.finished_at = {};
  state.error.clear();
  state.error_kind.reset();

  try {
    if(state.fingerprint.empty()) {
      enter(UploadPhase::Hashing);
      state.fingerprint = hasher_.hash(*file.source, &cancel);
      log->debug("{} fingerprint {} ({})", file.name, state.fingerprint, to_string(hasher_.algorithm()));
    }
    cancel.throw_if_cancelled();

    enter(UploadPhase::Checking);
    auto checked = store_->check(state.fingerprint, file.name, file.size, cancel);
    cancel.throw_if_cancelled();

    auto plan = plan_chunks(file.size, chunk_size_);
    if(!plan_matches(state.chunks, plan)) {
      state.chunks = make_chunks(plan);
    }

    if(checked.already_complete) {
      for(auto& chunk : state.chunks) {
        chunk.status = ChunkStatus::Succeeded;
        chunk.progress_percent = 100.0;
      }
      state.remote_url = checked.url;
      state.finished_at = std::chrono::steady_clock::now();
      log->info("{} already on the store, skipping upload", file.name);
      enter(UploadPhase::Succeeded);
      return;
    }

    enter(UploadPhase::Uploading);
    const auto total_chunks = static_cast<uint32_t>(state.chunks.size());
    auto result = scheduler_.run(file, state.fingerprint, state.chunks,
                                 checked.received_chunk_indexes, cancel,
                                 [&](const std::vector<Chunk>&, double, uint64_t uploaded_bytes){
                                   state.uploaded_bytes = uploaded_bytes;
                                   emit();
                                 });
    state.uploaded_bytes = result.uploaded_bytes;
    if(result.outcome == ChunkScheduleResult::Outcome::Cancelled) {
      throw UploadError::cancelled();
    }
    if(result.outcome == ChunkScheduleResult::Outcome::Failed) {
      throw result.error ? *result.error
                         : UploadError(UploadErrorKind::ChunkUploadFailed, "chunk upload failed");
    }
    cancel.throw_if_cancelled();

    enter(UploadPhase::Merging);
    MergeResult merged;
    try {
      merged = store_->merge(state.fingerprint, file.name, file.size, total_chunks, cancel);
    } catch(const UploadError& e) {
      if(e.is_cancelled()) throw;
      throw UploadError::merge_failed(e.what(), e.status());
    }
    state.remote_url = merged.url.empty() ? checked.url : merged.url;
    state.finished_at = std::chrono::steady_clock::now();
    log->info("{} uploaded ({}, {} chunks, {} sent)", file.name, format_bytes(file.size),
              total_chunks, result.chunks_sent);
    enter(UploadPhase::Succeeded);
  } catch(const UploadError& e) {
    state.finished_at = std::chrono::steady_clock::now();
    if(e.is_cancelled() || cancel.is_cancelled()) {
      state.error = "cancelled";
      state.error_kind = UploadErrorKind::Cancelled;
      log->info("{} cancelled during {}", file.name, to_string(state.phase));
      enter(UploadPhase::Cancelled);
      return;
    }
    state.error = e.what();
    state.error_kind = e.kind();
    log->error("{} failed during {}: {}", file.name, to_string(state.phase), e.what());
    enter(UploadPhase::Failed);
  } catch(const std::exception& e) {
    state.finished_at = std::chrono::steady_clock::now();
    state.error = e.what();
    state.error_kind.reset();
    log->error("{} failed during {}: {}", file.name, to_string(state.phase), e.what());
    enter(UploadPhase::Failed);
  }
}
