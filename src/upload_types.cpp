#include "upload_types.hpp"

#include <atomic>

#include "utils.hpp"

UploadFile make_upload_file(const std::filesystem::path& path) {
  static std::atomic<uint64_t> next_id{1};
  auto source = std::make_shared<FileByteSource>(path);
  UploadFile file;
  file.id = "file-" + std::to_string(next_id.fetch_add(1));
  file.name = path.filename().string();
  file.size = source->size();
  file.mime_type = guess_mime_type(path);
  file.source = std::move(source);
  return file;
}

const char* to_string(ChunkStatus status) {
  switch(status) {
    case ChunkStatus::Waiting: return "waiting";
    case ChunkStatus::Uploading: return "uploading";
    case ChunkStatus::Succeeded: return "succeeded";
    case ChunkStatus::Failed: return "failed";
  }
  return "unknown";
}

const char* to_string(UploadPhase phase) {
  switch(phase) {
    case UploadPhase::Pending: return "pending";
    case UploadPhase::Hashing: return "hashing";
    case UploadPhase::Checking: return "checking";
    case UploadPhase::Uploading: return "uploading";
    case UploadPhase::Merging: return "merging";
    case UploadPhase::Succeeded: return "succeeded";
    case UploadPhase::Failed: return "failed";
    case UploadPhase::Cancelled: return "cancelled";
  }
  return "unknown";
}

bool is_terminal(UploadPhase phase) {
  return phase == UploadPhase::Succeeded ||
         phase == UploadPhase::Failed ||
         phase == UploadPhase::Cancelled;
}

void FileUploadState::reset_for_retry() {
  for(auto& chunk : chunks) {
    if(chunk.status == ChunkStatus::Succeeded) continue;
    chunk.status = ChunkStatus::Waiting;
    chunk.retry_count = 0;
    chunk.progress_percent = 0.0;
  }
  overall_progress = mean_chunk_progress(chunks);
  phase = UploadPhase::Pending;
  error.clear();
  error_kind.reset();
  uploaded_bytes = 0;
  finished_at = {};
}

double mean_chunk_progress(const std::vector<Chunk>& chunks) {
  if(chunks.empty()) return 0.0;
  double total = 0.0;
  for(const auto& chunk : chunks) total += chunk.progress_percent;
  return total / static_cast<double>(chunks.size());
}

double transfer_rate(const FileUploadState& state,
                     std::chrono::steady_clock::time_point now) {
  if(state.started_at == std::chrono::steady_clock::time_point{}) return 0.0;
  auto end = state.finished_at == std::chrono::steady_clock::time_point{} ? now : state.finished_at;
  double secs = std::chrono::duration_cast<std::chrono::duration<double>>(end - state.started_at).count();
  if(secs <= 0.0) return 0.0;
  return static_cast<double>(state.uploaded_bytes) / secs;
}
