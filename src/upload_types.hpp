#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "byte_source.hpp"
#include "upload_error.hpp"

struct UploadFile {
  std::string id;
  std::string name;
  uint64_t size = 0;
  std::string mime_type = "application/octet-stream";
  std::shared_ptr<const ByteSource> source;
};

// Builds an UploadFile backed by a file on disk with a session-unique id.
UploadFile make_upload_file(const std::filesystem::path& path);

enum class ChunkStatus { Waiting, Uploading, Succeeded, Failed };

struct Chunk {
  uint32_t index = 0;
  uint64_t byte_start = 0;
  uint64_t byte_end = 0;
  ChunkStatus status = ChunkStatus::Waiting;
  uint32_t retry_count = 0;
  double progress_percent = 0.0;

  uint64_t length() const { return byte_end - byte_start; }
};

enum class UploadPhase {
  Pending,
  Hashing,
  Checking,
  Uploading,
  Merging,
  Succeeded,
  Failed,
  Cancelled,
};

const char* to_string(ChunkStatus status);
const char* to_string(UploadPhase phase);
bool is_terminal(UploadPhase phase);

struct FileUploadState {
  std::string fingerprint;
  std::vector<Chunk> chunks;
  double overall_progress = 0.0;
  UploadPhase phase = UploadPhase::Pending;
  std::string error;
  std::optional<UploadErrorKind> error_kind;
  uint64_t uploaded_bytes = 0; // this attempt only; drives the speed figure
  std::chrono::steady_clock::time_point started_at{};
  std::chrono::steady_clock::time_point finished_at{};
  std::string remote_url;
  uint32_t attempts = 0;

  // Keeps the fingerprint and Succeeded chunks; everything else returns to Waiting.
  void reset_for_retry();
};

struct FileSnapshot {
  std::string file_id;
  std::string file_name;
  uint64_t file_size = 0;
  FileUploadState state;
  double speed_bytes_per_sec = 0.0;
};

// Unweighted mean of chunk percentages; every chunk counts the same.
double mean_chunk_progress(const std::vector<Chunk>& chunks);

double transfer_rate(const FileUploadState& state,
                     std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
