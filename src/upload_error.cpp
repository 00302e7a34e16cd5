#include "upload_error.hpp"

#include <spdlog/fmt/fmt.h>

#include "utils.hpp"

const char* to_string(UploadErrorKind kind) {
  switch(kind) {
    case UploadErrorKind::HashFailed: return "HashFailed";
    case UploadErrorKind::NetworkError: return "NetworkError";
    case UploadErrorKind::ServerError: return "ServerError";
    case UploadErrorKind::Cancelled: return "Cancelled";
    case UploadErrorKind::ChunkUploadFailed: return "ChunkUploadFailed";
    case UploadErrorKind::MergeFailed: return "MergeFailed";
    case UploadErrorKind::FileTooLarge: return "FileTooLarge";
  }
  return "Unknown";
}

UploadError::UploadError(UploadErrorKind kind, const std::string& message)
  : std::runtime_error(message), kind_(kind) {}

UploadError UploadError::hash_failed(const std::string& message) {
  return UploadError(UploadErrorKind::HashFailed, "hashing failed: " + message);
}

UploadError UploadError::network(const std::string& message) {
  return UploadError(UploadErrorKind::NetworkError, "network error: " + message);
}

UploadError UploadError::server(int status, const std::string& message) {
  UploadError error(UploadErrorKind::ServerError,
                    fmt::format("server returned {}: {}", status,
                                message.empty() ? "no details" : message));
  error.status_ = status;
  return error;
}

UploadError UploadError::cancelled() {
  return UploadError(UploadErrorKind::Cancelled, "cancelled");
}

UploadError UploadError::chunk_failed(uint32_t chunk_index,
                                      uint32_t retry_count,
                                      const std::string& last_error) {
  UploadError error(UploadErrorKind::ChunkUploadFailed,
                    fmt::format("chunk {} failed after {} attempts: {}",
                                chunk_index, retry_count, last_error));
  error.chunk_index_ = chunk_index;
  error.retry_count_ = retry_count;
  return error;
}

UploadError UploadError::merge_failed(const std::string& message, int status) {
  UploadError error(UploadErrorKind::MergeFailed, "merge failed: " + message);
  error.status_ = status;
  return error;
}

UploadError UploadError::too_large(uint64_t size, uint64_t limit) {
  return UploadError(UploadErrorKind::FileTooLarge,
                     fmt::format("file is {} but the limit is {}",
                                 format_bytes(size), format_bytes(limit)));
}
