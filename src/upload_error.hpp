#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

enum class UploadErrorKind {
  HashFailed,
  NetworkError,
  ServerError,
  Cancelled,
  ChunkUploadFailed,
  MergeFailed,
  FileTooLarge,
};

const char* to_string(UploadErrorKind kind);

class UploadError : public std::runtime_error {
public:
  UploadError(UploadErrorKind kind, const std::string& message);

  static UploadError hash_failed(const std::string& message);
  static UploadError network(const std::string& message);
  static UploadError server(int status, const std::string& message);
  static UploadError cancelled();
  static UploadError chunk_failed(uint32_t chunk_index,
                                  uint32_t retry_count,
                                  const std::string& last_error);
  static UploadError merge_failed(const std::string& message, int status = 0);
  static UploadError too_large(uint64_t size, uint64_t limit);

  UploadErrorKind kind() const { return kind_; }
  // HTTP status for ServerError (and MergeFailed caused by one), 0 otherwise.
  int status() const { return status_; }
  std::optional<uint32_t> chunk_index() const { return chunk_index_; }
  uint32_t retry_count() const { return retry_count_; }

  bool is_cancelled() const { return kind_ == UploadErrorKind::Cancelled; }

private:
  UploadErrorKind kind_;
  int status_ = 0;
  std::optional<uint32_t> chunk_index_;
  uint32_t retry_count_ = 0;
};
