#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "content_hasher.hpp"
#include "retry_policy.hpp"

class SettingsManager;

// Validated runtime knobs for the upload pipeline.
struct UploadConfig {
  std::string server_url = "http://localhost:3001";
  uint64_t chunk_size_bytes = 2 * 1024 * 1024;
  std::size_t max_concurrent_chunks = 6;
  std::size_t max_concurrent_files = 3;
  RetryPolicy retry;
  uint64_t max_file_size_bytes = 10ULL * 1024 * 1024 * 1024;
  HashAlgorithm hash_algorithm = HashAlgorithm::Md5;
  std::size_t hash_window_bytes = ContentHasher::kDefaultWindowBytes;
  long request_timeout_seconds = 0;

  // Throws std::invalid_argument when a value is out of range.
  static UploadConfig from_settings(const SettingsManager& settings);

  void validate() const;
};
