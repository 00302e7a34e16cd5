#include "upload_config.hpp"

#include <stdexcept>
#include <string>

#include "chunk_planner.hpp"
#include "settings_manager.hpp"

namespace {

std::size_t positive_count(const SettingsManager& settings, const char* key) {
  int value = settings.get<int>(key);
  if(value <= 0) {
    throw std::invalid_argument(std::string(key) + " must be positive (got " + std::to_string(value) + ")");
  }
  return static_cast<std::size_t>(value);
}

std::chrono::milliseconds non_negative_ms(const SettingsManager& settings, const char* key) {
  int value = settings.get<int>(key);
  if(value < 0) {
    throw std::invalid_argument(std::string(key) + " must not be negative");
  }
  return std::chrono::milliseconds(value);
}

}

UploadConfig UploadConfig::from_settings(const SettingsManager& settings) {
  UploadConfig config;
  config.server_url = settings.get<std::string>("server_url");
  config.chunk_size_bytes = settings.get<uint64_t>("chunk_size_bytes");
  config.max_concurrent_chunks = positive_count(settings, "max_concurrent_chunks");
  config.max_concurrent_files = positive_count(settings, "max_concurrent_files");
  config.retry.max_attempts = static_cast<uint32_t>(positive_count(settings, "max_retry_count"));
  config.retry.base_delay = non_negative_ms(settings, "retry_delay_ms");
  config.retry.backoff = parse_retry_backoff(settings.get<std::string>("retry_backoff"));
  config.retry.max_delay = non_negative_ms(settings, "retry_max_delay_ms");
  config.max_file_size_bytes = settings.get<uint64_t>("max_file_size_bytes");
  config.hash_algorithm = parse_hash_algorithm(settings.get<std::string>("hash_algorithm"));
  config.hash_window_bytes = static_cast<std::size_t>(settings.get<uint64_t>("hash_window_bytes"));
  int timeout = settings.get<int>("request_timeout_seconds");
  if(timeout < 0) {
    throw std::invalid_argument("request_timeout_seconds must not be negative");
  }
  config.request_timeout_seconds = timeout;
  config.validate();
  return config;
}

void UploadConfig::validate() const {
  if(server_url.empty()) throw std::invalid_argument("server_url must not be empty");
  if(chunk_size_bytes == 0) throw std::invalid_argument("chunk_size_bytes must be positive");
  if(max_concurrent_chunks == 0) throw std::invalid_argument("max_concurrent_chunks must be positive");
  if(max_concurrent_files == 0) throw std::invalid_argument("max_concurrent_files must be positive");
  if(retry.max_attempts == 0) throw std::invalid_argument("max_retry_count must be positive");
  if(expected_chunk_count(max_file_size_bytes, chunk_size_bytes) > kMaxChunkCount) {
    throw std::invalid_argument("chunk_size_bytes " + std::to_string(chunk_size_bytes) +
                                " is too small for max_file_size_bytes " +
                                std::to_string(max_file_size_bytes));
  }
  if(hash_window_bytes == 0) throw std::invalid_argument("hash_window_bytes must be positive");
  if(retry.max_delay < retry.base_delay) {
    throw std::invalid_argument("retry_max_delay_ms must be at least retry_delay_ms");
  }
}
