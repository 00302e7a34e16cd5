#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "byte_source.hpp"
#include "cancellation.hpp"

enum class HashAlgorithm { Md5, Sha256 };

HashAlgorithm parse_hash_algorithm(const std::string& name);
const char* to_string(HashAlgorithm algorithm);

class ContentHasher {
public:
  using ProgressCallback = std::function<void(uint64_t bytes_hashed, uint64_t total_bytes)>;

  static constexpr std::size_t kDefaultWindowBytes = 4 * 1024 * 1024;

  explicit ContentHasher(HashAlgorithm algorithm = HashAlgorithm::Md5,
                         std::size_t window_bytes = kDefaultWindowBytes);

  // Streams the whole source through the digest from byte 0. Throws
  // UploadError (HashFailed, or Cancelled when `cancel` fires between windows).
  std::string hash(const ByteSource& source,
                   const CancellationHandle* cancel = nullptr,
                   const ProgressCallback& on_progress = {}) const;

  std::string hash_bytes(const std::string& bytes) const;

  HashAlgorithm algorithm() const { return algorithm_; }
  std::size_t window_bytes() const { return window_bytes_; }

private:
  HashAlgorithm algorithm_;
  std::size_t window_bytes_;
};
