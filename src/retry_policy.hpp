#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "cancellation.hpp"
#include "upload_error.hpp"

enum class RetryBackoff { Fixed, Exponential };

RetryBackoff parse_retry_backoff(const std::string& name);

struct RetryPolicy {
  uint32_t max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  RetryBackoff backoff = RetryBackoff::Fixed;
  std::chrono::milliseconds max_delay{30000};

  // Called after each failed attempt that will be retried, with the number of
  // failures so far (1-based) and the error that caused it.
  using RetryCallback = std::function<void(uint32_t retry_count, const UploadError& error)>;

  std::chrono::milliseconds delay_after(uint32_t failures) const;

  // Runs `work` until it returns, up to max_attempts times. Cancellation
  // short-circuits with UploadError::cancelled(); exhausting the attempts
  // throws UploadError::chunk_failed(chunk_index, max_attempts, last error).
  void run(const std::function<void()>& work,
           uint32_t chunk_index,
           const CancellationHandle& cancel,
           const RetryCallback& on_retry = {}) const;
};
