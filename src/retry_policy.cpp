#include "retry_policy.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include "utils.hpp"

RetryBackoff parse_retry_backoff(const std::string& name) {
  auto lowered = to_lower_copy(name);
  if(lowered == "fixed") return RetryBackoff::Fixed;
  if(lowered == "exponential" || lowered == "exp") return RetryBackoff::Exponential;
  throw std::invalid_argument("unknown retry backoff '" + name + "'");
}

std::chrono::milliseconds RetryPolicy::delay_after(uint32_t failures) const {
  if(backoff == RetryBackoff::Fixed || failures <= 1) return base_delay;
  auto delay = base_delay;
  for(uint32_t i = 1; i < failures && delay < max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_delay);
}

void RetryPolicy::run(const std::function<void()>& work,
                      uint32_t chunk_index,
                      const CancellationHandle& cancel,
                      const RetryCallback& on_retry) const {
  const uint32_t attempts = std::max<uint32_t>(1, max_attempts);
  uint32_t failures = 0;
  while(true) {
    cancel.throw_if_cancelled();
    std::optional<UploadError> failure;
    try {
      work();
      return;
    } catch(const UploadError& e) {
      failure = e;
    } catch(const std::runtime_error& e) {
      // Local read errors are retried like transport errors.
      failure = UploadError::network(e.what());
    }
    if(failure->is_cancelled() || cancel.is_cancelled()) throw UploadError::cancelled();
    ++failures;
    if(failures >= attempts) {
      throw UploadError::chunk_failed(chunk_index, failures, failure->what());
    }
    if(on_retry) on_retry(failures, *failure);
    if(cancel.wait_for(delay_after(failures))) {
      throw UploadError::cancelled();
    }
  }
}
