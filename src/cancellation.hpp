#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Per-file cancellation token. Copies share state, so the queue manager can keep
// one copy while the orchestrator, scheduler and HTTP callbacks hold others.
class CancellationHandle {
public:
  CancellationHandle();

  // Idempotent; returns true only for the call that actually cancelled.
  bool cancel();
  bool is_cancelled() const;

  // Sleeps up to `duration`. Returns true early if cancelled meanwhile.
  bool wait_for(std::chrono::milliseconds duration) const;

  // Throws UploadError::cancelled() when the token has fired.
  void throw_if_cancelled() const;

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
  };
  std::shared_ptr<State> state_;
};
