#include "cancellation.hpp"

#include "upload_error.hpp"

CancellationHandle::CancellationHandle()
  : state_(std::make_shared<State>()) {}

bool CancellationHandle::cancel() {
  bool fired = false;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    fired = !state_->cancelled.exchange(true);
  }
  if(fired) state_->cv.notify_all();
  return fired;
}

bool CancellationHandle::is_cancelled() const {
  return state_->cancelled.load(std::memory_order_acquire);
}

bool CancellationHandle::wait_for(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, duration, [this]{
    return state_->cancelled.load(std::memory_order_acquire);
  });
}

void CancellationHandle::throw_if_cancelled() const {
  if(is_cancelled()) throw UploadError::cancelled();
}
