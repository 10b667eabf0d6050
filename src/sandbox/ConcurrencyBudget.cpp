/***
 * Name: pyjudge::sandbox::ConcurrencyBudget (impl)
 * Purpose: Counting semaphore with RAII permits.
 */
#include "sandbox/ConcurrencyBudget.h"

#include <algorithm>
#include <cstddef>
#include <mutex>

#include "pyjudge/exceptions/config_error.h"

namespace pyjudge::sandbox {

ConcurrencyBudget::ConcurrencyBudget(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw exceptions::ConfigError("concurrency budget capacity must be at least 1");
  }
}

ConcurrencyBudget::Permit ConcurrencyBudget::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  freed_.wait(lock, [this] { return inUse_ < capacity_; });
  ++inUse_;
  peak_ = std::max(peak_, inUse_);
  return Permit(this);
}

void ConcurrencyBudget::release() {
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    --inUse_;
  }
  freed_.notify_one();
}

std::size_t ConcurrencyBudget::inUse() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return inUse_;
}

std::size_t ConcurrencyBudget::peakInUse() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return peak_;
}

ConcurrencyBudget::Permit::~Permit() {
  if (owner_ != nullptr) { owner_->release(); }
}

} // namespace pyjudge::sandbox
