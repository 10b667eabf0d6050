/***
 * Name: pyjudge::sandbox::ConcurrencyBudget
 * Purpose: Bound the number of interpreter processes alive at once.
 * Inputs:
 *   - capacity: maximum simultaneous permits (> 0)
 * Outputs:
 *   - Permit objects; holding one entitles the caller to one child process
 * Theory of Operation:
 *   Counting semaphore over a mutex and condition variable. acquire() blocks
 *   until a slot is free; the returned Permit gives the slot back when it is
 *   destroyed, on every exit path. No fairness is promised between waiters.
 *   The budget is owned by whoever composes the engine and injected into the
 *   runners that share it; it must outlive every Permit it hands out.
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace pyjudge::sandbox {

class ConcurrencyBudget {
 public:
  class Permit {
   public:
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
    Permit& operator=(Permit&&) = delete;
    ~Permit();

   private:
    friend class ConcurrencyBudget;
    explicit Permit(ConcurrencyBudget* owner) : owner_(owner) {}
    ConcurrencyBudget* owner_;
  };

  // Throws exceptions::ConfigError when capacity is zero.
  explicit ConcurrencyBudget(std::size_t capacity);
  ConcurrencyBudget(const ConcurrencyBudget&) = delete;
  ConcurrencyBudget& operator=(const ConcurrencyBudget&) = delete;

  Permit acquire();

  std::size_t capacity() const { return capacity_; }
  std::size_t inUse() const;
  // Highest number of permits observed outstanding at the same time.
  std::size_t peakInUse() const;

 private:
  void release();

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable freed_;
  std::size_t inUse_{0};
  std::size_t peak_{0};
};

} // namespace pyjudge::sandbox
